#include "model/ThetaSampler.hpp"
#include "exceptions/Exceptions.hpp"
#include <algorithm>
#include <numeric>
#include <string>

namespace transdist {

ThetaSampler::ThetaSampler(const PairwiseInfectorMatrix& pairwise, int max_sep)
    : times_(pairwise.getTimes()),
      buckets_(pairwise.getTimeBuckets()),
      max_sep_(max_sep)
{
    if (max_sep_ < 1) {
        THROW_INVALID_PARAM("ThetaSampler::ThetaSampler", "max_sep must be at least 1, got " + std::to_string(max_sep_) + ".");
    }
    const int n = pairwise.numCases();
    const Eigen::MatrixXd& p = pairwise.getProbabilities();

    order_.resize(n);
    std::iota(order_.begin(), order_.end(), 0);
    std::stable_sort(order_.begin(), order_.end(),
                     [this](int a, int b) { return buckets_[a] < buckets_[b]; });

    candidates_.resize(n);
    cumulative_.resize(n);
    for (int j = 0; j < n; ++j) {
        double running = 0.0;
        for (int i = 0; i < n; ++i) {
            if (p(i, j) > 0.0) {
                running += p(i, j);
                candidates_[j].push_back(i);
                cumulative_[j].push_back(running);
            }
        }
        if (!cumulative_[j].empty()) {
            for (double& c : cumulative_[j]) {
                c /= running;
            }
        }
    }
}

std::vector<int> ThetaSampler::sampleInfectors(gsl_rng* rng) const {
    const int n = numCases();
    std::vector<int> parents(n, -1);
    for (int j = 0; j < n; ++j) {
        const auto& cum = cumulative_[j];
        if (cum.empty()) continue;
        const double u = gsl_rng_uniform(rng);
        auto it = std::upper_bound(cum.begin(), cum.end(), u);
        size_t k = static_cast<size_t>(it - cum.begin());
        if (k >= cum.size()) k = cum.size() - 1;
        parents[j] = candidates_[j][k];
    }
    return parents;
}

int ThetaSampler::separation(const std::vector<int>& parents, const std::vector<int>& depth, int a, int b) const {
    int da = depth[a];
    int db = depth[b];
    int steps = 0;
    while (da > db) {
        a = parents[a];
        --da;
        if (++steps > max_sep_) return 0;
    }
    while (db > da) {
        b = parents[b];
        --db;
        if (++steps > max_sep_) return 0;
    }
    while (a != b) {
        a = parents[a];
        b = parents[b];
        // Reached two distinct roots: different trees.
        if (a < 0 || b < 0) return 0;
        steps += 2;
        if (steps > max_sep_) return 0;
    }
    return steps;
}

ThetaTensor ThetaSampler::tabulate(const std::vector<int>& parents) const {
    const int n = numCases();
    std::vector<int> depth(n, 0);
    std::vector<int> root(n, -1);
    for (int j : order_) {
        const int parent = parents[j];
        if (parent < 0) {
            depth[j] = 0;
            root[j] = j;
        } else {
            depth[j] = depth[parent] + 1;
            root[j] = root[parent];
        }
    }

    ThetaTensor tensor(times_, max_sep_);
    for (int a = 0; a < n; ++a) {
        for (int b = a + 1; b < n; ++b) {
            if (root[a] != root[b]) continue;
            const int theta = separation(parents, depth, a, b);
            if (theta == 0) continue;
            const int ta = buckets_[a];
            const int tb = buckets_[b];
            tensor.at(ta, tb, theta) += 1.0;
            if (ta != tb) {
                tensor.at(tb, ta, theta) += 1.0;
            }
        }
    }
    tensor.normalizeSlices();
    return tensor;
}

ThetaTensor ThetaSampler::sample(gsl_rng* rng) const {
    return tabulate(sampleInfectors(rng));
}

} // namespace transdist
