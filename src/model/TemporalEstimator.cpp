#include "model/TemporalEstimator.hpp"
#include "exceptions/Exceptions.hpp"
#include "utils/Logger.hpp"
#include "utils/RandomUtils.hpp"
#include <string>
#include <utility>

namespace transdist {

TemporalEstimator::TemporalEstimator(std::shared_ptr<const IKernelEstimator> estimator, int min_cases)
    : estimator_(std::move(estimator)), min_cases_(min_cases)
{
    if (!estimator_) {
        THROW_INVALID_PARAM("TemporalEstimator::TemporalEstimator", "Kernel estimator cannot be null.");
    }
    if (min_cases_ < 0) {
        THROW_INVALID_PARAM("TemporalEstimator::TemporalEstimator", "min_cases cannot be negative.");
    }
}

template <typename T>
std::vector<TemporalEntry<T>> TemporalEstimator::sweep(
    const CaseTable& cases, unsigned long seed, const WorkerPool& pool,
    const std::function<T(const CaseTable&, unsigned long, const WorkerPool&)>& estimate_window) const {
    const std::string funcName = "TemporalEstimator::sweep";
    Logger& logger = Logger::getInstance();

    validateCaseTable(cases, funcName);
    const CaseTable selected = estimator_->selectCases(cases);
    const std::vector<double> times = uniqueOnsetTimes(selected);
    std::vector<TemporalEntry<T>> series(times.size());
    const WorkerPool inner = pool.nested();

    pool.forEach(static_cast<int>(times.size()), [&](int k) {
        TemporalEntry<T>& entry = series[k];
        entry.time = times[k];
        const CaseTable window = filterCasesUpTo(selected, times[k]);
        entry.n_cases = static_cast<int>(window.size());
        if (entry.n_cases < min_cases_) {
            return;
        }
        try {
            entry.value = estimate_window(window, deriveSeed(seed, SeedStream::TemporalWindow, static_cast<std::size_t>(k)), inner);
        } catch (const InsufficientDataError& e) {
            logger.warning(funcName, "No estimate for window ending at t = " + std::to_string(times[k]) +
                ": " + e.what());
        }
    });

    int present = 0;
    for (const auto& entry : series) {
        if (entry.value) ++present;
    }
    logger.info(funcName, std::to_string(present) + " of " + std::to_string(series.size()) +
        " windows estimated.");
    return series;
}

TemporalSeries TemporalEstimator::run(const CaseTable& cases, unsigned long seed, const WorkerPool& pool) const {
    return sweep<KernelEstimate>(cases, seed, pool,
        [this](const CaseTable& window, unsigned long window_seed, const WorkerPool& inner) {
            return estimator_->estimate(window, window_seed, inner);
        });
}

TemporalBootstrapSeries TemporalEstimator::run(const CaseTable& cases, const BootstrapEstimator& bootstrap,
                                               unsigned long seed, const WorkerPool& pool) const {
    return sweep<BootstrapResult>(cases, seed, pool,
        [&bootstrap](const CaseTable& window, unsigned long window_seed, const WorkerPool& inner) {
            return bootstrap.run(window, window_seed, inner);
        });
}

} // namespace transdist
