#ifndef RANDOM_UTILS_HPP
#define RANDOM_UTILS_HPP

#include <gsl/gsl_rng.h>
#include <cstddef>
#include <memory>

namespace transdist {

/**
 * @brief Independent random streams of the pipeline. Each stochastic trial
 * seeds its own generator from (base seed, stream, trial index).
 */
enum class SeedStream : unsigned int {
    ThetaRepetition = 1,
    BootstrapResample = 2,
    BootstrapEstimate = 3,
    TemporalWindow = 4
};

/**
 * @brief Derives the seed of one trial.
 *
 * Mixes the three inputs through std::seed_seq so that neighbouring trial
 * indices give unrelated MT19937 states.
 */
unsigned long deriveSeed(unsigned long base_seed, SeedStream stream, std::size_t index);

/**
 * @brief Owning wrapper around a GSL MT19937 generator.
 */
class GslRng {
public:
    explicit GslRng(unsigned long seed);

    gsl_rng* get() const { return rng_.get(); }

    /** @return Uniform integer in [0, n). */
    unsigned long uniformInt(unsigned long n) const;

private:
    struct Deleter {
        void operator()(gsl_rng* r) const { gsl_rng_free(r); }
    };
    std::unique_ptr<gsl_rng, Deleter> rng_;
};

} // namespace transdist

#endif // RANDOM_UTILS_HPP
