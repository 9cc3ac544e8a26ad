#include "utils/RandomUtils.hpp"
#include "exceptions/Exceptions.hpp"
#include <array>
#include <cstdint>
#include <random>

namespace transdist {

unsigned long deriveSeed(unsigned long base_seed, SeedStream stream, std::size_t index) {
    std::seed_seq seq{
        static_cast<std::uint32_t>(base_seed & 0xffffffffUL),
        static_cast<std::uint32_t>((static_cast<unsigned long long>(base_seed) >> 32) & 0xffffffffULL),
        static_cast<std::uint32_t>(stream),
        static_cast<std::uint32_t>(index & 0xffffffffUL),
        static_cast<std::uint32_t>((static_cast<unsigned long long>(index) >> 32) & 0xffffffffULL)
    };
    std::array<std::uint32_t, 1> out{};
    seq.generate(out.begin(), out.end());
    return static_cast<unsigned long>(out[0]);
}

GslRng::GslRng(unsigned long seed)
    : rng_(gsl_rng_alloc(gsl_rng_mt19937))
{
    if (!rng_) {
        throw TransdistException("GslRng::GslRng", "Failed to allocate GSL RNG.");
    }
    gsl_rng_set(rng_.get(), seed);
}

unsigned long GslRng::uniformInt(unsigned long n) const {
    return gsl_rng_uniform_int(rng_.get(), n);
}

} // namespace transdist
