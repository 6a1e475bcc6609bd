#pragma once

#include <cstdint>
#include <random>

namespace specfact {
namespace spectra {

// Explicit, seedable source of the jitter applied to synthesized peaks.
// Every synthesis call draws from the instance it is handed; nothing global.
class RandomSource {
private:
    std::mt19937_64 engine;
    std::uniform_real_distribution<double> unit{0.0, 1.0};
    uint64_t initialSeed;

public:
    explicit RandomSource(uint64_t seed) : engine(seed), initialSeed(seed) {}

    // Derive an independent stream, e.g. one per row of a batch.
    static RandomSource forStream(uint64_t seed, uint64_t stream) {
        std::seed_seq seq{static_cast<uint32_t>(seed), static_cast<uint32_t>(seed >> 32),
                          static_cast<uint32_t>(stream), static_cast<uint32_t>(stream >> 32)};
        std::mt19937_64 mixer(seq);
        return RandomSource(mixer());
    }

    // Uniform in [0, 1)
    double uniform() { return unit(engine); }

    // base + U * span
    double jitter(double base, double span) { return base + uniform() * span; }

    // center + (U - 0.5) * span
    double around(double center, double span) { return center + (uniform() - 0.5) * span; }

    uint64_t getSeed() const { return initialSeed; }
};

} // namespace spectra
} // namespace specfact
