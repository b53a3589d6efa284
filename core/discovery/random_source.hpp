#pragma once

#include <cstddef>
#include <cstdint>
#include <random>
#include <vector>

namespace precursor {

// ─── Random Source ─────────────────────────────────────────────
// All randomness in a run flows through this interface so tests can
// pin it to a seed or replace it with a deterministic stub.

class RandomSource {
public:
    virtual ~RandomSource() = default;

    /// Pick min(count, population) distinct indices from [0, population).
    virtual std::vector<size_t> sampleIndices(size_t population, size_t count) = 0;

    /// Permute indices in place.
    virtual void shuffle(std::vector<size_t>& indices) = 0;
};

/// Mersenne Twister backed source.
class SeededRandomSource : public RandomSource {
public:
    explicit SeededRandomSource(uint32_t seed = 42) : rng_(seed) {}

    std::vector<size_t> sampleIndices(size_t population, size_t count) override;
    void shuffle(std::vector<size_t>& indices) override;

private:
    std::mt19937 rng_;
};

} // namespace precursor
