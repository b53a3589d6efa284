#include "discovery/random_source.hpp"

#include <algorithm>
#include <numeric>

namespace precursor {

std::vector<size_t> SeededRandomSource::sampleIndices(size_t population, size_t count) {
    std::vector<size_t> pool(population);
    std::iota(pool.begin(), pool.end(), 0);

    const size_t k = std::min(count, population);
    // Partial Fisher-Yates: the first k slots end up as the sample.
    for (size_t i = 0; i < k; i++) {
        std::uniform_int_distribution<size_t> dist(i, population - 1);
        std::swap(pool[i], pool[dist(rng_)]);
    }
    pool.resize(k);
    return pool;
}

void SeededRandomSource::shuffle(std::vector<size_t>& indices) {
    std::shuffle(indices.begin(), indices.end(), rng_);
}

} // namespace precursor
