#include "core/RandomSource.h"
#include <algorithm>
#include <cmath>
#include <limits>
#include <stdexcept>

namespace StemMix {
namespace Core {

RandomSource::RandomSource()
    : engine_(std::random_device{}()) {
}

RandomSource::RandomSource(uint32_t seed)
    : engine_(seed) {
}

void RandomSource::reseed(uint32_t seed) {
    engine_.seed(seed);
}

double RandomSource::uniform(double low, double high) {
    if (high <= low) {
        return low;
    }
    // Widen by one ulp so high itself can be drawn
    std::uniform_real_distribution<double> dist(low, std::nextafter(high, std::numeric_limits<double>::max()));
    return std::min(dist(engine_), high);
}

bool RandomSource::chance(double probability) {
    std::uniform_real_distribution<double> dist(0.0, 1.0);
    return dist(engine_) < probability;
}

size_t RandomSource::index(size_t size) {
    if (size == 0) {
        throw std::invalid_argument("Cannot draw an index from an empty range");
    }
    std::uniform_int_distribution<size_t> dist(0, size - 1);
    return dist(engine_);
}

} // namespace Core
} // namespace StemMix
