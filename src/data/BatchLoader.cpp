#include "data/BatchLoader.h"
#include <algorithm>
#include <numeric>
#include <stdexcept>

namespace StemMix {
namespace Data {

BatchLoader::BatchLoader(Dataset& dataset, Config config)
    : dataset_(dataset), config_(config) {
    if (config_.batchSize == 0) {
        throw std::invalid_argument("Batch size must be positive");
    }
    if (config_.seed) {
        rng_.reseed(*config_.seed);
    }
    reset();
}

size_t BatchLoader::getNumBatches() const {
    return (dataset_.size() + config_.batchSize - 1) / config_.batchSize;
}

void BatchLoader::reset() {
    order_.resize(dataset_.size());
    std::iota(order_.begin(), order_.end(), size_t{0});

    if (config_.shuffle) {
        // Fisher-Yates through the owned generator
        for (size_t i = order_.size(); i > 1; --i) {
            std::swap(order_[i - 1], order_[rng_.index(i)]);
        }
    }
    position_ = 0;
}

bool BatchLoader::next(std::vector<Example>& batch) {
    batch.clear();
    if (position_ >= order_.size()) {
        return false;
    }

    const size_t end = std::min(order_.size(), position_ + config_.batchSize);
    batch.reserve(end - position_);
    for (; position_ < end; ++position_) {
        batch.push_back(dataset_.get(order_[position_]));
    }
    return true;
}

} // namespace Data
} // namespace StemMix
