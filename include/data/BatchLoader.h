#pragma once

#include "core/RandomSource.h"
#include "data/Dataset.h"
#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>

namespace StemMix {
namespace Data {

/**
 * @brief Pulls examples from a dataset in fixed-size batches
 *
 * One pass over the dataset per epoch, reshuffled at every reset() when
 * shuffling is on. The last batch may be smaller than batchSize.
 */
class BatchLoader {
public:
    struct Config {
        size_t batchSize = 16;
        bool shuffle = true;
        std::optional<uint32_t> seed;
    };

    BatchLoader(Dataset& dataset, Config config);

    size_t getNumBatches() const;

    /**
     * @brief Start a new epoch
     */
    void reset();

    /**
     * @brief Fill batch with the next examples
     * @return false once the epoch is exhausted
     */
    bool next(std::vector<Example>& batch);

private:
    Dataset& dataset_;
    Config config_;
    Core::RandomSource rng_;
    std::vector<size_t> order_;
    size_t position_ = 0;
};

} // namespace Data
} // namespace StemMix
