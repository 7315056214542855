#include "data/AlignedDataset.h"
#include "core/Errors.h"
#include <iostream>

namespace StemMix {
namespace Data {

AlignedDataset::AlignedDataset(Config config, std::shared_ptr<const DSP::AudioAccessor> accessor)
    : Dataset(config.seed),
      config_(std::move(config)),
      assembler_(accessor ? std::move(accessor) : DSP::makeDefaultAccessor(),
                 ExcerptSampler(config_.seqDuration, config_.split == "train")) {
    pairs_ = buildAlignedIndex(config_.root, config_.split, config_.inputFile, config_.outputFile,
                               assembler_.getAccessor());
    if (pairs_.empty()) {
        throw Core::ConfigurationError("No track folder in " + (expandUser(config_.root) / config_.split).string() +
                                       " holds readable '" + config_.inputFile + "' and '" + config_.outputFile + "'");
    }

    std::cout << "[AlignedDataset] Indexed " << pairs_.size() << " tracks in "
              << (expandUser(config_.root) / config_.split).string() << std::endl;
}

Example AlignedDataset::loadExample(size_t index) {
    const AlignedPair& pair = pairs_[index];

    const ExcerptWindow window = assembler_.sampleSharedWindow({pair.input, pair.output}, rng());
    auto stems = assembler_.loadStems({{pair.input, window}, {pair.output, window}});

    const int sampleRate = stems.front().sampleRate;
    return {std::move(stems[0].audio), std::move(stems[1].audio), sampleRate};
}

} // namespace Data
} // namespace StemMix
