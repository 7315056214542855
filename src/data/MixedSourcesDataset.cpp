#include "data/MixedSourcesDataset.h"
#include "data/SourceIndex.h"
#include "core/Errors.h"
#include <algorithm>
#include <iostream>

namespace StemMix {
namespace Data {

MixedSourcesDataset::MixedSourcesDataset(Config config, std::shared_ptr<const DSP::AudioAccessor> accessor)
    : Dataset(config.seed),
      config_(std::move(config)),
      training_(config_.split == "train"),
      assembler_(accessor ? std::move(accessor) : DSP::makeDefaultAccessor(),
                 ExcerptSampler(config_.seqDuration, training_)) {
    std::vector<std::string> stems = config_.interferers;
    stems.push_back(config_.targetFile);

    // Missing stems stay indexed and are retried at load time
    for (auto& trackDir : buildTrackIndex(config_.root, config_.split)) {
        const bool readable = std::all_of(stems.begin(), stems.end(), [&](const std::string& stem) {
            const auto path = trackDir / stem;
            return !std::filesystem::exists(path) || isReadableAudio(assembler_.getAccessor(), path);
        });
        if (readable) {
            tracks_.push_back(std::move(trackDir));
        }
    }
    if (tracks_.empty()) {
        throw Core::ConfigurationError("No readable track folders in " +
                                       (expandUser(config_.root) / config_.split).string());
    }

    std::cout << "[MixedSourcesDataset] Indexed " << tracks_.size() << " tracks in "
              << (expandUser(config_.root) / config_.split).string() << std::endl;
}

Example MixedSourcesDataset::loadExample(size_t index) {
    std::vector<std::string> sources = config_.interferers;
    sources.push_back(config_.targetFile);

    std::vector<std::filesystem::path> paths;
    paths.reserve(sources.size());
    for (const auto& source : sources) {
        const auto& trackDir = training_ ? tracks_[rng().index(tracks_.size())] : tracks_[index];
        paths.push_back(trackDir / source);
    }

    const ExcerptWindow window = assembler_.sampleSharedWindow(paths, rng());

    std::vector<StemRequest> requests;
    requests.reserve(paths.size());
    for (const auto& path : paths) {
        requests.push_back({path, window});
    }

    auto stems = assembler_.loadStems(requests);
    if (training_) {
        MixtureAssembler::augment(stems, config_.augmentations, rng());
    }
    return MixtureAssembler::mixWithLastAsTarget(std::move(stems));
}

} // namespace Data
} // namespace StemMix
