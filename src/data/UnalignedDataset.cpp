#include "data/UnalignedDataset.h"
#include "data/SourceIndex.h"
#include "core/Errors.h"
#include <iostream>

namespace StemMix {
namespace Data {

namespace {

std::vector<std::string> withTargetLast(const std::vector<std::string>& interferences, const std::string& target) {
    std::vector<std::string> folders = interferences;
    folders.push_back(target);
    return folders;
}

} // namespace

UnalignedDataset::UnalignedDataset(Config config, std::shared_ptr<const DSP::AudioAccessor> accessor)
    : Dataset(config.seed),
      config_(std::move(config)),
      training_(config_.split == "train"),
      sourceFolders_(withTargetLast(config_.interferences, config_.target)),
      assembler_(accessor ? std::move(accessor) : DSP::makeDefaultAccessor(),
                 ExcerptSampler(config_.seqDuration, training_)) {
    if (config_.numSamples == 0) {
        throw Core::ConfigurationError("UnalignedDataset needs numSamples > 0");
    }

    sources_ = buildFolderIndex(config_.root, config_.split, sourceFolders_, config_.glob,
                                assembler_.getAccessor());

    std::cout << "[UnalignedDataset] Indexed " << sourceFolders_.size() << " source folders in "
              << (expandUser(config_.root) / config_.split).string() << std::endl;
}

Example UnalignedDataset::loadExample(size_t index) {
    std::vector<StemRequest> requests;
    requests.reserve(sources_.size());
    for (const auto& files : sources_) {
        const auto& path = training_ ? files[rng().index(files.size())] : files[index % files.size()];
        // Each stem gets its own window
        requests.push_back({path, assembler_.sampleWindow(path, rng())});
    }

    auto stems = assembler_.loadStems(requests);
    if (training_) {
        MixtureAssembler::augment(stems, config_.augmentations, rng());
    }
    return MixtureAssembler::mixWithLastAsTarget(std::move(stems));
}

} // namespace Data
} // namespace StemMix
