#include "data/FolderCorpus.h"
#include "data/SourceIndex.h"
#include "core/Errors.h"
#include <algorithm>
#include <iostream>
#include <iterator>

namespace fs = std::filesystem;

namespace StemMix {
namespace Data {

namespace {

bool contains(const std::vector<std::string>& names, const std::string& name) {
    return std::find(names.begin(), names.end(), name) != names.end();
}

// Frame-wise sum, truncated to the shortest input
void accumulate(DSP::InterleavedAudio& sum, const DSP::InterleavedAudio& part, const std::string& label) {
    if (sum.numChannels == 0) {
        sum = part;
        return;
    }
    if (part.numChannels != sum.numChannels || part.sampleRate != sum.sampleRate) {
        throw Core::StemMismatchError("Stem " + label + " does not match the other stems of its track");
    }

    sum.numFrames = std::min(sum.numFrames, part.numFrames);
    sum.samples.resize(static_cast<size_t>(sum.numFrames) * sum.numChannels);
    for (size_t i = 0; i < sum.samples.size(); ++i) {
        sum.samples[i] += part.samples[i];
    }
}

class FolderTrack : public CorpusTrack {
public:
    FolderTrack(fs::path directory,
                std::vector<std::string> sources,
                std::shared_ptr<const DSP::AudioAccessor> accessor)
        : directory_(std::move(directory)),
          sources_(std::move(sources)),
          accessor_(std::move(accessor)) {
        duration_ = -1.0;
        for (const auto& source : sources_) {
            const double d = accessor_->probe(stemPath(source)).durationSeconds;
            duration_ = duration_ < 0.0 ? d : std::min(duration_, d);
        }
    }

    std::string getName() const override { return directory_.filename().string(); }
    double getDuration() const override { return duration_; }

    void setChunk(double startSeconds, std::optional<double> durationSeconds) override {
        chunkStart_ = startSeconds;
        chunkDuration_ = durationSeconds;
    }

    DSP::InterleavedAudio loadSource(const std::string& name) const override {
        if (!contains(sources_, name)) {
            throw Core::ConfigurationError("Unknown source '" + name + "' in track " + getName());
        }
        return accessor_->loadInterleaved(stemPath(name), chunkStart_, chunkDuration_);
    }

    DSP::InterleavedAudio loadTarget(const std::string& name) const override {
        if (contains(sources_, name)) {
            return loadSource(name);
        }
        if (name == "accompaniment") {
            std::vector<std::string> rest;
            std::copy_if(sources_.begin(), sources_.end(), std::back_inserter(rest),
                         [](const std::string& s) { return s != "vocals"; });
            return sumOf(rest);
        }
        if (name == "linear_mixture") {
            return sumOf(sources_);
        }
        throw Core::ConfigurationError("Unknown target '" + name + "' in track " + getName());
    }

    DSP::InterleavedAudio loadMixture() const override {
        const fs::path mixture = directory_ / "mixture.wav";
        if (fs::exists(mixture)) {
            return accessor_->loadInterleaved(mixture, chunkStart_, chunkDuration_);
        }
        return sumOf(sources_);
    }

private:
    fs::path stemPath(const std::string& name) const {
        return directory_ / (name + ".wav");
    }

    DSP::InterleavedAudio sumOf(const std::vector<std::string>& names) const {
        DSP::InterleavedAudio sum;
        for (const auto& name : names) {
            accumulate(sum, loadSource(name), getName() + "/" + name);
        }
        return sum;
    }

    fs::path directory_;
    std::vector<std::string> sources_;
    std::shared_ptr<const DSP::AudioAccessor> accessor_;
    double duration_;
    double chunkStart_ = 0.0;
    std::optional<double> chunkDuration_;
};

} // namespace

std::vector<std::string> FolderCorpus::defaultValidationTracks() {
    return {
        "Actions - One Minute Smile",
        "Clara Berry And Wooldog - Waltz For My Victims",
        "Johnny Lokke - Promises & Lies",
        "Patrick Talbot - A Reason To Leave",
        "Triviul - Angelsaint",
        "Alexander Ross - Goodbye Bolero",
        "Fergessen - Nos Palpitants",
        "Leaf - Summerghost",
        "Skelpolu - Human Mistakes",
        "Young Griffo - Pennies",
        "ANiMAL - Rockshow",
        "James May - On The Line",
        "Meaxic - Take A Step",
        "Traffic Experiment - Sirens",
    };
}

FolderCorpus::FolderCorpus(Config config, std::shared_ptr<const DSP::AudioAccessor> accessor)
    : config_(std::move(config)) {
    if (!accessor) {
        accessor = DSP::makeDefaultAccessor();
    }
    if (config_.sources.empty()) {
        throw Core::ConfigurationError("FolderCorpus needs at least one source name");
    }

    const bool splitSubset = config_.subset == "train" && !config_.split.empty();
    if (splitSubset && config_.split != "train" && config_.split != "valid") {
        throw Core::ConfigurationError("Unknown corpus split: " + config_.split);
    }

    for (const auto& directory : buildTrackIndex(config_.root, config_.subset)) {
        const std::string name = directory.filename().string();
        if (splitSubset && contains(config_.validationTracks, name) != (config_.split == "valid")) {
            continue;
        }

        const bool complete = std::all_of(config_.sources.begin(), config_.sources.end(),
                                          [&](const std::string& s) { return fs::exists(directory / (s + ".wav")); });
        if (!complete) {
            std::cerr << "[FolderCorpus] Skipping incomplete track: " << directory.string() << std::endl;
            continue;
        }

        try {
            tracks_.push_back(std::make_shared<FolderTrack>(directory, config_.sources, accessor));
        } catch (const Core::UnreadableFileError& e) {
            std::cerr << "[FolderCorpus] Skipping unreadable track: " << e.what() << std::endl;
        }
    }

    if (tracks_.empty()) {
        throw Core::ConfigurationError("No tracks in " + (expandUser(config_.root) / config_.subset).string() +
                                       (splitSubset ? " for split " + config_.split : std::string()));
    }

    std::cout << "[FolderCorpus] Loaded " << tracks_.size() << " tracks from "
              << (expandUser(config_.root) / config_.subset).string() << std::endl;
}

std::vector<std::string> FolderCorpus::getTargetNames() const {
    std::vector<std::string> targets = config_.sources;
    if (contains(config_.sources, "vocals")) {
        targets.push_back("accompaniment");
    }
    targets.push_back("linear_mixture");
    return targets;
}

} // namespace Data
} // namespace StemMix
