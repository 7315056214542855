#include "data/CorpusDataset.h"
#include "core/Errors.h"
#include <algorithm>
#include <iostream>

namespace StemMix {
namespace Data {

namespace {

bool contains(const std::vector<std::string>& names, const std::string& name) {
    return std::find(names.begin(), names.end(), name) != names.end();
}

} // namespace

CorpusDataset::CorpusDataset(Config config, std::shared_ptr<Corpus> corpus)
    : Dataset(config.seed),
      config_(std::move(config)),
      training_(config_.split == "train"),
      corpus_(std::move(corpus)),
      sampler_(training_ ? config_.seqDuration : 0.0, training_) {
    if (!corpus_) {
        throw Core::ConfigurationError("CorpusDataset requires a corpus");
    }
    if (corpus_->getTracks().empty()) {
        throw Core::ConfigurationError("Corpus holds no tracks");
    }
    if (config_.samplesPerTrack == 0) {
        throw Core::ConfigurationError("CorpusDataset needs samplesPerTrack > 0");
    }

    sourceNames_ = corpus_->getSourceNames();
    if (training_) {
        if (!contains(sourceNames_, config_.target) && !contains(sourceNames_, "vocals")) {
            throw Core::ConfigurationError("Target '" + config_.target +
                                           "' is not a corpus source and there is no vocals stem to subtract");
        }
    } else if (!contains(corpus_->getTargetNames(), config_.target)) {
        throw Core::ConfigurationError("Unknown corpus target: " + config_.target);
    }

    std::cout << "[CorpusDataset] " << config_.split << ": " << corpus_->getTracks().size() << " tracks x "
              << config_.samplesPerTrack << " samples, target " << config_.target << std::endl;
}

Example CorpusDataset::loadExample(size_t index) {
    CorpusTrack& track = *corpus_->getTracks()[index / config_.samplesPerTrack];
    return training_ ? loadTrainingExample(track) : loadFullTrack(track);
}

Example CorpusDataset::loadTrainingExample(CorpusTrack& track) {
    const auto& tracks = corpus_->getTracks();

    std::optional<ExcerptWindow> shared;
    if (!config_.randomTrackMix) {
        shared = sampler_.sample(track.getDuration(), rng());
        if (!shared) {
            throw Core::InsufficientDurationError("Track " + track.getName() + " is shorter than the excerpt");
        }
    }

    std::vector<Stem> stems;
    stems.reserve(sourceNames_.size());
    for (const auto& source : sourceNames_) {
        CorpusTrack* chosen = &track;
        ExcerptWindow window;
        if (config_.randomTrackMix) {
            chosen = tracks[rng().index(tracks.size())].get();
            const auto drawn = sampler_.sample(chosen->getDuration(), rng());
            if (!drawn) {
                throw Core::InsufficientDurationError("Track " + chosen->getName() + " is shorter than the excerpt");
            }
            window = *drawn;
        } else {
            window = *shared;
        }

        chosen->setChunk(window.startSeconds, window.durationSeconds);
        const auto audio = chosen->loadSource(source);
        stems.push_back({DSP::toChannelMajor(audio), audio.sampleRate, chosen->getName() + "/" + source});
    }

    MixtureAssembler::conform(stems, sampler_);
    MixtureAssembler::augment(stems, config_.augmentations, rng());
    return MixtureAssembler::mixWithNamedTarget(std::move(stems), sourceNames_, config_.target);
}

Example CorpusDataset::loadFullTrack(CorpusTrack& track) {
    track.setChunk(0.0, std::nullopt);

    const auto mixture = track.loadMixture();
    const auto target = track.loadTarget(config_.target);

    std::vector<Stem> stems;
    stems.push_back({DSP::toChannelMajor(mixture), mixture.sampleRate, track.getName() + "/mixture"});
    stems.push_back({DSP::toChannelMajor(target), target.sampleRate, track.getName() + "/" + config_.target});
    MixtureAssembler::conform(stems, sampler_);

    const int sampleRate = stems.front().sampleRate;
    return {std::move(stems[0].audio), std::move(stems[1].audio), sampleRate};
}

} // namespace Data
} // namespace StemMix
