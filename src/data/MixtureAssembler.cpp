#include "data/MixtureAssembler.h"
#include "core/Errors.h"
#include <algorithm>

namespace fs = std::filesystem;

namespace StemMix {
namespace Data {

MixtureAssembler::MixtureAssembler(std::shared_ptr<const DSP::AudioAccessor> accessor, ExcerptSampler sampler)
    : accessor_(std::move(accessor)), sampler_(sampler) {
    if (!accessor_) {
        throw std::invalid_argument("MixtureAssembler requires an audio accessor");
    }
}

DSP::TrackMetadata MixtureAssembler::probe(const fs::path& path) const {
    if (!fs::exists(path)) {
        throw Core::EmptySourceError("Missing stem: " + path.string());
    }
    return accessor_->probe(path);
}

ExcerptWindow MixtureAssembler::sampleWindow(const fs::path& path, Core::RandomSource& rng) const {
    const auto info = probe(path);
    const auto window = sampler_.sample(info.durationSeconds, rng);
    if (!window) {
        throw Core::InsufficientDurationError(path.string() + " lasts " +
                                              std::to_string(info.durationSeconds) + "s, shorter than the excerpt");
    }
    return *window;
}

ExcerptWindow MixtureAssembler::sampleSharedWindow(const std::vector<fs::path>& paths,
                                                   Core::RandomSource& rng) const {
    std::vector<double> durations;
    durations.reserve(paths.size());
    for (const auto& path : paths) {
        durations.push_back(probe(path).durationSeconds);
    }

    const auto window = sampler_.sampleShared(durations, rng);
    if (!window) {
        throw Core::InsufficientDurationError("Shortest of " + std::to_string(paths.size()) +
                                              " stems (from " + paths.front().string() +
                                              ") is shorter than the excerpt");
    }
    return *window;
}

std::vector<Stem> MixtureAssembler::loadStems(const std::vector<StemRequest>& requests) const {
    std::vector<Stem> stems;
    stems.reserve(requests.size());
    for (const auto& request : requests) {
        if (!fs::exists(request.path)) {
            throw Core::EmptySourceError("Missing stem: " + request.path.string());
        }
        auto audio = accessor_->loadInterleaved(request.path, request.window.startSeconds,
                                                request.window.durationSeconds);
        const int sampleRate = audio.sampleRate;
        stems.push_back({DSP::toChannelMajor(audio), sampleRate, request.path.string()});
    }
    conform(stems, sampler_);
    return stems;
}

void MixtureAssembler::conform(std::vector<Stem>& stems, const ExcerptSampler& sampler) {
    if (stems.empty()) {
        throw Core::EmptySourceError("No stems to mix");
    }

    const Stem& reference = stems.front();
    int shortest = reference.audio.getNumSamples();
    for (const auto& stem : stems) {
        if (stem.sampleRate != reference.sampleRate) {
            throw Core::StemMismatchError(stem.label + " is " + std::to_string(stem.sampleRate) +
                                          " Hz, " + reference.label + " is " +
                                          std::to_string(reference.sampleRate) + " Hz");
        }
        if (stem.audio.getNumChannels() != reference.audio.getNumChannels()) {
            throw Core::StemMismatchError(stem.label + " has " + std::to_string(stem.audio.getNumChannels()) +
                                          " channels, " + reference.label + " has " +
                                          std::to_string(reference.audio.getNumChannels()));
        }
        shortest = std::min(shortest, stem.audio.getNumSamples());
    }

    int length = shortest;
    if (!sampler.isFullLength()) {
        const int64_t required = sampler.requiredSamples(reference.sampleRate);
        for (const auto& stem : stems) {
            if (stem.audio.getNumSamples() < required) {
                throw Core::InsufficientDurationError(stem.label + " returned " +
                                                      std::to_string(stem.audio.getNumSamples()) + " of " +
                                                      std::to_string(required) + " samples");
            }
        }
        length = static_cast<int>(required);
    }

    if (length == 0) {
        throw Core::InsufficientDurationError(reference.label + " holds no samples");
    }

    for (auto& stem : stems) {
        if (stem.audio.getNumSamples() != length) {
            stem.audio = stem.audio.cropped(length);
        }
    }
}

void MixtureAssembler::augment(std::vector<Stem>& stems, const DSP::Compose& augmentations,
                               Core::RandomSource& rng) {
    if (augmentations.empty()) {
        return;
    }
    for (auto& stem : stems) {
        stem.audio = augmentations(stem.audio, rng);
    }
}

Core::AudioBuffer MixtureAssembler::mix(const std::vector<Stem>& stems) {
    if (stems.empty()) {
        throw Core::EmptySourceError("No stems to mix");
    }

    Core::AudioBuffer mixture = stems.front().audio.clone();
    for (size_t i = 1; i < stems.size(); ++i) {
        mixture.add(stems[i].audio);
    }
    return mixture;
}

Example MixtureAssembler::mixWithLastAsTarget(std::vector<Stem> stems) {
    Core::AudioBuffer input = mix(stems);
    const int sampleRate = stems.back().sampleRate;
    return {std::move(input), std::move(stems.back().audio), sampleRate};
}

Example MixtureAssembler::mixWithNamedTarget(std::vector<Stem> stems,
                                             const std::vector<std::string>& names,
                                             const std::string& target) {
    if (names.size() != stems.size()) {
        throw std::invalid_argument("Stem names do not match stems");
    }

    Core::AudioBuffer input = mix(stems);
    const int sampleRate = stems.front().sampleRate;

    auto it = std::find(names.begin(), names.end(), target);
    if (it != names.end()) {
        return {std::move(input), std::move(stems[it - names.begin()].audio), sampleRate};
    }

    // Accompaniment by subtraction
    auto vocals = std::find(names.begin(), names.end(), "vocals");
    if (vocals == names.end()) {
        throw Core::ConfigurationError("Target '" + target + "' needs a vocals stem to subtract");
    }
    Core::AudioBuffer accompaniment = input.clone();
    accompaniment.add(stems[vocals - names.begin()].audio, -1.0f);
    return {std::move(input), std::move(accompaniment), sampleRate};
}

} // namespace Data
} // namespace StemMix
