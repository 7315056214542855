#pragma once

#include "core/AudioBuffer.h"
#include "core/RandomSource.h"
#include "data/ExcerptSampler.h"
#include "dsp/AudioFile.h"
#include "dsp/Augmentations.h"
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

namespace StemMix {
namespace Data {

/**
 * @brief One training example: model input and separation target
 *
 * input and target always share (channels, samples).
 */
struct Example {
    Core::AudioBuffer input;
    Core::AudioBuffer target;
    int sampleRate = 0;
};

/**
 * @brief A loaded stem and where it came from
 */
struct Stem {
    Core::AudioBuffer audio;
    int sampleRate = 0;
    std::string label;
};

/**
 * @brief A stem file and the window to read from it
 */
struct StemRequest {
    std::filesystem::path path;
    ExcerptWindow window;
};

/**
 * @brief Loads, validates, augments and sums per-source excerpts
 */
class MixtureAssembler {
public:
    MixtureAssembler(std::shared_ptr<const DSP::AudioAccessor> accessor, ExcerptSampler sampler);

    const DSP::AudioAccessor& getAccessor() const { return *accessor_; }

    /**
     * @brief Probe a stem file
     * @throws Core::EmptySourceError if the file does not exist
     */
    DSP::TrackMetadata probe(const std::filesystem::path& path) const;

    /**
     * @brief Window for a single stem
     * @throws Core::InsufficientDurationError if the stem is too short
     */
    ExcerptWindow sampleWindow(const std::filesystem::path& path, Core::RandomSource& rng) const;

    /**
     * @brief One window shared by all stems, bounded by the shortest
     * @throws Core::InsufficientDurationError if any stem is too short
     */
    ExcerptWindow sampleSharedWindow(const std::vector<std::filesystem::path>& paths,
                                     Core::RandomSource& rng) const;

    /**
     * @brief Load every request, then conform() the result
     */
    std::vector<Stem> loadStems(const std::vector<StemRequest>& requests) const;

    /**
     * @brief Check stems can be mixed and bring them to one length
     *
     * Every stem must hold the sampler's required sample count and share
     * channel count and sample rate with the first one. Stems are cropped to
     * the required count, or to the shortest stem in full-length mode.
     *
     * @throws Core::InsufficientDurationError, Core::StemMismatchError
     */
    static void conform(std::vector<Stem>& stems, const ExcerptSampler& sampler);

    /**
     * @brief Apply the augmentation chain to every stem with independent draws
     */
    static void augment(std::vector<Stem>& stems, const DSP::Compose& augmentations, Core::RandomSource& rng);

    /**
     * @brief Sample-wise sum of all stems
     */
    static Core::AudioBuffer mix(const std::vector<Stem>& stems);

    /**
     * @brief Input is the sum of all stems, target the last stem
     */
    static Example mixWithLastAsTarget(std::vector<Stem> stems);

    /**
     * @brief Input is the sum of all stems, target the stem named target
     *
     * If target is not among names, the target is the mix minus the stem
     * named "vocals".
     *
     * @throws Core::ConfigurationError if neither stem exists
     */
    static Example mixWithNamedTarget(std::vector<Stem> stems,
                                      const std::vector<std::string>& names,
                                      const std::string& target);

private:
    std::shared_ptr<const DSP::AudioAccessor> accessor_;
    ExcerptSampler sampler_;
};

} // namespace Data
} // namespace StemMix
