#pragma once

#include "dsp/AudioFile.h"
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace StemMix {
namespace Data {

/**
 * @brief One multi-track song of a curated corpus
 *
 * Loads are restricted to the excerpt window last set with setChunk().
 * Audio comes back frame-major, (samples, channels).
 */
class CorpusTrack {
public:
    virtual ~CorpusTrack() = default;

    virtual std::string getName() const = 0;

    /**
     * @brief Track length in seconds
     */
    virtual double getDuration() const = 0;

    /**
     * @brief Set the excerpt window; an empty duration reads to the end
     */
    virtual void setChunk(double startSeconds, std::optional<double> durationSeconds) = 0;

    virtual DSP::InterleavedAudio loadSource(const std::string& name) const = 0;
    virtual DSP::InterleavedAudio loadTarget(const std::string& name) const = 0;

    /**
     * @brief The mastered mixture of the track
     */
    virtual DSP::InterleavedAudio loadMixture() const = 0;
};

/**
 * @brief Provider of a curated multi-track corpus with fixed stem names
 */
class Corpus {
public:
    virtual ~Corpus() = default;

    virtual const std::vector<std::shared_ptr<CorpusTrack>>& getTracks() const = 0;

    /**
     * @brief Native source stems, in mixing order
     */
    virtual std::vector<std::string> getSourceNames() const = 0;

    /**
     * @brief Everything loadTarget() accepts: the sources plus derived targets
     */
    virtual std::vector<std::string> getTargetNames() const = 0;
};

} // namespace Data
} // namespace StemMix
