#pragma once

#include "core/RandomSource.h"
#include <cstdint>
#include <optional>
#include <vector>

namespace StemMix {
namespace Data {

/**
 * @brief Time window of a source: start offset plus optional duration
 *
 * An empty duration means "to the end of the file".
 */
struct ExcerptWindow {
    double startSeconds = 0.0;
    std::optional<double> durationSeconds;

    bool isFullLength() const { return !durationSeconds.has_value(); }
};

/**
 * @brief Picks excerpt windows for sources of known duration
 *
 * A non-positive sequence duration switches to full-length mode, where every
 * window is (0, to end). Otherwise training splits draw the start uniformly
 * from [0, D - d] and evaluation splits start at 0.
 */
class ExcerptSampler {
public:
    ExcerptSampler(double sequenceDuration, bool randomExcerpt);

    bool isFullLength() const { return !sequenceDuration_.has_value(); }
    bool isRandom() const { return randomExcerpt_; }
    std::optional<double> getSequenceDuration() const { return sequenceDuration_; }

    /**
     * @brief Window for a source lasting sourceDuration seconds
     * @return std::nullopt if the source is shorter than the sequence
     */
    std::optional<ExcerptWindow> sample(double sourceDuration, Core::RandomSource& rng) const;

    /**
     * @brief One window valid for every source, bounded by the shortest
     */
    std::optional<ExcerptWindow> sampleShared(const std::vector<double>& sourceDurations,
                                              Core::RandomSource& rng) const;

    /**
     * @brief Samples every stem must hold at the given rate (0 in full-length mode)
     */
    int64_t requiredSamples(int sampleRate) const;

private:
    std::optional<double> sequenceDuration_;
    bool randomExcerpt_;
};

} // namespace Data
} // namespace StemMix
