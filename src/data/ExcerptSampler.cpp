#include "data/ExcerptSampler.h"
#include <algorithm>
#include <cmath>

namespace StemMix {
namespace Data {

ExcerptSampler::ExcerptSampler(double sequenceDuration, bool randomExcerpt)
    : randomExcerpt_(randomExcerpt) {
    if (sequenceDuration > 0.0) {
        sequenceDuration_ = sequenceDuration;
    }
}

std::optional<ExcerptWindow> ExcerptSampler::sample(double sourceDuration, Core::RandomSource& rng) const {
    ExcerptWindow window;
    if (isFullLength()) {
        return window;
    }

    const double length = *sequenceDuration_;
    if (sourceDuration < length) {
        return std::nullopt;
    }

    window.durationSeconds = length;
    if (randomExcerpt_) {
        window.startSeconds = rng.uniform(0.0, sourceDuration - length);
    }
    return window;
}

std::optional<ExcerptWindow> ExcerptSampler::sampleShared(const std::vector<double>& sourceDurations,
                                                          Core::RandomSource& rng) const {
    if (sourceDurations.empty()) {
        return std::nullopt;
    }
    return sample(*std::min_element(sourceDurations.begin(), sourceDurations.end()), rng);
}

int64_t ExcerptSampler::requiredSamples(int sampleRate) const {
    if (isFullLength()) {
        return 0;
    }
    return std::llround(*sequenceDuration_ * sampleRate);
}

} // namespace Data
} // namespace StemMix
