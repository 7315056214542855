#pragma once

#include "core/AudioBuffer.h"
#include "core/RandomSource.h"
#include <functional>
#include <string>
#include <vector>

namespace StemMix {
namespace DSP {

/**
 * @brief Waveform-to-waveform transform applied to a single stem
 *
 * Transforms never modify their input; they return a new buffer.
 */
using Augmentation = std::function<Core::AudioBuffer(const Core::AudioBuffer&, Core::RandomSource&)>;

constexpr float kMinAugmentationGain = 0.25f;
constexpr float kMaxAugmentationGain = 1.25f;

/**
 * @brief Scale every sample by a gain drawn from [0.25, 1.25]
 */
Core::AudioBuffer augmentGain(const Core::AudioBuffer& audio, Core::RandomSource& rng);

/**
 * @brief Swap left and right with probability 0.5 (stereo only)
 */
Core::AudioBuffer augmentChannelSwap(const Core::AudioBuffer& audio, Core::RandomSource& rng);

/**
 * @brief Resolve "gain" or "channelswap"
 * @throws Core::ConfigurationError for any other name
 */
Augmentation makeAugmentation(const std::string& name);

/**
 * @brief Ordered chain of augmentations
 *
 * An empty chain returns an unmodified copy.
 */
class Compose {
public:
    Compose() = default;
    explicit Compose(std::vector<Augmentation> transforms);

    static Compose fromNames(const std::vector<std::string>& names);

    Core::AudioBuffer operator()(const Core::AudioBuffer& audio, Core::RandomSource& rng) const;

    bool empty() const { return transforms_.empty(); }
    size_t size() const { return transforms_.size(); }

private:
    std::vector<Augmentation> transforms_;
};

} // namespace DSP
} // namespace StemMix
