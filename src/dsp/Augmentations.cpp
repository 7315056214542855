#include "dsp/Augmentations.h"
#include "core/Errors.h"

namespace StemMix {
namespace DSP {

Core::AudioBuffer augmentGain(const Core::AudioBuffer& audio, Core::RandomSource& rng) {
    const float gain = static_cast<float>(rng.uniform(kMinAugmentationGain, kMaxAugmentationGain));
    Core::AudioBuffer result = audio.clone();
    result.applyGain(gain);
    return result;
}

Core::AudioBuffer augmentChannelSwap(const Core::AudioBuffer& audio, Core::RandomSource& rng) {
    if (audio.getNumChannels() == 2 && rng.chance(0.5)) {
        return audio.withReversedChannels();
    }
    return audio.clone();
}

Augmentation makeAugmentation(const std::string& name) {
    if (name == "gain") {
        return augmentGain;
    }
    if (name == "channelswap") {
        return augmentChannelSwap;
    }
    throw Core::ConfigurationError("Unknown augmentation: " + name);
}

Compose::Compose(std::vector<Augmentation> transforms)
    : transforms_(std::move(transforms)) {
}

Compose Compose::fromNames(const std::vector<std::string>& names) {
    std::vector<Augmentation> transforms;
    transforms.reserve(names.size());
    for (const auto& name : names) {
        transforms.push_back(makeAugmentation(name));
    }
    return Compose(std::move(transforms));
}

Core::AudioBuffer Compose::operator()(const Core::AudioBuffer& audio, Core::RandomSource& rng) const {
    Core::AudioBuffer result = audio.clone();
    for (const auto& transform : transforms_) {
        result = transform(result, rng);
    }
    return result;
}

} // namespace DSP
} // namespace StemMix
