#include <gtest/gtest.h>
#include "dsp/Augmentations.h"
#include "core/AudioBuffer.h"
#include "core/Errors.h"
#include "core/RandomSource.h"
#include <memory>

using namespace StemMix::DSP;
using namespace StemMix::Core;

namespace {

// Pins every draw to a fixed position in its range
class PinnedRandomSource : public RandomSource {
public:
    PinnedRandomSource(double position, bool swap) : position_(position), swap_(swap) {}

    double uniform(double low, double high) override { return low + position_ * (high - low); }
    bool chance(double) override { return swap_; }
    size_t index(size_t) override { return 0; }

private:
    double position_;
    bool swap_;
};

AudioBuffer makeStereo(float left, float right, int numSamples = 64) {
    AudioBuffer buffer(2, numSamples);
    for (int i = 0; i < numSamples; ++i) {
        buffer.getWritePointer(0)[i] = left;
        buffer.getWritePointer(1)[i] = right;
    }
    return buffer;
}

} // namespace

class AugmentationTest : public ::testing::Test {
protected:
    void SetUp() override {
        stereo = std::make_unique<AudioBuffer>(makeStereo(0.5f, -0.25f));
    }

    std::unique_ptr<AudioBuffer> stereo;
    RandomSource rng{1234};
};

TEST_F(AugmentationTest, GainStaysInRange) {
    for (int trial = 0; trial < 200; ++trial) {
        AudioBuffer out = augmentGain(*stereo, rng);
        const float gain = out.getReadPointer(0)[0] / 0.5f;
        EXPECT_GE(gain, kMinAugmentationGain - 1e-6f);
        EXPECT_LE(gain, kMaxAugmentationGain + 1e-6f);
        // One gain for every sample and channel
        EXPECT_FLOAT_EQ(out.getReadPointer(1)[63], -0.25f * gain);
    }
}

TEST_F(AugmentationTest, GainRangeEndpoints) {
    PinnedRandomSource lowest(0.0, false);
    PinnedRandomSource highest(1.0, false);

    EXPECT_FLOAT_EQ(augmentGain(*stereo, lowest).getReadPointer(0)[0], 0.5f * 0.25f);
    EXPECT_FLOAT_EQ(augmentGain(*stereo, highest).getReadPointer(0)[0], 0.5f * 1.25f);
}

TEST_F(AugmentationTest, GainDoesNotMutateInput) {
    AudioBuffer out = augmentGain(*stereo, rng);
    EXPECT_TRUE(out.hasSameShape(*stereo));
    EXPECT_FLOAT_EQ(stereo->getReadPointer(0)[0], 0.5f);
}

TEST_F(AugmentationTest, ChannelSwapSwapsStereo) {
    PinnedRandomSource swap(0.0, true);
    AudioBuffer out = augmentChannelSwap(*stereo, swap);

    EXPECT_FLOAT_EQ(out.getReadPointer(0)[0], -0.25f);
    EXPECT_FLOAT_EQ(out.getReadPointer(1)[0], 0.5f);
    EXPECT_FLOAT_EQ(stereo->getReadPointer(0)[0], 0.5f);
}

TEST_F(AugmentationTest, ChannelSwapCanKeepOrder) {
    PinnedRandomSource keep(0.0, false);
    AudioBuffer out = augmentChannelSwap(*stereo, keep);

    EXPECT_FLOAT_EQ(out.getReadPointer(0)[0], 0.5f);
    EXPECT_FLOAT_EQ(out.getReadPointer(1)[0], -0.25f);
}

TEST_F(AugmentationTest, ChannelSwapTwiceIsIdentity) {
    PinnedRandomSource swap(0.0, true);
    AudioBuffer twice = augmentChannelSwap(augmentChannelSwap(*stereo, swap), swap);

    for (int i = 0; i < stereo->getNumSamples(); ++i) {
        EXPECT_FLOAT_EQ(twice.getReadPointer(0)[i], stereo->getReadPointer(0)[i]);
        EXPECT_FLOAT_EQ(twice.getReadPointer(1)[i], stereo->getReadPointer(1)[i]);
    }
}

TEST_F(AugmentationTest, ChannelSwapLeavesOtherLayoutsAlone) {
    PinnedRandomSource swap(0.0, true);

    AudioBuffer mono(1, 16);
    mono.getWritePointer(0)[0] = 0.7f;
    AudioBuffer monoOut = augmentChannelSwap(mono, swap);
    EXPECT_EQ(monoOut.getNumChannels(), 1);
    EXPECT_FLOAT_EQ(monoOut.getReadPointer(0)[0], 0.7f);

    AudioBuffer surround(3, 16);
    surround.getWritePointer(0)[0] = 1.0f;
    AudioBuffer surroundOut = augmentChannelSwap(surround, swap);
    EXPECT_FLOAT_EQ(surroundOut.getReadPointer(0)[0], 1.0f);
    EXPECT_FLOAT_EQ(surroundOut.getReadPointer(2)[0], 0.0f);
}

TEST_F(AugmentationTest, ComposeAppliesInOrder) {
    PinnedRandomSource pinned(1.0, true);
    Compose chain = Compose::fromNames({"channelswap", "gain"});
    EXPECT_EQ(chain.size(), 2u);

    AudioBuffer out = chain(*stereo, pinned);
    EXPECT_FLOAT_EQ(out.getReadPointer(0)[0], -0.25f * 1.25f);
    EXPECT_FLOAT_EQ(out.getReadPointer(1)[0], 0.5f * 1.25f);
}

TEST_F(AugmentationTest, EmptyComposeCopies) {
    Compose chain;
    EXPECT_TRUE(chain.empty());

    AudioBuffer out = chain(*stereo, rng);
    EXPECT_TRUE(out.hasSameShape(*stereo));
    EXPECT_FLOAT_EQ(out.getReadPointer(1)[10], -0.25f);
}

TEST_F(AugmentationTest, UnknownNameIsConfigurationError) {
    EXPECT_THROW(makeAugmentation("reverb"), ConfigurationError);
    EXPECT_THROW(Compose::fromNames({"gain", "pitch"}), ConfigurationError);
}
