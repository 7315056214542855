#include <gtest/gtest.h>
#include "data/ExcerptSampler.h"
#include "core/RandomSource.h"

using namespace StemMix::Data;
using namespace StemMix::Core;

class ExcerptSamplerTest : public ::testing::Test {
protected:
    RandomSource rng{7};
};

TEST_F(ExcerptSamplerTest, RandomStartStaysInsideSource) {
    ExcerptSampler sampler(4.0, true);

    bool sawNonZero = false;
    for (int trial = 0; trial < 500; ++trial) {
        const auto window = sampler.sample(10.0, rng);
        ASSERT_TRUE(window.has_value());
        EXPECT_GE(window->startSeconds, 0.0);
        EXPECT_LE(window->startSeconds, 6.0);
        ASSERT_TRUE(window->durationSeconds.has_value());
        EXPECT_DOUBLE_EQ(*window->durationSeconds, 4.0);
        sawNonZero = sawNonZero || window->startSeconds > 0.0;
    }
    EXPECT_TRUE(sawNonZero);
}

TEST_F(ExcerptSamplerTest, ExactLengthStartsAtZero) {
    ExcerptSampler sampler(4.0, true);
    const auto window = sampler.sample(4.0, rng);
    ASSERT_TRUE(window.has_value());
    EXPECT_DOUBLE_EQ(window->startSeconds, 0.0);
}

TEST_F(ExcerptSamplerTest, TooShortSourceYieldsNothing) {
    ExcerptSampler sampler(4.0, true);
    EXPECT_FALSE(sampler.sample(3.5, rng).has_value());

    ExcerptSampler deterministic(4.0, false);
    EXPECT_FALSE(deterministic.sample(3.5, rng).has_value());
}

TEST_F(ExcerptSamplerTest, EvaluationStartsAtZero) {
    ExcerptSampler sampler(2.0, false);
    EXPECT_FALSE(sampler.isRandom());

    for (int trial = 0; trial < 10; ++trial) {
        const auto window = sampler.sample(30.0, rng);
        ASSERT_TRUE(window.has_value());
        EXPECT_DOUBLE_EQ(window->startSeconds, 0.0);
    }
}

TEST_F(ExcerptSamplerTest, NonPositiveDurationIsFullLength) {
    for (double seq : {0.0, -1.0}) {
        ExcerptSampler sampler(seq, true);
        EXPECT_TRUE(sampler.isFullLength());
        EXPECT_FALSE(sampler.getSequenceDuration().has_value());

        const auto window = sampler.sample(0.5, rng);
        ASSERT_TRUE(window.has_value());
        EXPECT_TRUE(window->isFullLength());
        EXPECT_DOUBLE_EQ(window->startSeconds, 0.0);
        EXPECT_EQ(sampler.requiredSamples(44100), 0);
    }
}

TEST_F(ExcerptSamplerTest, SharedWindowBoundedByShortest) {
    ExcerptSampler sampler(2.0, true);

    for (int trial = 0; trial < 200; ++trial) {
        const auto window = sampler.sampleShared({10.0, 3.0, 7.0}, rng);
        ASSERT_TRUE(window.has_value());
        EXPECT_LE(window->startSeconds + 2.0, 3.0 + 1e-9);
    }

    EXPECT_FALSE(sampler.sampleShared({10.0, 1.5}, rng).has_value());
    EXPECT_FALSE(sampler.sampleShared({}, rng).has_value());
}

TEST_F(ExcerptSamplerTest, RequiredSamplesRoundsToNearest) {
    EXPECT_EQ(ExcerptSampler(2.0, true).requiredSamples(44100), 88200);
    EXPECT_EQ(ExcerptSampler(0.1, false).requiredSamples(44100), 4410);
    EXPECT_EQ(ExcerptSampler(1.0 / 3.0, false).requiredSamples(8000), 2667);
}
