#include <gtest/gtest.h>
#include "data/AlignedDataset.h"
#include "data/BatchLoader.h"
#include "data/CorpusDataset.h"
#include "data/FolderCorpus.h"
#include "data/MixedSourcesDataset.h"
#include "data/UnalignedDataset.h"
#include "dsp/AudioFile.h"
#include "core/AudioBuffer.h"
#include "TestAudio.h"
#include <cmath>
#include <filesystem>
#include <memory>
#include <string>

using namespace StemMix;
namespace fs = std::filesystem;

/**
 * @brief End-to-end runs of every dataset layout, as a training loop drives them
 *
 * Covers:
 * - Building each dataset from a folder tree
 * - Excerpt length at CD sample rate
 * - Deterministic evaluation
 * - Batching a full epoch
 * - Writing examples back to disk
 */
class PipelineWorkflowTest : public ::testing::Test {
protected:
    static constexpr int kSampleRate = 44100;

    void SetUp() override {
        testDir = Testing::makeTestDirectory("e2e");
    }

    void TearDown() override {
        if (fs::exists(testDir)) {
            fs::remove_all(testDir);
        }
    }

    // Stereo sine; left and right differ so channel swaps are visible
    void writeTone(const fs::path& path, double frequency, double seconds, int sampleRate = kSampleRate) {
        Core::AudioBuffer buffer(2, static_cast<int>(seconds * sampleRate));
        for (int i = 0; i < buffer.getNumSamples(); ++i) {
            const double phase = 2.0 * 3.14159265358979 * frequency * i / sampleRate;
            buffer.getWritePointer(0)[i] = 0.3f * static_cast<float>(std::sin(phase));
            buffer.getWritePointer(1)[i] = 0.2f * static_cast<float>(std::cos(phase));
        }
        Testing::writeWav(path, buffer, sampleRate);
    }

    fs::path testDir;
};

TEST_F(PipelineWorkflowTest, AlignedExcerptsAtCdRate) {
    for (const char* track : {"01", "02", "03"}) {
        writeTone(testDir / "train" / track / "mixture.wav", 220.0, 5.0);
        writeTone(testDir / "train" / track / "vocals.wav", 440.0, 5.0);
        writeTone(testDir / "valid" / track / "mixture.wav", 220.0, 5.0);
        writeTone(testDir / "valid" / track / "vocals.wav", 440.0, 5.0);
    }

    Data::AlignedDataset::Config config;
    config.root = testDir;
    config.seqDuration = 2.0;
    config.seed = 2024;
    Data::AlignedDataset train(config);

    ASSERT_EQ(train.size(), 3u);
    for (size_t i = 0; i < train.size(); ++i) {
        Data::Example example = train.get(i);
        EXPECT_EQ(example.input.getNumChannels(), 2);
        EXPECT_EQ(example.input.getNumSamples(), 88200);
        EXPECT_TRUE(example.input.hasSameShape(example.target));
        EXPECT_EQ(example.sampleRate, kSampleRate);
    }

    config.split = "valid";
    Data::AlignedDataset valid(config);

    Data::Example first = valid.get(0);
    Data::Example second = valid.get(0);
    ASSERT_TRUE(first.input.hasSameShape(second.input));
    for (int ch = 0; ch < 2; ++ch) {
        for (int i = 0; i < first.input.getNumSamples(); i += 97) {
            ASSERT_FLOAT_EQ(first.input.getReadPointer(ch)[i], second.input.getReadPointer(ch)[i]);
            ASSERT_FLOAT_EQ(first.target.getReadPointer(ch)[i], second.target.getReadPointer(ch)[i]);
        }
    }
    // Evaluation excerpts start at the top of the file
    EXPECT_FLOAT_EQ(first.input.getReadPointer(0)[0], 0.0f);
    EXPECT_FLOAT_EQ(first.input.getReadPointer(1)[0], 0.2f);
}

TEST_F(PipelineWorkflowTest, UnalignedEpochAndExport) {
    for (int k = 0; k < 4; ++k) {
        writeTone(testDir / "train" / "noise" / ("n" + std::to_string(k) + ".wav"), 100.0 + 50.0 * k, 3.0, 16000);
    }
    writeTone(testDir / "train" / "speech" / "s0.wav", 300.0, 3.0, 16000);
    writeTone(testDir / "train" / "speech" / "s1.wav", 600.0, 4.0, 16000);

    Data::UnalignedDataset::Config config;
    config.root = testDir;
    config.target = "speech";
    config.interferences = {"noise"};
    config.seqDuration = 1.0;
    config.sampleRate = 16000;
    config.numSamples = 10;
    config.augmentations = DSP::Compose::fromNames({"gain", "channelswap"});
    config.seed = 1;
    Data::UnalignedDataset dataset(config);

    Data::BatchLoader::Config loaderConfig;
    loaderConfig.batchSize = 4;
    loaderConfig.seed = 1;
    Data::BatchLoader loader(dataset, loaderConfig);

    std::vector<Data::Example> batch;
    size_t total = 0;
    while (loader.next(batch)) {
        for (const auto& example : batch) {
            ASSERT_EQ(example.input.getNumSamples(), 16000);
            ASSERT_TRUE(example.input.hasSameShape(example.target));
        }
        total += batch.size();
    }
    EXPECT_EQ(total, 10u);
    EXPECT_EQ(dataset.getFailureCount(), 0u);

    // Export one example and read it back
    const fs::path exportDir = testDir / "export";
    fs::create_directories(exportDir);
    DSP::WavFileAccessor writer;
    Data::Example example = dataset.get(0);
    ASSERT_TRUE(writer.save(exportDir / "0x.wav", example.input, example.sampleRate, 32));
    ASSERT_TRUE(writer.save(exportDir / "0y.wav", example.target, example.sampleRate, 32));

    Core::AudioBuffer reloaded = writer.load(exportDir / "0y.wav");
    ASSERT_TRUE(reloaded.hasSameShape(example.target));
    EXPECT_FLOAT_EQ(reloaded.getReadPointer(1)[1234], example.target.getReadPointer(1)[1234]);
}

TEST_F(PipelineWorkflowTest, MixedSourcesTrainAndValid) {
    for (const std::string split : {"train", "valid"}) {
        for (int k = 0; k < 3; ++k) {
            const fs::path track = testDir / split / ("track" + std::to_string(k));
            writeTone(track / "vocals.wav", 440.0 + k, 2.5, 22050);
            writeTone(track / "bass.wav", 55.0 + k, 2.5, 22050);
            writeTone(track / "drums.wav", 110.0 + k, 2.5, 22050);
        }
    }

    Data::MixedSourcesDataset::Config config;
    config.root = testDir;
    config.seqDuration = 1.5;
    config.augmentations = DSP::Compose::fromNames({"gain"});
    config.seed = 3;
    Data::MixedSourcesDataset train(config);

    config.split = "valid";
    config.seqDuration = 0.0;
    Data::MixedSourcesDataset valid(config);

    for (size_t i = 0; i < train.size(); ++i) {
        Data::Example example = train.get(i);
        EXPECT_EQ(example.input.getNumSamples(), 33075);
    }

    // Full-length evaluation, no augmentation
    Data::Example example = valid.get(2);
    EXPECT_EQ(example.input.getNumSamples(), static_cast<int>(2.5 * 22050));
    EXPECT_FLOAT_EQ(example.target.getReadPointer(1)[0], 0.2f);
    EXPECT_FLOAT_EQ(example.input.getReadPointer(1)[0], 0.6f);
}

TEST_F(PipelineWorkflowTest, CorpusTrainingAndValidation) {
    const char* sources[] = {"vocals", "drums", "bass", "other"};
    for (const char* track : {"Artist A - One", "Artist B - Two", "Triviul - Angelsaint"}) {
        double frequency = 200.0;
        for (const char* source : sources) {
            writeTone(testDir / "train" / track / (std::string(source) + ".wav"), frequency, 3.0, 22050);
            frequency *= 1.5;
        }
    }

    Data::FolderCorpus::Config corpusConfig;
    corpusConfig.root = testDir;
    corpusConfig.split = "train";
    auto trainCorpus = std::make_shared<Data::FolderCorpus>(corpusConfig);
    corpusConfig.split = "valid";
    auto validCorpus = std::make_shared<Data::FolderCorpus>(corpusConfig);

    Data::CorpusDataset::Config config;
    config.target = "vocals";
    config.seqDuration = 1.0;
    config.samplesPerTrack = 3;
    config.augmentations = DSP::Compose::fromNames({"channelswap", "gain"});
    config.randomTrackMix = true;
    Data::CorpusDataset train(config, trainCorpus);
    EXPECT_EQ(train.size(), 6u);

    Data::BatchLoader::Config loaderConfig;
    loaderConfig.batchSize = 4;
    Data::BatchLoader loader(train, loaderConfig);
    EXPECT_EQ(loader.getNumBatches(), 2u);

    std::vector<Data::Example> batch;
    while (loader.next(batch)) {
        for (const auto& example : batch) {
            EXPECT_EQ(example.input.getNumSamples(), 22050);
            EXPECT_TRUE(example.input.hasSameShape(example.target));
        }
    }

    Data::CorpusDataset::Config validConfig;
    validConfig.target = "vocals";
    validConfig.split = "valid";
    validConfig.samplesPerTrack = 1;
    validConfig.seqDuration = 0.0;
    Data::CorpusDataset valid(validConfig, validCorpus);

    ASSERT_EQ(valid.size(), 1u);
    Data::Example example = valid.get(0);
    EXPECT_EQ(example.input.getNumSamples(), 3 * 22050);
    // Linear mixture stands in for the missing mastered mix
    EXPECT_NEAR(example.input.getReadPointer(1)[0], 0.8f, 1e-5f);
    EXPECT_FLOAT_EQ(example.target.getReadPointer(1)[0], 0.2f);
}
