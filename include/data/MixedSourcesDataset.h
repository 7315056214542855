#pragma once

#include "data/Dataset.h"
#include "dsp/AudioFile.h"
#include "dsp/Augmentations.h"
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace StemMix {
namespace Data {

/**
 * @brief Track folders of separate stems that get mixed on the fly
 *
 *   train/01/vocals.wav --\
 *   train/01/drums.wav  --+--> mixed input
 *   train/01/bass.wav   --/
 *   train/01/vocals.wav ----> output target
 *
 * Training takes every stem from an independently drawn track folder, so
 * stems of different songs get combined. Evaluation takes all stems from
 * folder `index`. All stems share one window.
 */
class MixedSourcesDataset : public Dataset {
public:
    struct Config {
        std::filesystem::path root;
        std::string split = "train";
        std::string targetFile = "vocals.wav";
        std::vector<std::string> interferers{"bass.wav", "drums.wav"};
        double seqDuration = 0.0;           ///< Seconds; <= 0 loads full files
        int sampleRate = 44100;             ///< Informational, never resampled
        DSP::Compose augmentations;         ///< Applied per stem, train split only
        std::optional<uint32_t> seed;
    };

    explicit MixedSourcesDataset(Config config,
                                 std::shared_ptr<const DSP::AudioAccessor> accessor = nullptr);

    size_t size() const override { return tracks_.size(); }
    std::string getName() const override { return "MixedSourcesDataset"; }

    const std::vector<std::filesystem::path>& getTracks() const { return tracks_; }

protected:
    Example loadExample(size_t index) override;

private:
    Config config_;
    bool training_;
    std::vector<std::filesystem::path> tracks_;
    MixtureAssembler assembler_;
};

} // namespace Data
} // namespace StemMix
