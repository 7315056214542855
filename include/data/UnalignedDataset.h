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
 * @brief Sources kept unaligned, one folder per source
 *
 *   train/noise/10923.wav --+
 *                           +--> mixed input
 *   train/vocals/1.wav -----+
 *   train/vocals/1.wav --------> output target
 *
 * Training draws a random file per folder on every call and a random
 * window per file. Evaluation takes file index % folder size from each folder
 * and reads from the start. Length is fixed by Config::numSamples and does
 * not depend on the number of files.
 */
class UnalignedDataset : public Dataset {
public:
    struct Config {
        std::filesystem::path root;
        std::string split = "train";
        double seqDuration = 0.0;           ///< Seconds; <= 0 loads full files
        std::string target = "drums";
        std::vector<std::string> interferences{"noise"};
        std::string glob = "*.wav";
        int sampleRate = 44100;             ///< Informational, never resampled
        size_t numSamples = 1000;
        DSP::Compose augmentations;         ///< Applied per stem, train split only
        std::optional<uint32_t> seed;
    };

    explicit UnalignedDataset(Config config,
                              std::shared_ptr<const DSP::AudioAccessor> accessor = nullptr);

    size_t size() const override { return config_.numSamples; }
    std::string getName() const override { return "UnalignedDataset"; }

    /**
     * @brief Source folder names; the target folder is last
     */
    const std::vector<std::string>& getSourceFolders() const { return sourceFolders_; }

    /**
     * @brief Files per source folder, in getSourceFolders() order
     */
    const std::vector<std::vector<std::filesystem::path>>& getSources() const { return sources_; }

protected:
    Example loadExample(size_t index) override;

private:
    Config config_;
    bool training_;
    std::vector<std::string> sourceFolders_;
    std::vector<std::vector<std::filesystem::path>> sources_;
    MixtureAssembler assembler_;
};

} // namespace Data
} // namespace StemMix
