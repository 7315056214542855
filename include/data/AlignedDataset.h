#pragma once

#include "data/Dataset.h"
#include "data/SourceIndex.h"
#include "dsp/AudioFile.h"
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace StemMix {
namespace Data {

/**
 * @brief Track folders holding an input file and its aligned output
 *
 *   train/01/mixture.wav --> input
 *   train/01/vocals.wav ---> output target
 *   train/02/mixture.wav --> input
 *   train/02/vocals.wav ---> output target
 *
 * One example per valid folder. Input and output share one window, bounded
 * by the shorter of the two files. File names accept wildcards.
 */
class AlignedDataset : public Dataset {
public:
    struct Config {
        std::filesystem::path root;
        std::string split = "train";
        std::string inputFile = "mixture.wav";
        std::string outputFile = "vocals.wav";
        double seqDuration = 0.0;           ///< Seconds; <= 0 loads full files
        int sampleRate = 44100;             ///< Informational, never resampled
        std::optional<uint32_t> seed;
    };

    explicit AlignedDataset(Config config,
                            std::shared_ptr<const DSP::AudioAccessor> accessor = nullptr);

    size_t size() const override { return pairs_.size(); }
    std::string getName() const override { return "AlignedDataset"; }

    const std::vector<AlignedPair>& getPairs() const { return pairs_; }

protected:
    Example loadExample(size_t index) override;

private:
    Config config_;
    std::vector<AlignedPair> pairs_;
    MixtureAssembler assembler_;
};

} // namespace Data
} // namespace StemMix
