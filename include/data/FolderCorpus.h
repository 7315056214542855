#pragma once

#include "data/Corpus.h"
#include "dsp/AudioFile.h"
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

namespace StemMix {
namespace Data {

/**
 * @brief Curated corpus read from a MUSDB18-style WAV folder tree
 *
 *   root/train/<track>/{mixture,vocals,drums,bass,other}.wav
 *   root/test/<track>/...
 *
 * The train subset is split into "train" and "valid" by a list of validation
 * track names; the test subset ignores the split. Besides the native sources,
 * targets include "accompaniment" (every source but vocals) and
 * "linear_mixture" (every source). A track without mixture.wav uses the
 * linear mixture instead. Track durations are probed once at construction.
 */
class FolderCorpus : public Corpus {
public:
    /**
     * @brief The 14 MUSDB18 training tracks held out for validation
     */
    static std::vector<std::string> defaultValidationTracks();

    struct Config {
        std::filesystem::path root;
        std::string subset = "train";
        std::string split = "train";        ///< "train", "valid" or empty for all
        std::vector<std::string> validationTracks = defaultValidationTracks();
        std::vector<std::string> sources{"vocals", "drums", "bass", "other"};
    };

    explicit FolderCorpus(Config config,
                          std::shared_ptr<const DSP::AudioAccessor> accessor = nullptr);

    const std::vector<std::shared_ptr<CorpusTrack>>& getTracks() const override { return tracks_; }
    std::vector<std::string> getSourceNames() const override { return config_.sources; }
    std::vector<std::string> getTargetNames() const override;

private:
    Config config_;
    std::vector<std::shared_ptr<CorpusTrack>> tracks_;
};

} // namespace Data
} // namespace StemMix
