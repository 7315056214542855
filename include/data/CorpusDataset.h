#pragma once

#include "data/Corpus.h"
#include "data/Dataset.h"
#include "dsp/Augmentations.h"
#include <memory>
#include <string>
#include <vector>

namespace StemMix {
namespace Data {

/**
 * @brief Samples excerpts from a curated corpus with replacement
 *
 * Training assembles a custom mix: every native source is read from an
 * excerpt of the track (or, with randomTrackMix, of an independently drawn
 * track), augmented and summed. The target is the named source or, for any
 * other name, the mix minus vocals. Each track yields samplesPerTrack
 * examples per pass.
 *
 * Other splits deterministically return the full track mixture and the
 * corpus target, without mixing or augmentation.
 */
class CorpusDataset : public Dataset {
public:
    struct Config {
        std::string target = "vocals";
        std::string split = "train";
        double seqDuration = 6.0;           ///< Seconds; <= 0 loads full tracks
        size_t samplesPerTrack = 64;
        DSP::Compose augmentations;         ///< Applied per source, train split only
        bool randomTrackMix = false;
        uint32_t seed = 42;
    };

    CorpusDataset(Config config, std::shared_ptr<Corpus> corpus);

    size_t size() const override { return corpus_->getTracks().size() * config_.samplesPerTrack; }
    std::string getName() const override { return "CorpusDataset"; }

protected:
    Example loadExample(size_t index) override;

private:
    Example loadTrainingExample(CorpusTrack& track);
    Example loadFullTrack(CorpusTrack& track);

    Config config_;
    bool training_;
    std::shared_ptr<Corpus> corpus_;
    std::vector<std::string> sourceNames_;
    ExcerptSampler sampler_;
};

} // namespace Data
} // namespace StemMix
