#include "core/Errors.h"
#include "data/AlignedDataset.h"
#include "data/BatchLoader.h"
#include "data/CorpusDataset.h"
#include "data/FolderCorpus.h"
#include "data/MixedSourcesDataset.h"
#include "data/UnalignedDataset.h"
#include "dsp/AudioFile.h"

#include <algorithm>
#include <chrono>
#include <filesystem>
#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

using namespace StemMix;

namespace {

struct Options {
    std::string dataset = "musdb";
    std::string root;
    std::string target = "vocals";
    double seqDuration = 5.0;
    size_t batchSize = 16;
    bool save = false;
    bool verbose = false;
    std::string saveDir = "test";
    size_t saveCount = 16;
    std::optional<uint32_t> seed;

    // unaligned
    std::vector<std::string> interferences{"noise"};
    // aligned
    std::string inputFile = "mixture.wav";
    std::string outputFile = "vocals.wav";
    // mixedsources
    std::vector<std::string> interferers{"bass.wav", "drums.wav"};
    std::string targetFile = "vocals.wav";
    // musdb
    size_t samplesPerTrack = 64;
};

void printUsage(const char* program) {
    std::cout << "Usage: " << program << " [options]\n";
    std::cout << "Options:\n";
    std::cout << "  --dataset NAME             musdb | aligned | unaligned | mixedsources (default musdb)\n";
    std::cout << "  --root PATH                Root path of the dataset\n";
    std::cout << "  --target NAME              Target source (default vocals)\n";
    std::cout << "  --seq-dur SECONDS          Excerpt duration, <= 0 loads full audio (default 5.0)\n";
    std::cout << "  --batch-size N             Batch size (default 16)\n";
    std::cout << "  --seed N                   Seed for the dataset generators\n";
    std::cout << "  --save                     Write out a fixed set of training examples\n";
    std::cout << "  --save-dir PATH            Where --save writes (default test)\n";
    std::cout << "  --save-count N             How many examples --save writes (default 16)\n";
    std::cout << "  --verbose                  Log every audio file read and write\n";
    std::cout << "  --interferences A B ...    unaligned: interference folders\n";
    std::cout << "  --input-file NAME          aligned: input file name or pattern\n";
    std::cout << "  --output-file NAME         aligned: output file name or pattern\n";
    std::cout << "  --interferers A B ...      mixedsources: interferer file names\n";
    std::cout << "  --target-file NAME         mixedsources: target file name\n";
    std::cout << "  --samples-per-track N      musdb: excerpts per track and epoch (default 64)\n";
    std::cout << "  --help                     Show this help\n";
}

// Consumes values up to the next "--" option
std::vector<std::string> takeList(int argc, char* argv[], int& i) {
    std::vector<std::string> values;
    while (i + 1 < argc && std::string(argv[i + 1]).rfind("--", 0) != 0) {
        values.emplace_back(argv[++i]);
    }
    return values;
}

bool parseArgs(int argc, char* argv[], Options& options) {
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        auto value = [&]() -> std::string {
            if (i + 1 >= argc) {
                throw std::invalid_argument("Missing value for " + arg);
            }
            return argv[++i];
        };

        if (arg == "--help") {
            return false;
        } else if (arg == "--dataset") {
            options.dataset = value();
        } else if (arg == "--root") {
            options.root = value();
        } else if (arg == "--target") {
            options.target = value();
        } else if (arg == "--seq-dur") {
            options.seqDuration = std::stod(value());
        } else if (arg == "--batch-size") {
            options.batchSize = std::stoul(value());
        } else if (arg == "--seed") {
            options.seed = static_cast<uint32_t>(std::stoul(value()));
        } else if (arg == "--save") {
            options.save = true;
        } else if (arg == "--verbose") {
            options.verbose = true;
        } else if (arg == "--save-dir") {
            options.saveDir = value();
        } else if (arg == "--save-count") {
            options.saveCount = std::stoul(value());
        } else if (arg == "--interferences") {
            options.interferences = takeList(argc, argv, i);
        } else if (arg == "--input-file") {
            options.inputFile = value();
        } else if (arg == "--output-file") {
            options.outputFile = value();
        } else if (arg == "--interferers") {
            options.interferers = takeList(argc, argv, i);
        } else if (arg == "--target-file") {
            options.targetFile = value();
        } else if (arg == "--samples-per-track") {
            options.samplesPerTrack = std::stoul(value());
        } else {
            throw std::invalid_argument("Unknown option: " + arg);
        }
    }
    return true;
}

using DatasetPair = std::pair<std::unique_ptr<Data::Dataset>, std::unique_ptr<Data::Dataset>>;

DatasetPair loadDatasets(Options& options, const std::shared_ptr<const DSP::AudioAccessor>& accessor) {
    if (options.dataset == "unaligned") {
        Data::UnalignedDataset::Config config;
        config.root = options.root;
        config.seqDuration = options.seqDuration;
        config.target = options.target;
        config.interferences = options.interferences;
        config.seed = options.seed;

        Data::UnalignedDataset::Config validConfig = config;
        config.split = "train";
        validConfig.split = "valid";
        return {std::make_unique<Data::UnalignedDataset>(config, accessor),
                std::make_unique<Data::UnalignedDataset>(validConfig, accessor)};
    }

    if (options.dataset == "aligned") {
        // The output file names the target
        options.target = std::filesystem::path(options.outputFile).stem().string();

        Data::AlignedDataset::Config config;
        config.root = options.root;
        config.seqDuration = options.seqDuration;
        config.inputFile = options.inputFile;
        config.outputFile = options.outputFile;
        config.seed = options.seed;

        Data::AlignedDataset::Config validConfig = config;
        config.split = "train";
        validConfig.split = "valid";
        return {std::make_unique<Data::AlignedDataset>(config, accessor),
                std::make_unique<Data::AlignedDataset>(validConfig, accessor)};
    }

    if (options.dataset == "mixedsources") {
        Data::MixedSourcesDataset::Config config;
        config.root = options.root;
        config.seqDuration = options.seqDuration;
        config.interferers = options.interferers;
        config.targetFile = options.targetFile;
        config.seed = options.seed;

        Data::MixedSourcesDataset::Config validConfig = config;
        config.split = "train";
        validConfig.split = "valid";
        return {std::make_unique<Data::MixedSourcesDataset>(config, accessor),
                std::make_unique<Data::MixedSourcesDataset>(validConfig, accessor)};
    }

    if (options.dataset == "musdb") {
        Data::FolderCorpus::Config corpusConfig;
        corpusConfig.root = options.root;
        corpusConfig.subset = "train";

        corpusConfig.split = "train";
        auto trainCorpus = std::make_shared<Data::FolderCorpus>(corpusConfig, accessor);
        corpusConfig.split = "valid";
        auto validCorpus = std::make_shared<Data::FolderCorpus>(corpusConfig, accessor);

        Data::CorpusDataset::Config config;
        config.target = options.target;
        config.split = "train";
        config.samplesPerTrack = options.samplesPerTrack;
        config.seqDuration = options.seqDuration;
        config.augmentations = DSP::Compose::fromNames({"channelswap", "gain"});
        config.randomTrackMix = true;
        if (options.seed) {
            config.seed = *options.seed;
        }

        Data::CorpusDataset::Config validConfig;
        validConfig.target = options.target;
        validConfig.split = "valid";
        validConfig.samplesPerTrack = 1;
        validConfig.seqDuration = 0.0;
        validConfig.seed = config.seed;

        return {std::make_unique<Data::CorpusDataset>(config, trainCorpus),
                std::make_unique<Data::CorpusDataset>(validConfig, validCorpus)};
    }

    throw Core::ConfigurationError("Unknown dataset: " + options.dataset);
}

void saveExamples(Data::Dataset& dataset, const Options& options) {
    std::filesystem::create_directories(options.saveDir);
    DSP::WavFileAccessor writer;
    writer.setVerbose(options.verbose);

    const size_t count = std::min(options.saveCount, dataset.size());
    for (size_t k = 0; k < count; ++k) {
        const Data::Example example = dataset.get(k);
        const auto base = std::filesystem::path(options.saveDir) / std::to_string(k);
        if (!writer.save(base.string() + "x.wav", example.input, example.sampleRate, 16) ||
            !writer.save(base.string() + "y.wav", example.target, example.sampleRate, 16)) {
            throw std::runtime_error("Could not write example " + std::to_string(k));
        }
    }

    std::cout << "[stemmix-data] Saved " << count << " examples to " << options.saveDir << "\n";
}

void drain(Data::Dataset& dataset, const Options& options) {
    Data::BatchLoader::Config loaderConfig;
    loaderConfig.batchSize = options.batchSize;
    loaderConfig.seed = options.seed;
    Data::BatchLoader loader(dataset, loaderConfig);

    const size_t numBatches = loader.getNumBatches();
    const auto start = std::chrono::steady_clock::now();

    std::vector<Data::Example> batch;
    size_t done = 0;
    while (loader.next(batch)) {
        ++done;
        if (done % 10 == 0 || done == numBatches) {
            const double elapsed = std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();
            std::cout << "\r[stemmix-data] batch " << done << "/" << numBatches
                      << " (" << elapsed / done << " s/batch)" << std::flush;
        }
    }
    std::cout << "\n[stemmix-data] " << dataset.getFailureCount() << " examples retried\n";
}

} // namespace

int main(int argc, char* argv[]) {
    Options options;

    try {
        if (!parseArgs(argc, argv, options)) {
            printUsage(argv[0]);
            return 0;
        }
    } catch (const std::exception& e) {
        std::cerr << e.what() << "\n";
        printUsage(argv[0]);
        return 2;
    }

    if (options.root.empty()) {
        std::cerr << "--root is required\n";
        printUsage(argv[0]);
        return 2;
    }

    try {
        auto accessor = std::make_shared<DSP::WavFileAccessor>();
        accessor->setVerbose(options.verbose);

        auto datasets = loadDatasets(options, accessor);
        Data::Dataset& train = *datasets.first;
        Data::Dataset& valid = *datasets.second;

        std::cout << "[stemmix-data] " << options.dataset << ", target " << options.target
                  << ": " << train.size() << " train / " << valid.size() << " valid examples\n";

        if (options.save) {
            saveExamples(train, options);
        }

        drain(train, options);
    } catch (const Core::DatasetError& e) {
        std::cerr << "[stemmix-data] " << e.what() << "\n";
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "[stemmix-data] Unexpected error: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
