#include "dsp/AudioFile.h"
#include "core/Errors.h"
#include <fstream>
#include <iostream>
#include <cstring>
#include <cmath>
#include <algorithm>
#include <cctype>

namespace StemMix {
namespace DSP {

namespace {

// Canonical 44-byte header, used for writing only
struct WAVHeader {
    char riff[4];           // "RIFF"
    uint32_t fileSize;      // Total file size - 8
    char wave[4];           // "WAVE"
    char fmt[4];            // "fmt "
    uint32_t fmtSize;       // Format chunk size
    uint16_t audioFormat;   // Audio format (1 = PCM, 3 = float)
    uint16_t numChannels;   // Number of channels
    uint32_t sampleRate;    // Sample rate
    uint32_t byteRate;      // Byte rate
    uint16_t blockAlign;    // Block align
    uint16_t bitsPerSample; // Bits per sample
    char data[4];           // "data"
    uint32_t dataSize;      // Data chunk size
};

constexpr uint16_t kFormatPCM = 1;
constexpr uint16_t kFormatFloat = 3;
constexpr uint16_t kFormatExtensible = 0xFFFE;

// What probe() learns from the fmt and data chunks
struct WavLayout {
    uint16_t audioFormat = 0;
    uint16_t numChannels = 0;
    uint32_t sampleRate = 0;
    uint16_t blockAlign = 0;
    uint16_t bitsPerSample = 0;
    std::streamoff dataOffset = 0;
    uint32_t dataSize = 0;

    int64_t totalFrames() const { return blockAlign ? dataSize / blockAlign : 0; }
};

uint16_t readU16(const unsigned char* p) {
    return static_cast<uint16_t>(p[0] | (p[1] << 8));
}

uint32_t readU32(const unsigned char* p) {
    return static_cast<uint32_t>(p[0]) |
           (static_cast<uint32_t>(p[1]) << 8) |
           (static_cast<uint32_t>(p[2]) << 16) |
           (static_cast<uint32_t>(p[3]) << 24);
}

WavLayout readLayout(std::ifstream& file, const std::filesystem::path& path) {
    unsigned char riff[12];
    if (!file.read(reinterpret_cast<char*>(riff), sizeof(riff)) ||
        std::memcmp(riff, "RIFF", 4) != 0 ||
        std::memcmp(riff + 8, "WAVE", 4) != 0) {
        throw Core::UnreadableFileError("Invalid WAV file: " + path.string());
    }

    WavLayout layout;
    bool haveFmt = false;
    bool haveData = false;

    // Walk chunks; LIST, fact and friends are skipped
    unsigned char chunk[8];
    while (!(haveFmt && haveData) && file.read(reinterpret_cast<char*>(chunk), sizeof(chunk))) {
        const uint32_t chunkSize = readU32(chunk + 4);
        const std::streamoff bodyStart = file.tellg();

        if (std::memcmp(chunk, "fmt ", 4) == 0) {
            if (chunkSize < 16) {
                throw Core::UnreadableFileError("Truncated fmt chunk: " + path.string());
            }
            unsigned char fmt[40] = {};
            const std::streamsize toRead = std::min<std::streamsize>(chunkSize, sizeof(fmt));
            if (!file.read(reinterpret_cast<char*>(fmt), toRead)) {
                throw Core::UnreadableFileError("Truncated fmt chunk: " + path.string());
            }
            layout.audioFormat = readU16(fmt);
            layout.numChannels = readU16(fmt + 2);
            layout.sampleRate = readU32(fmt + 4);
            layout.blockAlign = readU16(fmt + 12);
            layout.bitsPerSample = readU16(fmt + 14);
            if (layout.audioFormat == kFormatExtensible && toRead >= 26) {
                // First two bytes of the sub-format GUID carry the real tag
                layout.audioFormat = readU16(fmt + 24);
            }
            haveFmt = true;
        } else if (std::memcmp(chunk, "data", 4) == 0) {
            layout.dataOffset = bodyStart;
            layout.dataSize = chunkSize;
            haveData = true;
        }

        // Chunks are padded to an even size
        const std::streamoff next = bodyStart + chunkSize + (chunkSize & 1);
        file.clear();
        file.seekg(next);
    }

    if (!haveFmt || !haveData) {
        throw Core::UnreadableFileError("No audio stream in " + path.string());
    }
    if (layout.numChannels == 0 || layout.sampleRate == 0 || layout.blockAlign == 0) {
        throw Core::UnreadableFileError("Invalid WAV format header: " + path.string());
    }

    const bool pcm = layout.audioFormat == kFormatPCM &&
                     (layout.bitsPerSample == 8 || layout.bitsPerSample == 16 ||
                      layout.bitsPerSample == 24 || layout.bitsPerSample == 32);
    const bool ieee = layout.audioFormat == kFormatFloat &&
                      (layout.bitsPerSample == 32 || layout.bitsPerSample == 64);
    if (!pcm && !ieee) {
        throw Core::UnreadableFileError("Unsupported WAV encoding (format " +
                                        std::to_string(layout.audioFormat) + ", " +
                                        std::to_string(layout.bitsPerSample) + " bit): " +
                                        path.string());
    }
    if (layout.blockAlign != layout.numChannels * (layout.bitsPerSample / 8)) {
        throw Core::UnreadableFileError("Inconsistent block alignment: " + path.string());
    }

    return layout;
}

WavLayout openLayout(std::ifstream& file, const std::filesystem::path& path) {
    file.open(path, std::ios::binary);
    if (!file.is_open()) {
        throw Core::UnreadableFileError("Failed to open: " + path.string());
    }
    return readLayout(file, path);
}

float decodeSample(const unsigned char* p, const WavLayout& layout) {
    if (layout.audioFormat == kFormatFloat) {
        if (layout.bitsPerSample == 32) {
            float value;
            std::memcpy(&value, p, sizeof(value));
            return value;
        }
        double value;
        std::memcpy(&value, p, sizeof(value));
        return static_cast<float>(value);
    }

    switch (layout.bitsPerSample) {
        case 8:
            return (static_cast<int>(p[0]) - 128) / 128.0f;
        case 16:
            return static_cast<int16_t>(readU16(p)) / 32768.0f;
        case 24: {
            int32_t sample = (p[2] << 16) | (p[1] << 8) | p[0];
            // Sign extend
            if (sample & 0x800000) {
                sample |= static_cast<int32_t>(0xFF000000);
            }
            return sample / 8388608.0f;
        }
        default:
            return static_cast<float>(static_cast<int32_t>(readU32(p)) / 2147483648.0);
    }
}

} // namespace

Core::AudioBuffer toChannelMajor(const InterleavedAudio& audio) {
    Core::AudioBuffer buffer(std::max(audio.numChannels, 1), static_cast<int>(audio.numFrames));
    for (int ch = 0; ch < audio.numChannels; ++ch) {
        float* channelData = buffer.getWritePointer(ch);
        for (int64_t i = 0; i < audio.numFrames; ++i) {
            channelData[i] = audio.samples[i * audio.numChannels + ch];
        }
    }
    return buffer;
}

Core::AudioBuffer AudioAccessor::load(const std::filesystem::path& path,
                                      double startSeconds,
                                      std::optional<double> durationSeconds) const {
    return toChannelMajor(loadInterleaved(path, startSeconds, durationSeconds));
}

std::shared_ptr<const AudioAccessor> makeDefaultAccessor() {
    return std::make_shared<WavFileAccessor>();
}

TrackMetadata WavFileAccessor::probe(const std::filesystem::path& path) const {
    std::ifstream file;
    const WavLayout layout = openLayout(file, path);

    TrackMetadata info;
    info.sampleRate = static_cast<int>(layout.sampleRate);
    info.numChannels = layout.numChannels;
    info.totalSamples = layout.totalFrames();
    info.durationSeconds = static_cast<double>(info.totalSamples) / info.sampleRate;
    return info;
}

InterleavedAudio WavFileAccessor::loadInterleaved(const std::filesystem::path& path,
                                                  double startSeconds,
                                                  std::optional<double> durationSeconds) const {
    std::ifstream file;
    const WavLayout layout = openLayout(file, path);
    const int64_t totalFrames = layout.totalFrames();

    // Start is floored, length is rounded to the nearest frame
    const int64_t startFrame = std::clamp<int64_t>(
        static_cast<int64_t>(std::floor(std::max(startSeconds, 0.0) * layout.sampleRate)),
        0, totalFrames);
    int64_t numFrames = totalFrames - startFrame;
    if (durationSeconds) {
        numFrames = std::min<int64_t>(numFrames, std::llround(*durationSeconds * layout.sampleRate));
    }
    numFrames = std::max<int64_t>(numFrames, 0);

    InterleavedAudio audio;
    audio.sampleRate = static_cast<int>(layout.sampleRate);
    audio.numChannels = layout.numChannels;
    audio.numFrames = numFrames;
    audio.samples.resize(static_cast<size_t>(numFrames) * layout.numChannels);

    if (numFrames == 0) {
        return audio;
    }

    const std::streamsize numBytes = static_cast<std::streamsize>(numFrames) * layout.blockAlign;
    std::vector<unsigned char> raw(static_cast<size_t>(numBytes));

    file.clear();
    file.seekg(layout.dataOffset + startFrame * layout.blockAlign);
    file.read(reinterpret_cast<char*>(raw.data()), numBytes);
    if (file.gcount() != numBytes) {
        // The header promised these bytes
        throw Core::DecodeError("Unexpected end of audio data in " + path.string() +
                                " (frame " + std::to_string(startFrame) + ")");
    }

    const int bytesPerSample = layout.bitsPerSample / 8;
    const size_t totalSamples = audio.samples.size();
    for (size_t i = 0; i < totalSamples; ++i) {
        audio.samples[i] = decodeSample(raw.data() + i * bytesPerSample, layout);
    }

    if (verbose_) {
        std::cout << "[AudioFile] Loaded: " << path.string() << " ("
                  << audio.numChannels << " ch, "
                  << audio.sampleRate << " Hz, "
                  << layout.bitsPerSample << " bit, "
                  << startSeconds << "s +" << numFrames << " frames)" << std::endl;
    }

    return audio;
}

bool WavFileAccessor::isWavPath(const std::filesystem::path& filepath) {
    std::string ext = filepath.extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return ext == ".wav";
}

bool WavFileAccessor::save(const std::filesystem::path& filepath,
                           const Core::AudioBuffer& buffer,
                           int sampleRate,
                           int bitDepth) const {
    if (!isWavPath(filepath)) {
        std::cerr << "[AudioFile] Unsupported format: " << filepath.string() << std::endl;
        return false;
    }
    if (bitDepth != 16 && bitDepth != 24 && bitDepth != 32) {
        std::cerr << "[AudioFile] Unsupported bit depth: " << bitDepth << std::endl;
        return false;
    }

    std::ofstream file(filepath, std::ios::binary);
    if (!file.is_open()) {
        std::cerr << "[AudioFile] Failed to create: " << filepath.string() << std::endl;
        return false;
    }

    int numChannels = buffer.getNumChannels();
    int numSamples = buffer.getNumSamples();
    int bytesPerSample = bitDepth / 8;
    uint32_t dataSize = static_cast<uint32_t>(numSamples) * numChannels * bytesPerSample;

    WAVHeader header;
    std::memcpy(header.riff, "RIFF", 4);
    header.fileSize = sizeof(WAVHeader) - 8 + dataSize;
    std::memcpy(header.wave, "WAVE", 4);
    std::memcpy(header.fmt, "fmt ", 4);
    header.fmtSize = 16;
    header.audioFormat = (bitDepth == 32) ? kFormatFloat : kFormatPCM;
    header.numChannels = static_cast<uint16_t>(numChannels);
    header.sampleRate = static_cast<uint32_t>(sampleRate);
    header.byteRate = sampleRate * numChannels * bytesPerSample;
    header.blockAlign = static_cast<uint16_t>(numChannels * bytesPerSample);
    header.bitsPerSample = static_cast<uint16_t>(bitDepth);
    std::memcpy(header.data, "data", 4);
    header.dataSize = dataSize;

    file.write(reinterpret_cast<const char*>(&header), sizeof(WAVHeader));

    if (bitDepth == 16) {
        std::vector<int16_t> tempBuffer(static_cast<size_t>(numSamples) * numChannels);

        // Interleave and convert to int16
        for (int i = 0; i < numSamples; ++i) {
            for (int ch = 0; ch < numChannels; ++ch) {
                float sample = buffer.getReadPointer(ch)[i];
                tempBuffer[i * numChannels + ch] = static_cast<int16_t>(std::clamp(sample, -1.0f, 1.0f) * 32767.0f);
            }
        }

        file.write(reinterpret_cast<const char*>(tempBuffer.data()), dataSize);
    } else if (bitDepth == 24) {
        std::vector<uint8_t> tempBuffer(dataSize);

        for (int i = 0; i < numSamples; ++i) {
            for (int ch = 0; ch < numChannels; ++ch) {
                float sample = std::clamp(buffer.getReadPointer(ch)[i], -1.0f, 1.0f);
                int32_t value = static_cast<int32_t>(sample * 8388607.0f);

                size_t offset = (static_cast<size_t>(i) * numChannels + ch) * 3;
                tempBuffer[offset] = value & 0xFF;
                tempBuffer[offset + 1] = (value >> 8) & 0xFF;
                tempBuffer[offset + 2] = (value >> 16) & 0xFF;
            }
        }

        file.write(reinterpret_cast<const char*>(tempBuffer.data()), dataSize);
    } else {
        std::vector<float> tempBuffer(static_cast<size_t>(numSamples) * numChannels);

        for (int i = 0; i < numSamples; ++i) {
            for (int ch = 0; ch < numChannels; ++ch) {
                tempBuffer[i * numChannels + ch] = buffer.getReadPointer(ch)[i];
            }
        }

        file.write(reinterpret_cast<const char*>(tempBuffer.data()), dataSize);
    }

    if (!file) {
        std::cerr << "[AudioFile] Write failed: " << filepath.string() << std::endl;
        return false;
    }

    if (verbose_) {
        std::cout << "[AudioFile] Saved: " << filepath.string() << " ("
                  << numChannels << " ch, "
                  << sampleRate << " Hz, "
                  << bitDepth << " bit)" << std::endl;
    }

    return true;
}

} // namespace DSP
} // namespace StemMix
