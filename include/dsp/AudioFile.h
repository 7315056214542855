#pragma once

#include "core/AudioBuffer.h"
#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace StemMix {
namespace DSP {

/**
 * @brief Metadata returned by AudioAccessor::probe()
 */
struct TrackMetadata {
    int sampleRate = 0;
    int numChannels = 0;
    int64_t totalSamples = 0;
    double durationSeconds = 0.0;
};

/**
 * @brief Frame-major samples, shape (samples, channels)
 *
 * The convention used by corpus providers; convert with toChannelMajor().
 */
struct InterleavedAudio {
    int sampleRate = 0;
    int numChannels = 0;
    int64_t numFrames = 0;
    std::vector<float> samples;
};

/**
 * @brief Transpose frame-major audio into a channel-major buffer
 */
Core::AudioBuffer toChannelMajor(const InterleavedAudio& audio);

/**
 * @brief Uniform probe/load interface over an audio decoding backend
 */
class AudioAccessor {
public:
    virtual ~AudioAccessor() = default;

    /**
     * @brief Read sample rate, channel count and length without decoding
     * @throws Core::UnreadableFileError if the file cannot be opened or
     *         holds no audio stream
     */
    virtual TrackMetadata probe(const std::filesystem::path& path) const = 0;

    /**
     * @brief Read a time window as frame-major samples
     *
     * A missing duration reads to the end of file. A window reaching past
     * the end returns only the available frames; callers validate length.
     *
     * @throws Core::UnreadableFileError if probing the file fails
     * @throws Core::DecodeError on corrupt data inside the window
     */
    virtual InterleavedAudio loadInterleaved(const std::filesystem::path& path,
                                             double startSeconds = 0.0,
                                             std::optional<double> durationSeconds = std::nullopt) const = 0;

    /**
     * @brief Read a time window as a channel-major buffer
     */
    Core::AudioBuffer load(const std::filesystem::path& path,
                           double startSeconds = 0.0,
                           std::optional<double> durationSeconds = std::nullopt) const;
};

/**
 * @brief RIFF/WAVE reader/writer
 *
 * Reads PCM 8/16/24/32-bit and IEEE float 32/64-bit, including
 * WAVE_FORMAT_EXTENSIBLE, seeking straight to the requested frame.
 * Writes 16/24-bit PCM and 32-bit float.
 */
class WavFileAccessor : public AudioAccessor {
public:
    WavFileAccessor() = default;

    TrackMetadata probe(const std::filesystem::path& path) const override;

    InterleavedAudio loadInterleaved(const std::filesystem::path& path,
                                     double startSeconds = 0.0,
                                     std::optional<double> durationSeconds = std::nullopt) const override;

    /**
     * @brief Save audio buffer to file
     * @param filepath Output path
     * @param buffer Audio data to write
     * @param sampleRate Sample rate
     * @param bitDepth Bit depth (16, 24, or 32)
     * @return true if successful
     */
    bool save(const std::filesystem::path& filepath,
              const Core::AudioBuffer& buffer,
              int sampleRate,
              int bitDepth = 16) const;

    /**
     * @brief Log every windowed read and every save to stdout
     */
    void setVerbose(bool verbose) { verbose_ = verbose; }

    /**
     * @brief True if the extension is .wav, in any case
     */
    static bool isWavPath(const std::filesystem::path& filepath);

private:
    bool verbose_ = false;
};

/**
 * @brief The statically selected backend, a shared WavFileAccessor
 */
std::shared_ptr<const AudioAccessor> makeDefaultAccessor();

} // namespace DSP
} // namespace StemMix
