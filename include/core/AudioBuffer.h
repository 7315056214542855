#pragma once

#include <vector>
#include <memory>
#include <cstring>
#include <algorithm>

namespace StemMix {
namespace Core {

/**
 * @brief Channel-major multi-channel waveform, shape (channels, samples)
 *
 * Every stem, mixture and target handed around the data pipeline is one of
 * these. Buffers are move-only; use clone() for an explicit deep copy.
 */
class AudioBuffer {
public:
    /**
     * @brief Construct a zeroed buffer with the given channels and samples
     *
     * A zero-length buffer is valid (a window read past the end of a file).
     */
    AudioBuffer(int numChannels, int numSamples);

    ~AudioBuffer();

    // Move semantics
    AudioBuffer(AudioBuffer&& other) noexcept;
    AudioBuffer& operator=(AudioBuffer&& other) noexcept;

    // Disable copying (use clone() instead)
    AudioBuffer(const AudioBuffer&) = delete;
    AudioBuffer& operator=(const AudioBuffer&) = delete;

    int getNumChannels() const { return numChannels_; }
    int getNumSamples() const { return numSamples_; }

    /**
     * @brief True if both buffers have identical (channels, samples)
     */
    bool hasSameShape(const AudioBuffer& other) const {
        return numChannels_ == other.numChannels_ && numSamples_ == other.numSamples_;
    }

    const float* getReadPointer(int channel) const;
    float* getWritePointer(int channel);

    /**
     * @brief Copy one channel of another buffer into a channel of this one
     */
    void copyFrom(const AudioBuffer& source, int destChannel, int sourceChannel);

    /**
     * @brief Add one channel of another buffer, scaled by gain
     */
    void addFrom(const AudioBuffer& source, int destChannel, int sourceChannel, float gain = 1.0f);

    /**
     * @brief Sample-wise accumulate a whole buffer of the same shape
     * @param gain Use -1 to subtract
     */
    void add(const AudioBuffer& other, float gain = 1.0f);

    /**
     * @brief Multiply every sample of every channel by gain
     */
    void applyGain(float gain);

    /**
     * @brief Deep copy of this buffer
     */
    AudioBuffer clone() const;

    /**
     * @brief Deep copy with the channel order reversed
     */
    AudioBuffer withReversedChannels() const;

    /**
     * @brief Deep copy of the first numSamples samples of every channel
     */
    AudioBuffer cropped(int numSamples) const;

private:
    int numChannels_;
    int numSamples_;
    std::vector<float*> channels_;
    std::unique_ptr<float[]> data_;

    void allocate();
    void deallocate();
};

} // namespace Core
} // namespace StemMix
