#include "core/AudioBuffer.h"
#include <stdexcept>
#include <algorithm>

namespace StemMix {
namespace Core {

AudioBuffer::AudioBuffer(int numChannels, int numSamples)
    : numChannels_(numChannels), numSamples_(numSamples) {
    if (numChannels <= 0 || numSamples < 0) {
        throw std::invalid_argument("Invalid buffer dimensions");
    }
    allocate();
}

AudioBuffer::~AudioBuffer() {
    deallocate();
}

AudioBuffer::AudioBuffer(AudioBuffer&& other) noexcept
    : numChannels_(other.numChannels_),
      numSamples_(other.numSamples_),
      channels_(std::move(other.channels_)),
      data_(std::move(other.data_)) {
    other.numChannels_ = 0;
    other.numSamples_ = 0;
}

AudioBuffer& AudioBuffer::operator=(AudioBuffer&& other) noexcept {
    if (this != &other) {
        deallocate();
        numChannels_ = other.numChannels_;
        numSamples_ = other.numSamples_;
        channels_ = std::move(other.channels_);
        data_ = std::move(other.data_);
        other.numChannels_ = 0;
        other.numSamples_ = 0;
    }
    return *this;
}

const float* AudioBuffer::getReadPointer(int channel) const {
    if (channel < 0 || channel >= numChannels_) {
        throw std::out_of_range("Channel index out of range");
    }
    return channels_[channel];
}

float* AudioBuffer::getWritePointer(int channel) {
    if (channel < 0 || channel >= numChannels_) {
        throw std::out_of_range("Channel index out of range");
    }
    return channels_[channel];
}

void AudioBuffer::copyFrom(const AudioBuffer& source, int destChannel, int sourceChannel) {
    if (numSamples_ != source.numSamples_) {
        throw std::invalid_argument("Buffer size mismatch");
    }

    const float* src = source.getReadPointer(sourceChannel);
    float* dst = getWritePointer(destChannel);
    std::copy_n(src, numSamples_, dst);
}

void AudioBuffer::addFrom(const AudioBuffer& source, int destChannel, int sourceChannel, float gain) {
    if (numSamples_ != source.numSamples_) {
        throw std::invalid_argument("Buffer size mismatch");
    }

    const float* src = source.getReadPointer(sourceChannel);
    float* dst = getWritePointer(destChannel);

    for (int i = 0; i < numSamples_; ++i) {
        dst[i] += src[i] * gain;
    }
}

void AudioBuffer::add(const AudioBuffer& other, float gain) {
    if (!hasSameShape(other)) {
        throw std::invalid_argument("Buffer shape mismatch");
    }

    for (int ch = 0; ch < numChannels_; ++ch) {
        addFrom(other, ch, ch, gain);
    }
}

void AudioBuffer::applyGain(float gain) {
    const size_t total = static_cast<size_t>(numChannels_) * numSamples_;
    float* data = data_.get();
    for (size_t i = 0; i < total; ++i) {
        data[i] *= gain;
    }
}

AudioBuffer AudioBuffer::clone() const {
    AudioBuffer copy(numChannels_, numSamples_);
    std::copy_n(data_.get(), static_cast<size_t>(numChannels_) * numSamples_, copy.data_.get());
    return copy;
}

AudioBuffer AudioBuffer::withReversedChannels() const {
    AudioBuffer flipped(numChannels_, numSamples_);
    for (int ch = 0; ch < numChannels_; ++ch) {
        flipped.copyFrom(*this, ch, numChannels_ - 1 - ch);
    }
    return flipped;
}

AudioBuffer AudioBuffer::cropped(int numSamples) const {
    if (numSamples < 0 || numSamples > numSamples_) {
        throw std::out_of_range("Crop length out of range");
    }

    AudioBuffer result(numChannels_, numSamples);
    for (int ch = 0; ch < numChannels_; ++ch) {
        std::copy_n(channels_[ch], numSamples, result.channels_[ch]);
    }
    return result;
}

void AudioBuffer::allocate() {
    size_t totalSamples = static_cast<size_t>(numChannels_) * numSamples_;
    data_ = std::make_unique<float[]>(totalSamples);
    std::fill_n(data_.get(), totalSamples, 0.0f);

    channels_.resize(numChannels_);
    for (int i = 0; i < numChannels_; ++i) {
        channels_[i] = data_.get() + (static_cast<size_t>(i) * numSamples_);
    }
}

void AudioBuffer::deallocate() {
    channels_.clear();
    data_.reset();
}

} // namespace Core
} // namespace StemMix
