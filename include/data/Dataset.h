#pragma once

#include "core/RandomSource.h"
#include "data/MixtureAssembler.h"
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

namespace StemMix {
namespace Data {

/**
 * @brief Index-to-example mapping over an immutable source index
 *
 * Concrete datasets build their index at construction and synthesize every
 * example on request. get() wraps loadExample() in a bounded retry policy:
 * a recoverable Core::ExampleError is logged and the neighbouring index
 * (index - 1, or index + 1 at 0) is tried instead, at most getMaxRetries()
 * times before Core::NoUsableExampleError is thrown.
 *
 * A dataset owns its RandomSource and is not safe to share between threads;
 * give each worker its own instance.
 */
class Dataset {
public:
    static constexpr int kDefaultMaxRetries = 16;

    virtual ~Dataset() = default;

    Dataset(const Dataset&) = delete;
    Dataset& operator=(const Dataset&) = delete;

    virtual size_t size() const = 0;
    virtual std::string getName() const = 0;

    /**
     * @brief Produce the example at index
     * @throws std::out_of_range if index >= size()
     * @throws Core::NoUsableExampleError when retries are exhausted
     */
    Example get(size_t index);

    void setMaxRetries(int maxRetries) { maxRetries_ = maxRetries < 0 ? 0 : maxRetries; }
    int getMaxRetries() const { return maxRetries_; }

    /**
     * @brief Examples skipped because of recoverable errors so far
     */
    size_t getFailureCount() const { return failures_; }

protected:
    explicit Dataset(std::optional<uint32_t> seed);

    virtual Example loadExample(size_t index) = 0;

    Core::RandomSource& rng() { return rng_; }

private:
    Core::RandomSource rng_;
    int maxRetries_ = kDefaultMaxRetries;
    size_t failures_ = 0;
};

} // namespace Data
} // namespace StemMix
