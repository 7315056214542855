#pragma once

#include <stdexcept>
#include <string>

namespace StemMix {
namespace Core {

/**
 * @brief Base class for every error raised by the data pipeline
 */
class DatasetError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * @brief File missing, unopenable, or not a readable audio stream
 *
 * Raised by probe(). Never retried.
 */
class UnreadableFileError : public DatasetError {
public:
    using DatasetError::DatasetError;
};

/**
 * @brief Invalid dataset construction: bad root, empty index, unknown target
 */
class ConfigurationError : public DatasetError {
public:
    using DatasetError::DatasetError;
};

/**
 * @brief A single example could not be produced
 *
 * Recoverable: the dataset logs it and retries a neighbouring index.
 */
class ExampleError : public DatasetError {
public:
    using DatasetError::DatasetError;
};

/**
 * @brief Corrupt audio data hit during a windowed read
 */
class DecodeError : public ExampleError {
public:
    using ExampleError::ExampleError;
};

/**
 * @brief Source shorter than the requested excerpt
 */
class InsufficientDurationError : public ExampleError {
public:
    using ExampleError::ExampleError;
};

/**
 * @brief Designated stem file does not exist for an index
 */
class EmptySourceError : public ExampleError {
public:
    using ExampleError::ExampleError;
};

/**
 * @brief Stems of one example disagree on channel count or sample rate
 */
class StemMismatchError : public ExampleError {
public:
    using ExampleError::ExampleError;
};

/**
 * @brief Every neighbour tried by the retry loop failed
 */
class NoUsableExampleError : public DatasetError {
public:
    using DatasetError::DatasetError;
};

} // namespace Core
} // namespace StemMix
