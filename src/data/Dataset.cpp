#include "data/Dataset.h"
#include "core/Errors.h"
#include <iostream>

namespace StemMix {
namespace Data {

Dataset::Dataset(std::optional<uint32_t> seed) {
    if (seed) {
        rng_.reseed(*seed);
    }
}

Example Dataset::get(size_t index) {
    const size_t count = size();
    if (index >= count) {
        throw std::out_of_range(getName() + " index " + std::to_string(index) +
                                " out of range (size " + std::to_string(count) + ")");
    }

    const size_t requested = index;
    for (int attempt = 0; attempt <= maxRetries_; ++attempt) {
        try {
            return loadExample(index);
        } catch (const Core::ExampleError& e) {
            ++failures_;
            std::cerr << "[" << getName() << "] error in index " << index << ": " << e.what() << std::endl;
        }

        if (index > 0) {
            --index;
        } else if (count > 1) {
            ++index;
        }
    }

    throw Core::NoUsableExampleError(getName() + ": no usable example near index " +
                                     std::to_string(requested) + " after " +
                                     std::to_string(maxRetries_ + 1) + " attempts");
}

} // namespace Data
} // namespace StemMix
