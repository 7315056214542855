#pragma once

#include <cstddef>
#include <cstdint>
#include <random>

namespace StemMix {
namespace Core {

/**
 * @brief Explicitly owned pseudorandom source
 *
 * Each dataset owns one and passes it into every sampling decision, so two
 * datasets never share generator state. Draws are virtual so tests can pin
 * them to distribution endpoints.
 */
class RandomSource {
public:
    /**
     * @brief Seeded from std::random_device
     */
    RandomSource();

    explicit RandomSource(uint32_t seed);

    virtual ~RandomSource() = default;

    void reseed(uint32_t seed);

    /**
     * @brief Uniform real draw from the closed interval [low, high]
     *
     * Returns low when high <= low.
     */
    virtual double uniform(double low, double high);

    /**
     * @brief True with the given probability
     */
    virtual bool chance(double probability);

    /**
     * @brief Uniform index into a container of the given size (> 0)
     */
    virtual size_t index(size_t size);

private:
    std::mt19937 engine_;
};

} // namespace Core
} // namespace StemMix
