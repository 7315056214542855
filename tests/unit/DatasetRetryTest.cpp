#include <gtest/gtest.h>
#include "data/Dataset.h"
#include "core/Errors.h"
#include <set>
#include <stdexcept>
#include <vector>

using namespace StemMix::Data;
using namespace StemMix::Core;

namespace {

// Fails with a chosen error for a chosen set of indices, records every attempt
class ScriptedDataset : public Dataset {
public:
    ScriptedDataset(size_t size, std::set<size_t> broken)
        : Dataset(std::nullopt), size_(size), broken_(std::move(broken)) {}

    size_t size() const override { return size_; }
    std::string getName() const override { return "ScriptedDataset"; }

    bool fatal = false;
    std::vector<size_t> attempts;

protected:
    Example loadExample(size_t index) override {
        attempts.push_back(index);
        if (broken_.count(index)) {
            if (fatal) {
                throw UnreadableFileError("unreadable " + std::to_string(index));
            }
            throw DecodeError("corrupt " + std::to_string(index));
        }
        AudioBuffer input(1, 4);
        input.getWritePointer(0)[0] = static_cast<float>(index);
        AudioBuffer target = input.clone();
        return {std::move(input), std::move(target), 8000};
    }

private:
    size_t size_;
    std::set<size_t> broken_;
};

} // namespace

TEST(DatasetRetryTest, HealthyIndexLoadsOnce) {
    ScriptedDataset dataset(5, {});
    Example example = dataset.get(3);

    EXPECT_FLOAT_EQ(example.input.getReadPointer(0)[0], 3.0f);
    EXPECT_EQ(dataset.attempts, std::vector<size_t>({3}));
    EXPECT_EQ(dataset.getFailureCount(), 0u);
}

TEST(DatasetRetryTest, FallsBackToPreviousIndex) {
    ScriptedDataset dataset(5, {3});
    Example example = dataset.get(3);

    EXPECT_FLOAT_EQ(example.input.getReadPointer(0)[0], 2.0f);
    EXPECT_EQ(dataset.attempts, std::vector<size_t>({3, 2}));
    EXPECT_EQ(dataset.getFailureCount(), 1u);
}

TEST(DatasetRetryTest, IndexZeroFallsForward) {
    ScriptedDataset dataset(5, {0});
    Example example = dataset.get(0);

    EXPECT_FLOAT_EQ(example.input.getReadPointer(0)[0], 1.0f);
}

TEST(DatasetRetryTest, WalksDownThroughBrokenRun) {
    ScriptedDataset dataset(10, {7, 6, 5});
    Example example = dataset.get(7);

    EXPECT_FLOAT_EQ(example.input.getReadPointer(0)[0], 4.0f);
    EXPECT_EQ(dataset.getFailureCount(), 3u);
}

TEST(DatasetRetryTest, ExhaustedRetriesRaise) {
    ScriptedDataset dataset(3, {0, 1, 2});
    dataset.setMaxRetries(4);

    EXPECT_THROW(dataset.get(2), NoUsableExampleError);
    EXPECT_EQ(dataset.attempts.size(), 5u);
}

TEST(DatasetRetryTest, NonRecoverableErrorsPropagate) {
    ScriptedDataset dataset(3, {1});
    dataset.fatal = true;

    EXPECT_THROW(dataset.get(1), UnreadableFileError);
    EXPECT_EQ(dataset.attempts.size(), 1u);
}

TEST(DatasetRetryTest, OutOfRangeIndex) {
    ScriptedDataset dataset(3, {});
    EXPECT_THROW(dataset.get(3), std::out_of_range);
    EXPECT_TRUE(dataset.attempts.empty());
}

TEST(DatasetRetryTest, MaxRetriesClampedAtZero) {
    ScriptedDataset dataset(3, {1});
    EXPECT_EQ(dataset.getMaxRetries(), Dataset::kDefaultMaxRetries);

    dataset.setMaxRetries(-5);
    EXPECT_EQ(dataset.getMaxRetries(), 0);
    EXPECT_THROW(dataset.get(1), NoUsableExampleError);
}
