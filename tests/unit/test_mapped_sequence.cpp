/**
 * @file test_mapped_sequence.cpp
 * @brief Unit tests for MappedSequence
 */

#include <gtest/gtest.h>
#include <mapr/core/mapping/mapped_sequence.hpp>

#include <memory>
#include <optional>
#include <string>
#include <vector>

using namespace mapr::common;
using namespace mapr::core;

namespace {

/// Yields 0..count-1, failing at @p fail_at if given
MappedSequence<int> counting(int count, int* pulls, int fail_at = -1) {
    auto position = std::make_shared<int>(0);
    return MappedSequence<int>([=]() -> std::optional<Result<int>> {
        if (*position >= count) {
            return std::nullopt;
        }
        int value = (*position)++;
        ++*pulls;
        if (value == fail_at) {
            return Result<int>(Error(ErrorCode::TRANSFORM_FAILED, "bad " + std::to_string(value)));
        }
        return Result<int>(value);
    });
}

}  // namespace

TEST(MappedSequenceTest, NothingHappensUntilIterated) {
    int pulls = 0;
    auto seq  = counting(5, &pulls);

    EXPECT_EQ(pulls, 0);
    EXPECT_EQ(seq.produced(), 0u);
}

TEST(MappedSequenceTest, IteratesInOrder) {
    int pulls = 0;
    auto seq  = counting(4, &pulls);

    std::vector<int> values;
    for (const auto& result : seq) {
        ASSERT_TRUE(result.is_success());
        values.push_back(result.value());
    }
    EXPECT_EQ(values, (std::vector<int>{0, 1, 2, 3}));
    EXPECT_EQ(seq.produced(), 4u);
}

TEST(MappedSequenceTest, PullsOneElementAtATime) {
    int pulls = 0;
    auto seq  = counting(10, &pulls);

    auto it = seq.begin();
    EXPECT_EQ(pulls, 1);
    EXPECT_EQ(it->value(), 0);

    ++it;
    EXPECT_EQ(pulls, 2);
    EXPECT_EQ((*it).value(), 1);
}

TEST(MappedSequenceTest, EmptySequence) {
    int pulls = 0;
    auto seq  = counting(0, &pulls);

    EXPECT_EQ(seq.begin(), seq.end());
    EXPECT_FALSE(seq.next().has_value());

    auto all = seq.collect();
    ASSERT_TRUE(all.is_success());
    EXPECT_TRUE(all.value().empty());
}

TEST(MappedSequenceTest, ErrorsAreElements) {
    int pulls = 0;
    auto seq  = counting(3, &pulls, 1);

    std::vector<ErrorCode> codes;
    for (const auto& result : seq) {
        codes.push_back(result.code());
    }
    EXPECT_EQ(codes,
              (std::vector<ErrorCode>{ErrorCode::SUCCESS, ErrorCode::TRANSFORM_FAILED,
                                      ErrorCode::SUCCESS}));
}

TEST(MappedSequenceTest, CollectStopsAtFirstError) {
    int pulls = 0;
    auto seq  = counting(10, &pulls, 2);

    auto all = seq.collect();
    ASSERT_TRUE(all.is_error());
    EXPECT_EQ(all.code(), ErrorCode::TRANSFORM_FAILED);
    EXPECT_EQ(all.message(), "bad 2");
    EXPECT_EQ(pulls, 3);
}

TEST(MappedSequenceTest, CollectAll) {
    int pulls = 0;
    auto all  = counting(3, &pulls).collect();

    ASSERT_TRUE(all.is_success());
    EXPECT_EQ(all.value(), (std::vector<int>{0, 1, 2}));
}

TEST(MappedSequenceTest, NextTakesElements) {
    int pulls = 0;
    auto seq  = counting(2, &pulls);

    auto first = seq.next();
    ASSERT_TRUE(first.has_value());
    EXPECT_EQ(first->value(), 0);

    auto second = seq.next();
    ASSERT_TRUE(second.has_value());
    EXPECT_EQ(second->value(), 1);

    EXPECT_FALSE(seq.next().has_value());
    EXPECT_EQ(pulls, 2);
}

TEST(MappedSequenceTest, CopiesShareOnePass) {
    int pulls = 0;
    auto seq  = counting(3, &pulls);
    auto copy = seq;

    auto first = seq.next();
    ASSERT_TRUE(first.has_value());
    EXPECT_EQ(first->value(), 0);

    auto rest = copy.collect();
    ASSERT_TRUE(rest.is_success());
    EXPECT_EQ(rest.value(), (std::vector<int>{1, 2}));
    EXPECT_EQ(pulls, 3);

    // Exhausted for everyone
    EXPECT_EQ(seq.begin(), seq.end());
}
