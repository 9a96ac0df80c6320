// SPDX-License-Identifier: MIT

// tests/multi_stream_test.cpp
#include <gtest/gtest.h>

#include <algorithm>
#include <deque>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "lib/stream/line_source.hpp"
#include "lib/stream/line_stream.hpp"
#include "lib/stream/multi_stream.hpp"
#include "tests/stream_test_helpers.hpp"

using namespace kvmerge;
using namespace kvmerge::test;

using Merged = Record<int, std::vector<std::string>>;

static_assert(Appendable<std::vector<std::string>, std::string>);
static_assert(Appendable<std::deque<std::string>, std::string>);
static_assert(!Appendable<int, std::string>);

TEST(MultiStreamTest, MergesThreeStreams) {
    auto merged = MakeMultiStream(
        MakeVectorStream<int, std::string>({{1, "x"}}),
        MakeVectorStream<int, std::string>({{1, "y"}, {2, "z"}}),
        MakeVectorStream<int, std::string>({{2, "w"}}));

    EXPECT_EQ(merged->StreamCount(), 3u);
    auto records = Drain(*merged);
    EXPECT_EQ(records, (std::vector<Merged>{
        {1, {"x", "y"}},
        {2, {"z", "w"}},
    }));
}

TEST(MultiStreamTest, OutputKeysAreNonDecreasing) {
    auto merged = MakeMultiStream(
        MakeVectorStream<int, std::string>({{1, "a"}, {4, "b"}, {9, "c"}}),
        MakeVectorStream<int, std::string>({{2, "d"}, {3, "e"}, {10, "f"}}),
        MakeVectorStream<int, std::string>({{0, "g"}, {4, "h"}, {5, "i"}, {11, "j"}}));

    auto records = Drain(*merged);
    std::vector<int> keys;
    size_t total_values = 0;
    for (const auto& r : records) {
        keys.push_back(r.key);
        total_values += r.value.size();
    }
    EXPECT_TRUE(std::is_sorted(keys.begin(), keys.end()));
    EXPECT_EQ(keys, (std::vector<int>{0, 1, 2, 3, 4, 5, 9, 10, 11}));
    EXPECT_EQ(total_values, 10u);
}

TEST(MultiStreamTest, ValuesFollowInputOrder) {
    auto merged = MakeMultiStream(
        MakeStringStream({{"k", "third"}}),
        MakeStringStream({{"k", "first"}}),
        MakeStringStream({{"k", "second"}}));

    auto next = merged->Pull();
    ASSERT_TRUE(next.has_value() && next->has_value());
    EXPECT_EQ((*next)->value, (std::vector<std::string>{"third", "first", "second"}));
}

TEST(MultiStreamTest, DuplicateKeysWithinOneStreamStaySeparate) {
    auto merged = MakeMultiStream(
        MakeVectorStream<int, std::string>({{1, "a"}, {1, "b"}}),
        MakeVectorStream<int, std::string>({{1, "c"}}));

    auto records = Drain(*merged);
    EXPECT_EQ(records, (std::vector<Merged>{
        {1, {"a", "c"}},
        {1, {"b"}},
    }));
}

TEST(MultiStreamTest, SingleStream) {
    auto merged = MakeMultiStream(MakeStringStream({{"a", "1"}, {"b", "2"}}));

    auto records = Drain(*merged);
    ASSERT_EQ(records.size(), 2u);
    EXPECT_EQ(records[0].value, std::vector<std::string>{"1"});
    EXPECT_EQ(records[1].value, std::vector<std::string>{"2"});
}

TEST(MultiStreamTest, AtEndOnlyWhenEveryStreamEnds) {
    auto merged = MakeMultiStream(
        MakeStringStream({{"a", "1"}}),
        MakeStringStream({}),
        MakeStringStream({{"a", "2"}, {"b", "3"}}));

    EXPECT_FALSE(merged->AtEnd());
    ASSERT_TRUE(merged->Pull().has_value());
    EXPECT_FALSE(merged->AtEnd());
    ASSERT_TRUE(merged->Pull().has_value());
    EXPECT_TRUE(merged->AtEnd());
}

TEST(MultiStreamTest, RewindReplays) {
    auto merged = MakeMultiStream(
        MakeStringStream({{"a", "1"}, {"c", "3"}}),
        MakeStringStream({{"b", "2"}, {"c", "4"}}));

    auto first = Drain(*merged);
    ASSERT_TRUE(merged->Rewind().has_value());
    EXPECT_EQ(Drain(*merged), first);
    EXPECT_EQ(first.size(), 3u);
}

TEST(MultiStreamTest, RewindReportsFailureAfterRewindingOthers) {
    std::vector<std::unique_ptr<SortedStream<std::string, std::string>>> streams;
    streams.push_back(MakeStringStream({{"a", "1"}}));
    streams.push_back(std::make_unique<FailingStream<std::string, std::string>>(
        std::vector<StringRecord>{}));
    MultiStream<std::string, std::string> merged(std::move(streams));

    auto result = merged.Rewind();
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::ReadFailed);
}

TEST(MultiStreamTest, FailedInputKeepsRecordsPulledFromOthers) {
    auto merged = MakeMultiStream(
        MakeVectorStream<int, std::string>({{1, "a"}, {2, "b"}}),
        std::make_unique<FailOnceStream<int, std::string>>(
            std::vector<Record<int, std::string>>{{1, "x"}}, 0));

    auto failed = merged->Pull();
    ASSERT_FALSE(failed.has_value());
    EXPECT_EQ(failed.error().code, ErrorCode::ReadFailed);

    EXPECT_EQ(Drain(*merged), (std::vector<Merged>{
        {1, {"a", "x"}},
        {2, {"b"}},
    }));
}

TEST(MultiStreamTest, CustomContainer) {
    std::vector<std::unique_ptr<SortedStream<std::string, std::string>>> streams;
    streams.push_back(MakeStringStream({{"a", "1"}}));
    streams.push_back(MakeStringStream({{"a", "2"}}));
    MultiStream<std::string, std::string, std::deque<std::string>> merged(std::move(streams));

    auto next = merged.Pull();
    ASSERT_TRUE(next.has_value() && next->has_value());
    EXPECT_EQ((*next)->value, (std::deque<std::string>{"1", "2"}));
}

TEST(MultiStreamTest, CreateRejectsEmptyInput) {
    auto merged = MultiStream<std::string, std::string>::Create({});
    ASSERT_FALSE(merged.has_value());
    EXPECT_EQ(merged.error().code, ErrorCode::InvalidArgument);
    EXPECT_EQ(error_category(merged.error().code), "usage");
}

TEST(MultiStreamTest, CreateSucceeds) {
    std::vector<std::unique_ptr<SortedStream<std::string, std::string>>> streams;
    streams.push_back(MakeStringStream({{"a", "1"}}));

    auto merged = MultiStream<std::string, std::string>::Create(std::move(streams));
    ASSERT_TRUE(merged.has_value());
    EXPECT_EQ((*merged)->StreamCount(), 1u);
}

TEST(MultiStreamTest, ConstructorThrowsOnEmptyInput) {
    using StringMulti = MultiStream<std::string, std::string>;
    EXPECT_THROW(StringMulti(std::vector<StringMulti::InputPtr>{}), std::invalid_argument);
}

TEST(MultiStreamTest, ErrorFromInputPropagates) {
    auto merged = MakeMultiStream(
        MakeStringStream({{"a", "1"}}),
        std::make_unique<FailingStream<std::string, std::string>>(std::vector<StringRecord>{}));

    auto result = merged->Pull();
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::ReadFailed);
}

TEST(MultiStreamTest, MergesLineStreams) {
    auto left = LineSource::FromString("a 1\nc 3\n", "left");
    auto right = LineSource::FromString("b 2\nc 4\n", "right");
    auto merged = MakeMultiStream(std::make_unique<LineStream>(left),
                                  std::make_unique<LineStream>(right));

    EXPECT_EQ(merged->Describe(),
              "MultiStream(wrapping LineStream(from left), LineStream(from right))");

    std::vector<std::string> keys;
    ASSERT_TRUE(merged->ForEach([&](const std::string& k, const std::vector<FieldValue>&) {
        keys.push_back(k);
    }).has_value());
    EXPECT_EQ(keys, (std::vector<std::string>{"a", "b", "c"}));
}
