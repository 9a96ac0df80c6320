// SPDX-License-Identifier: MIT

// tests/folded_stream_test.cpp
#include <gtest/gtest.h>

#include <memory>
#include <string>
#include <vector>

#include "lib/stream/folded_stream.hpp"
#include "lib/stream/line_source.hpp"
#include "lib/stream/line_stream.hpp"
#include "tests/stream_test_helpers.hpp"

using namespace kvmerge;
using namespace kvmerge::test;

using Group = Record<std::string, std::vector<std::string>>;

TEST(FoldedStreamTest, GroupsAdjacentKeysInOrder) {
    auto folded = MakeFoldedStream(MakeStringStream({
        {"a", "1"}, {"a", "2"}, {"a", "3"}, {"b", "4"}, {"c", "5"}, {"c", "6"},
    }));

    auto groups = Drain(*folded);
    EXPECT_EQ(groups, (std::vector<Group>{
        {"a", {"1", "2", "3"}},
        {"b", {"4"}},
        {"c", {"5", "6"}},
    }));
}

TEST(FoldedStreamTest, SingletonGroupIsStillAVector) {
    auto folded = MakeFoldedStream(MakeStringStream({{"only", "x"}}));

    auto next = folded->Pull();
    ASSERT_TRUE(next.has_value() && next->has_value());
    EXPECT_EQ((*next)->key, "only");
    EXPECT_EQ((*next)->value, std::vector<std::string>{"x"});
    EXPECT_TRUE(folded->AtEnd());
}

TEST(FoldedStreamTest, EmptyInput) {
    auto folded = MakeFoldedStream(MakeStringStream({}));

    EXPECT_TRUE(folded->AtEnd());
    EXPECT_TRUE(Drain(*folded).empty());
}

TEST(FoldedStreamTest, GroupSizesMatchInputRuns) {
    const std::vector<size_t> runs{3, 1, 4, 1, 5};
    std::vector<Record<int, int>> input;
    int value = 0;
    for (size_t i = 0; i < runs.size(); ++i) {
        for (size_t n = 0; n < runs[i]; ++n) {
            input.push_back({static_cast<int>(i), value++});
        }
    }

    auto folded = MakeFoldedStream(MakeVectorStream(input));
    auto groups = Drain(*folded);

    ASSERT_EQ(groups.size(), runs.size());
    int expected_value = 0;
    for (size_t i = 0; i < runs.size(); ++i) {
        EXPECT_EQ(groups[i].key, static_cast<int>(i));
        ASSERT_EQ(groups[i].value.size(), runs[i]);
        for (int v : groups[i].value) {
            EXPECT_EQ(v, expected_value++);
        }
    }
}

TEST(FoldedStreamTest, RewindReplays) {
    auto folded = MakeFoldedStream(MakeStringStream({{"a", "1"}, {"a", "2"}, {"b", "3"}}));

    auto first = Drain(*folded);
    ASSERT_TRUE(folded->Rewind().has_value());
    EXPECT_EQ(Drain(*folded), first);
}

TEST(FoldedStreamTest, OverLineStream) {
    auto source = LineSource::FromString("k 1 2\nk 3\nm 4\n");
    auto folded = MakeFoldedStream(std::make_unique<LineStream>(source));

    auto groups = Drain(*folded);
    ASSERT_EQ(groups.size(), 2u);
    ASSERT_EQ(groups[0].value.size(), 2u);
    EXPECT_EQ(ToString(groups[0].value[0]), "1 2");
    EXPECT_EQ(ToString(groups[0].value[1]), "3");
    EXPECT_EQ(groups[1].key, "m");
}

TEST(FoldedStreamTest, ErrorFromInnerStreamPropagates) {
    auto folded = MakeFoldedStream(std::make_unique<FailingStream<std::string, std::string>>(
        std::vector<StringRecord>{{"a", "1"}, {"a", "2"}}));

    auto result = folded->Pull();
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::ReadFailed);
}

TEST(FoldedStreamTest, ErrorMidGroupKeepsPartialGroup) {
    auto folded = MakeFoldedStream(std::make_unique<FailOnceStream<std::string, std::string>>(
        std::vector<StringRecord>{{"a", "1"}, {"a", "2"}, {"b", "3"}}, 1));

    auto failed = folded->Pull();
    ASSERT_FALSE(failed.has_value());
    EXPECT_EQ(failed.error().code, ErrorCode::ReadFailed);

    EXPECT_EQ(Drain(*folded), (std::vector<Group>{
        {"a", {"1", "2"}},
        {"b", {"3"}},
    }));
}
