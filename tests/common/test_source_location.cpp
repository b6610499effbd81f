#include "common/source_location.hpp"

#include <gtest/gtest.h>

#include <string_view>

using namespace aliasorder;

TEST(SourcePositionTest, DefaultConstruction) {
    SourcePosition pos;
    EXPECT_EQ(pos.line, 1u);
    EXPECT_EQ(pos.column, 1u);
}

TEST(SourcePositionTest, Comparison) {
    SourcePosition a{1, 5};
    SourcePosition b{1, 10};
    SourcePosition c{2, 1};

    EXPECT_LT(a, b);
    EXPECT_LT(b, c);
    EXPECT_LT(a, c);
    EXPECT_EQ(a, a);
}

TEST(SourceLocationTest, ToString) {
    SourceLocation loc{"Program.cs", {10, 5}, 42};
    EXPECT_EQ(loc.to_string(), "Program.cs:10:5");
}

TEST(SourceSpanTest, Text) {
    std::string_view source = "using System.IO;";
    SourceSpan span{6, 15};
    EXPECT_EQ(span.length(), 9u);
    EXPECT_EQ(span.text(source), "System.IO");
}

TEST(SourceSpanTest, Cover) {
    SourceSpan a{6, 12};
    SourceSpan b{13, 15};
    auto covered = SourceSpan::cover(a, b);
    EXPECT_EQ(covered.begin, 6u);
    EXPECT_EQ(covered.end, 15u);

    auto reversed = SourceSpan::cover(b, a);
    EXPECT_EQ(reversed.begin, 6u);
    EXPECT_EQ(reversed.end, 15u);
}

TEST(SourceSpanTest, Empty) {
    SourceSpan span{4, 4};
    EXPECT_EQ(span.length(), 0u);
    EXPECT_EQ(span.text("abcdef"), "");
}
