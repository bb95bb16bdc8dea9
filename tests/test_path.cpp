/**
 * @file test_path.cpp
 * @brief Tests for destination path parsing using Google Test
 */

#include <gtest/gtest.h>
#include "jtl/Path.hpp"

using namespace jtl;

namespace {

Segment key(const char* k) { return Segment(std::string(k)); }
Segment idx(std::size_t i) { return Segment(i); }

} // namespace

// ============================================================================
// Valid paths
// ============================================================================

TEST(ParsePath, RootIsEmpty) {
    EXPECT_TRUE(parse_path(".").empty());
}

TEST(ParsePath, SingleKey) {
    EXPECT_EQ(parse_path(".name"), (Path{key("name")}));
}

TEST(ParsePath, NestedKeysAndIndices) {
    EXPECT_EQ(parse_path(".a.b[2].c"), (Path{key("a"), key("b"), idx(2), key("c")}));
}

TEST(ParsePath, IdentifiersWithUnderscoresAndDigits) {
    EXPECT_EQ(parse_path("._x.item_2"), (Path{key("_x"), key("item_2")}));
}

TEST(ParsePath, ConsecutiveIndices) {
    EXPECT_EQ(parse_path(".m[0][10]"), (Path{key("m"), idx(0), idx(10)}));
}

TEST(ParsePath, QuotedKeysWithEscapes) {
    Path expected{key("foo"), key("bar baz"), idx(0), key("qu\"ote")};
    EXPECT_EQ(parse_path(".foo[\"bar baz\"][0][\"qu\\\"ote\"]"), expected);
}

TEST(ParsePath, SingleQuotedKey) {
    EXPECT_EQ(parse_path(".a['it\\'s']"), (Path{key("a"), key("it's")}));
}

TEST(ParsePath, QuotedKeyDecodesControlEscapes) {
    EXPECT_EQ(parse_path(".a[\"x\\ty\"]"), (Path{key("a"), key("x\ty")}));
}

TEST(ParsePath, QuotedKeyKeepsEscapedSlash) {
    EXPECT_EQ(parse_path(R"(.["a\/b"])"), (Path{key("a\\/b")}));
}

TEST(ParsePath, QuotedKeyDecodesOctalEscapes) {
    EXPECT_EQ(parse_path(R"(.["x\012y"]["\101"])"), (Path{key("x\ny"), key("A")}));
}

TEST(ParsePath, SpacesInsideBrackets) {
    EXPECT_EQ(parse_path(".a[ 3 ][ \"k\" ]"), (Path{key("a"), idx(3), key("k")}));
}

TEST(ParsePath, QuotedKeyMayLookLikeIndex) {
    Path path = parse_path(".a[\"0\"]");
    ASSERT_EQ(path.size(), 2u);
    EXPECT_TRUE(is_key(path[1]));
}

// ============================================================================
// Rejected paths
// ============================================================================

TEST(ParsePath, MustStartWithDot) {
    EXPECT_THROW(parse_path("a.b"), SyntaxError);
    EXPECT_THROW(parse_path("[0]"), SyntaxError);
    EXPECT_THROW(parse_path(""), SyntaxError);
}

TEST(ParsePath, NonConcretePathsRejected) {
    EXPECT_THROW(parse_path(".a[]"), SyntaxError);
    EXPECT_THROW(parse_path(".a[1:2]"), SyntaxError);
    EXPECT_THROW(parse_path(".a[-1]"), SyntaxError);
    EXPECT_THROW(parse_path(".a | .b"), SyntaxError);
    EXPECT_THROW(parse_path(".a.*"), SyntaxError);
}

TEST(ParsePath, MalformedTokensRejected) {
    EXPECT_THROW(parse_path(".a["), SyntaxError);
    EXPECT_THROW(parse_path(".a[\"open"), SyntaxError);
    EXPECT_THROW(parse_path(".a."), SyntaxError);
    EXPECT_THROW(parse_path(".1abc"), SyntaxError);
    EXPECT_THROW(parse_path(".."), SyntaxError);
}

TEST(ParsePath, ErrorReportsRemainderAndOffset) {
    try {
        parse_path(".ok.also[x]");
        FAIL() << "expected SyntaxError";
    } catch (const SyntaxError& e) {
        EXPECT_EQ(e.offset(), 8u);
        EXPECT_EQ(e.remainder(), "[x]");
        EXPECT_EQ(e.path(), ".ok.also[x]");
        EXPECT_NE(std::string(e.what()).find("[x]"), std::string::npos);
    }
}

// ============================================================================
// format_path
// ============================================================================

TEST(FormatPath, Root) {
    EXPECT_EQ(format_path({}), ".");
}

TEST(FormatPath, IdentifiersAndIndices) {
    EXPECT_EQ(format_path({key("a"), idx(2), key("c")}), ".a[2].c");
}

TEST(FormatPath, QuotesOtherKeys) {
    EXPECT_EQ(format_path({key("bar baz"), key("qu\"ote")}), "[\"bar baz\"][\"qu\\\"ote\"]");
}

TEST(FormatPath, ParsesBackToSameSegments) {
    Path path{key("foo"), key("bar baz"), idx(0), key("x")};
    EXPECT_EQ(parse_path(format_path(path)), path);
}
