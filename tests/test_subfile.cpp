#include <gtest/gtest.h>
#include <subrepo/subfile.hpp>
#include <core/utils.hpp>

// ── .hgsub ──────────────────────────────────────────────────

TEST(Hgsub, ParseSkipsCommentsAndBlanks) {
    auto r = parse_hgsub({
        "# subrepositories",
        "",
        "   ",
        "libs/foo = [git]https://example.com/foo.git",
        "  vendor/bar=bar  ",
    });
    ASSERT_TRUE(r.is_ok()) << r.error;
    ASSERT_EQ(r.value.size(), 2u);
    EXPECT_EQ(r.value.entries()[0].first, "libs/foo");
    EXPECT_EQ(r.value.entries()[0].second, "[git]https://example.com/foo.git");
    EXPECT_EQ(r.value.get("vendor/bar").value_or(""), "bar");
}

TEST(Hgsub, SplitsOnFirstEquals) {
    auto r = parse_hgsub({"path = http://host/?a=b"});
    ASSERT_TRUE(r.is_ok());
    EXPECT_EQ(r.value.get("path").value_or(""), "http://host/?a=b");
}

TEST(Hgsub, IndentedCommentIsSkipped) {
    auto r = parse_hgsub({"   # not an entry"});
    ASSERT_TRUE(r.is_ok());
    EXPECT_TRUE(r.value.empty());
}

TEST(Hgsub, MissingEqualsIsError) {
    auto r = parse_hgsub({"a = b", "garbage"});
    ASSERT_TRUE(r.is_err());
    EXPECT_NE(r.error.find("line 2"), std::string::npos);
}

TEST(Hgsub, SerializeKeepsInsertionOrder) {
    SubrepoEntries e;
    e.set("zeta", "z");
    e.set("alpha", "a");
    EXPECT_EQ(serialize_hgsub(e), "zeta = z\nalpha = a\n");
}

TEST(Hgsub, ReassignKeepsPosition) {
    auto r = parse_hgsub({"a = 1", "b = 2", "a = 3"});
    ASSERT_TRUE(r.is_ok());
    EXPECT_EQ(serialize_hgsub(r.value), "a = 3\nb = 2\n");
}

TEST(Hgsub, RoundTrip) {
    const std::string text = "sub/one = one\nsub/two = [git]two\n";
    auto r = parse_hgsub(split_lines(text));
    ASSERT_TRUE(r.is_ok());
    EXPECT_EQ(serialize_hgsub(r.value), text);
}

// ── .hgsubstate ─────────────────────────────────────────────

TEST(Hgsubstate, ParseValueThenKey) {
    auto r = parse_hgsubstate({
        "0123456789abcdef0123456789abcdef01234567 sub/one",
        "# comment",
        "fedcba9876543210fedcba9876543210fedcba98 sub/with space",
    });
    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_EQ(r.value.get("sub/one").value_or(""), "0123456789abcdef0123456789abcdef01234567");
    EXPECT_EQ(r.value.get("sub/with space").value_or(""), "fedcba9876543210fedcba9876543210fedcba98");
}

TEST(Hgsubstate, MissingSpaceIsError) {
    EXPECT_TRUE(parse_hgsubstate({"deadbeef"}).is_err());
}

TEST(Hgsubstate, SerializeSortsByKey) {
    SubrepoEntries e;
    e.set("zeta", "111");
    e.set("alpha", "222");
    EXPECT_EQ(serialize_hgsubstate(e), "222 alpha\n111 zeta\n");
}

TEST(Hgsubstate, RoundTripIsEquivalent) {
    auto first = parse_hgsubstate({"aaa b/path", "bbb a/path"});
    ASSERT_TRUE(first.is_ok());
    auto second = parse_hgsubstate(split_lines(serialize_hgsubstate(first.value)));
    ASSERT_TRUE(second.is_ok());
    ASSERT_EQ(second.value.size(), first.value.size());
    for (const auto& [key, value] : first.value.entries()) {
        EXPECT_EQ(second.value.get(key).value_or("<missing>"), value);
    }
}

// ── SubrepoEntries ──────────────────────────────────────────

TEST(SubrepoEntries, Erase) {
    SubrepoEntries e;
    e.set("a", "1");
    e.set("b", "2");
    EXPECT_TRUE(e.erase("a"));
    EXPECT_FALSE(e.erase("a"));
    EXPECT_FALSE(e.get("a").has_value());
    EXPECT_EQ(e.size(), 1u);
}
