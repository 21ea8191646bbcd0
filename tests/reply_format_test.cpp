#include "protocol/reply.hpp"

#include <gtest/gtest.h>

#include <optional>
#include <string>
#include <vector>

using respc::Array;
using respc::BulkString;
using respc::CommandError;
using respc::Integer;
using respc::Reply;
using respc::SimpleString;
using respc::format_reply;

namespace {

Reply bulk(std::string s) { return Reply{BulkString{std::move(s)}}; }

Reply array(std::vector<Reply> items) { return Reply{Array{std::move(items)}}; }

} // namespace

// ── Scalars ───────────────────────────────────────────────────────────────────

TEST(ReplyFormatTest, SimpleStringIsPrintedBare) {
    EXPECT_EQ(format_reply(Reply{SimpleString{"OK"}}), "OK");
}

TEST(ReplyFormatTest, ErrorIsTagged) {
    EXPECT_EQ(format_reply(Reply{CommandError{"ERR unknown command 'FOO'"}}),
              "(error) ERR unknown command 'FOO'");
}

TEST(ReplyFormatTest, IntegerIsTagged) {
    EXPECT_EQ(format_reply(Reply{Integer{2}}),  "(integer) 2");
    EXPECT_EQ(format_reply(Reply{Integer{-7}}), "(integer) -7");
}

TEST(ReplyFormatTest, BulkStringIsQuoted) {
    EXPECT_EQ(format_reply(bulk("way after first")), "\"way after first\"");
    EXPECT_EQ(format_reply(bulk("")), "\"\"");
}

TEST(ReplyFormatTest, BulkStringEscapesControlAndHighBytes) {
    EXPECT_EQ(format_reply(bulk("a\"b\\c")), R"("a\"b\\c")");
    EXPECT_EQ(format_reply(bulk("l1\r\nl2\t")), R"("l1\r\nl2\t")");
    EXPECT_EQ(format_reply(bulk(std::string{"\0\x01\xff", 3})), R"("\x00\x01\xff")");
}

TEST(ReplyFormatTest, NullsPrintAsNil) {
    EXPECT_EQ(format_reply(Reply{BulkString{std::nullopt}}), "(nil)");
    EXPECT_EQ(format_reply(Reply{Array{std::nullopt}}), "(nil)");
}

// ── Arrays ────────────────────────────────────────────────────────────────────

TEST(ReplyFormatTest, EmptyArray) {
    EXPECT_EQ(format_reply(array({})), "(empty array)");
}

TEST(ReplyFormatTest, FlatArrayIsNumbered) {
    EXPECT_EQ(format_reply(array({bulk("a"), Reply{Integer{1}}, Reply{BulkString{std::nullopt}}})),
              "1) \"a\"\n"
              "2) (integer) 1\n"
              "3) (nil)");
}

TEST(ReplyFormatTest, NumbersAreRightAligned) {
    std::vector<Reply> items;
    for (int i = 0; i < 10; ++i) items.push_back(Reply{Integer{i}});

    const std::string out = format_reply(array(std::move(items)));
    EXPECT_EQ(out.substr(0, 16), " 1) (integer) 0\n");
    EXPECT_NE(out.find("\n10) (integer) 9"), std::string::npos) << out;
}

TEST(ReplyFormatTest, NestedArraysAreIndented) {
    const Reply r = array({bulk("a"), array({bulk("b"), bulk("c")})});
    EXPECT_EQ(format_reply(r),
              "1) \"a\"\n"
              "2) 1) \"b\"\n"
              "   2) \"c\"");
}

// ── Helpers ───────────────────────────────────────────────────────────────────

TEST(ReplyFormatTest, IsErrorOnlyForErrorReplies) {
    EXPECT_TRUE(respc::is_error(Reply{CommandError{"ERR"}}));
    EXPECT_FALSE(respc::is_error(Reply{SimpleString{"ERR"}}));
    EXPECT_FALSE(respc::is_error(Reply{BulkString{std::nullopt}}));
}

TEST(ReplyFormatTest, TypeNames) {
    EXPECT_EQ(respc::reply_type_name(Reply{SimpleString{"OK"}}), "simple-string");
    EXPECT_EQ(respc::reply_type_name(Reply{CommandError{"ERR"}}), "error");
    EXPECT_EQ(respc::reply_type_name(Reply{Integer{1}}), "integer");
    EXPECT_EQ(respc::reply_type_name(bulk("x")), "bulk-string");
    EXPECT_EQ(respc::reply_type_name(Reply{BulkString{std::nullopt}}), "null-bulk-string");
    EXPECT_EQ(respc::reply_type_name(array({})), "array");
    EXPECT_EQ(respc::reply_type_name(Reply{Array{std::nullopt}}), "null-array");
}

TEST(ReplyFormatTest, EqualityComparesNestedValues) {
    EXPECT_EQ(array({bulk("a"), array({Reply{Integer{1}}})}),
              array({bulk("a"), array({Reply{Integer{1}}})}));
    EXPECT_NE(array({bulk("a")}), array({bulk("b")}));
    EXPECT_NE(Reply{Array{std::nullopt}}, array({}));
    EXPECT_NE(Reply{BulkString{std::nullopt}}, bulk(""));
    EXPECT_NE(Reply{SimpleString{"OK"}}, bulk("OK"));
}
