/// @file json_encoding_test.cpp
/// @brief Unit tests for JSON rendering of values, including the Marshaler pass.

#include <gtest/gtest.h>

#include <cstdint>
#include <limits>
#include <memory>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "alerter/marshaler.hpp"
#include "alerter/sinks/json_encoding.hpp"

using alerter::Fields;
using alerter::Marshaler;
using alerter::Value;
using alerter::sinks::append_json_members;
using alerter::sinks::append_json_string;
using alerter::sinks::append_json_value;

namespace {

std::string render(const Value& value) {
    std::string out;
    append_json_value(out, value);
    return out;
}

// Hides its password behind a slimmer object.
struct User final : Marshaler {
    User(std::string name, std::string password)
        : name(std::move(name)), password(std::move(password)) {}
    Value marshal_alert() const override { return Fields{{"name", name}}; }
    std::string name;
    std::string password;
};

// Substitutes another Marshaler, which must not be marshaled again.
struct Indirect final : Marshaler {
    Value marshal_alert() const override { return User("inner", "pw"); }
};

struct Throwing final : Marshaler {
    Value marshal_alert() const override { throw std::runtime_error("boom"); }
};

struct ThrowingNonStd final : Marshaler {
    Value marshal_alert() const override { throw 42; }
};

// Returns an object that contains a Marshaler.
struct Wrapper final : Marshaler {
    Value marshal_alert() const override { return Fields{{"user", User("bob", "pw")}}; }
};

} // namespace

TEST(JsonEncodingTest, EscapesSpecialCharacters) {
    std::string out;
    append_json_string(out, "quote\" backslash\\ newline\n tab\t");
    EXPECT_EQ(out, "quote\\\" backslash\\\\ newline\\n tab\\t");
}

TEST(JsonEncodingTest, EscapesControlCharactersAsUnicode) {
    std::string out;
    append_json_string(out, std::string("a\x01z", 3));
    EXPECT_EQ(out, "a\\u0001z");
}

TEST(JsonEncodingTest, ReplacesMalformedUtf8) {
    std::string out;
    append_json_string(out, "caf\xC3\xA9 \xE2\x82\xAC");
    EXPECT_EQ(out, "caf\xC3\xA9 \xE2\x82\xAC");

    out.clear();
    append_json_string(out, std::string("a\xFFz", 3));
    EXPECT_EQ(out, "a\xEF\xBF\xBDz");

    // Truncated sequence, overlong encoding and UTF-16 surrogate.
    out.clear();
    append_json_string(out, std::string("\xE2\x82", 2));
    EXPECT_EQ(out, "\xEF\xBF\xBD\xEF\xBF\xBD");
    out.clear();
    append_json_string(out, std::string("\xC0\xAF", 2));
    EXPECT_EQ(out, "\xEF\xBF\xBD\xEF\xBF\xBD");
    out.clear();
    append_json_string(out, std::string("\xED\xA0\x80", 3));
    EXPECT_EQ(out, "\xEF\xBF\xBD\xEF\xBF\xBD\xEF\xBF\xBD");
}

TEST(JsonEncodingTest, RendersScalars) {
    EXPECT_EQ(render(nullptr), "null");
    EXPECT_EQ(render(true), "true");
    EXPECT_EQ(render(false), "false");
    EXPECT_EQ(render(-42), "-42");
    EXPECT_EQ(render(std::numeric_limits<std::uint64_t>::max()), "18446744073709551615");
    EXPECT_EQ(render("text"), "\"text\"");
}

TEST(JsonEncodingTest, RendersNonFiniteDoubleAsNull) {
    EXPECT_EQ(render(std::numeric_limits<double>::infinity()), "null");
    EXPECT_EQ(render(std::numeric_limits<double>::quiet_NaN()), "null");
}

TEST(JsonEncodingTest, RendersDoublesInShortestRoundTripForm) {
    EXPECT_EQ(render(1.5), "1.5");
    EXPECT_EQ(render(-0.25), "-0.25");
    EXPECT_EQ(render(1e-7), "1e-07");
    EXPECT_EQ(render(0.1), "0.1");
}

TEST(JsonEncodingTest, RendersStringListAsArray) {
    EXPECT_EQ(render(std::vector<std::string>{"a", "b\""}), "[\"a\",\"b\\\"\"]");
    EXPECT_EQ(render(std::vector<std::string>{}), "[]");
}

TEST(JsonEncodingTest, RendersNestedObjectsInOrder) {
    Value value = Fields{{"b", 1}, {"a", Fields{{"c", "d"}}}, {"b", 2}};
    EXPECT_EQ(render(value), "{\"b\":1,\"a\":{\"c\":\"d\"},\"b\":2}");
}

TEST(JsonEncodingTest, MarshalerIsReplacedBySubstitute) {
    EXPECT_EQ(render(User("alice", "secret")), "{\"name\":\"alice\"}");
}

TEST(JsonEncodingTest, SubstituteIsNotMarshaledAgain) {
    EXPECT_EQ(render(Indirect{}), "\"<marshaler>\"");
}

TEST(JsonEncodingTest, MarshalerInsideSubstituteObjectIsMarshaled) {
    EXPECT_EQ(render(Wrapper{}), "{\"user\":{\"name\":\"bob\"}}");
}

TEST(JsonEncodingTest, ThrowingMarshalerIsReportedInline) {
    EXPECT_EQ(render(Throwing{}), "\"<panic: boom>\"");
}

TEST(JsonEncodingTest, NonStdExceptionFromMarshalerIsReportedInline) {
    EXPECT_EQ(render(ThrowingNonStd{}), "\"<panic: unknown>\"");
    EXPECT_EQ(render(Fields{{"k", ThrowingNonStd{}}, {"after", 1}}),
              "{\"k\":\"<panic: unknown>\",\"after\":1}");
}

TEST(JsonEncodingTest, NullMarshalerPointerIsNull) {
    EXPECT_EQ(render(std::shared_ptr<const Marshaler>{}), "null");
}

TEST(JsonEncodingTest, DeepNestingIsCut) {
    Value value = 1;
    for (int i = 0; i < alerter::sinks::kMaxRenderDepth + 2; ++i) {
        value = Fields{{"n", value}};
    }
    auto out = render(value);
    EXPECT_NE(out.find("\"<max-depth>\""), std::string::npos) << out;
}

TEST(JsonEncodingTest, MembersArePrefixedWithComma) {
    std::string out;
    append_json_members(out, Fields{{"a", 1}, {"a", "x"}});
    EXPECT_EQ(out, ",\"a\":1,\"a\":\"x\"");
}
