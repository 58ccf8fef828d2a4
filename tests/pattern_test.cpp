#include <str-cursor/pattern.hpp>

#include <gtest/gtest.h>

#include <array>
#include <functional>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

using namespace str_cursor;

// -- Single code point --------------------------------------------------------

TEST(Pattern, ascii_char_finds_first_occurrence) {
    EXPECT_EQ(pattern::find(' ', "hello world"), 5u);
    EXPECT_EQ(pattern::find('h', "hello world"), 0u);
    EXPECT_FALSE(pattern::find('z', "hello world").has_value());
    EXPECT_FALSE(pattern::find('a', "").has_value());
}

TEST(Pattern, char32_finds_multibyte_code_point) {
    // "a€b€"
    constexpr auto text = std::string_view{"a\xE2\x82\xAC" "b\xE2\x82\xAC"};
    EXPECT_EQ(pattern::find(U'€', text), 1u);
    EXPECT_EQ(pattern::find(U'b', text), 4u);
    EXPECT_FALSE(pattern::find(U'\U0001F600', text).has_value());
}

// -- Literal text -------------------------------------------------------------

TEST(Pattern, high_char_is_read_as_latin1_code_point) {
    // "é" is C3 A9; the byte A9 alone must not match inside it
    EXPECT_FALSE(pattern::find('\xA9', "\xC3\xA9").has_value());
    // U+00A9 "©" is C2 A9
    EXPECT_EQ(pattern::find('\xA9', "(c) \xC2\xA9"), 4u);
    EXPECT_EQ(pattern::find('\xE9', "caf\xC3\xA9"), 3u);
}

TEST(Pattern, literal_finds_substring) {
    EXPECT_EQ(pattern::find(std::string_view{"world"}, "hello world"), 6u);
    EXPECT_EQ(pattern::find(std::string{"lo"}, "hello world"), 3u);
    EXPECT_EQ(pattern::find("o w", "hello world"), 4u);
    EXPECT_FALSE(pattern::find("worlds", "hello world").has_value());
}

TEST(Pattern, empty_literal_matches_at_start) {
    EXPECT_EQ(pattern::find("", "abc"), 0u);
    EXPECT_EQ(pattern::find("", ""), 0u);
}

TEST(Pattern, literal_match_lands_on_code_point_boundary) {
    // "é" is C3 A9; "©" is C2 A9. Searching "©" must not match inside "é".
    constexpr auto text = std::string_view{"\xC3\xA9\xC2\xA9"};
    EXPECT_EQ(pattern::find("\xC2\xA9", text), 2u);
}

// -- Code point sets ----------------------------------------------------------

TEST(Pattern, fixed_size_set_finds_any_member) {
    const auto separators = std::array<char32_t, 3>{U',', U';', U'\n'};
    EXPECT_EQ(pattern::find(separators, "abc;def,ghi"), 3u);
    EXPECT_FALSE(pattern::find(separators, "abcdef").has_value());
}

TEST(Pattern, growable_set_finds_any_member) {
    auto quotes = std::vector<char32_t>{U'«', U'"'};
    // "x«y"
    EXPECT_EQ(pattern::find(quotes, "x\xC2\xAB" "y"), 1u);
    quotes.push_back(U'y');
    EXPECT_EQ(pattern::find(quotes, "xy"), 1u);
}

TEST(Pattern, span_set_finds_any_member) {
    const char32_t digits[] = {U'0', U'1', U'2', U'3', U'4', U'5', U'6', U'7', U'8', U'9'};
    EXPECT_EQ(pattern::find(std::span<const char32_t>{digits}, "abc42"), 3u);
}

TEST(Pattern, empty_set_never_matches) {
    EXPECT_FALSE(pattern::find(std::vector<char32_t>{}, "anything").has_value());
}

// -- Predicates ---------------------------------------------------------------

TEST(Pattern, predicate_finds_first_accepted_code_point) {
    auto is_upper = [](char32_t c) { return c >= U'A' && c <= U'Z'; };
    EXPECT_EQ(pattern::find(is_upper, "abcDef"), 3u);
    EXPECT_FALSE(pattern::find(is_upper, "abcdef").has_value());
}

TEST(Pattern, predicate_reports_byte_offset_after_multibyte_code_points) {
    auto is_bang = [](char32_t c) { return c == U'!'; };
    // "é€!"
    EXPECT_EQ(pattern::find(is_bang, "\xC3\xA9\xE2\x82\xAC!"), 5u);
}

TEST(Pattern, predicate_may_carry_mutable_state) {
    auto seen = 0;
    auto third_code_point = [&seen](char32_t) mutable { return ++seen == 3; };
    EXPECT_EQ(pattern::find(third_code_point, "abcdef"), 2u);
    EXPECT_EQ(seen, 3);
}

TEST(Pattern, std_function_is_a_predicate) {
    const auto pred = std::function<bool(char32_t)>{[](char32_t c) { return c == U'='; }};
    EXPECT_EQ(pattern::find(pred, "key=value"), 3u);
}

// -- Custom matchers ----------------------------------------------------------

namespace {

// Finds the first run of two identical code points.
struct DoubledLetter {
    auto find(std::string_view text) const -> std::optional<std::size_t> {
        for (std::size_t i = 0; i + 1 < text.size(); ++i) {
            if (text[i] == text[i + 1]) return i;
        }
        return std::nullopt;
    }
};

}  // namespace

TEST(Pattern, type_with_find_member_is_a_pattern) {
    EXPECT_EQ(pattern::find(DoubledLetter{}, "bookkeeper"), 1u);
    EXPECT_FALSE(pattern::find(DoubledLetter{}, "abc").has_value());
}

// -- Concept ------------------------------------------------------------------

static_assert(Pattern<char>);
static_assert(Pattern<char32_t>);
static_assert(Pattern<std::string_view>);
static_assert(Pattern<std::string>);
static_assert(Pattern<const char*>);
static_assert(Pattern<std::array<char32_t, 4>>);
static_assert(Pattern<std::vector<char32_t>>);
static_assert(Pattern<std::span<const char32_t>>);
static_assert(Pattern<bool (*)(char32_t)>);
static_assert(Pattern<DoubledLetter>);
static_assert(!Pattern<int*>);
static_assert(!Pattern<std::vector<int>>);
