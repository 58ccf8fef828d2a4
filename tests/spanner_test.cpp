#include <str-cursor/spanner.hpp>

#include <gtest/gtest.h>

#include <cstdint>
#include <string_view>
#include <vector>

using namespace str_cursor;

// Code points covering each UTF-8 width, newline, and other controls.
static const auto sample_code_points = std::vector<char32_t>{
    U'a', U' ', U'é', U'€', U'\U0001F600', U'\n', U'\t', U'\r', char32_t{0x85}, char32_t{0x7F},
};

// Check backward(forward(s, c), c) == s for every sample code point.
template <Spanner S>
static void expect_backward_undoes_forward(S start) {
    for (auto c : sample_code_points) {
        auto s = start;
        s.forward(c);
        s.backward(c);
        EXPECT_EQ(s, start) << "code point U+" << std::hex << static_cast<std::uint32_t>(c);
    }
}

// Check forward_str(s, text) == forward(c) for each code point of text.
template <Spanner S>
static void expect_forward_str_matches_forward(S start, std::string_view text) {
    auto bulk = start;
    forward_str(bulk, text);

    auto single = start;
    while (auto d = utf8::decode_front(text)) {
        single.forward(d->code_point);
        text.remove_prefix(d->width);
    }
    EXPECT_EQ(bulk, single);
}

// -- NoOpSpanner --------------------------------------------------------------

TEST(NoOpSpanner, stays_equal_to_default) {
    auto s = NoOpSpanner{};
    for (auto c : sample_code_points) s.forward(c);
    forward_str(s, "some more text\n");
    s.validate();
    s.backward(U'x');
    EXPECT_EQ(s, NoOpSpanner{});
}

// -- ByteSpanner --------------------------------------------------------------

TEST(ByteSpanner, forward_adds_encoded_width) {
    auto s = ByteSpanner{};
    s.forward(U'a');
    EXPECT_EQ(s.bytes, 1u);
    s.forward(U'é');
    EXPECT_EQ(s.bytes, 3u);
    s.forward(U'€');
    EXPECT_EQ(s.bytes, 6u);
    s.forward(U'\U0001F600');
    EXPECT_EQ(s.bytes, 10u);
}

TEST(ByteSpanner, backward_undoes_forward) {
    expect_backward_undoes_forward(ByteSpanner{});
    expect_backward_undoes_forward(ByteSpanner{.bytes = 17});
}

TEST(ByteSpanner, forward_str_adds_byte_length) {
    auto s = ByteSpanner{.bytes = 2};
    forward_str(s, "h\xC3\xA9llo");
    EXPECT_EQ(s.bytes, 8u);
    expect_forward_str_matches_forward(ByteSpanner{}, "a\xC3\xA9\xE2\x82\xAC\n");
}

TEST(ByteSpanner, validate_keeps_count) {
    auto s = ByteSpanner{.bytes = 5};
    s.validate();
    EXPECT_EQ(s.bytes, 5u);
}

// -- CharSpanner --------------------------------------------------------------

TEST(CharSpanner, forward_counts_code_points) {
    auto s = CharSpanner{};
    s.forward(U'a');
    s.forward(U'\U0001F600');
    s.forward(U'\n');
    EXPECT_EQ(s.chars, 3u);
}

TEST(CharSpanner, backward_undoes_forward) {
    expect_backward_undoes_forward(CharSpanner{});
    expect_backward_undoes_forward(CharSpanner{.chars = 3});
}

TEST(CharSpanner, forward_str_counts_code_points) {
    auto s = CharSpanner{};
    forward_str(s, "h\xC3\xA9llo \xF0\x9F\x98\x80");
    EXPECT_EQ(s.chars, 7u);
    expect_forward_str_matches_forward(CharSpanner{.chars = 1}, "\xE2\x82\xAC\xE2\x82\xAC x");
}

// -- RowColSpanner ------------------------------------------------------------

TEST(RowColSpanner, starts_at_origin) {
    const auto s = RowColSpanner{};
    EXPECT_EQ(s.row(), 0u);
    EXPECT_EQ(s.col(), 0u);
    EXPECT_EQ(s.pending_newlines(), 0u);
}

TEST(RowColSpanner, printable_code_points_advance_column) {
    auto s = RowColSpanner{};
    s.forward(U'a');
    s.forward(U'é');
    s.forward(U'\U0001F600');
    EXPECT_EQ(s.row(), 0u);
    EXPECT_EQ(s.col(), 3u);
}

TEST(RowColSpanner, newline_starts_a_row_and_saves_column) {
    auto s = RowColSpanner{};
    s.forward(U'a');
    s.forward(U'b');
    s.forward(U'\n');
    EXPECT_EQ(s.row(), 1u);
    EXPECT_EQ(s.col(), 0u);
    EXPECT_EQ(s.pending_newlines(), 1u);
}

TEST(RowColSpanner, control_code_points_do_not_move) {
    auto s = RowColSpanner{};
    s.forward(U'x');
    s.forward(U'\t');
    s.forward(U'\r');
    s.forward(char32_t{0x7F});
    EXPECT_EQ(s.row(), 0u);
    EXPECT_EQ(s.col(), 1u);
}

TEST(RowColSpanner, column_is_not_display_width) {
    auto s = RowColSpanner{};
    forward_str(s, "e\xCC\x81");  // 'e' followed by a combining acute accent
    EXPECT_EQ(s.col(), 2u);
}

TEST(RowColSpanner, backward_over_newline_restores_previous_column) {
    auto s = RowColSpanner{};
    s.forward(U'a');
    s.forward(U'b');
    s.forward(U'\n');
    s.forward(U'c');
    s.forward(U'\n');

    s.backward(U'\n');
    EXPECT_EQ(s.row(), 1u);
    EXPECT_EQ(s.col(), 1u);
    s.backward(U'c');
    s.backward(U'\n');
    EXPECT_EQ(s.row(), 0u);
    EXPECT_EQ(s.col(), 2u);
    EXPECT_EQ(s.pending_newlines(), 0u);
}

TEST(RowColSpanner, backward_undoes_forward) {
    expect_backward_undoes_forward(RowColSpanner{});
    expect_backward_undoes_forward(RowColSpanner::at(4, 9));

    auto with_history = RowColSpanner{};
    forward_str(with_history, "ab\ncd\n");
    expect_backward_undoes_forward(with_history);
}

TEST(RowColSpanner, forward_str_matches_forward) {
    expect_forward_str_matches_forward(RowColSpanner{}, "line one\nline\ttwo\r\n\nend");
}

TEST(RowColSpanner, validate_drops_saved_columns_only) {
    auto s = RowColSpanner{};
    forward_str(s, "abc\nde\nf");
    EXPECT_EQ(s.pending_newlines(), 2u);

    s.validate();
    EXPECT_EQ(s.pending_newlines(), 0u);
    EXPECT_EQ(s.row(), 2u);
    EXPECT_EQ(s.col(), 1u);
    EXPECT_EQ(s, RowColSpanner::at(2, 1));
}

TEST(RowColSpanner, at_starts_from_given_location) {
    auto s = RowColSpanner::at(10, 4);
    EXPECT_EQ(s.row(), 10u);
    EXPECT_EQ(s.col(), 4u);
    s.forward(U'x');
    EXPECT_EQ(s.col(), 5u);
    s.forward(U'\n');
    EXPECT_EQ(s.row(), 11u);
    EXPECT_EQ(s.col(), 0u);
}

TEST(RowColSpanner, copies_evolve_independently) {
    auto a = RowColSpanner{};
    forward_str(a, "x\n");
    auto b = a;
    b.forward(U'y');
    b.backward(U'y');
    b.backward(U'\n');
    EXPECT_EQ(a.row(), 1u);
    EXPECT_EQ(a.pending_newlines(), 1u);
    EXPECT_EQ(b.row(), 0u);
    EXPECT_EQ(b.col(), 1u);
}
