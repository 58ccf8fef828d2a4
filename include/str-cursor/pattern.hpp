/// @file pattern.hpp
/// @brief Patterns searched for by StrCursor::step_until().
///
/// A pattern locates the first match within a piece of text and returns its
/// byte offset, or nullopt if there is none. The offset must fall on a code
/// point boundary of the text. Built-in patterns:
///
/// | Pattern                                   | Matches                       |
/// |-------------------------------------------|-------------------------------|
/// | `char32_t`, `char` (as Latin-1)           | that code point               |
/// | `std::string_view`, `std::string`, `const char*` | that literal text      |
/// | `std::array<char32_t, N>`, `std::vector<char32_t>`, `std::span<const char32_t>` | any code point of the set |
/// | callable `bool(char32_t)`                 | first code point it accepts   |
/// | type with `find(std::string_view) -> std::optional<std::size_t>` | whatever it finds |
///
/// Patterns are handed the whole remaining text, so multi code point
/// lookahead (literal search, custom matchers) is possible.

#pragma once

#include <str-cursor/utf8.hpp>

#include <algorithm>
#include <array>
#include <concepts>
#include <cstddef>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <type_traits>
#include <vector>

namespace str_cursor::pattern {

namespace detail {

inline auto to_offset(std::size_t pos) -> std::optional<std::size_t> {
    if (pos == std::string_view::npos) return std::nullopt;
    return pos;
}

}  // namespace detail

/// Byte offset of the first code point of `text` accepted by `pred`.
template <typename F>
auto find_if(std::string_view text, F&& pred) -> std::optional<std::size_t> {
    auto offset = std::size_t{0};
    while (auto decoded = utf8::decode_front(text.substr(offset))) {
        if (pred(decoded->code_point)) return offset;
        offset += decoded->width;
    }
    return std::nullopt;
}

// -- Literal text -------------------------------------------------------------

/// Find a literal. The empty literal matches at offset 0.
inline auto find(std::string_view literal, std::string_view text) -> std::optional<std::size_t> {
    return detail::to_offset(text.find(literal));
}

inline auto find(const std::string& literal, std::string_view text) -> std::optional<std::size_t> {
    return find(std::string_view{literal}, text);
}

inline auto find(const char* literal, std::string_view text) -> std::optional<std::size_t> {
    return find(std::string_view{literal}, text);
}

// -- Single code point --------------------------------------------------------

inline auto find(char32_t c, std::string_view text) -> std::optional<std::size_t> {
    if (c < 0x80) return detail::to_offset(text.find(static_cast<char>(c)));
    const auto encoded = utf8::encode(c);
    return find(encoded.view(), text);
}

/// Find a character. Bytes above 0x7F are read as Latin-1 code points
/// (U+0080..U+00FF), never as raw UTF-8 bytes.
inline auto find(char c, std::string_view text) -> std::optional<std::size_t> {
    return find(char32_t{static_cast<unsigned char>(c)}, text);
}

// -- Code point sets ----------------------------------------------------------

inline auto find(std::span<const char32_t> set, std::string_view text) -> std::optional<std::size_t> {
    return find_if(text, [set](char32_t c) {
        return std::ranges::find(set, c) != set.end();
    });
}

template <std::size_t N>
auto find(const std::array<char32_t, N>& set, std::string_view text) -> std::optional<std::size_t> {
    return find(std::span<const char32_t>{set}, text);
}

inline auto find(const std::vector<char32_t>& set, std::string_view text) -> std::optional<std::size_t> {
    return find(std::span<const char32_t>{set}, text);
}

// -- Predicates and custom matchers -------------------------------------------

template <typename F>
    requires std::predicate<F&, char32_t>
auto find(F&& pred, std::string_view text) -> std::optional<std::size_t> {
    return find_if(text, pred);
}

template <typename M>
    requires requires(M& m, std::string_view text) {
        { m.find(text) } -> std::same_as<std::optional<std::size_t>>;
    }
auto find(M&& matcher, std::string_view text) -> std::optional<std::size_t> {
    return matcher.find(text);
}

}  // namespace str_cursor::pattern

namespace str_cursor {

/// Anything pattern::find() accepts.
template <typename P>
concept Pattern = requires(P& p, std::string_view text) {
    { pattern::find(p, text) } -> std::same_as<std::optional<std::size_t>>;
};

}  // namespace str_cursor
