/// @file utf8.hpp
/// @brief UTF-8 code point primitives used by the cursor and its spanners.
///
/// Decoding functions trust their input: they are only ever given views of
/// a buffer that is valid UTF-8, sliced at code point boundaries. Use
/// validate() or is_valid() on untrusted bytes first.

#pragma once

#include <str-cursor/error.hpp>

#include <array>
#include <cassert>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace str_cursor::utf8 {

/// Largest Unicode scalar value.
inline constexpr char32_t max_code_point = 0x10FFFF;

/// A code point together with the number of bytes it occupies.
struct Decoded {
    char32_t code_point;  ///< The decoded Unicode scalar value.
    std::size_t width;    ///< Encoded length in bytes (1 to 4).

    auto operator==(const Decoded&) const -> bool = default;
};

/// A code point encoded as UTF-8 in a fixed buffer (no allocation).
struct Encoded {
    std::array<char, 4> bytes{};  ///< The encoded bytes; only `size` are used.
    std::size_t size{0};          ///< Number of meaningful bytes.

    /// View over the encoded bytes.
    auto view() const -> std::string_view { return {bytes.data(), size}; }
};

// -- Byte classification ------------------------------------------------------

/// Check if a byte is a continuation byte (10xxxxxx).
constexpr auto is_continuation(char byte) noexcept -> bool {
    return (static_cast<unsigned char>(byte) & 0xC0) == 0x80;
}

/// Length of the sequence introduced by a lead byte, or 0 for a byte that
/// cannot start a sequence.
constexpr auto sequence_width(char lead) noexcept -> std::size_t {
    const auto b = static_cast<unsigned char>(lead);
    if (b < 0x80) return 1;
    if ((b & 0xE0) == 0xC0) return 2;
    if ((b & 0xF0) == 0xE0) return 3;
    if ((b & 0xF8) == 0xF0) return 4;
    return 0;
}

/// Number of bytes needed to encode a code point.
constexpr auto encoded_width(char32_t c) noexcept -> std::size_t {
    if (c < 0x80) return 1;
    if (c < 0x800) return 2;
    if (c < 0x10000) return 3;
    return 4;
}

/// Check if a code point is a control character (general category Cc).
constexpr auto is_control(char32_t c) noexcept -> bool {
    return c < 0x20 || (c >= 0x7F && c < 0xA0);
}

/// Check if `offset` falls on a code point boundary of `text`.
/// Both ends of the view count as boundaries.
constexpr auto is_boundary(std::string_view text, std::size_t offset) noexcept -> bool {
    if (offset == text.size()) return true;
    if (offset > text.size()) return false;
    return !is_continuation(text[offset]);
}

// -- Decoding -----------------------------------------------------------------

/// Decode the first code point of a valid UTF-8 view.
/// Returns nullopt if the view is empty.
inline auto decode_front(std::string_view text) -> std::optional<Decoded> {
    if (text.empty()) return std::nullopt;

    const auto lead = static_cast<unsigned char>(text[0]);
    if (lead < 0x80) {
        return Decoded{.code_point = lead, .width = 1};
    }

    const auto width = sequence_width(text[0]);
    assert(width >= 2 && width <= text.size());

    static constexpr unsigned char lead_mask[5] = {0, 0, 0x1F, 0x0F, 0x07};
    auto cp = static_cast<char32_t>(lead & lead_mask[width]);
    for (std::size_t i = 1; i < width; ++i) {
        cp = (cp << 6) | (static_cast<unsigned char>(text[i]) & 0x3F);
    }
    return Decoded{.code_point = cp, .width = width};
}

/// Decode the last code point of a valid UTF-8 view.
/// Returns nullopt if the view is empty.
inline auto decode_back(std::string_view text) -> std::optional<Decoded> {
    if (text.empty()) return std::nullopt;

    auto start = text.size() - 1;
    while (start > 0 && is_continuation(text[start])) {
        --start;
    }
    auto result = decode_front(text.substr(start));
    assert(result && result->width == text.size() - start);
    return result;
}

/// Count the code points of a valid UTF-8 view.
inline auto count(std::string_view text) noexcept -> std::size_t {
    auto n = std::size_t{0};
    for (auto byte : text) {
        if (!is_continuation(byte)) ++n;
    }
    return n;
}

// -- Encoding -----------------------------------------------------------------

/// Encode a Unicode scalar value as UTF-8.
inline auto encode(char32_t c) -> Encoded {
    assert(c <= max_code_point && !(c >= 0xD800 && c <= 0xDFFF));

    auto out = Encoded{};
    out.size = encoded_width(c);
    switch (out.size) {
        case 1:
            out.bytes[0] = static_cast<char>(c);
            break;
        case 2:
            out.bytes[0] = static_cast<char>(0xC0 | (c >> 6));
            out.bytes[1] = static_cast<char>(0x80 | (c & 0x3F));
            break;
        case 3:
            out.bytes[0] = static_cast<char>(0xE0 | (c >> 12));
            out.bytes[1] = static_cast<char>(0x80 | ((c >> 6) & 0x3F));
            out.bytes[2] = static_cast<char>(0x80 | (c & 0x3F));
            break;
        default:
            out.bytes[0] = static_cast<char>(0xF0 | (c >> 18));
            out.bytes[1] = static_cast<char>(0x80 | ((c >> 12) & 0x3F));
            out.bytes[2] = static_cast<char>(0x80 | ((c >> 6) & 0x3F));
            out.bytes[3] = static_cast<char>(0x80 | (c & 0x3F));
            break;
    }
    return out;
}

// -- Validation ---------------------------------------------------------------

/// Check that `bytes` is well-formed UTF-8.
///
/// Rejects stray continuation bytes, invalid lead bytes, truncated
/// sequences, overlong forms, UTF-16 surrogates and values above U+10FFFF.
/// @return nullopt if valid, otherwise an ErrorKind::invalid_utf8 error
///   naming the byte offset of the offending sequence.
inline auto validate(std::string_view bytes) -> std::optional<Error> {
    static constexpr char32_t min_for_width[5] = {0, 0, 0x80, 0x800, 0x10000};

    auto fail = [](std::string_view what, std::size_t offset) {
        return Error{ErrorKind::invalid_utf8,
                     std::string{what} + " at byte offset " + std::to_string(offset)};
    };

    std::size_t i = 0;
    while (i < bytes.size()) {
        const auto width = sequence_width(bytes[i]);
        if (width == 0) {
            return fail(is_continuation(bytes[i]) ? "unexpected continuation byte"
                                                  : "invalid lead byte", i);
        }
        if (width == 1) {
            ++i;
            continue;
        }
        if (bytes.size() - i < width) {
            return fail("truncated sequence", i);
        }

        static constexpr unsigned char lead_mask[5] = {0, 0, 0x1F, 0x0F, 0x07};
        auto cp = static_cast<char32_t>(static_cast<unsigned char>(bytes[i]) & lead_mask[width]);
        for (std::size_t k = 1; k < width; ++k) {
            if (!is_continuation(bytes[i + k])) {
                return fail("truncated sequence", i);
            }
            cp = (cp << 6) | (static_cast<unsigned char>(bytes[i + k]) & 0x3F);
        }

        if (cp < min_for_width[width]) return fail("overlong encoding", i);
        if (cp >= 0xD800 && cp <= 0xDFFF) return fail("encoded surrogate", i);
        if (cp > max_code_point) return fail("code point out of range", i);

        i += width;
    }
    return std::nullopt;
}

/// Check that `bytes` is well-formed UTF-8.
inline auto is_valid(std::string_view bytes) -> bool {
    return !validate(bytes).has_value();
}

}  // namespace str_cursor::utf8
