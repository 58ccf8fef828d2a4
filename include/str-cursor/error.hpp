/// @file error.hpp
/// @brief Error types for the str-cursor library.

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace str_cursor {

/// Categories of errors that can occur while scanning text.
enum class ErrorKind : std::uint8_t {
    invalid_utf8,      ///< The input bytes are not well-formed UTF-8.
    unexpected_end,    ///< The text ended before a construct was complete.
    unexpected_input,  ///< The highlighted text does not form the expected construct.
};

/// Convert an ErrorKind to its string representation.
constexpr auto to_string_view(ErrorKind kind) noexcept -> std::string_view {
    switch (kind) {
        case ErrorKind::invalid_utf8:     return "invalid_utf8";
        case ErrorKind::unexpected_end:   return "unexpected_end";
        case ErrorKind::unexpected_input: return "unexpected_input";
    }
    return "unknown";
}

/// Parse the string representation produced by to_string_view().
constexpr auto error_kind_from_string(std::string_view name) noexcept
    -> std::optional<ErrorKind> {
    if (name == "invalid_utf8")     return ErrorKind::invalid_utf8;
    if (name == "unexpected_end")   return ErrorKind::unexpected_end;
    if (name == "unexpected_input") return ErrorKind::unexpected_input;
    return std::nullopt;
}

/// A structured error with a category and a human-readable message.
struct Error {
    ErrorKind kind;      ///< The category of this error.
    std::string message; ///< A human-readable description.

    /// Construct an Error with the given kind and message.
    Error(ErrorKind k, std::string msg)
        : kind{k}, message{std::move(msg)} {}

    auto operator==(const Error& other) const -> bool = default;
};

}  // namespace str_cursor
