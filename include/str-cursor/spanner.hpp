/// @file spanner.hpp
/// @brief Position tracking strategies ("spanners") for StrCursor.
///
/// A spanner records where the cursor is in the input. The cursor calls
/// forward() for every code point it consumes, backward() for every code
/// point it gives back with unstep(), and validate() when the highlight is
/// committed. Different spanners count different things at different costs.

#pragma once

#include <str-cursor/utf8.hpp>

#include <concepts>
#include <cstddef>
#include <string_view>
#include <vector>

namespace str_cursor {

/// Requirements on a position tracking strategy.
///
/// - `forward(c)` is called when code point `c` is consumed.
/// - `backward(c)` is called when `c` is un-consumed; it must exactly undo
///   the matching forward(c). It is never called without one.
/// - `validate()` is called when tail catches up to head; the spanner may
///   discard whatever it kept to support backward().
///
/// A spanner may also provide `forward_str(std::string_view)`, equivalent
/// to calling forward() for each code point of the view. See forward_str().
template <typename S>
concept Spanner = std::copyable<S> && requires(S& s, char32_t c) {
    s.forward(c);
    s.backward(c);
    s.validate();
};

/// Advance `spanner` over every code point of `text`.
///
/// Uses the spanner's own forward_str() when it has one, and falls back to
/// one forward() call per code point otherwise.
template <Spanner S>
void forward_str(S& spanner, std::string_view text) {
    if constexpr (requires { spanner.forward_str(text); }) {
        spanner.forward_str(text);
    } else {
        while (auto decoded = utf8::decode_front(text)) {
            spanner.forward(decoded->code_point);
            text.remove_prefix(decoded->width);
        }
    }
}

/// A spanner that tracks nothing, at zero cost.
struct NoOpSpanner {
    constexpr void forward(char32_t) noexcept {}
    constexpr void backward(char32_t) noexcept {}
    constexpr void validate() noexcept {}
    constexpr void forward_str(std::string_view) noexcept {}

    auto operator==(const NoOpSpanner&) const -> bool = default;
};

/// A spanner counting how many bytes have been passed.
struct ByteSpanner {
    std::size_t bytes{0};  ///< UTF-8 bytes consumed since the start.

    constexpr void forward(char32_t c) noexcept { bytes += utf8::encoded_width(c); }
    constexpr void backward(char32_t c) noexcept { bytes -= utf8::encoded_width(c); }
    constexpr void validate() noexcept {}
    constexpr void forward_str(std::string_view s) noexcept { bytes += s.size(); }

    auto operator==(const ByteSpanner&) const -> bool = default;
};

/// A spanner counting how many code points have been passed.
struct CharSpanner {
    std::size_t chars{0};  ///< Code points consumed since the start.

    constexpr void forward(char32_t) noexcept { ++chars; }
    constexpr void backward(char32_t) noexcept { --chars; }
    constexpr void validate() noexcept {}
    void forward_str(std::string_view s) noexcept { chars += utf8::count(s); }

    auto operator==(const CharSpanner&) const -> bool = default;
};

/// A spanner keeping track of rows and columns.
///
/// Rows are counted in '\n' code points. The column counts the non-control
/// code points since the last newline; it is not a display width, so a tab
/// contributes nothing and a combining mark counts as one column.
///
/// Crossing a newline forward saves the column it ended, so that crossing
/// it backward can restore it. The saved columns are dropped on validate():
/// more expensive than the other spanners, but only in proportion to the
/// newlines inside the uncommitted highlight.
class RowColSpanner {
public:
    RowColSpanner() = default;

    /// A spanner starting at the given (zero-based) location, for text that
    /// is embedded at a known position of a larger document.
    static auto at(std::size_t row, std::size_t col) -> RowColSpanner {
        auto s = RowColSpanner{};
        s.row_ = row;
        s.col_ = col;
        return s;
    }

    void forward(char32_t c);
    void backward(char32_t c);
    void validate() noexcept;

    /// Zero-based row (number of newlines passed).
    auto row() const noexcept -> std::size_t { return row_; }

    /// Zero-based column within the current row.
    auto col() const noexcept -> std::size_t { return col_; }

    /// Number of newlines that can still be crossed backward.
    auto pending_newlines() const noexcept -> std::size_t { return saved_cols_.size(); }

    auto operator==(const RowColSpanner&) const -> bool = default;

private:
    std::size_t row_ = 0;
    std::size_t col_ = 0;
    std::vector<std::size_t> saved_cols_;
};

static_assert(Spanner<NoOpSpanner>);
static_assert(Spanner<ByteSpanner>);
static_assert(Spanner<CharSpanner>);
static_assert(Spanner<RowColSpanner>);

}  // namespace str_cursor
