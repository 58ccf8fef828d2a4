/// @file cursor.hpp
/// @brief StrCursor: a highlight cursor over a UTF-8 string view.

#pragma once

#include <str-cursor/pattern.hpp>
#include <str-cursor/spanner.hpp>
#include <str-cursor/utf8.hpp>

#include <algorithm>
#include <cassert>
#include <concepts>
#include <cstddef>
#include <functional>
#include <optional>
#include <string_view>
#include <type_traits>
#include <utility>

namespace str_cursor {

/// A result that can report success when tested as a bool, such as
/// `std::optional<T>`, `std::expected<T, E>` or `bool` itself.
template <typename R>
concept ValidationResult = requires(const R& r) {
    static_cast<bool>(r);
};

/// A cursor (or highlight) over a UTF-8 string view.
///
/// The cursor can be seen as a tape with two pointers on it, `tail` and
/// `head`, delimiting the current highlight `[tail, head)`. `head` moves
/// forward with step() and step_until(), and back with unstep(), but never
/// before `tail`. validate() brings `tail` to `head`; once `tail` has moved
/// forward it cannot move backward, and the text before it is no longer
/// reachable from the cursor.
///
/// The text is borrowed, never copied: it must be valid UTF-8 and must
/// outlive the cursor and every view returned from it. Use try_new() for
/// bytes that have not been validated.
///
/// The cursor is parametrised by a Spanner that keeps track of the
/// position in the input. `spanner_tail` and `spanner_head` hold the
/// position at `tail` and `head` respectively and may be read at any time,
/// e.g. to report where a diagnostic applies.
///
/// @code
/// auto cursor = StrCursor{"key = value", RowColSpanner{}};
/// auto key = cursor.step_until(U'=');        // "key "
/// cursor.validate();
/// cursor.step();                              // '='
/// @endcode
template <Spanner S = NoOpSpanner>
class StrCursor {
public:
    using spanner_type = S;

    /// Create a cursor over `text` with a default-constructed spanner.
    explicit StrCursor(std::string_view text)
        requires std::default_initializable<S>
        : StrCursor{text, S{}} {}

    /// Create a cursor over `text`, starting from the given spanner value.
    StrCursor(std::string_view text, S spanner)
        : spanner_tail{std::move(spanner)}, spanner_head{spanner_tail}, base_{text} {}

    /// Create a cursor over bytes that may not be valid UTF-8.
    /// @return nullopt if `bytes` is not valid UTF-8.
    static auto try_new(std::string_view bytes, S spanner) -> std::optional<StrCursor> {
        if (!utf8::is_valid(bytes)) return std::nullopt;
        return StrCursor{bytes, std::move(spanner)};
    }

    /// Create a cursor over bytes that may not be valid UTF-8, with a
    /// default-constructed spanner.
    static auto try_new(std::string_view bytes) -> std::optional<StrCursor>
        requires std::default_initializable<S>
    {
        return try_new(bytes, S{});
    }

    // -- Queries --------------------------------------------------------------

    /// Check if the current highlight is empty (`head == tail`).
    auto highlight_empty() const noexcept -> bool { return highlight_length_ == 0; }

    /// Check if the post slice (`[head, end)`) is empty.
    auto post_empty() const noexcept -> bool { return highlight_length_ == base_.size(); }

    /// The current highlight, `[tail, head)`.
    auto highlight() const noexcept -> std::string_view {
        return base_.substr(0, highlight_length_);
    }

    /// The post slice, `[head, end)`.
    auto post() const noexcept -> std::string_view {
        return base_.substr(highlight_length_);
    }

    /// The text from `tail` to the end: highlight followed by post.
    auto base() const noexcept -> std::string_view { return base_; }

    /// Length of the highlight in bytes.
    auto highlight_length() const noexcept -> std::size_t { return highlight_length_; }

    // -- Moving head ----------------------------------------------------------

    /// Advance `head` by one code point.
    /// @return The code point passed, or nullopt if `head` is already at the
    ///   end of the text.
    auto step() -> std::optional<char32_t> {
        const auto decoded = utf8::decode_front(post());
        if (!decoded) return std::nullopt;
        highlight_length_ += decoded->width;
        spanner_head.forward(decoded->code_point);
        return decoded->code_point;
    }

    /// Move `head` back by one code point.
    /// @return The code point given back, or nullopt if `head` is already at
    ///   `tail`.
    auto unstep() -> std::optional<char32_t> {
        const auto decoded = utf8::decode_back(highlight());
        if (!decoded) return std::nullopt;
        highlight_length_ -= decoded->width;
        spanner_head.backward(decoded->code_point);
        return decoded->code_point;
    }

    /// Advance `head` up to the first match of `pat` in the post slice.
    ///
    /// The returned slice is empty if the pattern matches right at `head`.
    /// If the pattern does not match at all, or reports an offset past the
    /// end, the whole post slice is consumed and returned.
    template <Pattern P>
    auto step_until(P&& pat) -> std::string_view {
        const auto rest = post();
        const auto offset = std::min(pattern::find(pat, rest).value_or(rest.size()), rest.size());
        assert(utf8::is_boundary(rest, offset));

        const auto consumed = rest.substr(0, offset);
        highlight_length_ += consumed.size();
        forward_str(spanner_head, consumed);
        return consumed;
    }

    // -- Committing -----------------------------------------------------------

    /// Validate the current highlight, bringing `tail` to `head`.
    ///
    /// The highlighted text is dropped from the cursor's view and can no
    /// longer be stepped back into.
    void validate() {
        base_ = post();
        highlight_length_ = 0;
        spanner_head.validate();
        spanner_tail = spanner_head;
    }

    /// Run `f` on the current highlight and validate it if `f` succeeds.
    ///
    /// Success is the result testing true. On failure, or if `f` throws,
    /// the cursor is left untouched.
    /// @return Whatever `f` returned.
    template <typename F>
        requires std::invocable<F&, std::string_view> &&
                 ValidationResult<std::invoke_result_t<F&, std::string_view>>
    auto then_validate(F&& f) -> std::remove_cvref_t<std::invoke_result_t<F&, std::string_view>> {
        auto result = std::invoke(f, highlight());
        if (static_cast<bool>(result)) {
            validate();
        }
        return result;
    }

    /// Position at `tail`.
    S spanner_tail;
    /// Position at `head`.
    S spanner_head;

private:
    std::string_view base_;
    std::size_t highlight_length_ = 0;
};

}  // namespace str_cursor
