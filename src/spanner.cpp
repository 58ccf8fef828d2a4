#include <str-cursor/spanner.hpp>

#include <cassert>

namespace str_cursor {

void RowColSpanner::forward(char32_t c) {
    if (c == U'\n') {
        saved_cols_.push_back(col_);
        ++row_;
        col_ = 0;
    } else if (!utf8::is_control(c)) {
        ++col_;
    }
}

void RowColSpanner::backward(char32_t c) {
    if (c == U'\n') {
        // backward('\n') without a matching forward('\n') since the last
        // validate() is a caller bug
        assert(!saved_cols_.empty() && row_ > 0);
        --row_;
        col_ = saved_cols_.back();
        saved_cols_.pop_back();
    } else if (!utf8::is_control(c)) {
        assert(col_ > 0);
        --col_;
    }
}

void RowColSpanner::validate() noexcept {
    saved_cols_.clear();
}

}  // namespace str_cursor
