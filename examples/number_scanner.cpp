// number_scanner — transactional consumption with then_validate
//
// Demonstrates: try_new on untrusted bytes, step/unstep lookahead,
//               then_validate with std::optional, CharSpanner offsets
//
// Build: cmake -B build -DSTR_CURSOR_BUILD_EXAMPLES=ON && cmake --build build
// Run:   ./build/examples/number_scanner

#include <str-cursor/str_cursor.hpp>

#include <charconv>
#include <cstdint>
#include <cstdio>
#include <optional>
#include <string_view>

namespace sc = str_cursor;

namespace {

auto is_digit(char32_t c) -> bool { return c >= U'0' && c <= U'9'; }

auto parse_integer(std::string_view text) -> std::optional<std::int64_t> {
    auto value = std::int64_t{0};
    const auto* end = text.data() + text.size();
    const auto [ptr, ec] = std::from_chars(text.data(), end, value);
    if (text.empty() || ec != std::errc{} || ptr != end) return std::nullopt;
    return value;
}

void scan(std::string_view input) {
    std::printf("input: \"%.*s\"\n", static_cast<int>(input.size()), input.data());

    auto cursor = sc::StrCursor<sc::CharSpanner>::try_new(input);
    if (!cursor) {
        const auto error = sc::utf8::validate(input);
        std::printf("  rejected: %s\n", error ? error->message.c_str() : "invalid input");
        return;
    }

    while (!cursor->post_empty()) {
        // Optional sign, kept only if a digit follows
        if (cursor->step() != U'-') {
            cursor->unstep();
        }
        cursor->step_until([](char32_t c) { return !is_digit(c); });

        const auto at = cursor->spanner_tail.chars;
        if (auto n = cursor->then_validate(parse_integer)) {
            std::printf("  %lld at code point %zu\n", static_cast<long long>(*n), at);
            continue;
        }

        // Not a number: skip one code point and try again from there
        while (cursor->unstep()) {}
        cursor->step();
        cursor->validate();
    }
}

}  // namespace

int main() {
    scan("12 apples, -3 \xE2\x82\xAC, 4096 bytes");
    scan("-x-7");
    scan("bad \xFF byte 42");
    return 0;
}
