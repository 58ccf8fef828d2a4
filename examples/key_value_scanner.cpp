// key_value_scanner — scans `key = value` lines with row/column diagnostics
//
// Demonstrates: RowColSpanner, step_until with sets and literals,
//               validate, reporting errors as JSON via json::span_of
//
// Build: cmake -B build -DSTR_CURSOR_BUILD_EXAMPLES=ON && cmake --build build
// Run:   ./build/examples/key_value_scanner

#include <str-cursor/json.hpp>
#include <str-cursor/str_cursor.hpp>

#include <nlohmann/json.hpp>

#include <array>
#include <cstdio>
#include <string>
#include <string_view>

namespace sc = str_cursor;

namespace {

constexpr std::string_view config =
    "# server settings\n"
    "host = example.org\n"
    "port = 8080\n"
    "greeting = h\xC3\xA9llo w\xC3\xB6rld\n"
    "broken line\n"
    " = orphan value\n"
    "timeout = 30";

auto trim(std::string_view s) -> std::string_view {
    while (!s.empty() && (s.front() == ' ' || s.front() == '\t')) s.remove_prefix(1);
    while (!s.empty() && (s.back() == ' ' || s.back() == '\t')) s.remove_suffix(1);
    return s;
}

// Reports an error at the cursor's current highlight.
void report(const sc::StrCursor<sc::RowColSpanner>& cursor, const sc::Error& error) {
    auto diag = sc::json::span_of(cursor);
    diag["error"] = error;
    std::printf("  error at %zu:%zu: %s\n", cursor.spanner_tail.row() + 1,
                cursor.spanner_tail.col() + 1, diag.dump().c_str());
}

}  // namespace

int main() {
    auto cursor = sc::StrCursor{config, sc::RowColSpanner{}};

    while (!cursor.post_empty()) {
        // Comment lines
        if (cursor.post().starts_with("#")) {
            cursor.step_until('\n');
            cursor.step();
            cursor.validate();
            continue;
        }

        // Key: everything up to '=' or the end of the line
        const auto key = trim(cursor.step_until(std::array<char32_t, 2>{U'=', U'\n'}));
        const auto line = cursor.spanner_tail.row() + 1;

        if (cursor.post_empty() || cursor.step() != U'=') {
            // Give the terminator back so the highlight covers the line only
            if (!cursor.highlight_empty() && cursor.highlight().back() == '\n') cursor.unstep();
            report(cursor, sc::Error{sc::ErrorKind::unexpected_end,
                                     "line ended before '=' after \"" + std::string{key} + "\""});
            cursor.step_until('\n');
            cursor.step();
            cursor.validate();
            continue;
        }
        if (key.empty()) {
            report(cursor, sc::Error{sc::ErrorKind::unexpected_input, "missing key before '='"});
            cursor.step_until('\n');
            cursor.step();
            cursor.validate();
            continue;
        }
        cursor.validate();

        // Value: the rest of the line
        const auto value = trim(cursor.step_until('\n'));
        std::printf("line %zu: %-10.*s -> \"%.*s\" (%zu code points)\n", line,
                    static_cast<int>(key.size()), key.data(),
                    static_cast<int>(value.size()), value.data(),
                    sc::utf8::count(value));
        cursor.step();
        cursor.validate();
    }

    std::printf("\nscanned %zu lines\n", cursor.spanner_tail.row() + 1);
    return 0;
}
