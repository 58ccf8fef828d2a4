// Fuzz target for StrCursor — interprets the input as a script of cursor
// operations over itself and checks the highlight/spanner invariants after
// every operation:
//   - highlight() + post() == base(), split on a code point boundary
//   - spanner_head == spanner_tail advanced over highlight()
//   - unstep() after step() restores the previous state

#include <str-cursor/str_cursor.hpp>

#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <string_view>

namespace sc = str_cursor;

namespace {

template <sc::Spanner S>
void check_invariants(const sc::StrCursor<S>& c) {
    if (c.highlight().size() + c.post().size() != c.base().size()) std::abort();
    if (c.highlight().data() != c.base().data()) std::abort();
    if (!sc::utf8::is_boundary(c.base(), c.highlight_length())) std::abort();

    auto expected = c.spanner_tail;
    sc::forward_str(expected, c.highlight());
    if (!(c.spanner_head == expected)) std::abort();
}

template <sc::Spanner S>
void run_script(std::string_view text) {
    auto c = sc::StrCursor<S>{text};
    for (auto op : text) {
        switch (static_cast<unsigned char>(op) % 6) {
            case 0: {
                const auto before = c.highlight_length();
                const auto head = c.spanner_head;
                if (c.step()) {
                    c.unstep();
                    if (c.highlight_length() != before || !(c.spanner_head == head)) std::abort();
                    c.step();
                }
                break;
            }
            case 1:
                c.unstep();
                break;
            case 2: {
                const auto before = c.highlight_length();
                const auto needle = static_cast<char>(static_cast<unsigned char>(op) & 0x7F);
                const auto consumed = c.step_until(needle);
                if (before + consumed.size() != c.highlight_length()) std::abort();
                break;
            }
            case 3:
                c.step_until([op](char32_t cp) { return cp == static_cast<unsigned char>(op) / 2u; });
                break;
            case 4:
                c.validate();
                break;
            default:
                c.then_validate([op](std::string_view h) { return h.size() % 2 == static_cast<std::size_t>(op & 1); });
                break;
        }
        check_invariants(c);
    }
}

}  // namespace

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    const auto text = std::string_view{reinterpret_cast<const char*>(data), size};
    if (!sc::utf8::is_valid(text)) return 0;

    run_script<sc::ByteSpanner>(text);
    run_script<sc::CharSpanner>(text);
    run_script<sc::RowColSpanner>(text);
    return 0;
}
