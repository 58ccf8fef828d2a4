// Fuzz target for UTF-8 validation — exercises malformed sequences
// (overlong forms, surrogates, truncation) and checks that every input
// accepted by validate() decodes cleanly in both directions.

#include <str-cursor/utf8.hpp>

#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <string_view>

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    const auto text = std::string_view{reinterpret_cast<const char*>(data), size};
    namespace utf8 = str_cursor::utf8;

    if (!utf8::is_valid(text)) return 0;

    // Forward and backward decoding must agree on the code point count
    auto forward = text;
    auto n_forward = std::size_t{0};
    while (auto d = utf8::decode_front(forward)) {
        if (utf8::encode(d->code_point).view() != forward.substr(0, d->width)) std::abort();
        forward.remove_prefix(d->width);
        ++n_forward;
    }

    auto backward = text;
    auto n_backward = std::size_t{0};
    while (auto d = utf8::decode_back(backward)) {
        backward.remove_suffix(d->width);
        ++n_backward;
    }

    if (n_forward != n_backward || n_forward != utf8::count(text)) std::abort();
    return 0;
}
