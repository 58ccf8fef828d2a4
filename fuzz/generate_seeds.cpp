// Helper to generate seed corpus files for fuzz testing.
// Build and run once: ./generate_seeds
// Not a fuzz target itself — just a corpus generator.

#include <str-cursor/utf8.hpp>

#include <cstdio>
#include <filesystem>
#include <fstream>
#include <string>
#include <string_view>

static void write_seed(const std::string& path, std::string_view data) {
    auto ofs = std::ofstream{path, std::ios::binary};
    ofs.write(data.data(), static_cast<std::streamsize>(data.size()));
}

int main() {
    namespace fs = std::filesystem;
    const auto dir = std::string{"fuzz/corpus"};
    fs::create_directories(dir);

    struct Seed {
        const char* name;
        std::string_view bytes;
    };

    const Seed seeds[] = {
        // Valid text: exercised by both targets
        {"seed_ascii.txt", "hello world"},
        {"seed_lines.txt", "key = value;\nother = 42;\r\n\n\tindented\n"},
        {"seed_multibyte.txt", "a\xC3\xA9\xE2\x82\xAC\xF0\x9F\x98\x80\n\xC2\xA9"},
        {"seed_controls.txt", std::string_view{"\0\x01\x7F\xC2\x85\n\x1B[0m", 10}},
        // Malformed text: exercises validation rejects
        {"seed_overlong.bin", "\xC0\xAF\xE0\x80\xAF"},
        {"seed_surrogate.bin", "\xED\xA0\x80"},
        {"seed_truncated.bin", "ok\xF0\x9F\x98"},
        {"seed_out_of_range.bin", "\xF4\x90\x80\x80"},
    };

    for (const auto& seed : seeds) {
        write_seed(dir + "/" + seed.name, seed.bytes);
        std::printf("%-24s %s\n", seed.name,
                    str_cursor::utf8::is_valid(seed.bytes) ? "valid" : "invalid");
    }

    return 0;
}
