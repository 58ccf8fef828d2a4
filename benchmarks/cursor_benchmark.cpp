// str-cursor benchmarks — measures throughput of the scanning hot path
// across spanners and pattern kinds.

#include <str-cursor/str_cursor.hpp>

#include <benchmark/benchmark.h>

#include <array>
#include <cstdint>
#include <string>

using namespace str_cursor;

// ~64 KiB of mixed ASCII and multi-byte text over many short lines.
static auto make_text() -> const std::string& {
    static const auto text = [] {
        auto s = std::string{};
        for (int i = 0; s.size() < 64 * 1024; ++i) {
            s += "key_" + std::to_string(i) + " = \"valu\xC3\xA9 \xE2\x82\xAC" + std::to_string(i * 7) + "\";\n";
        }
        return s;
    }();
    return text;
}

// =============================================================================
// step
// =============================================================================

template <Spanner S>
static void bm_step_to_end(benchmark::State& state) {
    const auto& text = make_text();
    for (auto _ : state) {
        auto c = StrCursor<S>{text};
        while (auto cp = c.step()) {
            benchmark::DoNotOptimize(cp);
        }
        benchmark::DoNotOptimize(c.spanner_head);
    }
    state.SetBytesProcessed(static_cast<std::int64_t>(state.iterations() * text.size()));
}
BENCHMARK_TEMPLATE(bm_step_to_end, NoOpSpanner);
BENCHMARK_TEMPLATE(bm_step_to_end, ByteSpanner);
BENCHMARK_TEMPLATE(bm_step_to_end, CharSpanner);
BENCHMARK_TEMPLATE(bm_step_to_end, RowColSpanner);

template <Spanner S>
static void bm_step_unstep(benchmark::State& state) {
    const auto& text = make_text();
    auto c = StrCursor<S>{text};
    for (auto _ : state) {
        for (int i = 0; i < 64; ++i) c.step();
        for (int i = 0; i < 64; ++i) c.unstep();
        benchmark::DoNotOptimize(c.spanner_head);
    }
    state.SetItemsProcessed(state.iterations() * 128);
}
BENCHMARK_TEMPLATE(bm_step_unstep, ByteSpanner);
BENCHMARK_TEMPLATE(bm_step_unstep, RowColSpanner);

// =============================================================================
// step_until, one statement per validate
// =============================================================================

template <Spanner S>
static void bm_step_until_char(benchmark::State& state) {
    const auto& text = make_text();
    for (auto _ : state) {
        auto c = StrCursor<S>{text};
        while (!c.post_empty()) {
            benchmark::DoNotOptimize(c.step_until(';'));
            c.step();
            c.validate();
        }
    }
    state.SetBytesProcessed(static_cast<std::int64_t>(state.iterations() * text.size()));
}
BENCHMARK_TEMPLATE(bm_step_until_char, NoOpSpanner);
BENCHMARK_TEMPLATE(bm_step_until_char, ByteSpanner);
BENCHMARK_TEMPLATE(bm_step_until_char, CharSpanner);
BENCHMARK_TEMPLATE(bm_step_until_char, RowColSpanner);

static void bm_step_until_literal(benchmark::State& state) {
    const auto& text = make_text();
    for (auto _ : state) {
        auto c = StrCursor<CharSpanner>{text};
        while (!c.post_empty()) {
            benchmark::DoNotOptimize(c.step_until("\";\n"));
            c.step_until('\n');
            c.step();
            c.validate();
        }
    }
    state.SetBytesProcessed(static_cast<std::int64_t>(state.iterations() * text.size()));
}
BENCHMARK(bm_step_until_literal);

static void bm_step_until_set(benchmark::State& state) {
    const auto& text = make_text();
    const auto separators = std::array<char32_t, 3>{U'=', U';', U'€'};
    for (auto _ : state) {
        auto c = StrCursor<ByteSpanner>{text};
        while (!c.post_empty()) {
            benchmark::DoNotOptimize(c.step_until(separators));
            c.step();
            c.validate();
        }
    }
    state.SetBytesProcessed(static_cast<std::int64_t>(state.iterations() * text.size()));
}
BENCHMARK(bm_step_until_set);

static void bm_step_until_predicate(benchmark::State& state) {
    const auto& text = make_text();
    for (auto _ : state) {
        auto c = StrCursor<RowColSpanner>{text};
        while (!c.post_empty()) {
            benchmark::DoNotOptimize(c.step_until([](char32_t cp) { return cp == U'"'; }));
            c.step();
            c.validate();
        }
    }
    state.SetBytesProcessed(static_cast<std::int64_t>(state.iterations() * text.size()));
}
BENCHMARK(bm_step_until_predicate);

// =============================================================================
// then_validate
// =============================================================================

static void bm_then_validate_words(benchmark::State& state) {
    const auto& text = make_text();
    std::int64_t words = 0;
    for (auto _ : state) {
        auto c = StrCursor<RowColSpanner>{text};
        while (!c.post_empty()) {
            c.step_until([](char32_t cp) { return cp == U' ' || cp == U'\n'; });
            if (c.then_validate([](std::string_view w) { return !w.empty(); })) ++words;
            c.step();
            c.validate();
        }
    }
    benchmark::DoNotOptimize(words);
    state.SetBytesProcessed(static_cast<std::int64_t>(state.iterations() * text.size()));
}
BENCHMARK(bm_then_validate_words);

// =============================================================================
// UTF-8 validation
// =============================================================================

static void bm_utf8_validate(benchmark::State& state) {
    const auto& text = make_text();
    for (auto _ : state) {
        benchmark::DoNotOptimize(utf8::is_valid(text));
    }
    state.SetBytesProcessed(static_cast<std::int64_t>(state.iterations() * text.size()));
}
BENCHMARK(bm_utf8_validate);

BENCHMARK_MAIN();
