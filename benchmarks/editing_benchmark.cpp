// docspan-cpp benchmarks - measures throughput of core editing operations.

#include "../src/snapshot.hpp"

#include <docspan-cpp/docspan.hpp>

#include <benchmark/benchmark.h>

#include <spdlog/spdlog.h>

#include <cstdint>
#include <string>
#include <vector>

using namespace docspan_cpp;

// A document of `paragraphs` paragraphs with `runs` addressed runs each.
static auto make_doc(std::size_t paragraphs, std::size_t runs, AddressMinter& minter) -> Document {
    auto doc = Document{};
    for (std::size_t p = 0; p < paragraphs; ++p) {
        auto pid = doc.append_paragraph();
        for (std::size_t r = 0; r < runs; ++r) {
            auto rid = doc.append_run(pid, "The quick brown fox jumps over the lazy dog. ", RunFormat{});
            doc.addresses().bind(rid, minter.mint());
        }
    }
    return doc;
}

static auto first_address(const Document& doc) -> Address {
    return *doc.addresses().address_of(doc.paragraphs().front().runs.front());
}

// =============================================================================
// SpanEditor
// =============================================================================

static void bm_insert_text(benchmark::State& state) {
    auto minter = AddressMinter{1};
    auto doc = make_doc(10, 4, minter);
    auto address = first_address(doc);
    auto editor = SpanEditor{doc, minter};
    for (auto _ : state) {
        editor.insert_text(Caret{address, 0}, "x", std::nullopt);
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(bm_insert_text);

static void bm_range_style(benchmark::State& state) {
    const auto runs = static_cast<std::size_t>(state.range(0));
    auto style = StyleUpdate{};
    for (auto _ : state) {
        state.PauseTiming();
        auto minter = AddressMinter{1};
        auto doc = make_doc(1, runs, minter);
        const auto& order = doc.paragraphs().front().runs;
        auto start = *doc.addresses().address_of(order.front());
        auto end = *doc.addresses().address_of(order.back());
        style.bold = !style.bold.value_or(false);
        auto editor = SpanEditor{doc, minter};
        state.ResumeTiming();

        editor.update_range_style(TextRange{Caret{start, 3}, Caret{end, 7}}, style);
    }
    state.SetItemsProcessed(static_cast<std::int64_t>(state.iterations() * runs));
}
BENCHMARK(bm_range_style)->Range(8, 512);

static void bm_backspace_merge(benchmark::State& state) {
    for (auto _ : state) {
        state.PauseTiming();
        auto minter = AddressMinter{1};
        auto doc = make_doc(100, 2, minter);
        auto second = *doc.addresses().address_of(doc.paragraphs()[1].runs.front());
        auto editor = SpanEditor{doc, minter};
        state.ResumeTiming();

        editor.delete_backward(Caret{second, 0});
    }
}
BENCHMARK(bm_backspace_merge);

// =============================================================================
// Engine
// =============================================================================

static void bm_render_page(benchmark::State& state) {
    const auto paragraphs = static_cast<std::size_t>(state.range(0));
    const auto engine = NativeEngine{EngineOptions{paragraphs, 64}};
    auto minter = AddressMinter{1};
    auto doc = make_doc(paragraphs, 4, minter);
    for (auto _ : state) {
        auto html = engine.render_html(doc, 1);
        benchmark::DoNotOptimize(html);
    }
    state.SetItemsProcessed(static_cast<std::int64_t>(state.iterations() * paragraphs));
}
BENCHMARK(bm_render_page)->Range(8, 4096);

static void bm_render_sequential(benchmark::State& state) {
    const auto paragraphs = static_cast<std::size_t>(state.range(0));
    const auto engine = NativeEngine{EngineOptions{paragraphs, 0}};
    auto minter = AddressMinter{1};
    auto doc = make_doc(paragraphs, 4, minter);
    for (auto _ : state) {
        auto html = engine.render_html(doc, 1);
        benchmark::DoNotOptimize(html);
    }
    state.SetItemsProcessed(static_cast<std::int64_t>(state.iterations() * paragraphs));
}
BENCHMARK(bm_render_sequential)->Range(8, 4096);

static void bm_serialize_load(benchmark::State& state) {
    const auto engine = NativeEngine{};
    auto minter = AddressMinter{1};
    auto doc = make_doc(static_cast<std::size_t>(state.range(0)), 4, minter);
    for (auto _ : state) {
        auto loaded = engine.load(engine.serialize(doc));
        benchmark::DoNotOptimize(loaded);
    }
}
BENCHMARK(bm_serialize_load)->Range(8, 1024);

static void bm_snapshot_capture(benchmark::State& state) {
    const auto engine = NativeEngine{};
    auto minter = AddressMinter{1};
    auto doc = make_doc(static_cast<std::size_t>(state.range(0)), 4, minter);
    for (auto _ : state) {
        auto snapshot = detail::capture_snapshot(engine, doc);
        benchmark::DoNotOptimize(snapshot);
    }
}
BENCHMARK(bm_snapshot_capture)->Range(8, 1024);

static void bm_snapshot_restore(benchmark::State& state) {
    const auto engine = NativeEngine{};
    auto minter = AddressMinter{1};
    auto doc = make_doc(static_cast<std::size_t>(state.range(0)), 4, minter);
    const auto snapshot = detail::capture_snapshot(engine, doc);
    for (auto _ : state) {
        auto restored = detail::restore_snapshot(engine, snapshot);
        benchmark::DoNotOptimize(restored);
    }
}
BENCHMARK(bm_snapshot_restore)->Range(8, 1024);

// =============================================================================
// Session pipeline
// =============================================================================

static void bm_session_typing(benchmark::State& state) {
    spdlog::set_level(spdlog::level::warn);
    auto session = Session{};
    auto doc = session.snapshot();
    auto address = first_address(doc);
    std::uint64_t op = 0;
    for (auto _ : state) {
        auto id = session.identity();
        auto reply = session.insert_text(VersionedRequest{id.doc_id, id.version, std::to_string(op++)},
                                         Caret{address, 0}, "x", std::nullopt);
        benchmark::DoNotOptimize(reply);
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(bm_session_typing);

static void bm_session_undo_redo(benchmark::State& state) {
    spdlog::set_level(spdlog::level::warn);
    auto session = Session{};
    auto style = StyleUpdate{};
    style.italic = true;
    auto id = session.identity();
    session.update_document_style(VersionedRequest{id.doc_id, id.version, "seed"}, style);
    std::uint64_t op = 0;
    for (auto _ : state) {
        id = session.identity();
        session.undo(VersionedRequest{id.doc_id, id.version, std::to_string(op++)});
        id = session.identity();
        session.redo(VersionedRequest{id.doc_id, id.version, std::to_string(op++)});
    }
    state.SetItemsProcessed(state.iterations() * 2);
}
BENCHMARK(bm_session_undo_redo);

BENCHMARK_MAIN();
