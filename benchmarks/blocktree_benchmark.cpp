// blocktree-cpp benchmarks: measures conversion, lookup and mutation costs.

#include <blocktree-cpp/blocktree.hpp>

#include <benchmark/benchmark.h>
#include <loguru.hpp>

#include <cstdint>
#include <string>
#include <vector>

using namespace blocktree_cpp;

namespace {

auto paragraphs(std::size_t n) -> std::vector<PartialBlock> {
    auto blocks = std::vector<PartialBlock>{};
    blocks.reserve(n);
    for (std::size_t i = 0; i < n; ++i) {
        blocks.push_back(PartialBlock{
            .id = "b" + std::to_string(i),
            .type = i % 4 == 0 ? "heading" : "paragraph",
            .props = {},
            .content = std::vector<InlineContent>{
                StyledText{.text = "Block number ", .styles = {}},
                StyledText{.text = std::to_string(i), .styles = Styles{.bold = true}},
            },
            .children = std::nullopt,
        });
    }
    return blocks;
}

auto make_editor(std::size_t n) -> Editor {
    loguru::g_stderr_verbosity = loguru::Verbosity_WARNING;
    return Editor{EditorOptions{.initial_content = paragraphs(n),
                                .id_generator = sequential_id_generator("g"),
                                .read_locking = false}};
}

}  // anonymous namespace

// =============================================================================
// Conversion
// =============================================================================

static void bm_convert_cold(benchmark::State& state) {
    const auto n = static_cast<std::size_t>(state.range(0));
    auto editor = make_editor(n);
    const auto& schema = editor.schema();
    for (auto _ : state) {
        auto blocks = std::vector<Block>{};
        for (const auto& frame : editor.doc()->first_child()->content()) {
            blocks.push_back(node_to_block(frame, schema));
        }
        benchmark::DoNotOptimize(blocks);
    }
    state.SetItemsProcessed(static_cast<std::int64_t>(state.iterations() * n));
}
BENCHMARK(bm_convert_cold)->Range(8, 1024);

static void bm_convert_cached(benchmark::State& state) {
    const auto n = static_cast<std::size_t>(state.range(0));
    auto editor = make_editor(n);
    for (auto _ : state) {
        auto blocks = editor.top_level_blocks();
        benchmark::DoNotOptimize(blocks);
    }
    state.SetItemsProcessed(static_cast<std::int64_t>(state.iterations() * n));
}
BENCHMARK(bm_convert_cached)->Range(8, 1024);

// =============================================================================
// Lookups
// =============================================================================

static void bm_find_block(benchmark::State& state) {
    const auto n = static_cast<std::size_t>(state.range(0));
    auto editor = make_editor(n);
    auto doc = editor.doc();
    auto id = "b" + std::to_string(n - 1);
    for (auto _ : state) {
        benchmark::DoNotOptimize(find_block(doc, id));
    }
}
BENCHMARK(bm_find_block)->Range(8, 1024);

static void bm_block_info_at(benchmark::State& state) {
    const auto n = static_cast<std::size_t>(state.range(0));
    auto editor = make_editor(n);
    auto doc = editor.doc();
    auto last = find_block(doc, "b" + std::to_string(n - 1));
    for (auto _ : state) {
        benchmark::DoNotOptimize(block_info_at(doc, last->content_start()));
    }
}
BENCHMARK(bm_block_info_at)->Range(8, 1024);

// =============================================================================
// Mutations
// =============================================================================

static void bm_update_block(benchmark::State& state) {
    const auto n = static_cast<std::size_t>(state.range(0));
    auto editor = make_editor(n);
    auto target = "b" + std::to_string(n / 2);
    std::int64_t i = 0;
    for (auto _ : state) {
        editor.update_block(target, PartialBlock{.content = plain_content("edit " + std::to_string(i++))});
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(bm_update_block)->Range(8, 1024);

static void bm_insert_remove(benchmark::State& state) {
    auto editor = make_editor(64);
    auto insertion = std::vector<PartialBlock>{PartialBlock{.type = "paragraph", .content = plain_content("x")}};
    for (auto _ : state) {
        auto ids = editor.insert_blocks(insertion, "b32", Placement::after);
        editor.remove_blocks({ids.front()});
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(bm_insert_remove);

static void bm_markdown_round_trip(benchmark::State& state) {
    auto editor = make_editor(static_cast<std::size_t>(state.range(0)));
    auto blocks = editor.top_level_blocks();
    for (auto _ : state) {
        auto md = blocktree_cpp::blocks_to_markdown(blocks);
        benchmark::DoNotOptimize(markdown_to_blocks(md, editor.schema()));
    }
}
BENCHMARK(bm_markdown_round_trip)->Range(8, 512);
