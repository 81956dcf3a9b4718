// basic_usage: demonstrates the core blocktree-cpp API
//
// Builds a small document, edits it through block-level operations, styles
// text, nests list items and exports the result as Markdown, HTML and JSON.
//
// Build: cmake --build build
// Run:   ./build/examples/basic_usage

#include <blocktree-cpp/blocktree.hpp>
#include <blocktree-cpp/json.hpp>

#include <loguru.hpp>

#include <cstdint>
#include <cstdio>
#include <string>
#include <vector>

namespace bt = blocktree_cpp;

namespace {

void print_outline(const std::vector<bt::Block>& blocks, int depth = 0) {
    for (const auto& block : blocks) {
        std::printf("%*s- [%s] %s\n", depth * 2, "", block.type.c_str(), bt::plain_text(block.content).c_str());
        print_outline(block.children, depth + 1);
    }
}

}  // anonymous namespace

int main(int argc, char* argv[]) {
    loguru::init(argc, argv);

    auto editor = bt::Editor{bt::EditorOptions{
        .initial_content = {
            bt::PartialBlock{.id = "title", .type = "heading", .content = bt::plain_content("Shopping List")},
            bt::PartialBlock{.id = "milk", .type = "bulletListItem", .content = bt::plain_content("Milk")},
            bt::PartialBlock{.id = "eggs", .type = "bulletListItem", .content = bt::plain_content("Eggs")},
        },
        .on_content_change = [](bt::Editor& e) {
            std::printf("content changed (version %llu)\n", static_cast<unsigned long long>(e.version()));
        },
    }};

    // -- Insert and update ------------------------------------------------------
    auto ids = editor.insert_blocks(
        {bt::PartialBlock{.type = "bulletListItem", .content = bt::plain_content("Bread")}},
        "eggs", bt::Placement::after);
    editor.update_block("title", bt::PartialBlock{.props = {{"level", bt::PropValue{std::int64_t{2}}}}});

    // -- Nesting: make "Eggs" a child of "Milk" ---------------------------------
    editor.set_text_cursor_position("eggs");
    if (editor.can_nest_block()) editor.nest_block();

    // -- Styles: bold the word "Bread" ------------------------------------------
    editor.set_text_cursor_position(ids.front());
    auto cursor = editor.text_cursor_position();
    auto bread = bt::find_block(editor.doc(), ids.front());
    editor.set_selection(bread->content_start(), bread->content_end());
    editor.add_styles(bt::Styles{.bold = true});
    std::printf("cursor block: %s, bold: %s\n", cursor->block.id.c_str(),
                editor.active_styles().bold ? "yes" : "no");

    // -- Links --------------------------------------------------------------------
    editor.set_text_cursor_position("title", bt::CursorPlacement::end);
    editor.create_link("https://example.com/list", " (online)");

    print_outline(editor.top_level_blocks());

    // -- Export -------------------------------------------------------------------
    auto blocks = editor.top_level_blocks();
    std::printf("\nMarkdown:\n%s", editor.blocks_to_markdown(blocks).get().c_str());
    std::printf("\nHTML:\n%s\n", editor.blocks_to_html(blocks).get().c_str());
    std::printf("\nJSON:\n%s\n", bt::blocks_to_json(blocks).dump(2).c_str());

    // -- Import -------------------------------------------------------------------
    auto imported = editor.markdown_to_blocks("# Notes\n\n- one\n  - two\n").get();
    print_outline(imported);

    auto stats = editor.cache_stats();
    std::printf("\ncache: %zu hits, %zu misses, %zu evictions\n", stats.hits, stats.misses, stats.evictions);
    return 0;
}
