#include <blocktree-cpp/editor.hpp>
#include <blocktree-cpp/error.hpp>

#include <gtest/gtest.h>
#include <loguru.hpp>

#include <cstdint>
#include <string>
#include <vector>

using namespace blocktree_cpp;

namespace {

// Rejected mutations log warnings.
class QuietLogging : public ::testing::Environment {
public:
    void SetUp() override { loguru::g_stderr_verbosity = loguru::Verbosity_ERROR; }
};

const auto* const quiet_logging = ::testing::AddGlobalTestEnvironment(new QuietLogging);

auto block(std::string id, std::string text, std::vector<PartialBlock> children = {}) -> PartialBlock {
    return PartialBlock{.id = std::move(id), .type = "paragraph", .props = {},
                        .content = plain_content(std::move(text)),
                        .children = std::move(children)};
}

auto options(std::vector<PartialBlock> content) -> EditorOptions {
    auto opts = EditorOptions{};
    opts.initial_content = std::move(content);
    opts.id_generator = sequential_id_generator("n");
    return opts;
}

// a: "Hello", b: "World", c: "!"
auto hello_world() -> EditorOptions {
    return options({block("a", "Hello"), block("b", "World"), block("c", "!")});
}

auto ids_of(const std::vector<Block>& blocks) -> std::vector<std::string> {
    auto ids = std::vector<std::string>{};
    for (const auto& b : blocks) ids.push_back(b.id);
    return ids;
}

/// Select the whole text of one block.
void select_block_text(Editor& editor, const std::string& id) {
    editor.set_text_cursor_position(id, CursorPlacement::start);
    auto from = editor.text_selection().from;
    editor.set_text_cursor_position(id, CursorPlacement::end);
    editor.set_selection(from, editor.text_selection().from);
}

}  // anonymous namespace

// -- Construction ---------------------------------------------------------------

TEST(Editor, starts_with_one_empty_paragraph) {
    auto editor = Editor{};
    auto blocks = editor.top_level_blocks();
    ASSERT_EQ(blocks.size(), 1u);
    EXPECT_EQ(blocks[0].type, "paragraph");
    EXPECT_TRUE(blocks[0].content.empty());
    EXPECT_EQ(blocks[0].id.size(), 36u);
    EXPECT_TRUE(editor.read_locking());
}

TEST(Editor, initial_content_replaces_the_empty_paragraph) {
    auto editor = Editor{hello_world()};
    EXPECT_EQ(ids_of(editor.top_level_blocks()), (std::vector<std::string>{"a", "b", "c"}));
}

TEST(Editor, empty_schema_is_a_config_error) {
    auto opts = EditorOptions{};
    opts.block_specs.clear();
    try {
        Editor{std::move(opts)};
        FAIL() << "expected BlockTreeError";
    } catch (const BlockTreeError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::invalid_config);
    }
}

// -- Queries --------------------------------------------------------------------

TEST(Editor, get_block_finds_nested_blocks) {
    auto editor = Editor{options({block("a", "A", {block("x", "X")}), block("b", "B")})};
    auto x = editor.get_block("x");
    ASSERT_TRUE(x.has_value());
    EXPECT_EQ(plain_text(x->content), "X");
    EXPECT_FALSE(editor.get_block("missing").has_value());

    auto a = editor.get_block(Block{.id = "a"});
    ASSERT_TRUE(a.has_value());
    EXPECT_EQ(ids_of(a->children), (std::vector<std::string>{"x"}));
}

TEST(Editor, blocks_are_identified_by_any_value_with_an_id) {
    struct Row {
        std::string id;
        int order;
    };

    auto editor = Editor{hello_world()};
    EXPECT_EQ(editor.get_block(Row{.id = "b", .order = 2})->id, "b");
    EXPECT_EQ(editor.get_block(PartialBlock{.id = "c"})->id, "c");

    editor.remove_blocks({Row{.id = "a", .order = 1}, PartialBlock{.id = "c"}});
    EXPECT_EQ(ids_of(editor.top_level_blocks()), (std::vector<std::string>{"b"}));

    try {
        editor.get_block(PartialBlock{.type = "paragraph"});
        FAIL() << "expected BlockTreeError";
    } catch (const BlockTreeError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::block_not_found);
    }
}

TEST(Editor, for_each_block_walks_depth_first) {
    auto editor = Editor{options({block("a", "A", {block("x", "X"), block("y", "Y")}), block("b", "B")})};

    auto order = std::vector<std::string>{};
    editor.for_each_block([&](const Block& b) {
        order.push_back(b.id);
        return true;
    });
    EXPECT_EQ(order, (std::vector<std::string>{"a", "x", "y", "b"}));

    order.clear();
    editor.for_each_block([&](const Block& b) {
        order.push_back(b.id);
        return true;
    }, true);
    EXPECT_EQ(order, (std::vector<std::string>{"b", "a", "y", "x"}));

    order.clear();
    editor.for_each_block([&](const Block& b) {
        order.push_back(b.id);
        return b.id != "x";
    });
    EXPECT_EQ(order, (std::vector<std::string>{"a", "x"}));
}

TEST(Editor, cursor_context_at_a_position) {
    auto editor = Editor{hello_world()};
    auto context = editor.cursor_context(12);
    ASSERT_TRUE(context.has_value());
    EXPECT_EQ(context->block.id, "b");
    EXPECT_EQ(context->prev_block->id, "a");
    EXPECT_EQ(context->next_block->id, "c");

    EXPECT_FALSE(editor.cursor_context(10).has_value());
    EXPECT_THROW(editor.cursor_context(999), BlockTreeError);
}

// -- Cursor and selection -------------------------------------------------------

TEST(Editor, text_cursor_position_follows_the_selection) {
    auto editor = Editor{hello_world()};
    editor.set_text_cursor_position("a");
    auto cursor = editor.text_cursor_position();
    ASSERT_TRUE(cursor.has_value());
    EXPECT_EQ(cursor->block.id, "a");
    EXPECT_FALSE(cursor->prev_block.has_value());
    EXPECT_EQ(cursor->next_block->id, "b");
    EXPECT_EQ(editor.text_selection(), (TextSelection{3, 3}));

    editor.set_text_cursor_position("a", CursorPlacement::end);
    EXPECT_EQ(editor.text_selection(), (TextSelection{8, 8}));

    try {
        editor.set_text_cursor_position("missing");
        FAIL() << "expected BlockTreeError";
    } catch (const BlockTreeError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::block_not_found);
    }
}

TEST(Editor, selection_lists_the_covered_blocks) {
    auto editor = Editor{hello_world()};
    editor.set_selection(5, 14);
    EXPECT_EQ(ids_of(editor.selection().blocks), (std::vector<std::string>{"a", "b"}));
    EXPECT_EQ(ids_of(editor.selection_blocks(14, 5)), (std::vector<std::string>{"a", "b"}));

    editor.set_selection(4, 4);
    EXPECT_EQ(ids_of(editor.selection().blocks), (std::vector<std::string>{"a"}));
}

// -- Callbacks ------------------------------------------------------------------

TEST(Editor, change_callbacks_fire_after_commit) {
    auto content_changes = 0;
    auto selection_changes = 0;
    auto seen_blocks = std::size_t{0};
    auto opts = hello_world();
    opts.on_content_change = [&](Editor& e) {
        ++content_changes;
        seen_blocks = e.top_level_blocks().size();
    };
    opts.on_selection_change = [&](Editor&) { ++selection_changes; };
    auto editor = Editor{std::move(opts)};
    content_changes = 0;
    selection_changes = 0;

    editor.insert_blocks({block("x", "X")}, "c", Placement::after);
    EXPECT_EQ(content_changes, 1);
    EXPECT_EQ(seen_blocks, 4u);

    editor.set_text_cursor_position("b");
    EXPECT_EQ(content_changes, 1);
    EXPECT_EQ(selection_changes, 1);

    EXPECT_THROW(editor.remove_blocks({"missing"}), BlockTreeError);
    EXPECT_EQ(content_changes, 1);
}

// -- Mutations ------------------------------------------------------------------

TEST(Editor, block_mutations) {
    auto editor = Editor{hello_world()};
    auto version = editor.version();

    auto ids = editor.insert_blocks({PartialBlock{.type = "heading"}}, "a", Placement::before);
    ASSERT_EQ(ids.size(), 1u);
    EXPECT_EQ(ids_of(editor.top_level_blocks()), (std::vector<std::string>{ids[0], "a", "b", "c"}));

    editor.update_block("b", PartialBlock{.type = "bulletListItem"});
    EXPECT_EQ(editor.get_block("b")->type, "bulletListItem");

    editor.remove_blocks({ids[0], "c"});
    EXPECT_EQ(ids_of(editor.top_level_blocks()), (std::vector<std::string>{"a", "b"}));

    editor.replace_blocks({"a"}, {block("z", "Z")});
    EXPECT_EQ(ids_of(editor.top_level_blocks()), (std::vector<std::string>{"z", "b"}));
    EXPECT_EQ(editor.version(), version + 4);
}

TEST(Editor, apply_fragment_inserts_raw_nodes) {
    auto editor = Editor{hello_world()};
    auto frame = Node::block_container(
        "raw", Node::block_content("paragraph", Attrs{}, {Node::text("raw")}));
    editor.apply_fragment(10, {frame});
    EXPECT_EQ(ids_of(editor.top_level_blocks()), (std::vector<std::string>{"a", "raw", "b", "c"}));
    EXPECT_EQ(plain_text(editor.to_block(frame).content), "raw");
}

// -- Styles and links -----------------------------------------------------------

TEST(Editor, styles_on_the_selection) {
    auto editor = Editor{hello_world()};
    select_block_text(editor, "a");

    editor.add_styles(Styles{.bold = true, .text_color = "red"});
    auto active = editor.active_styles();
    EXPECT_TRUE(active.bold);
    EXPECT_EQ(active.text_color, "red");

    editor.toggle_styles(Styles{.bold = true, .italic = true});
    active = editor.active_styles();
    EXPECT_FALSE(active.bold);
    EXPECT_TRUE(active.italic);

    editor.remove_styles(Styles{.italic = true, .text_color = "any"});
    EXPECT_TRUE(editor.active_styles().empty());
    EXPECT_EQ(editor.get_block("a")->content, plain_content("Hello"));
}

TEST(Editor, create_link_over_the_selection) {
    auto editor = Editor{hello_world()};
    select_block_text(editor, "b");
    editor.create_link("https://example.com");

    auto link = editor.active_link();
    EXPECT_EQ(link.url, "https://example.com");
    EXPECT_EQ(link.text, "World");

    auto content = editor.get_block("b")->content;
    ASSERT_EQ(content.size(), 1u);
    EXPECT_EQ(std::get<Link>(content[0]).href, "https://example.com");
}

TEST(Editor, create_link_with_text_at_the_cursor) {
    auto editor = Editor{hello_world()};
    editor.set_text_cursor_position("c", CursorPlacement::end);
    editor.create_link("https://example.com", "here");

    auto content = editor.get_block("c")->content;
    ASSERT_EQ(content.size(), 2u);
    const auto& link = std::get<Link>(content[1]);
    EXPECT_EQ(plain_text({link}), "here");

    auto version = editor.version();
    editor.create_link("");
    EXPECT_EQ(editor.version(), version);
}

// -- Nesting --------------------------------------------------------------------

TEST(Editor, nest_and_unnest_the_cursor_block) {
    auto editor = Editor{hello_world()};
    editor.set_text_cursor_position("b");
    EXPECT_TRUE(editor.can_nest_block());
    EXPECT_FALSE(editor.can_unnest_block());

    editor.nest_block();
    EXPECT_EQ(ids_of(editor.top_level_blocks()), (std::vector<std::string>{"a", "c"}));
    EXPECT_EQ(ids_of(editor.get_block("a")->children), (std::vector<std::string>{"b"}));
    EXPECT_EQ(editor.text_cursor_position()->block.id, "b");
    EXPECT_TRUE(editor.can_unnest_block());

    editor.unnest_block();
    EXPECT_EQ(ids_of(editor.top_level_blocks()), (std::vector<std::string>{"a", "b", "c"}));
    EXPECT_EQ(editor.text_cursor_position()->block.id, "b");
}

// -- Codecs ---------------------------------------------------------------------

TEST(Editor, codecs_run_asynchronously) {
    auto editor = Editor{options({block("a", "Hello"), block("b", "World")})};
    auto blocks = editor.top_level_blocks();

    auto markdown = editor.blocks_to_markdown(blocks);
    auto html = editor.blocks_to_html(blocks);
    EXPECT_EQ(markdown.get(), "Hello\n\nWorld\n");
    EXPECT_EQ(html.get(), "<p>Hello</p><p>World</p>");

    auto parsed = editor.markdown_to_blocks("# Title\n\nBody").get();
    ASSERT_EQ(parsed.size(), 2u);
    EXPECT_EQ(parsed[0].type, "heading");
    EXPECT_EQ(plain_text(parsed[1].content), "Body");
    EXPECT_FALSE(parsed[0].id.empty());
    EXPECT_NE(parsed[0].id, parsed[1].id);
}

TEST(Editor, html_parses_into_blocks_with_fresh_ids) {
    auto editor = Editor{hello_world()};
    auto parsed = editor.html_to_blocks("<h2>Title</h2><ul><li>a<ul><li>b</li></ul></li></ul>").get();
    ASSERT_EQ(parsed.size(), 2u);
    EXPECT_EQ(parsed[0].type, "heading");
    EXPECT_EQ(get_prop<std::int64_t>(parsed[0].props, "level"), 2);
    EXPECT_EQ(parsed[1].type, "bulletListItem");
    ASSERT_EQ(parsed[1].children.size(), 1u);
    EXPECT_EQ(plain_text(parsed[1].children[0].content), "b");
    EXPECT_FALSE(parsed[1].children[0].id.empty());
    EXPECT_NE(parsed[1].id, parsed[1].children[0].id);

    // the parsed blocks serialize back to the same markup
    EXPECT_EQ(editor.blocks_to_html(parsed).get(), "<h2>Title</h2><ul><li>a<ul><li>b</li></ul></li></ul>");
}

// -- Cache ----------------------------------------------------------------------

TEST(Editor, block_cache_reuses_unchanged_blocks) {
    auto editor = Editor{hello_world()};
    auto before = editor.cache_stats();

    editor.top_level_blocks();
    editor.top_level_blocks();
    auto stats = editor.cache_stats();
    EXPECT_EQ(stats.misses - before.misses, 3u);
    EXPECT_EQ(stats.hits - before.hits, 3u);

    editor.update_block("b", PartialBlock{.content = plain_content("Changed")});
    EXPECT_EQ(editor.cache_size(), 2u);

    before = editor.cache_stats();
    auto blocks = editor.top_level_blocks();
    stats = editor.cache_stats();
    EXPECT_EQ(stats.hits - before.hits, 2u);
    EXPECT_EQ(stats.misses - before.misses, 1u);
    EXPECT_EQ(plain_text(blocks[1].content), "Changed");
    EXPECT_EQ(editor.cache_size(), 3u);
}

TEST(Editor, read_locking_can_be_switched_off) {
    auto opts = hello_world();
    opts.read_locking = false;
    auto editor = Editor{std::move(opts)};
    EXPECT_FALSE(editor.read_locking());
    EXPECT_EQ(editor.top_level_blocks().size(), 3u);

    editor.set_read_locking(true);
    EXPECT_TRUE(editor.read_locking());
}
