#include <blocktree-cpp/error.hpp>
#include <blocktree-cpp/node_conversions.hpp>

#include <gtest/gtest.h>

#include <cstdint>
#include <limits>
#include <string>
#include <vector>

using namespace blocktree_cpp;

namespace {

auto schema() -> BlockSchema {
    auto specs = default_block_specs();
    specs.push_back(BlockSpec{.type = "divider", .content = ContentKind::none,
                              .allows_children = false, .prop_schema = {}});
    return BlockSchema{std::move(specs)};
}

auto text(std::string s, Styles styles = {}) -> InlineContent {
    return StyledText{.text = std::move(s), .styles = std::move(styles)};
}

auto partial(std::string id, std::string type, std::vector<InlineContent> content = {}) -> PartialBlock {
    return PartialBlock{.id = std::move(id), .type = std::move(type), .props = {},
                        .content = std::move(content), .children = std::nullopt};
}

auto expect_kind(ErrorKind kind, auto&& fn) -> std::string {
    try {
        fn();
        ADD_FAILURE() << "expected BlockTreeError";
    } catch (const BlockTreeError& e) {
        EXPECT_EQ(e.kind(), kind) << e.what();
        return e.error().message;
    }
    return {};
}

}  // anonymous namespace

// -- Styles -------------------------------------------------------------------

TEST(Styles, map_to_marks_and_back) {
    auto styles = Styles{.bold = true, .italic = false, .underline = true, .strike = false,
                         .code = true, .text_color = "red", .background_color = "blue"};
    auto marks = styles_to_marks(styles);
    EXPECT_EQ(marks.size(), 5u);
    EXPECT_EQ(marks_to_styles(marks), styles);
    EXPECT_TRUE(styles_to_marks(Styles{}).empty());
}

// -- Inline content -----------------------------------------------------------

TEST(InlineContent, newlines_become_hard_breaks) {
    auto nodes = inline_content_to_nodes({text("a\nb")});
    ASSERT_EQ(nodes.size(), 3u);
    EXPECT_EQ(nodes[1]->role(), NodeRole::hard_break);

    auto content = Node::block_content("paragraph", Attrs{}, nodes);
    EXPECT_EQ(content_node_to_inline_content(*content), (std::vector<InlineContent>{text("a\nb")}));
}

TEST(InlineContent, adjacent_runs_with_equal_styles_merge) {
    auto content = Node::block_content("paragraph", Attrs{},
                                       inline_content_to_nodes({text("ab"), text("cd")}));
    EXPECT_EQ(content->child_count(), 1u);
    EXPECT_EQ(content_node_to_inline_content(*content), (std::vector<InlineContent>{text("abcd")}));
}

TEST(InlineContent, links_group_consecutive_runs_with_the_same_href) {
    auto bold = Styles{.bold = true};
    auto input = std::vector<InlineContent>{
        text("see "),
        Link{.href = "https://a", .content = {StyledText{.text = "one", .styles = {}}}},
        Link{.href = "https://a", .content = {StyledText{.text = "two", .styles = bold}}},
        Link{.href = "https://b", .content = {StyledText{.text = "three", .styles = {}}}},
    };
    auto content = Node::block_content("paragraph", Attrs{}, inline_content_to_nodes(input));
    auto output = content_node_to_inline_content(*content);

    ASSERT_EQ(output.size(), 3u);
    const auto& first = std::get<Link>(output[1]);
    EXPECT_EQ(first.href, "https://a");
    ASSERT_EQ(first.content.size(), 2u);
    EXPECT_EQ(first.content[1].styles, bold);
    EXPECT_EQ(std::get<Link>(output[2]).href, "https://b");
}

// -- Blocks -------------------------------------------------------------------

TEST(BlockConversion, round_trips_a_nested_block) {
    auto in = partial("h", "heading", {text("Hi ", Styles{.bold = true}),
                                       Link{.href = "https://x",
                                            .content = {StyledText{.text = "there", .styles = {}}}}});
    in.props = {{"level", PropValue{std::int64_t{2}}}};
    in.children = std::vector<PartialBlock>{partial("c", "paragraph", {text("child")})};

    auto s = schema();
    auto node = block_to_node(in, s, IdGenerator{});
    EXPECT_EQ(node->block_id(), "h");

    auto out = node_to_block(node, s);
    EXPECT_EQ(out.id, "h");
    EXPECT_EQ(out.type, "heading");
    EXPECT_EQ(out.props.size(), 4u);
    EXPECT_EQ(get_prop<std::int64_t>(out.props, "level"), 2);
    EXPECT_EQ(out.content, *in.content);
    ASSERT_EQ(out.children.size(), 1u);
    EXPECT_EQ(out.children[0].id, "c");
    EXPECT_EQ(plain_text(out.children[0].content), "child");
    EXPECT_TRUE(out.children[0].children.empty());
}

TEST(BlockConversion, every_default_type_converts) {
    auto s = schema();
    for (const auto& spec : s.specs()) {
        auto node = block_to_node(partial("x", spec.type), s, IdGenerator{});
        auto block = node_to_block(node, s);
        EXPECT_EQ(block.type, spec.type);
        EXPECT_EQ(block.props.size(), spec.prop_schema.size());
        EXPECT_TRUE(block.content.empty());
    }
}

TEST(BlockConversion, missing_type_is_rejected) {
    auto message = expect_kind(ErrorKind::unknown_block_type, [] {
        block_to_node(PartialBlock{}, schema(), sequential_id_generator());
    });
    EXPECT_EQ(message, "block type is required");
    expect_kind(ErrorKind::unknown_block_type, [] {
        block_to_node(partial("t", "table"), schema(), sequential_id_generator());
    });
}

TEST(BlockConversion, ids_come_from_the_generator) {
    auto ids = sequential_id_generator("id-");
    auto in = PartialBlock{.type = "paragraph",
                           .children = std::vector<PartialBlock>{PartialBlock{.type = "paragraph"}}};
    auto node = block_to_node(in, schema(), ids);
    EXPECT_FALSE(node->block_id().empty());
    EXPECT_NE(node->block_id(), node->last_child()->first_child()->block_id());
    EXPECT_EQ(node->block_id().rfind("id-", 0), 0u);

    expect_kind(ErrorKind::invalid_config, [] {
        block_to_node(PartialBlock{.type = "paragraph"}, schema(), IdGenerator{});
    });
}

TEST(BlockConversion, content_and_children_are_checked) {
    auto s = schema();
    expect_kind(ErrorKind::invalid_content, [&] {
        block_to_node(partial("i", "image", {text("x")}), s, IdGenerator{});
    });

    auto divider = partial("d", "divider");
    divider.children = std::vector<PartialBlock>{partial("c", "paragraph")};
    expect_kind(ErrorKind::invalid_placement, [&] { block_to_node(divider, s, IdGenerator{}); });

    auto bad_prop = partial("p", "heading");
    bad_prop.props = {{"level", PropValue{std::int64_t{9}}}};
    expect_kind(ErrorKind::invalid_prop, [&] { block_to_node(bad_prop, s, IdGenerator{}); });
}

TEST(BlockConversion, huge_integer_prop_is_rejected) {
    auto s = schema();
    auto huge = partial("i", "image");
    huge.props = {{"width", PropValue{1e300}}};
    expect_kind(ErrorKind::invalid_prop, [&] { block_to_node(huge, s, IdGenerator{}); });

    huge.props = {{"width", PropValue{std::numeric_limits<double>::infinity()}}};
    expect_kind(ErrorKind::invalid_prop, [&] { block_to_node(huge, s, IdGenerator{}); });

    huge.props = {{"width", PropValue{640.0}}};
    auto block = node_to_block(block_to_node(huge, s, IdGenerator{}), s);
    EXPECT_EQ(get_prop<std::int64_t>(block.props, "width"), 640);
}

TEST(BlockConversion, node_to_block_drops_undeclared_attrs) {
    auto node = Node::block_container(
        "p", Node::block_content("paragraph", Attrs{{"stale", PropValue{true}}}));
    auto block = node_to_block(node, schema());
    EXPECT_FALSE(block.props.contains("stale"));
    EXPECT_EQ(get_prop<std::string>(block.props, "textAlignment"), "left");

    auto unknown = Node::block_container("t", Node::block_content("table", Attrs{}));
    expect_kind(ErrorKind::unknown_block_type, [&] { node_to_block(unknown, schema()); });
}

TEST(BlockConversion, cache_reuses_converted_frames) {
    auto s = schema();
    auto in = partial("p", "paragraph", {text("parent")});
    in.children = std::vector<PartialBlock>{partial("c", "paragraph", {text("child")})};
    auto node = block_to_node(in, s, IdGenerator{});

    auto cache = BlockCache{};
    auto first = node_to_block(node, s, &cache);
    EXPECT_EQ(cache.size(), 2u);
    EXPECT_EQ(cache.stats().misses, 2u);

    auto second = node_to_block(node, s, &cache);
    EXPECT_EQ(second, first);
    EXPECT_EQ(cache.stats().hits, 1u);

    // a new parent around the same child frame reuses the child's entry
    auto parent = node->with_content({Node::block_content("heading", Attrs{}), node->last_child()});
    auto third = node_to_block(parent, s, &cache);
    EXPECT_EQ(third.type, "heading");
    EXPECT_EQ(third.children, first.children);
    EXPECT_EQ(cache.stats().hits, 2u);
}
