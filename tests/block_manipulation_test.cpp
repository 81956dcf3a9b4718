#include <blocktree-cpp/block_info.hpp>
#include <blocktree-cpp/block_manipulation.hpp>
#include <blocktree-cpp/document.hpp>
#include <blocktree-cpp/error.hpp>
#include <blocktree-cpp/node_conversions.hpp>

#include <gtest/gtest.h>

#include <string>
#include <vector>

using namespace blocktree_cpp;

namespace {

auto specs() -> std::vector<BlockSpec> {
    auto result = default_block_specs();
    result.push_back(BlockSpec{.type = "divider", .content = ContentKind::none,
                               .allows_children = false, .prop_schema = {}});
    return result;
}

auto block(std::string id, std::string text, std::vector<PartialBlock> children = {}) -> PartialBlock {
    return PartialBlock{.id = std::move(id), .type = "paragraph", .props = {},
                        .content = plain_content(std::move(text)),
                        .children = std::move(children)};
}

auto outline_of(const Node& group) -> std::string {
    auto out = std::string{};
    for (const auto& frame : group.content()) {
        if (!out.empty()) out += ',';
        out += frame->block_id();
        if (frame->child_count() == 2) out += "(" + outline_of(*frame->last_child()) + ")";
    }
    return out;
}

/// A document plus everything the mutators need.
struct Tree {
    BlockSchema schema{specs()};
    IdGenerator ids = sequential_id_generator("n");
    Document doc;

    explicit Tree(const std::vector<PartialBlock>& blocks)
        : doc{schema.node_schema(), build(blocks)} {}

    auto build(const std::vector<PartialBlock>& blocks) const -> NodePtr {
        auto frames = Fragment{};
        for (const auto& b : blocks) frames.push_back(block_to_node(b, schema, ids));
        return Node::doc(Node::block_group(std::move(frames)));
    }

    template <typename Fn>
    auto edit(Fn&& fn) {
        auto ctx = MutationContext{.schema = schema, .ids = ids};
        return doc.transact([&](Transaction& tx) { return fn(tx, ctx); });
    }

    auto outline() const -> std::string { return outline_of(*doc.doc()->first_child()); }

    auto pos_of(const std::string& id) const -> std::size_t {
        return find_block(doc.doc(), id)->content_start();
    }

    auto get(const std::string& id) const -> Block {
        return node_to_block(find_block(doc.doc(), id)->frame, schema);
    }
};

auto abc() -> std::vector<PartialBlock> {
    return {block("a", "A"), block("b", "B"), block("c", "C")};
}

auto error_of(auto&& fn) -> Error {
    try {
        fn();
    } catch (const BlockTreeError& e) {
        return e.error();
    }
    ADD_FAILURE() << "expected BlockTreeError";
    return Error{ErrorKind::invalid_document, "no error"};
}

}  // anonymous namespace

// -- Insert -------------------------------------------------------------------

TEST(InsertBlocks, before_and_after) {
    auto tree = Tree{abc()};
    auto ids = tree.edit([](Transaction& tx, const MutationContext& ctx) {
        return insert_blocks(tx, ctx, {block("x", "X")}, "b", Placement::before);
    });
    EXPECT_EQ(ids, (std::vector<std::string>{"x"}));
    EXPECT_EQ(tree.outline(), "a,x,b,c");

    tree.edit([](Transaction& tx, const MutationContext& ctx) {
        return insert_blocks(tx, ctx, {block("y", "Y"), block("z", "Z")}, "c", Placement::after);
    });
    EXPECT_EQ(tree.outline(), "a,x,b,c,y,z");
}

TEST(InsertBlocks, nested_become_first_children) {
    auto tree = Tree{abc()};
    tree.edit([](Transaction& tx, const MutationContext& ctx) {
        return insert_blocks(tx, ctx, {block("x", "X")}, "b", Placement::nested);
    });
    EXPECT_EQ(tree.outline(), "a,b(x),c");

    tree.edit([](Transaction& tx, const MutationContext& ctx) {
        return insert_blocks(tx, ctx, {block("y", "Y")}, "b", Placement::nested);
    });
    EXPECT_EQ(tree.outline(), "a,b(y,x),c");
}

TEST(InsertBlocks, generates_missing_ids) {
    auto tree = Tree{abc()};
    auto ids = tree.edit([](Transaction& tx, const MutationContext& ctx) {
        return insert_blocks(tx, ctx, {PartialBlock{.type = "heading"}}, "a", Placement::after);
    });
    EXPECT_EQ(ids, (std::vector<std::string>{"n0"}));
    EXPECT_EQ(tree.get("n0").type, "heading");
}

TEST(InsertBlocks, rejects_children_under_a_childless_type) {
    auto tree = Tree{{block("a", "A"), PartialBlock{.id = "d", .type = "divider"}}};
    auto error = error_of([&] {
        tree.edit([](Transaction& tx, const MutationContext& ctx) {
            return insert_blocks(tx, ctx, {block("x", "X")}, "d", Placement::nested);
        });
    });
    EXPECT_EQ(error.kind, ErrorKind::invalid_placement);
    EXPECT_EQ(tree.outline(), "a,d");
    EXPECT_EQ(tree.doc.version(), 0u);
}

TEST(InsertBlocks, unknown_reference) {
    auto tree = Tree{abc()};
    auto error = error_of([&] {
        tree.edit([](Transaction& tx, const MutationContext& ctx) {
            return insert_blocks(tx, ctx, {block("x", "X")}, "zz", Placement::before);
        });
    });
    EXPECT_EQ(error, (Error{ErrorKind::block_not_found, "block with id zz not found"}));
}

// -- Remove -------------------------------------------------------------------

TEST(RemoveBlocks, removes_every_target) {
    auto tree = Tree{abc()};
    tree.edit([](Transaction& tx, const MutationContext&) {
        remove_blocks(tx, {"a", "c"});
    });
    EXPECT_EQ(tree.outline(), "b");
}

TEST(RemoveBlocks, is_atomic_when_a_target_is_missing) {
    auto tree = Tree{abc()};
    auto error = error_of([&] {
        tree.edit([](Transaction& tx, const MutationContext&) { remove_blocks(tx, {"a", "missing"}); });
    });
    EXPECT_EQ(error, (Error{ErrorKind::block_not_found, "block with id missing not found"}));
    EXPECT_EQ(tree.outline(), "a,b,c");

    error = error_of([&] {
        tree.edit([](Transaction& tx, const MutationContext&) { remove_blocks(tx, {"m1", "b", "m2"}); });
    });
    EXPECT_EQ(error.message, "blocks with ids m1, m2 not found");
}

TEST(RemoveBlocks, last_child_takes_its_group_along) {
    auto tree = Tree{{block("a", "A", {block("x", "X")}), block("b", "B")}};
    tree.edit([](Transaction& tx, const MutationContext&) { remove_blocks(tx, {"x"}); });
    EXPECT_EQ(tree.outline(), "a,b");
}

TEST(RemoveBlocks, parent_and_child_together) {
    auto tree = Tree{{block("a", "A", {block("x", "X")}), block("b", "B")}};
    tree.edit([](Transaction& tx, const MutationContext&) { remove_blocks(tx, {"a", "x"}); });
    EXPECT_EQ(tree.outline(), "b");
}

// -- Replace ------------------------------------------------------------------

TEST(ReplaceBlocks, contiguous_run_is_replaced_in_place) {
    auto tree = Tree{abc()};
    tree.edit([](Transaction& tx, const MutationContext& ctx) {
        return replace_blocks(tx, ctx, {"b", "c"}, {block("x", "X"), block("y", "Y")});
    });
    EXPECT_EQ(tree.outline(), "a,x,y");
}

TEST(ReplaceBlocks, scattered_targets_insert_at_the_first) {
    auto tree = Tree{abc()};
    tree.edit([](Transaction& tx, const MutationContext& ctx) {
        return replace_blocks(tx, ctx, {"a", "c"}, {block("x", "X")});
    });
    EXPECT_EQ(tree.outline(), "x,b");
}

TEST(ReplaceBlocks, empty_targets_append_and_empty_insertions_remove) {
    auto tree = Tree{abc()};
    tree.edit([](Transaction& tx, const MutationContext& ctx) {
        return replace_blocks(tx, ctx, {}, {block("x", "X")});
    });
    EXPECT_EQ(tree.outline(), "a,b,c,x");

    tree.edit([](Transaction& tx, const MutationContext& ctx) {
        return replace_blocks(tx, ctx, {"a"}, {});
    });
    EXPECT_EQ(tree.outline(), "b,c,x");
}

// -- Update -------------------------------------------------------------------

TEST(UpdateBlock, type_change_keeps_content) {
    auto tree = Tree{abc()};
    tree.edit([](Transaction& tx, const MutationContext& ctx) {
        update_block(tx, ctx, "b", PartialBlock{.type = "heading",
                                                .props = {{"level", PropValue{std::int64_t{2}}}}});
    });
    auto b = tree.get("b");
    EXPECT_EQ(b.type, "heading");
    EXPECT_EQ(get_prop<std::int64_t>(b.props, "level"), 2);
    EXPECT_EQ(plain_text(b.content), "B");
    EXPECT_EQ(tree.outline(), "a,b,c");
}

TEST(UpdateBlock, props_merge_with_the_current_ones) {
    auto tree = Tree{abc()};
    tree.edit([](Transaction& tx, const MutationContext& ctx) {
        update_block(tx, ctx, "a", PartialBlock{.props = {{"textColor", PropValue{std::string{"red"}}}}});
    });
    tree.edit([](Transaction& tx, const MutationContext& ctx) {
        update_block(tx, ctx, "a", PartialBlock{.props = {{"textAlignment", PropValue{std::string{"right"}}}}});
    });
    auto a = tree.get("a");
    EXPECT_EQ(get_prop<std::string>(a.props, "textColor"), "red");
    EXPECT_EQ(get_prop<std::string>(a.props, "textAlignment"), "right");
    EXPECT_EQ(tree.doc.version(), 2u);
}

TEST(UpdateBlock, content_and_children) {
    auto tree = Tree{{block("a", "A", {block("x", "X")})}};
    tree.edit([](Transaction& tx, const MutationContext& ctx) {
        update_block(tx, ctx, "a", PartialBlock{.content = plain_content("Alpha"),
                                                .children = std::vector<PartialBlock>{block("y", "Y"),
                                                                                      block("z", "Z")}});
    });
    EXPECT_EQ(plain_text(tree.get("a").content), "Alpha");
    EXPECT_EQ(tree.outline(), "a(y,z)");

    tree.edit([](Transaction& tx, const MutationContext& ctx) {
        update_block(tx, ctx, "a", PartialBlock{.children = std::vector<PartialBlock>{}});
    });
    EXPECT_EQ(tree.outline(), "a");
}

TEST(UpdateBlock, no_op_update_does_not_change_the_document) {
    auto tree = Tree{abc()};
    tree.edit([](Transaction& tx, const MutationContext& ctx) { update_block(tx, ctx, "a", PartialBlock{}); });
    EXPECT_EQ(tree.doc.version(), 0u);
}

TEST(UpdateBlock, failures_leave_the_block_unchanged) {
    auto tree = Tree{{block("a", "A", {block("x", "X")})}};
    auto update = [&](PartialBlock partial) {
        return error_of([&] {
            tree.edit([&](Transaction& tx, const MutationContext& ctx) { update_block(tx, ctx, "a", partial); });
        }).kind;
    };

    EXPECT_EQ(update(PartialBlock{.props = {{"level", PropValue{std::int64_t{2}}}}}), ErrorKind::invalid_prop);
    EXPECT_EQ(update(PartialBlock{.type = "divider"}), ErrorKind::invalid_placement);
    EXPECT_EQ(update(PartialBlock{.type = "image", .content = plain_content("x")}), ErrorKind::invalid_content);
    EXPECT_EQ(update(PartialBlock{.type = "table"}), ErrorKind::unknown_block_type);
    EXPECT_EQ(tree.get("a").type, "paragraph");
    EXPECT_EQ(tree.doc.version(), 0u);
}

TEST(UpdateBlock, contentless_type_drops_inline_content) {
    auto tree = Tree{abc()};
    tree.edit([](Transaction& tx, const MutationContext& ctx) {
        update_block(tx, ctx, "c", PartialBlock{.type = "image"});
    });
    auto c = tree.get("c");
    EXPECT_EQ(c.type, "image");
    EXPECT_TRUE(c.content.empty());
    EXPECT_EQ(get_prop<std::int64_t>(c.props, "width"), 512);
}

// -- Nesting ------------------------------------------------------------------

TEST(Nesting, nest_under_the_previous_sibling) {
    auto tree = Tree{abc()};
    const auto& doc = tree.doc.doc();
    auto ctx = MutationContext{.schema = tree.schema, .ids = tree.ids};
    EXPECT_FALSE(can_nest_block(doc, ctx, tree.pos_of("a")));
    EXPECT_TRUE(can_nest_block(doc, ctx, tree.pos_of("b")));
    EXPECT_FALSE(can_nest_block(doc, ctx, 0));

    EXPECT_TRUE(tree.edit([&](Transaction& tx, const MutationContext& c) {
        return nest_block(tx, c, tree.pos_of("b"));
    }));
    EXPECT_EQ(tree.outline(), "a(b),c");

    tree.edit([&](Transaction& tx, const MutationContext& c) { return nest_block(tx, c, tree.pos_of("c")); });
    EXPECT_EQ(tree.outline(), "a(b,c)");

    EXPECT_FALSE(tree.edit([&](Transaction& tx, const MutationContext& c) {
        return nest_block(tx, c, tree.pos_of("b"));
    }));
}

TEST(Nesting, not_under_a_childless_type) {
    auto tree = Tree{{PartialBlock{.id = "d", .type = "divider"}, block("b", "B")}};
    auto ctx = MutationContext{.schema = tree.schema, .ids = tree.ids};
    EXPECT_FALSE(can_nest_block(tree.doc.doc(), ctx, tree.pos_of("b")));
}

TEST(Nesting, selection_follows_the_nested_block) {
    auto tree = Tree{abc()};
    tree.edit([&](Transaction& tx, const MutationContext& ctx) {
        auto at = tree.pos_of("b") + 1;
        tx.set_selection(TextSelection{.from = at, .to = at});
        return nest_block(tx, ctx, at);
    });
    auto info = block_info_at(tree.doc.doc(), tree.doc.selection().from);
    ASSERT_TRUE(info.has_value());
    EXPECT_EQ(info->id, "b");
    EXPECT_EQ(tree.doc.selection().from, tree.pos_of("b") + 1);
}

TEST(Nesting, unnest_first_child_adopts_later_siblings) {
    auto tree = Tree{{block("a", "A", {block("b", "B"), block("c", "C")})}};
    EXPECT_FALSE(can_unnest_block(tree.doc.doc(), tree.pos_of("a")));
    EXPECT_TRUE(can_unnest_block(tree.doc.doc(), tree.pos_of("b")));

    EXPECT_TRUE(tree.edit([&](Transaction& tx, const MutationContext&) {
        return unnest_block(tx, tree.pos_of("b"));
    }));
    EXPECT_EQ(tree.outline(), "a,b(c)");
}

TEST(Nesting, unnest_last_child) {
    auto tree = Tree{{block("a", "A", {block("b", "B"), block("c", "C")}), block("d", "D")}};
    tree.edit([&](Transaction& tx, const MutationContext&) { return unnest_block(tx, tree.pos_of("c")); });
    EXPECT_EQ(tree.outline(), "a(b),c,d");

    EXPECT_FALSE(tree.edit([&](Transaction& tx, const MutationContext&) {
        return unnest_block(tx, tree.pos_of("d"));
    }));
}
