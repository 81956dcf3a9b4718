#include <blocktree-cpp/traversal.hpp>

#include <gtest/gtest.h>

#include <string>
#include <vector>

using namespace blocktree_cpp;

namespace {

auto frame(std::string id, std::string text, NodePtr children = nullptr) -> NodePtr {
    return Node::block_container(
        std::move(id), Node::block_content("paragraph", Attrs{}, {Node::text(std::move(text))}),
        std::move(children));
}

// a: "Hello" at 1, b: "World" at 10 with child c: "!" at 19
auto make_doc() -> NodePtr {
    return Node::doc(Node::block_group({
        frame("a", "Hello"),
        frame("b", "World", Node::block_group({frame("c", "!")})),
    }));
}

}  // anonymous namespace

TEST(Traversal, visits_all_nodes_in_document_order) {
    auto walk = Traversal{make_doc()};
    auto roles = std::vector<NodeRole>{};
    auto positions = std::vector<std::size_t>{};
    while (auto v = walk.next()) {
        roles.push_back(v->node->role());
        positions.push_back(v->pos);
    }

    EXPECT_EQ(roles.size(), 11u);
    EXPECT_EQ(positions, (std::vector<std::size_t>{0, 1, 2, 3, 10, 11, 12, 18, 19, 20, 21}));
    EXPECT_EQ(roles[7], NodeRole::block_group);
    EXPECT_TRUE(walk.done());
}

TEST(Traversal, reports_depth_index_and_parent) {
    auto walk = Traversal{make_doc()};
    auto ids = std::vector<std::string>{};
    auto depths = std::vector<std::size_t>{};
    while (auto v = walk.next()) {
        if (v->node->role() != NodeRole::block_container) continue;
        ids.push_back(v->node->block_id());
        depths.push_back(v->depth);
        EXPECT_EQ(v->parent->role(), NodeRole::block_group);
        EXPECT_EQ(v->parent->child(v->index), v->node);
    }
    EXPECT_EQ(ids, (std::vector<std::string>{"a", "b", "c"}));
    EXPECT_EQ(depths, (std::vector<std::size_t>{2, 2, 4}));
}

TEST(Traversal, skip_children_prunes_the_last_node) {
    auto walk = Traversal{make_doc()};
    auto text_nodes = 0;
    auto visited = 0;
    while (auto v = walk.next()) {
        ++visited;
        if (v->node->is_text()) ++text_nodes;
        if (v->node->role() == NodeRole::block_content) walk.skip_children();
    }
    EXPECT_EQ(text_nodes, 0);
    EXPECT_EQ(visited, 8);
}

TEST(Traversal, stop_ends_the_walk) {
    auto walk = Traversal{make_doc()};
    auto first = walk.next();
    ASSERT_TRUE(first.has_value());
    walk.stop();
    EXPECT_TRUE(walk.done());
    EXPECT_FALSE(walk.next().has_value());
}

TEST(Traversal, can_be_paused_and_resumed) {
    auto walk = Traversal{make_doc()};
    walk.next();
    walk.next();
    auto third = walk.next();
    ASSERT_TRUE(third.has_value());
    EXPECT_EQ(third->node->role(), NodeRole::block_content);
    EXPECT_FALSE(walk.done());

    auto rest = 0;
    while (walk.next()) ++rest;
    EXPECT_EQ(rest, 8);
}

TEST(Traversal, content_start_offsets_positions) {
    auto group = make_doc()->first_child();
    auto walk = Traversal{group, 1};
    auto first = walk.next();
    ASSERT_TRUE(first.has_value());
    EXPECT_EQ(first->node->block_id(), "a");
    EXPECT_EQ(first->pos, 1u);
}

TEST(Traversal, empty_root_yields_nothing) {
    auto walk = Traversal{Node::doc(Node::block_group({}))};
    auto group = walk.next();
    ASSERT_TRUE(group.has_value());
    EXPECT_FALSE(walk.next().has_value());
    EXPECT_TRUE(walk.done());
}

TEST(ForEachDescendant, visitor_controls_the_walk) {
    auto ids = std::vector<std::string>{};
    for_each_descendant(make_doc(), [&](const VisitedNode& v) {
        if (v.node->role() == NodeRole::block_content) return Visit::skip_children;
        if (v.node->role() == NodeRole::block_container) {
            ids.push_back(v.node->block_id());
            if (v.node->block_id() == "b") return Visit::stop;
        }
        return Visit::descend;
    });
    EXPECT_EQ(ids, (std::vector<std::string>{"a", "b"}));
}
