#include <blocktree-cpp/document.hpp>
#include <blocktree-cpp/error.hpp>
#include <blocktree-cpp/transaction.hpp>

#include <gtest/gtest.h>

#include <stdexcept>
#include <string>

using namespace blocktree_cpp;

namespace {

auto schema() -> NodeSchema {
    return NodeSchema{.content_types = {{"paragraph", ContentKind::inline_content},
                                        {"heading", ContentKind::inline_content},
                                        {"image", ContentKind::none}}};
}

auto frame(std::string id, std::string text, NodePtr children = nullptr) -> NodePtr {
    auto inline_nodes = Fragment{};
    if (!text.empty()) inline_nodes.push_back(Node::text(std::move(text)));
    return Node::block_container(std::move(id),
                                 Node::block_content("paragraph", Attrs{}, std::move(inline_nodes)),
                                 std::move(children));
}

// a: "Hello" spans [1, 10), b: "World" spans [10, 19)
auto two_blocks() -> Document {
    return Document{schema(), Node::doc(Node::block_group({frame("a", "Hello"), frame("b", "World")}))};
}

auto ids_of(const Document& doc) -> std::vector<std::string> {
    auto ids = std::vector<std::string>{};
    for (const auto& f : doc.doc()->first_child()->content()) ids.push_back(f->block_id());
    return ids;
}

auto bold() -> Mark { return Mark{.type = "bold", .attrs = {}}; }

}  // anonymous namespace

// -- Document -----------------------------------------------------------------

TEST(Document, starts_with_an_empty_root_group) {
    auto doc = Document{schema()};
    EXPECT_EQ(doc.doc()->content_size(), 2u);
    EXPECT_EQ(doc.version(), 0u);
    EXPECT_EQ(doc.selection(), (TextSelection{0, 0}));
}

TEST(Document, initial_selection_settles_into_the_first_block) {
    auto doc = two_blocks();
    EXPECT_EQ(doc.selection(), (TextSelection{3, 3}));
}

TEST(Document, rejects_an_invalid_initial_document) {
    auto bad = Node::doc(Node::block_group({Node::block_container(
        "a", Node::block_content("table", Attrs{}))}));
    EXPECT_THROW((Document{schema(), bad}), BlockTreeError);
}

TEST(Document, transact_commits_and_bumps_the_version) {
    auto doc = two_blocks();
    doc.transact([](Transaction& tx) {
        tx.insert(10, {frame("x", "New")});
    });
    EXPECT_EQ(doc.version(), 1u);
    EXPECT_EQ(ids_of(doc), (std::vector<std::string>{"a", "x", "b"}));
}

TEST(Document, transact_returns_the_callback_result) {
    auto doc = two_blocks();
    auto size = doc.transact([](Transaction& tx) { return tx.doc()->content_size(); });
    EXPECT_EQ(size, 20u);
    EXPECT_EQ(doc.version(), 0u);
}

TEST(Document, throwing_transaction_leaves_document_untouched) {
    auto doc = two_blocks();
    auto before = doc.doc();

    EXPECT_THROW(doc.transact([](Transaction& tx) {
        tx.delete_range(1, 10);
        throw std::runtime_error{"abort"};
    }), std::runtime_error);

    EXPECT_EQ(doc.doc(), before);
    EXPECT_EQ(doc.version(), 0u);
}

TEST(Document, failing_step_leaves_document_untouched) {
    auto doc = two_blocks();
    auto before = doc.doc();

    EXPECT_THROW(doc.transact([](Transaction& tx) {
        tx.insert(10, {frame("x", "New")});
        tx.delete_range(5, 13);  // spans two blocks
    }), BlockTreeError);

    EXPECT_EQ(doc.doc(), before);
}

// -- Structural steps ---------------------------------------------------------

TEST(Transaction, edits_preserve_untouched_siblings) {
    auto doc = two_blocks();
    auto b = doc.doc()->first_child()->child(1);

    doc.transact([](Transaction& tx) { tx.insert_text("!", 8, 8); });

    EXPECT_EQ(doc.doc()->first_child()->child(1), b);
    EXPECT_EQ(doc.doc()->first_child()->child(0)->text_content(), "Hello!");
}

TEST(Transaction, replace_must_stay_in_one_parent) {
    auto doc = two_blocks();
    try {
        doc.transact([](Transaction& tx) { tx.delete_range(5, 13); });
        FAIL() << "expected BlockTreeError";
    } catch (const BlockTreeError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::invalid_position);
    }
}

TEST(Transaction, replace_range_checks) {
    auto doc = two_blocks();
    EXPECT_THROW(doc.transact([](Transaction& tx) { tx.delete_range(6, 4); }), BlockTreeError);
    EXPECT_THROW(doc.transact([](Transaction& tx) { tx.delete_range(19, 21); }), BlockTreeError);
}

TEST(Transaction, inserted_nodes_are_checked_against_the_schema) {
    auto doc = two_blocks();
    auto table = Node::block_container("t", Node::block_content("table", Attrs{}));
    try {
        doc.transact([&](Transaction& tx) { tx.insert(10, {table}); });
        FAIL() << "expected BlockTreeError";
    } catch (const BlockTreeError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::unknown_block_type);
    }
}

TEST(Transaction, emptying_a_children_group_is_rejected) {
    // a spans [1, 16) with its children group at [9, 16) holding c at [10, 15)
    auto doc = Document{schema(), Node::doc(Node::block_group({
        frame("a", "Hello", Node::block_group({frame("c", "!")})),
    }))};
    try {
        doc.transact([](Transaction& tx) { tx.delete_range(10, 15); });
        FAIL() << "expected BlockTreeError";
    } catch (const BlockTreeError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::invalid_document);
    }
    EXPECT_NO_THROW(doc.transact([](Transaction& tx) { tx.delete_range(9, 16); }));
    EXPECT_EQ(doc.doc()->first_child()->child(0)->child_count(), 1u);
}

TEST(Transaction, root_group_may_become_empty) {
    auto doc = two_blocks();
    doc.transact([](Transaction& tx) { tx.delete_range(1, 19); });
    EXPECT_EQ(doc.doc()->first_child()->child_count(), 0u);
    EXPECT_EQ(doc.selection(), (TextSelection{1, 1}));
}

TEST(Transaction, set_node_markup_changes_type_and_attrs) {
    auto doc = two_blocks();
    doc.transact([](Transaction& tx) {
        tx.set_node_markup(2, "heading", Attrs{{"level", PropValue{std::int64_t{2}}}});
    });
    const auto& content = doc.doc()->first_child()->child(0)->first_child();
    EXPECT_EQ(content->type(), "heading");
    EXPECT_EQ(content->text_content(), "Hello");
    EXPECT_EQ(doc.version(), 1u);

    EXPECT_THROW(doc.transact([](Transaction& tx) {
        tx.set_node_markup(4, "paragraph", Attrs{});
    }), BlockTreeError);
}

TEST(Transaction, contentless_type_rejects_text) {
    auto doc = Document{schema(), Node::doc(Node::block_group({
        Node::block_container("img", Node::block_content("image", Attrs{})),
        frame("b", "x"),
    }))};
    try {
        doc.transact([](Transaction& tx) { tx.insert(3, {Node::text("x")}); });
        FAIL() << "expected BlockTreeError";
    } catch (const BlockTreeError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::invalid_content);
    }
}

// -- Inline steps -------------------------------------------------------------

TEST(Transaction, insert_text_turns_newlines_into_hard_breaks) {
    auto doc = two_blocks();
    doc.transact([](Transaction& tx) { tx.insert_text("X\nY", 3, 3); });

    const auto& content = doc.doc()->first_child()->child(0)->first_child();
    ASSERT_EQ(content->child_count(), 3u);
    EXPECT_EQ(content->child(0)->text(), "X");
    EXPECT_EQ(content->child(1)->role(), NodeRole::hard_break);
    EXPECT_EQ(content->child(2)->text(), "YHello");
    EXPECT_EQ(content->content_size(), 8u);
}

TEST(Transaction, insert_text_replaces_the_range) {
    auto doc = two_blocks();
    doc.transact([](Transaction& tx) { tx.insert_text("J", 3, 4); });
    EXPECT_EQ(doc.doc()->first_child()->child(0)->text_content(), "Jello");
}

TEST(Transaction, insert_text_requires_inline_content) {
    auto doc = two_blocks();
    try {
        doc.transact([](Transaction& tx) { tx.insert_text("x", 10, 10); });
        FAIL() << "expected BlockTreeError";
    } catch (const BlockTreeError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::invalid_position);
    }
}

TEST(Transaction, add_and_remove_marks) {
    auto doc = two_blocks();
    doc.transact([](Transaction& tx) { tx.add_mark(3, 6, bold()); });

    const auto& a = doc.doc()->first_child()->child(0)->first_child();
    ASSERT_EQ(a->child_count(), 2u);
    EXPECT_EQ(a->child(0)->text(), "Hel");
    EXPECT_EQ(a->child(0)->marks().size(), 1u);
    EXPECT_TRUE(a->child(1)->marks().empty());

    doc.transact([](Transaction& tx) { tx.remove_mark(1, 19, "bold"); });
    EXPECT_EQ(doc.doc()->first_child()->child(0)->first_child()->child_count(), 1u);
    EXPECT_EQ(doc.version(), 2u);
}

TEST(Transaction, marks_across_blocks) {
    auto doc = two_blocks();
    doc.transact([](Transaction& tx) {
        tx.add_mark(5, 14, bold());
        EXPECT_EQ(tx.step_count(), 1u);
    });
    const auto& group = doc.doc()->first_child();
    EXPECT_EQ(group->child(0)->first_child()->child(1)->text(), "llo");
    EXPECT_EQ(group->child(1)->first_child()->child(0)->text(), "Wo");
    EXPECT_FALSE(group->child(1)->first_child()->child(0)->marks().empty());
}

TEST(Transaction, redundant_mark_is_not_a_change) {
    auto doc = two_blocks();
    doc.transact([](Transaction& tx) { tx.remove_mark(3, 8, "bold"); });
    EXPECT_EQ(doc.version(), 0u);
}

// -- Selection mapping --------------------------------------------------------

TEST(Transaction, selection_maps_through_insertions) {
    auto doc = two_blocks();
    doc.transact([](Transaction& tx) { tx.set_selection(TextSelection{.from = 13, .to = 13}); });
    EXPECT_EQ(doc.version(), 0u);

    doc.transact([](Transaction& tx) {
        tx.insert(10, {frame("x", "New")});  // 7 positions
        EXPECT_EQ(tx.map(13), 20u);
        EXPECT_EQ(tx.map(5), 5u);
    });
    EXPECT_EQ(doc.selection(), (TextSelection{20, 20}));
}

TEST(Transaction, selection_settles_after_its_block_is_deleted) {
    auto doc = two_blocks();
    doc.transact([](Transaction& tx) {
        tx.set_selection(TextSelection{.from = 13, .to = 13});
        tx.delete_range(10, 19);
    });
    EXPECT_EQ(doc.selection(), (TextSelection{8, 8}));
}

TEST(Transaction, set_selection_orders_and_checks_the_range) {
    auto doc = two_blocks();
    doc.transact([](Transaction& tx) { tx.set_selection(TextSelection{.from = 7, .to = 4}); });
    EXPECT_EQ(doc.selection(), (TextSelection{4, 7}));

    EXPECT_THROW(doc.transact([](Transaction& tx) {
        tx.set_selection(TextSelection{.from = 0, .to = 99});
    }), BlockTreeError);
}
