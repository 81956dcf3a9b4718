/// @file transaction.hpp
/// @brief Transaction class for mutating flat documents.

#pragma once

#include <blocktree-cpp/mark.hpp>
#include <blocktree-cpp/node.hpp>
#include <blocktree-cpp/resolved_pos.hpp>
#include <blocktree-cpp/types.hpp>
#include <blocktree-cpp/value.hpp>

#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace blocktree_cpp {

/// A mutation interface for a flat Document.
///
/// Transactions are created exclusively by Document::transact(). Every step
/// works on a private copy of the document: the copy replaces the live
/// snapshot only when the transaction function returns normally, so a step
/// that throws leaves the document untouched. Steps address the document
/// through absolute positions as of the moment the step runs.
///
/// @code
/// doc.transact([](Transaction& tx) {
///     tx.insert_text("Hello", 3, 3);
///     tx.add_mark(3, 8, Mark{.type = "bold"});
/// });
/// @endcode
class Transaction {
    friend class Document;
    Transaction(NodePtr doc, TextSelection selection, const NodeSchema& schema);

public:
    /// The working document, including every step applied so far.
    auto doc() const noexcept -> const NodePtr& { return doc_; }

    /// The working selection, mapped through every step applied so far.
    auto selection() const noexcept -> const TextSelection& { return selection_; }

    /// The node schema edits are checked against.
    auto schema() const noexcept -> const NodeSchema& { return schema_; }

    /// Resolve a position against the working document.
    auto resolve(std::size_t pos) const -> ResolvedPos;

    // -- Structural steps -----------------------------------------------------

    /// Replace the range [from, to) with `nodes`.
    ///
    /// Both ends must lie inside the same parent node. Text nodes at the
    /// ends are split; any other node crossed by an end throws
    /// invalid_position. The resulting parent must still fit the document
    /// shape and the node schema.
    void replace(std::size_t from, std::size_t to, Fragment nodes);

    /// Insert nodes at a position.
    void insert(std::size_t pos, Fragment nodes) { replace(pos, pos, std::move(nodes)); }

    /// Delete the range [from, to).
    void delete_range(std::size_t from, std::size_t to) { replace(from, to, Fragment{}); }

    /// Change the type and attributes of the non-inline node directly after
    /// `pos`, keeping its children.
    void set_node_markup(std::size_t pos, std::string type, Attrs attrs);

    // -- Inline steps ---------------------------------------------------------

    /// Add a mark to every text node in [from, to), replacing any mark of the
    /// same type.
    void add_mark(std::size_t from, std::size_t to, Mark mark);

    /// Remove marks of the given type from every text node in [from, to).
    void remove_mark(std::size_t from, std::size_t to, std::string_view type);

    /// Replace [from, to) inside a textblock with plain text carrying the
    /// marks active at `from`. Newlines become hard breaks.
    void insert_text(std::string_view text, std::size_t from, std::size_t to);

    // -- Selection ------------------------------------------------------------

    /// Set the selection. The ends are ordered and checked against the
    /// working document.
    void set_selection(TextSelection selection);

    /// Map a position of the original document through every step applied
    /// so far.
    auto map(std::size_t pos) const -> std::size_t;

    /// Number of steps that changed the document.
    auto step_count() const noexcept -> std::size_t { return maps_.size() + markup_steps_; }

    /// True when at least one step changed the document.
    auto doc_changed() const noexcept -> bool { return step_count() > 0; }

private:
    struct StepMap {
        std::size_t from;
        std::size_t old_to;
        std::size_t new_size;

        auto map(std::size_t pos) const noexcept -> std::size_t;
    };

    /// Rebuild the ancestors of `replacement`, which takes the place of
    /// `rpos.node(depth)`.
    void rebuild(const ResolvedPos& rpos, std::size_t depth, NodePtr replacement);

    /// Replace the node directly after `pos` without moving any position.
    void replace_node_at(std::size_t pos, NodePtr replacement);

    /// Rewrite the mark sets of the text nodes in [from, to).
    void remark(std::size_t from, std::size_t to,
                const std::function<MarkSet(const MarkSet&)>& fn);

    /// Move the selection into the closest content node.
    auto settled_selection() const -> TextSelection;

    NodePtr doc_;
    TextSelection selection_;
    const NodeSchema& schema_;
    std::vector<StepMap> maps_;
    std::size_t markup_steps_ = 0;
};

}  // namespace blocktree_cpp
