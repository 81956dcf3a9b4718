/// @file document.hpp
/// @brief Document, the flat position-addressed document engine.

#pragma once

#include <blocktree-cpp/node.hpp>
#include <blocktree-cpp/resolved_pos.hpp>
#include <blocktree-cpp/transaction.hpp>
#include <blocktree-cpp/types.hpp>

#include <concepts>
#include <cstddef>
#include <cstdint>
#include <type_traits>
#include <utility>

namespace blocktree_cpp {

/// A flat rich-text document: an immutable node snapshot plus a selection.
///
/// All mutations go through Transaction objects obtained via transact().
/// A transaction commits only when its function returns normally; if the
/// function throws, the snapshot and selection stay exactly as they were.
/// Committed snapshots share every untouched subtree with their
/// predecessor.
///
/// Document itself is not synchronized. Editor serializes access to it.
///
/// @code
/// auto doc = Document{schema};
/// doc.transact([](Transaction& tx) {
///     tx.insert(1, {Node::block_container("a", Node::block_content("paragraph", {}))});
/// });
/// @endcode
class Document {
public:
    /// Construct a document holding an empty root group.
    explicit Document(NodeSchema schema);

    /// Construct a document from an existing snapshot, checked against
    /// `schema`. Throws invalid_document or unknown_block_type.
    Document(NodeSchema schema, NodePtr doc);

    /// The current snapshot.
    auto doc() const noexcept -> const NodePtr& { return doc_; }

    /// The current selection.
    auto selection() const noexcept -> const TextSelection& { return selection_; }

    /// The node schema edits are checked against.
    auto schema() const noexcept -> const NodeSchema& { return schema_; }

    /// Resolve a position against the current snapshot.
    auto resolve(std::size_t pos) const -> ResolvedPos;

    /// Number of committed transactions that changed the snapshot.
    auto version() const noexcept -> std::uint64_t { return version_; }

    /// Execute a function within a transaction and return its result.
    template <typename Fn>
        requires std::invocable<Fn, Transaction&>
    auto transact(Fn&& fn) -> std::invoke_result_t<Fn, Transaction&>;

private:
    void commit(Transaction& tx);

    NodeSchema schema_;
    NodePtr doc_;
    TextSelection selection_;
    std::uint64_t version_ = 0;
};

// -- Template implementations (must be in header) ----------------------------

template <typename Fn>
    requires std::invocable<Fn, Transaction&>
auto Document::transact(Fn&& fn) -> std::invoke_result_t<Fn, Transaction&> {
    auto tx = Transaction{doc_, selection_, schema_};
    if constexpr (std::is_void_v<std::invoke_result_t<Fn, Transaction&>>) {
        std::forward<Fn>(fn)(tx);
        commit(tx);
    } else {
        auto result = std::forward<Fn>(fn)(tx);
        commit(tx);
        return result;
    }
}

}  // namespace blocktree_cpp
