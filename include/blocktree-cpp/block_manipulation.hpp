/// @file block_manipulation.hpp
/// @brief Tree-level edits translated into position-range steps.

#pragma once

#include <blocktree-cpp/block.hpp>
#include <blocktree-cpp/id_generator.hpp>
#include <blocktree-cpp/schema.hpp>
#include <blocktree-cpp/transaction.hpp>
#include <blocktree-cpp/types.hpp>

#include <string>
#include <vector>

namespace blocktree_cpp {

/// What the tree mutator needs besides the transaction.
struct MutationContext {
    const BlockSchema& schema;
    const IdGenerator& ids;
};

/// Insert blocks before, after, or as the first children of `reference`.
///
/// Nested insertion creates the children group when the reference has
/// none. Returns the ids of the inserted top-level blocks. Throws
/// block_not_found, invalid_placement for a reference whose type forbids
/// children, and the conversion errors of block_to_node().
auto insert_blocks(Transaction& tx, const MutationContext& ctx,
                   const std::vector<PartialBlock>& blocks, const BlockIdentifier& reference,
                   Placement placement = Placement::before) -> std::vector<std::string>;

/// Update the fields of `target` that are set in `update`.
///
/// A changed type replaces the whole content node (props not mentioned in
/// `update` carry over when the new type declares them) while the
/// children group keeps its identity. Props alone are applied as a markup
/// change, content alone as a replacement of the inline range. Children,
/// when given, replace the children group; an empty list removes it.
void update_block(Transaction& tx, const MutationContext& ctx,
                  const BlockIdentifier& target, const PartialBlock& update);

/// Remove blocks with all of their children.
///
/// Every id is resolved before anything is removed; a missing id throws
/// block_not_found naming all missing ids. A nested group left empty is
/// removed as well.
void remove_blocks(Transaction& tx, const std::vector<BlockIdentifier>& targets);

/// Replace blocks with new ones.
///
/// When the targets form one contiguous run at a single level the run is
/// replaced in place. Otherwise the new blocks are inserted at the position
/// of the first target in `targets` and then every target is removed. With
/// no targets the new blocks are appended to the document. Returns the ids
/// of the inserted blocks.
auto replace_blocks(Transaction& tx, const MutationContext& ctx,
                    const std::vector<BlockIdentifier>& targets,
                    const std::vector<PartialBlock>& insertions) -> std::vector<std::string>;

/// True when the block holding position `pos` has a previous sibling that
/// may have children.
auto can_nest_block(const NodePtr& doc, const MutationContext& ctx, std::size_t pos) -> bool;

/// Move the block holding position `pos` to the end of its previous
/// sibling's children. Returns false when can_nest_block() does not hold.
auto nest_block(Transaction& tx, const MutationContext& ctx, std::size_t pos) -> bool;

/// True when the block holding position `pos` is nested.
auto can_unnest_block(const NodePtr& doc, std::size_t pos) -> bool;

/// Move the block holding position `pos` out of its parent, directly after
/// it. The siblings that followed it become its trailing children. Returns
/// false when the block is not nested.
auto unnest_block(Transaction& tx, std::size_t pos) -> bool;

}  // namespace blocktree_cpp
