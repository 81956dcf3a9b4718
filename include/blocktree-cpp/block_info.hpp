/// @file block_info.hpp
/// @brief Position-to-block resolution and block lookup by id.

#pragma once

#include <blocktree-cpp/node.hpp>

#include <cstddef>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace blocktree_cpp {

/// The block frame enclosing a position.
///
/// Positions follow the frame's content: the frame spans
/// [start_pos - 1, end_pos + 1), its content node starts at start_pos, the
/// previous sibling's content ends at start_pos - 2 and the next sibling's
/// content starts at end_pos + 2.
struct BlockInfo {
    NodePtr frame;                      ///< The block container.
    NodePtr content_node;               ///< Its content node.
    std::string id;                     ///< The block id.
    std::size_t depth = 0;              ///< Depth of the frame (top-level frames are at 2).
    std::size_t start_pos = 0;          ///< Start of the frame's content.
    std::size_t end_pos = 0;            ///< End of the frame's content.
    std::size_t index = 0;              ///< Index of the frame inside its group.
    std::size_t sibling_count = 0;      ///< Number of frames in that group.
    std::size_t num_child_blocks = 0;   ///< Number of nested frames.

    /// Position directly before the frame.
    auto pos_before() const noexcept -> std::size_t { return start_pos - 1; }

    /// Position directly after the frame.
    auto pos_after() const noexcept -> std::size_t { return end_pos + 1; }

    /// First position inside the content node.
    auto content_start() const noexcept -> std::size_t { return start_pos + 1; }

    /// Last position inside the content node.
    auto content_end() const noexcept -> std::size_t {
        return start_pos + content_node->node_size() - 1;
    }

    auto has_previous() const noexcept -> bool { return index > 0; }
    auto has_next() const noexcept -> bool { return index + 1 < sibling_count; }
};

/// Resolve the block frame enclosing `pos`.
///
/// The innermost frame whose range contains `pos` wins. A position between
/// nested frames, or at the start or end of a children group, resolves to
/// the frame owning that group. Returns nullopt when `pos` lies outside
/// every frame: directly inside the root group or at the document
/// boundaries. Throws invalid_position for positions outside the document.
auto block_info_at(const NodePtr& doc, std::size_t pos) -> std::optional<BlockInfo>;

/// The previous sibling frame at the same level, if any.
auto previous_sibling(const NodePtr& doc, const BlockInfo& info) -> std::optional<BlockInfo>;

/// The next sibling frame at the same level, if any.
auto next_sibling(const NodePtr& doc, const BlockInfo& info) -> std::optional<BlockInfo>;

/// Find the frame with the given block id.
auto find_block(const NodePtr& doc, std::string_view id) -> std::optional<BlockInfo>;

/// Find several frames in a single walk. The result has one entry per id,
/// nullopt for ids that are not in the document.
auto find_blocks(const NodePtr& doc, std::span<const std::string> ids)
    -> std::vector<std::optional<BlockInfo>>;

}  // namespace blocktree_cpp
