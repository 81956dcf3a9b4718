#include <blocktree-cpp/block_info.hpp>
#include <blocktree-cpp/resolved_pos.hpp>
#include <blocktree-cpp/traversal.hpp>

#include <map>

namespace blocktree_cpp {

namespace {

/// Info of the frame that is `rpos.node(depth)`.
auto info_from(const ResolvedPos& rpos, std::size_t depth) -> BlockInfo {
    const auto& frame = rpos.node(depth);
    const auto& group = rpos.node(depth - 1);
    return BlockInfo{
        .frame = frame,
        .content_node = frame->first_child(),
        .id = frame->block_id(),
        .depth = depth,
        .start_pos = rpos.start(depth),
        .end_pos = rpos.end(depth),
        .index = rpos.index(depth - 1),
        .sibling_count = group->child_count(),
        .num_child_blocks = frame->child_count() == 2 ? frame->last_child()->child_count() : 0,
    };
}

}  // anonymous namespace

auto block_info_at(const NodePtr& doc, std::size_t pos) -> std::optional<BlockInfo> {
    auto rpos = ResolvedPos::resolve(doc, pos);
    // Positions inside a children group belong to the frame that owns it;
    // the root group has no enclosing frame.
    for (auto depth = rpos.depth(); depth > 0; --depth) {
        if (rpos.node(depth)->role() == NodeRole::block_container) {
            return info_from(rpos, depth);
        }
    }
    return std::nullopt;
}

auto previous_sibling(const NodePtr& doc, const BlockInfo& info) -> std::optional<BlockInfo> {
    if (!info.has_previous()) return std::nullopt;
    auto rpos = ResolvedPos::resolve(doc, info.start_pos - 2);
    return info_from(rpos, rpos.depth());
}

auto next_sibling(const NodePtr& doc, const BlockInfo& info) -> std::optional<BlockInfo> {
    if (!info.has_next()) return std::nullopt;
    auto rpos = ResolvedPos::resolve(doc, info.end_pos + 2);
    return info_from(rpos, rpos.depth());
}

auto find_block(const NodePtr& doc, std::string_view id) -> std::optional<BlockInfo> {
    auto result = std::optional<BlockInfo>{};
    for_each_descendant(doc, [&](const VisitedNode& v) {
        switch (v.node->role()) {
            case NodeRole::block_content:
                return Visit::skip_children;
            case NodeRole::block_container:
                if (v.node->block_id() == id) {
                    auto rpos = ResolvedPos::resolve(doc, v.pos + 1);
                    result = info_from(rpos, rpos.depth());
                    return Visit::stop;
                }
                return Visit::descend;
            default:
                return Visit::descend;
        }
    });
    return result;
}

auto find_blocks(const NodePtr& doc, std::span<const std::string> ids)
    -> std::vector<std::optional<BlockInfo>> {
    auto wanted = std::multimap<std::string_view, std::size_t, std::less<>>{};
    for (std::size_t i = 0; i < ids.size(); ++i) {
        wanted.emplace(ids[i], i);
    }

    auto result = std::vector<std::optional<BlockInfo>>(ids.size());
    auto remaining = ids.size();
    for_each_descendant(doc, [&](const VisitedNode& v) {
        if (v.node->role() == NodeRole::block_content) return Visit::skip_children;
        if (v.node->role() != NodeRole::block_container) return Visit::descend;

        auto [lo, hi] = wanted.equal_range(v.node->block_id());
        if (lo != hi) {
            auto rpos = ResolvedPos::resolve(doc, v.pos + 1);
            auto info = info_from(rpos, rpos.depth());
            for (auto it = lo; it != hi; ++it) {
                if (!result[it->second]) {
                    result[it->second] = info;
                    --remaining;
                }
            }
        }
        return remaining == 0 ? Visit::stop : Visit::descend;
    });
    return result;
}

}  // namespace blocktree_cpp
