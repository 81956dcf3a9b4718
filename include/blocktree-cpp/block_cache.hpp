/// @file block_cache.hpp
/// @brief BlockCache: identity-keyed memo of frame-to-Block conversions.

#pragma once

#include <blocktree-cpp/block.hpp>
#include <blocktree-cpp/node.hpp>
#include <blocktree-cpp/types.hpp>

#include <cstddef>
#include <memory>
#include <mutex>
#include <unordered_map>

namespace blocktree_cpp {

/// Counters describing cache effectiveness.
struct BlockCacheStats {
    std::size_t hits = 0;
    std::size_t misses = 0;
    std::size_t evictions = 0;

    auto operator==(const BlockCacheStats&) const -> bool = default;
};

/// Memo of converted Blocks keyed by the identity of their block frame.
///
/// Entries hold only a weak reference to the frame, so the cache never keeps
/// a node alive. A frame's serial is unique for the lifetime of the process
/// and nodes never change after construction, so a hit needs no freshness
/// check. prune() drops the entries whose frame is no longer referenced by
/// any snapshot.
///
/// Thread-safe: concurrent readers may populate the cache.
class BlockCache {
public:
    /// The Block converted from `frame`, or nullptr when not cached.
    auto get(const NodePtr& frame) const -> std::shared_ptr<const Block>;

    /// Remember the Block converted from `frame`. Returns the stored Block.
    auto set(const NodePtr& frame, Block block) -> std::shared_ptr<const Block>;

    /// Drop entries whose frame has been destroyed. Returns the number of
    /// entries removed.
    auto prune() -> std::size_t;

    /// Remove every entry.
    void clear();

    auto size() const -> std::size_t;
    auto stats() const -> BlockCacheStats;

private:
    struct Entry {
        std::weak_ptr<const Node> frame;
        std::shared_ptr<const Block> block;
    };

    mutable std::mutex mutex_;
    std::unordered_map<NodeSerial, Entry> entries_;
    mutable BlockCacheStats stats_;
};

}  // namespace blocktree_cpp
