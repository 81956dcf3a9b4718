#include <blocktree-cpp/block_cache.hpp>

#include <utility>

namespace blocktree_cpp {

auto BlockCache::get(const NodePtr& frame) const -> std::shared_ptr<const Block> {
    auto lock = std::lock_guard{mutex_};
    auto it = entries_.find(frame->serial());
    if (it == entries_.end() || it->second.frame.lock() != frame) {
        ++stats_.misses;
        return nullptr;
    }
    ++stats_.hits;
    return it->second.block;
}

auto BlockCache::set(const NodePtr& frame, Block block) -> std::shared_ptr<const Block> {
    auto stored = std::make_shared<const Block>(std::move(block));
    auto lock = std::lock_guard{mutex_};
    entries_.insert_or_assign(frame->serial(), Entry{.frame = frame, .block = stored});
    return stored;
}

auto BlockCache::prune() -> std::size_t {
    auto lock = std::lock_guard{mutex_};
    auto removed = std::erase_if(entries_, [](const auto& kv) { return kv.second.frame.expired(); });
    stats_.evictions += removed;
    return removed;
}

void BlockCache::clear() {
    auto lock = std::lock_guard{mutex_};
    entries_.clear();
}

auto BlockCache::size() const -> std::size_t {
    auto lock = std::lock_guard{mutex_};
    return entries_.size();
}

auto BlockCache::stats() const -> BlockCacheStats {
    auto lock = std::lock_guard{mutex_};
    return stats_;
}

}  // namespace blocktree_cpp
