#include <blocktree-cpp/resolved_pos.hpp>
#include <blocktree-cpp/error.hpp>

#include <string>

namespace blocktree_cpp {

auto ResolvedPos::resolve(const NodePtr& doc, std::size_t pos) -> ResolvedPos {
    if (!doc || pos > doc->content_size()) {
        throw BlockTreeError{ErrorKind::invalid_position,
                             "position " + std::to_string(pos) + " out of range"};
    }

    auto path = std::vector<Entry>{};
    auto start = std::size_t{0};
    auto parent_offset = pos;
    for (auto node = doc;;) {
        auto [index, offset] = find_index(node->content(), parent_offset);
        auto rem = parent_offset - offset;
        path.push_back(Entry{.node = node, .index = index, .offset = start + offset});
        if (rem == 0) break;
        node = node->child(index);
        if (node->is_text()) break;
        parent_offset = rem - 1;
        start += offset + 1;
    }
    return ResolvedPos{pos, std::move(path)};
}

auto ResolvedPos::start(std::size_t depth) const -> std::size_t {
    return depth == 0 ? 0 : path_.at(depth - 1).offset + 1;
}

auto ResolvedPos::end(std::size_t depth) const -> std::size_t {
    return start(depth) + node(depth)->content_size();
}

auto ResolvedPos::before(std::size_t depth) const -> std::size_t {
    if (depth == 0) {
        throw BlockTreeError{ErrorKind::invalid_position, "there is no position before the document"};
    }
    return path_.at(depth - 1).offset;
}

auto ResolvedPos::after(std::size_t depth) const -> std::size_t {
    return before(depth) + node(depth)->node_size();
}

auto ResolvedPos::text_offset() const -> std::size_t {
    return pos_ - path_.back().offset;
}

auto ResolvedPos::node_after() const -> NodePtr {
    const auto& p = parent();
    auto i = index();
    if (i == p->child_count()) return nullptr;
    const auto& child = p->child(i);
    auto off = text_offset();
    return off ? child->cut_text(off, child->node_size()) : child;
}

auto ResolvedPos::node_before() const -> NodePtr {
    const auto& p = parent();
    auto i = index();
    auto off = text_offset();
    if (off) return p->child(i)->cut_text(0, off);
    return i == 0 ? nullptr : p->child(i - 1);
}

auto ResolvedPos::marks() const -> MarkSet {
    const auto& p = parent();
    if (!p->is_textblock() || p->content_size() == 0) return {};
    auto i = index();
    if (text_offset()) return p->child(i)->marks();

    auto main = i > 0 ? p->child(i - 1) : NodePtr{};
    if (!main && i < p->child_count()) main = p->child(i);
    return main ? main->marks() : MarkSet{};
}

}  // namespace blocktree_cpp
