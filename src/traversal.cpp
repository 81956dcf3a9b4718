#include <blocktree-cpp/traversal.hpp>

namespace blocktree_cpp {

Traversal::Traversal(NodePtr root, std::size_t content_start) {
    if (root) {
        stack_.push_back(Frame{.node = std::move(root), .index = 0, .pos = content_start, .depth = 1});
    }
}

auto Traversal::next() -> std::optional<VisitedNode> {
    if (descend_ && last_ && last_->node->child_count() > 0) {
        stack_.push_back(Frame{
            .node = last_->node,
            .index = 0,
            .pos = last_->pos + 1,
            .depth = last_->depth + 1,
        });
    }
    descend_ = false;

    while (!stack_.empty()) {
        auto& top = stack_.back();
        if (top.index < top.node->child_count()) {
            const auto& child = top.node->child(top.index);
            last_ = VisitedNode{
                .node = child,
                .pos = top.pos,
                .depth = top.depth,
                .index = top.index,
                .parent = top.node,
            };
            top.pos += child->node_size();
            ++top.index;
            descend_ = true;
            return last_;
        }
        stack_.pop_back();
    }
    last_.reset();
    return std::nullopt;
}

}  // namespace blocktree_cpp
