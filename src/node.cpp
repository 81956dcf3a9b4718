#include <blocktree-cpp/node.hpp>
#include <blocktree-cpp/error.hpp>

#include "utf8.hpp"

#include <algorithm>
#include <atomic>
#include <numeric>
#include <string>

namespace blocktree_cpp {

namespace {

auto next_serial() noexcept -> NodeSerial {
    static auto counter = std::atomic<NodeSerial>{1};
    return counter.fetch_add(1, std::memory_order_relaxed);
}

}  // anonymous namespace

Node::Node(Private, NodeRole role, std::string type, Attrs attrs, Fragment content,
           std::string text, MarkSet marks)
    : role_{role},
      type_{std::move(type)},
      attrs_{std::move(attrs)},
      content_{std::move(content)},
      text_{std::move(text)},
      marks_{std::move(marks)},
      serial_{next_serial()},
      content_size_{fragment_size(content_)},
      node_size_{0} {
    switch (role_) {
        case NodeRole::text:       node_size_ = detail::utf8::length(text_); break;
        case NodeRole::hard_break: node_size_ = 1; break;
        default:                   node_size_ = content_size_ + 2; break;
    }
}

// -- Factories ----------------------------------------------------------------

auto Node::doc(NodePtr block_group) -> NodePtr {
    if (!block_group || block_group->role() != NodeRole::block_group) {
        throw BlockTreeError{ErrorKind::invalid_document, "doc must wrap a block group"};
    }
    return std::make_shared<const Node>(Private{}, NodeRole::doc, "doc", Attrs{},
                                        Fragment{std::move(block_group)}, std::string{}, MarkSet{});
}

auto Node::block_group(Fragment frames) -> NodePtr {
    for (const auto& f : frames) {
        if (!f || f->role() != NodeRole::block_container) {
            throw BlockTreeError{ErrorKind::invalid_document,
                                 "block group may only hold block containers"};
        }
    }
    return std::make_shared<const Node>(Private{}, NodeRole::block_group, "blockGroup", Attrs{},
                                        std::move(frames), std::string{}, MarkSet{});
}

auto Node::block_container(std::string id, NodePtr content_node, NodePtr children_group) -> NodePtr {
    if (!content_node || content_node->role() != NodeRole::block_content) {
        throw BlockTreeError{ErrorKind::invalid_document,
                             "block container must start with a content node"};
    }
    auto content = Fragment{std::move(content_node)};
    if (children_group) {
        if (children_group->role() != NodeRole::block_group) {
            throw BlockTreeError{ErrorKind::invalid_document,
                                 "second child of a block container must be a block group"};
        }
        content.push_back(std::move(children_group));
    }
    auto attrs = Attrs{{"id", PropValue{std::move(id)}}};
    return std::make_shared<const Node>(Private{}, NodeRole::block_container, "blockContainer",
                                        std::move(attrs), std::move(content), std::string{}, MarkSet{});
}

auto Node::block_content(std::string type, Attrs attrs, Fragment inline_content) -> NodePtr {
    for (const auto& n : inline_content) {
        if (!n || !n->is_inline()) {
            throw BlockTreeError{ErrorKind::invalid_document,
                                 "content node '" + type + "' may only hold inline nodes"};
        }
    }
    return std::make_shared<const Node>(Private{}, NodeRole::block_content, std::move(type),
                                        std::move(attrs), normalize_inline(inline_content),
                                        std::string{}, MarkSet{});
}

auto Node::text(std::string text, MarkSet marks) -> NodePtr {
    if (text.empty()) {
        throw BlockTreeError{ErrorKind::invalid_content, "empty text nodes are not allowed"};
    }
    return std::make_shared<const Node>(Private{}, NodeRole::text, "text", Attrs{}, Fragment{},
                                        std::move(text), normalize_marks(std::move(marks)));
}

auto Node::hard_break(MarkSet marks) -> NodePtr {
    return std::make_shared<const Node>(Private{}, NodeRole::hard_break, "hardBreak", Attrs{},
                                        Fragment{}, std::string{}, normalize_marks(std::move(marks)));
}

// -- Accessors ----------------------------------------------------------------

auto Node::attr(std::string_view name) const -> const PropValue* {
    auto it = attrs_.find(name);
    return it != attrs_.end() ? &it->second : nullptr;
}

auto Node::block_id() const -> std::string {
    if (role_ != NodeRole::block_container) return {};
    return get_prop<std::string>(attrs_, "id").value_or(std::string{});
}

auto Node::text_content() const -> std::string {
    if (role_ == NodeRole::text) return text_;
    auto result = std::string{};
    for (const auto& child : content_) {
        result += child->text_content();
    }
    return result;
}

// -- Derivation ---------------------------------------------------------------

auto Node::with_content(Fragment content) const -> NodePtr {
    switch (role_) {
        case NodeRole::doc:
            if (content.size() != 1) {
                throw BlockTreeError{ErrorKind::invalid_document, "doc must hold exactly one block group"};
            }
            return doc(std::move(content.front()));
        case NodeRole::block_group:
            return block_group(std::move(content));
        case NodeRole::block_container:
            if (content.empty() || content.size() > 2) {
                throw BlockTreeError{ErrorKind::invalid_document,
                                     "block container must hold one or two children"};
            }
            return block_container(block_id(), content[0],
                                   content.size() == 2 ? content[1] : nullptr);
        case NodeRole::block_content:
            return block_content(type_, attrs_, std::move(content));
        case NodeRole::text:
        case NodeRole::hard_break:
            break;
    }
    throw BlockTreeError{ErrorKind::invalid_document, "leaf nodes have no content"};
}

auto Node::with_markup(std::string type, Attrs attrs) const -> NodePtr {
    return std::make_shared<const Node>(Private{}, role_, std::move(type), std::move(attrs),
                                        content_, text_, marks_);
}

auto Node::with_marks(MarkSet marks) const -> NodePtr {
    if (!is_inline()) {
        throw BlockTreeError{ErrorKind::invalid_document, "only inline nodes carry marks"};
    }
    return std::make_shared<const Node>(Private{}, role_, type_, attrs_, content_, text_,
                                        normalize_marks(std::move(marks)));
}

auto Node::cut_text(std::size_t from, std::size_t to) const -> NodePtr {
    if (!is_text() || from >= to || to > node_size_) {
        throw BlockTreeError{ErrorKind::invalid_position, "invalid text cut"};
    }
    if (from == 0 && to == node_size_) return with_marks(marks_);
    return text(detail::utf8::substr(text_, from, to), marks_);
}

auto Node::same_as(const Node& other) const -> bool {
    if (this == &other) return true;
    if (role_ != other.role_ || type_ != other.type_ || attrs_ != other.attrs_ ||
        text_ != other.text_ || marks_ != other.marks_ ||
        content_.size() != other.content_.size()) {
        return false;
    }
    return std::ranges::equal(content_, other.content_,
        [](const NodePtr& a, const NodePtr& b) { return a->same_as(*b); });
}

// -- Fragment helpers ---------------------------------------------------------

auto fragment_size(const Fragment& fragment) noexcept -> std::size_t {
    return std::accumulate(fragment.begin(), fragment.end(), std::size_t{0},
        [](std::size_t acc, const NodePtr& n) { return acc + n->node_size(); });
}

auto find_index(const Fragment& fragment, std::size_t pos) -> std::pair<std::size_t, std::size_t> {
    if (pos == 0) return {0, 0};
    auto cur = std::size_t{0};
    for (std::size_t i = 0; i < fragment.size(); ++i) {
        auto end = cur + fragment[i]->node_size();
        if (end >= pos) {
            if (end == pos) return {i + 1, end};
            return {i, cur};
        }
        cur = end;
    }
    if (pos == cur) return {fragment.size(), cur};
    throw BlockTreeError{ErrorKind::invalid_position,
                         "position " + std::to_string(pos) + " outside fragment of size " +
                         std::to_string(cur)};
}

auto cut_fragment(const Fragment& fragment, std::size_t from, std::size_t to) -> Fragment {
    auto result = Fragment{};
    if (from >= to) return result;
    auto pos = std::size_t{0};
    for (const auto& child : fragment) {
        auto end = pos + child->node_size();
        if (end > from && pos < to) {
            if (pos >= from && end <= to) {
                result.push_back(child);
            } else if (child->is_text()) {
                auto cut_from = from > pos ? from - pos : 0;
                auto cut_to = std::min(to, end) - pos;
                result.push_back(child->cut_text(cut_from, cut_to));
            } else {
                throw BlockTreeError{ErrorKind::invalid_position,
                                     "cannot cut through a " + std::string{to_string_view(child->role())} +
                                     " node"};
            }
        }
        pos = end;
        if (pos >= to) break;
    }
    return result;
}

void append_inline(Fragment& fragment, NodePtr node) {
    if (!fragment.empty() && node->is_text()) {
        const auto& last = fragment.back();
        if (last->is_text() && last->marks() == node->marks()) {
            fragment.back() = Node::text(last->text() + node->text(), last->marks());
            return;
        }
    }
    fragment.push_back(std::move(node));
}

auto normalize_inline(const Fragment& fragment) -> Fragment {
    auto result = Fragment{};
    result.reserve(fragment.size());
    for (const auto& n : fragment) {
        append_inline(result, n);
    }
    return result;
}

// -- Node schema --------------------------------------------------------------

void check_node(const Node& node, const NodeSchema& schema, bool root_group) {
    switch (node.role()) {
        case NodeRole::doc:
            if (node.child_count() != 1 || node.first_child()->role() != NodeRole::block_group) {
                throw BlockTreeError{ErrorKind::invalid_document, "doc must hold exactly one block group"};
            }
            check_node(*node.first_child(), schema, true);
            return;
        case NodeRole::block_group:
            if (!root_group && node.child_count() == 0) {
                throw BlockTreeError{ErrorKind::invalid_document, "a children group cannot be empty"};
            }
            for (const auto& frame : node.content()) {
                if (frame->role() != NodeRole::block_container) {
                    throw BlockTreeError{ErrorKind::invalid_document,
                                         "block group may only hold block containers"};
                }
                check_node(*frame, schema);
            }
            return;
        case NodeRole::block_container:
            if (node.block_id().empty()) {
                throw BlockTreeError{ErrorKind::invalid_document, "block container without an id"};
            }
            if (node.child_count() == 0 || node.child_count() > 2 ||
                node.first_child()->role() != NodeRole::block_content ||
                (node.child_count() == 2 && node.last_child()->role() != NodeRole::block_group)) {
                throw BlockTreeError{ErrorKind::invalid_document,
                                     "block container '" + node.block_id() + "' has a malformed body"};
            }
            for (const auto& child : node.content()) {
                check_node(*child, schema);
            }
            return;
        case NodeRole::block_content: {
            auto kind = schema.content_kind(node.type());
            if (!kind) {
                throw BlockTreeError{ErrorKind::unknown_block_type,
                                     "unknown block type '" + node.type() + "'"};
            }
            if (*kind == ContentKind::none && node.child_count() > 0) {
                throw BlockTreeError{ErrorKind::invalid_content,
                                     "block type '" + node.type() + "' has no inline content"};
            }
            for (const auto& child : node.content()) {
                if (!child->is_inline()) {
                    throw BlockTreeError{ErrorKind::invalid_document,
                                         "content node '" + node.type() + "' may only hold inline nodes"};
                }
            }
            return;
        }
        case NodeRole::text:
        case NodeRole::hard_break:
            return;
    }
}

}  // namespace blocktree_cpp
