#include <blocktree-cpp/transaction.hpp>
#include <blocktree-cpp/error.hpp>
#include <blocktree-cpp/traversal.hpp>

#include <algorithm>
#include <string>
#include <utility>

namespace blocktree_cpp {

namespace {

auto out_of_range(std::size_t pos) -> BlockTreeError {
    return BlockTreeError{ErrorKind::invalid_position,
                          "position " + std::to_string(pos) + " out of range"};
}

/// Check a parent after its children changed. Inserted subtrees are checked
/// in full by the caller.
void check_parent(const Node& parent, std::size_t depth, const NodeSchema& schema) {
    switch (parent.role()) {
        case NodeRole::block_group:
            if (depth > 1 && parent.child_count() == 0) {
                throw BlockTreeError{ErrorKind::invalid_document,
                                     "a children group cannot be empty"};
            }
            break;
        case NodeRole::block_content: {
            auto kind = schema.content_kind(parent.type());
            if (kind == ContentKind::none && parent.child_count() > 0) {
                throw BlockTreeError{ErrorKind::invalid_content,
                                     "block type '" + parent.type() + "' has no inline content"};
            }
            break;
        }
        default:
            break;
    }
}

}  // anonymous namespace

auto Transaction::StepMap::map(std::size_t pos) const noexcept -> std::size_t {
    if (pos < from) return pos;
    if (pos > old_to) return pos - (old_to - from) + new_size;
    if (pos == from && from != old_to) return from;
    return from + new_size;
}

Transaction::Transaction(NodePtr doc, TextSelection selection, const NodeSchema& schema)
    : doc_{std::move(doc)}, selection_{selection}, schema_{schema} {}

auto Transaction::resolve(std::size_t pos) const -> ResolvedPos {
    return ResolvedPos::resolve(doc_, pos);
}

// -- Structural steps ---------------------------------------------------------

void Transaction::replace(std::size_t from, std::size_t to, Fragment nodes) {
    if (from > to) {
        throw BlockTreeError{ErrorKind::invalid_position,
                             "range start " + std::to_string(from) + " is after its end " +
                             std::to_string(to)};
    }
    if (to > doc_->content_size()) throw out_of_range(to);

    auto rfrom = resolve(from);
    auto rto = resolve(to);
    auto depth = rfrom.depth();
    if (rto.depth() != depth || rfrom.start(depth) != rto.start(depth)) {
        throw BlockTreeError{ErrorKind::invalid_position,
                             "replaced range [" + std::to_string(from) + ", " + std::to_string(to) +
                             ") must stay inside one parent"};
    }

    for (const auto& n : nodes) {
        if (!n) throw BlockTreeError{ErrorKind::invalid_document, "null node in fragment"};
        check_node(*n, schema_);
    }

    const auto& parent = rfrom.parent();
    auto start = rfrom.start(depth);
    auto inserted = fragment_size(nodes);

    auto content = cut_fragment(parent->content(), 0, from - start);
    content.insert(content.end(), std::make_move_iterator(nodes.begin()),
                   std::make_move_iterator(nodes.end()));
    auto tail = cut_fragment(parent->content(), to - start, parent->content_size());
    content.insert(content.end(), tail.begin(), tail.end());

    auto replacement = parent->with_content(std::move(content));
    check_parent(*replacement, depth, schema_);
    rebuild(rfrom, depth, std::move(replacement));

    auto step = StepMap{.from = from, .old_to = to, .new_size = inserted};
    maps_.push_back(step);
    selection_ = TextSelection{.from = step.map(selection_.from), .to = step.map(selection_.to)};
    selection_.to = std::min(selection_.to, doc_->content_size());
    selection_.from = std::min(selection_.from, selection_.to);
}

void Transaction::set_node_markup(std::size_t pos, std::string type, Attrs attrs) {
    auto rpos = resolve(pos);
    auto node = rpos.node_after();
    if (!node || node->is_inline() || rpos.text_offset() != 0) {
        throw BlockTreeError{ErrorKind::invalid_position,
                             "no block node at position " + std::to_string(pos)};
    }
    auto replacement = node->with_markup(std::move(type), std::move(attrs));
    check_node(*replacement, schema_, node->role() == NodeRole::block_group && rpos.depth() == 0);
    replace_node_at(pos, std::move(replacement));
    ++markup_steps_;
}

void Transaction::rebuild(const ResolvedPos& rpos, std::size_t depth, NodePtr replacement) {
    for (auto d = depth; d-- > 0;) {
        const auto& ancestor = rpos.node(d);
        auto content = ancestor->content();
        content.at(rpos.index(d)) = std::move(replacement);
        replacement = ancestor->with_content(std::move(content));
    }
    doc_ = std::move(replacement);
}

void Transaction::replace_node_at(std::size_t pos, NodePtr replacement) {
    auto rpos = resolve(pos);
    const auto& parent = rpos.parent();
    auto content = parent->content();
    content.at(rpos.index()) = std::move(replacement);
    rebuild(rpos, rpos.depth(), parent->with_content(std::move(content)));
}

// -- Inline steps -------------------------------------------------------------

void Transaction::remark(std::size_t from, std::size_t to,
                         const std::function<MarkSet(const MarkSet&)>& fn) {
    if (from > to || to > doc_->content_size()) throw out_of_range(to);
    if (from == to) return;

    // Collect the affected textblocks first: marks never move positions, so
    // the collected positions stay valid while each block is rewritten.
    auto blocks = std::vector<std::size_t>{};
    for_each_descendant(doc_, [&](const VisitedNode& v) {
        if (v.pos >= to) return Visit::stop;
        if (v.pos + v.node->node_size() <= from) return Visit::skip_children;
        if (v.node->is_textblock()) {
            blocks.push_back(v.pos);
            return Visit::skip_children;
        }
        return Visit::descend;
    });

    auto changed = false;
    for (auto pos : blocks) {
        auto block = resolve(pos).node_after();
        auto start = pos + 1;
        auto lo = std::max(from, start) - start;
        auto hi = std::min(to, start + block->content_size()) - start;
        if (lo >= hi) continue;

        const auto& inline_nodes = block->content();
        auto content = cut_fragment(inline_nodes, 0, lo);
        auto local = false;
        for (const auto& n : cut_fragment(inline_nodes, lo, hi)) {
            auto marks = fn(n->marks());
            if (marks != n->marks()) {
                content.push_back(n->with_marks(std::move(marks)));
                local = true;
            } else {
                content.push_back(n);
            }
        }
        if (!local) continue;
        auto tail = cut_fragment(inline_nodes, hi, block->content_size());
        content.insert(content.end(), tail.begin(), tail.end());
        replace_node_at(pos, block->with_content(std::move(content)));
        changed = true;
    }
    if (changed) ++markup_steps_;
}

void Transaction::add_mark(std::size_t from, std::size_t to, Mark mark) {
    remark(from, to, [&](const MarkSet& marks) { return add_to_set(marks, mark); });
}

void Transaction::remove_mark(std::size_t from, std::size_t to, std::string_view type) {
    remark(from, to, [&](const MarkSet& marks) { return remove_from_set(marks, type); });
}

void Transaction::insert_text(std::string_view text, std::size_t from, std::size_t to) {
    auto rfrom = resolve(from);
    const auto& parent = rfrom.parent();
    if (!parent->is_textblock() ||
        schema_.content_kind(parent->type()) != ContentKind::inline_content) {
        throw BlockTreeError{ErrorKind::invalid_position,
                             "position " + std::to_string(from) + " is not inside inline content"};
    }

    auto marks = rfrom.marks();
    auto nodes = Fragment{};
    auto rest = text;
    while (!rest.empty()) {
        auto nl = rest.find('\n');
        auto line = rest.substr(0, nl);
        if (!line.empty()) nodes.push_back(Node::text(std::string{line}, marks));
        if (nl == std::string_view::npos) break;
        nodes.push_back(Node::hard_break(marks));
        rest.remove_prefix(nl + 1);
    }
    replace(from, to, std::move(nodes));
}

// -- Selection ----------------------------------------------------------------

void Transaction::set_selection(TextSelection selection) {
    if (selection.from > selection.to) std::swap(selection.from, selection.to);
    if (selection.to > doc_->content_size()) throw out_of_range(selection.to);
    selection_ = selection;
}

auto Transaction::map(std::size_t pos) const -> std::size_t {
    for (const auto& step : maps_) {
        pos = step.map(pos);
    }
    return pos;
}

auto Transaction::settled_selection() const -> TextSelection {
    auto inside = [&](std::size_t pos) {
        return resolve(pos).parent()->is_textblock();
    };
    if (inside(selection_.from) && inside(selection_.to)) return selection_;

    // Nearest content start after the anchor, else the nearest content end
    // before it.
    auto after = std::optional<std::size_t>{};
    auto before = std::optional<std::size_t>{};
    for_each_descendant(doc_, [&](const VisitedNode& v) {
        if (!v.node->is_textblock()) return Visit::descend;
        auto start = v.pos + 1;
        if (start >= selection_.from) {
            after = start;
            return Visit::stop;
        }
        before = start + v.node->content_size();
        return Visit::skip_children;
    });
    auto pos = after ? *after : before.value_or(selection_.from);
    return TextSelection{.from = pos, .to = pos};
}

}  // namespace blocktree_cpp
