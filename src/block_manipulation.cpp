#include <blocktree-cpp/block_manipulation.hpp>
#include <blocktree-cpp/block_info.hpp>
#include <blocktree-cpp/error.hpp>
#include <blocktree-cpp/node_conversions.hpp>

#include <algorithm>
#include <functional>
#include <optional>
#include <utility>

namespace blocktree_cpp {

namespace {

auto convert_all(const MutationContext& ctx, const std::vector<PartialBlock>& blocks) -> Fragment {
    auto nodes = Fragment{};
    nodes.reserve(blocks.size());
    for (const auto& block : blocks) {
        nodes.push_back(block_to_node(block, ctx.schema, ctx.ids));
    }
    return nodes;
}

auto ids_of(const Fragment& frames) -> std::vector<std::string> {
    auto ids = std::vector<std::string>{};
    ids.reserve(frames.size());
    for (const auto& frame : frames) {
        ids.push_back(frame->block_id());
    }
    return ids;
}

auto not_found(const std::vector<std::string>& missing) -> BlockTreeError {
    auto message = std::string{missing.size() == 1 ? "block with id " : "blocks with ids "};
    for (std::size_t i = 0; i < missing.size(); ++i) {
        if (i > 0) message += ", ";
        message += missing[i];
    }
    message += " not found";
    return BlockTreeError{ErrorKind::block_not_found, std::move(message)};
}

auto resolve_one(const Transaction& tx, const BlockIdentifier& target) -> BlockInfo {
    auto info = find_block(tx.doc(), target.id());
    if (!info) throw not_found({target.id()});
    return std::move(*info);
}

/// Resolve every target, failing with all missing ids at once.
auto resolve_all(const Transaction& tx, const std::vector<BlockIdentifier>& targets)
    -> std::vector<BlockInfo> {
    auto ids = std::vector<std::string>{};
    ids.reserve(targets.size());
    for (const auto& t : targets) {
        ids.push_back(t.id());
    }

    auto found = find_blocks(tx.doc(), ids);
    auto missing = std::vector<std::string>{};
    auto infos = std::vector<BlockInfo>{};
    infos.reserve(found.size());
    for (std::size_t i = 0; i < found.size(); ++i) {
        if (!found[i]) {
            if (std::ranges::find(missing, ids[i]) == missing.end()) missing.push_back(ids[i]);
        } else {
            infos.push_back(std::move(*found[i]));
        }
    }
    if (!missing.empty()) throw not_found(missing);
    return infos;
}

/// Delete one frame. A nested group that would be left empty goes with it.
void remove_frame(Transaction& tx, const BlockInfo& info) {
    if (info.depth > 2 && info.sibling_count == 1) {
        tx.delete_range(info.pos_before() - 1, info.pos_after() + 1);
    } else {
        tx.delete_range(info.pos_before(), info.pos_after());
    }
}

/// Delete the frames whose content starts at the given positions, last
/// first. Each frame is resolved again right before its deletion: only
/// later positions have moved by then.
void remove_frames(Transaction& tx, std::vector<std::size_t> starts) {
    std::ranges::sort(starts, std::greater<>{});
    auto [first, last] = std::ranges::unique(starts);
    starts.erase(first, last);
    for (auto start : starts) {
        auto info = block_info_at(tx.doc(), start);
        if (!info) {
            throw BlockTreeError{ErrorKind::invalid_document,
                                 "no block at position " + std::to_string(start)};
        }
        remove_frame(tx, *info);
    }
}

auto start_positions(const std::vector<BlockInfo>& infos) -> std::vector<std::size_t> {
    auto starts = std::vector<std::size_t>{};
    starts.reserve(infos.size());
    for (const auto& info : infos) {
        starts.push_back(info.start_pos);
    }
    return starts;
}

/// True when the frames form one gap-free run inside one group.
auto is_contiguous(std::vector<BlockInfo> infos) -> bool {
    std::ranges::sort(infos, {}, &BlockInfo::start_pos);
    for (std::size_t i = 1; i < infos.size(); ++i) {
        if (infos[i].depth != infos[0].depth ||
            infos[i].pos_before() != infos[i - 1].pos_after()) {
            return false;
        }
    }
    return true;
}

/// Keep the selection on a frame that moved from `old_before` to
/// `new_before`, when the selection lay inside it.
void follow_selection(Transaction& tx, const TextSelection& sel, std::size_t old_from,
                      std::size_t old_to, std::size_t old_before, std::size_t new_before) {
    if (sel.from < old_from || sel.to > old_to) return;
    tx.set_selection(TextSelection{
        .from = new_before + (sel.from - old_before),
        .to = new_before + (sel.to - old_before),
    });
}

}  // anonymous namespace

// -- Insert -------------------------------------------------------------------

auto insert_blocks(Transaction& tx, const MutationContext& ctx,
                   const std::vector<PartialBlock>& blocks, const BlockIdentifier& reference,
                   Placement placement) -> std::vector<std::string> {
    auto nodes = convert_all(ctx, blocks);
    auto info = resolve_one(tx, reference);
    if (nodes.empty()) return {};
    auto ids = ids_of(nodes);

    switch (placement) {
        case Placement::before:
            tx.insert(info.pos_before(), std::move(nodes));
            break;
        case Placement::after:
            tx.insert(info.pos_after(), std::move(nodes));
            break;
        case Placement::nested: {
            const auto& spec = ctx.schema.at(info.content_node->type());
            if (!spec.allows_children) {
                throw BlockTreeError{ErrorKind::invalid_placement,
                                     "block type '" + spec.type + "' cannot have children"};
            }
            auto group_pos = info.start_pos + info.content_node->node_size();
            if (info.frame->child_count() == 2) {
                tx.insert(group_pos + 1, std::move(nodes));
            } else {
                tx.insert(group_pos, Fragment{Node::block_group(std::move(nodes))});
            }
            break;
        }
    }
    return ids;
}

// -- Update -------------------------------------------------------------------

void update_block(Transaction& tx, const MutationContext& ctx,
                  const BlockIdentifier& target, const PartialBlock& update) {
    auto info = resolve_one(tx, target);
    const auto& old_content = info.content_node;
    const auto& spec = ctx.schema.at(update.type.value_or(old_content->type()));
    auto type_changed = spec.type != old_content->type();

    auto new_inline = std::optional<Fragment>{};
    if (update.content) {
        new_inline = inline_content_to_nodes(*update.content);
        if (spec.content == ContentKind::none && !new_inline->empty()) {
            throw BlockTreeError{ErrorKind::invalid_content,
                                 "block type '" + spec.type + "' has no inline content"};
        }
    }
    auto props = ctx.schema.resolve_props(spec.type, update.props, old_content->attrs());

    auto new_children = std::optional<Fragment>{};
    if (update.children) new_children = convert_all(ctx, *update.children);
    auto has_children = new_children ? !new_children->empty() : info.frame->child_count() == 2;
    if (has_children && !spec.allows_children) {
        throw BlockTreeError{ErrorKind::invalid_placement,
                             "block type '" + spec.type + "' cannot have children"};
    }

    // Children first: they sit after the content node, so the content
    // positions stay valid.
    auto group_pos = info.start_pos + old_content->node_size();
    if (new_children) {
        if (info.frame->child_count() == 2) {
            const auto& group = info.frame->last_child();
            if (new_children->empty()) {
                tx.delete_range(group_pos, group_pos + group->node_size());
            } else {
                tx.replace(group_pos + 1, group_pos + 1 + group->content_size(),
                           std::move(*new_children));
            }
        } else if (!new_children->empty()) {
            tx.insert(group_pos, Fragment{Node::block_group(std::move(*new_children))});
        }
    }

    if (type_changed) {
        auto inline_nodes = new_inline ? std::move(*new_inline)
                          : spec.content == ContentKind::none ? Fragment{}
                          : old_content->content();
        tx.replace(info.start_pos, group_pos,
                   Fragment{Node::block_content(spec.type, std::move(props), std::move(inline_nodes))});
        return;
    }
    if (new_inline) {
        tx.replace(info.start_pos + 1, group_pos - 1, std::move(*new_inline));
    }
    if (props != old_content->attrs()) {
        tx.set_node_markup(info.start_pos, spec.type, std::move(props));
    }
}

// -- Remove / replace ---------------------------------------------------------

void remove_blocks(Transaction& tx, const std::vector<BlockIdentifier>& targets) {
    remove_frames(tx, start_positions(resolve_all(tx, targets)));
}

auto replace_blocks(Transaction& tx, const MutationContext& ctx,
                    const std::vector<BlockIdentifier>& targets,
                    const std::vector<PartialBlock>& insertions) -> std::vector<std::string> {
    auto nodes = convert_all(ctx, insertions);
    auto infos = resolve_all(tx, targets);
    auto ids = ids_of(nodes);

    if (infos.empty()) {
        if (!nodes.empty()) tx.insert(tx.doc()->content_size() - 1, std::move(nodes));
        return ids;
    }
    if (nodes.empty()) {
        remove_frames(tx, start_positions(infos));
        return ids;
    }

    if (is_contiguous(infos)) {
        auto [lo, hi] = std::ranges::minmax(start_positions(infos));
        auto first = block_info_at(tx.doc(), lo);
        auto last = block_info_at(tx.doc(), hi);
        tx.replace(first->pos_before(), last->pos_after(), std::move(nodes));
        return ids;
    }

    auto at = infos.front().pos_before();
    auto inserted = fragment_size(nodes);
    tx.insert(at, std::move(nodes));
    auto starts = start_positions(infos);
    for (auto& start : starts) {
        if (start >= at) start += inserted;
    }
    remove_frames(tx, std::move(starts));
    return ids;
}

// -- Nesting ------------------------------------------------------------------

auto can_nest_block(const NodePtr& doc, const MutationContext& ctx, std::size_t pos) -> bool {
    auto info = block_info_at(doc, pos);
    if (!info) return false;
    auto prev = previous_sibling(doc, *info);
    if (!prev) return false;
    const auto* spec = ctx.schema.find(prev->content_node->type());
    return spec && spec->allows_children;
}

auto nest_block(Transaction& tx, const MutationContext& ctx, std::size_t pos) -> bool {
    if (!can_nest_block(tx.doc(), ctx, pos)) return false;
    auto info = *block_info_at(tx.doc(), pos);
    auto prev = *previous_sibling(tx.doc(), info);
    auto sel = tx.selection();

    // The block follows its previous sibling, so deleting it first leaves
    // the sibling's positions unchanged.
    tx.delete_range(info.pos_before(), info.pos_after());
    auto new_before = std::size_t{0};
    if (prev.frame->child_count() == 2) {
        new_before = prev.end_pos - 1;
        tx.insert(new_before, Fragment{info.frame});
    } else {
        tx.insert(prev.end_pos, Fragment{Node::block_group({info.frame})});
        new_before = prev.end_pos + 1;
    }
    follow_selection(tx, sel, info.pos_before(), info.pos_after(), info.pos_before(), new_before);
    return true;
}

auto can_unnest_block(const NodePtr& doc, std::size_t pos) -> bool {
    auto info = block_info_at(doc, pos);
    return info && info->depth > 2;
}

auto unnest_block(Transaction& tx, std::size_t pos) -> bool {
    auto info = block_info_at(tx.doc(), pos);
    if (!info || info->depth <= 2) return false;

    auto rpos = tx.resolve(info->start_pos);
    auto d = info->depth;
    const auto& group = rpos.node(d - 1);

    auto children = Fragment{};
    if (info->frame->child_count() == 2) children = info->frame->last_child()->content();
    const auto& siblings = group->content();
    children.insert(children.end(), siblings.begin() + static_cast<std::ptrdiff_t>(info->index) + 1,
                    siblings.end());
    auto lifted = Node::block_container(info->id, info->content_node,
                                        children.empty() ? nullptr : Node::block_group(std::move(children)));

    auto del_from = info->index == 0 ? rpos.before(d - 1) : info->pos_before();
    auto del_to = info->index == 0 ? rpos.after(d - 1) : rpos.end(d - 1);
    auto parent_after = rpos.after(d - 2);
    auto sel = tx.selection();

    tx.delete_range(del_from, del_to);
    auto new_before = parent_after - (del_to - del_from);
    tx.insert(new_before, Fragment{std::move(lifted)});
    follow_selection(tx, sel, info->start_pos, info->start_pos + info->content_node->node_size(),
                     info->pos_before(), new_before);
    return true;
}

}  // namespace blocktree_cpp
