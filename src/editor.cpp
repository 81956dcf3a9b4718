#include <blocktree-cpp/editor.hpp>
#include <blocktree-cpp/error.hpp>
#include <blocktree-cpp/format.hpp>
#include <blocktree-cpp/node_conversions.hpp>
#include <blocktree-cpp/traversal.hpp>

#include "executor.hpp"
#include "utf8.hpp"

#include <loguru.hpp>

#include <algorithm>
#include <utility>

namespace blocktree_cpp {

namespace {

auto initial_doc(const BlockSchema& schema, const IdGenerator& ids) -> NodePtr {
    if (schema.size() == 0) {
        throw BlockTreeError{ErrorKind::invalid_config, "the block schema is empty"};
    }
    auto type = schema.contains("paragraph") ? std::string{"paragraph"} : schema.specs().front().type;
    auto frame = block_to_node(PartialBlock{.type = std::move(type)}, schema, ids);
    return Node::doc(Node::block_group({std::move(frame)}));
}

/// Plain text of [from, to). Hard breaks read as "\n".
auto text_between(const NodePtr& doc, std::size_t from, std::size_t to) -> std::string {
    auto text = std::string{};
    for_each_descendant(doc, [&](const VisitedNode& v) {
        auto end = v.pos + v.node->node_size();
        if (v.pos >= to) return Visit::stop;
        if (end <= from) return Visit::skip_children;
        if (v.node->is_text()) {
            text += detail::utf8::substr(v.node->text(), std::max(from, v.pos) - v.pos,
                                         std::min(to, end) - v.pos);
        } else if (v.node->role() == NodeRole::hard_break) {
            text += '\n';
        }
        return Visit::descend;
    });
    return text;
}

/// True when every text node overlapping [from, to) carries a mark of `type`.
auto range_has_mark(const NodePtr& doc, std::size_t from, std::size_t to, std::string_view type) -> bool {
    auto seen = false;
    auto all = true;
    for_each_descendant(doc, [&](const VisitedNode& v) {
        if (v.pos >= to) return Visit::stop;
        if (v.pos + v.node->node_size() <= from) return Visit::skip_children;
        if (v.node->is_text()) {
            seen = true;
            if (!find_mark(v.node->marks(), type)) {
                all = false;
                return Visit::stop;
            }
        }
        return Visit::descend;
    });
    return seen && all;
}

auto link_mark(std::string href) -> Mark {
    return Mark{.type = "link", .attrs = Attrs{{"href", PropValue{std::move(href)}}}};
}

}  // anonymous namespace

Editor::Editor(EditorOptions options)
    : schema_{std::move(options.block_specs)},
      ids_{std::move(options.id_generator)},
      document_{schema_.node_schema(), initial_doc(schema_, ids_)},
      on_content_change_{std::move(options.on_content_change)},
      on_selection_change_{std::move(options.on_selection_change)},
      read_locking_{options.read_locking} {
    if (!options.initial_content.empty()) {
        document_.transact([&](Transaction& tx) {
            const auto& group = tx.doc()->first_child();
            auto targets = std::vector<BlockIdentifier>{};
            for (const auto& frame : group->content()) {
                targets.emplace_back(frame->block_id());
            }
            blocktree_cpp::replace_blocks(tx, context(), targets, options.initial_content);
        });
    }
    LOG_F(INFO, "editor created with %zu block types and %zu top-level blocks", schema_.size(),
          document_.doc()->first_child()->child_count());
}

// -- Locking and commit ---------------------------------------------------------

auto Editor::read_guard() const -> ReadGuard {
    return ReadGuard{mutex_, read_locking_};
}

void Editor::set_read_locking(bool enabled) {
    auto lock = std::unique_lock{mutex_};
    read_locking_ = enabled;
}

auto Editor::read_locking() const -> bool {
    auto lock = std::shared_lock{mutex_};
    return read_locking_;
}

template <typename Fn>
auto Editor::mutate(const char* operation, Fn&& fn) -> std::invoke_result_t<Fn, Transaction&> {
    using Result = std::invoke_result_t<Fn, Transaction&>;
    auto lock = std::unique_lock{mutex_};
    auto version = document_.version();
    auto selection = document_.selection();

    auto run = [&]() -> Result {
        try {
            return document_.transact(std::forward<Fn>(fn));
        } catch (const BlockTreeError& e) {
            LOG_F(WARNING, "%s rejected (%s): %s", operation,
                  std::string{to_string_view(e.kind())}.c_str(), e.error().message.c_str());
            throw;
        }
    };
    auto finish = [&] {
        auto content_changed = document_.version() != version;
        auto selection_changed = document_.selection() != selection;
        if (content_changed) {
            auto evicted = cache_.prune();
            VLOG_F(2, "%s: pruned %zu cache entries", operation, evicted);
        }
        lock.unlock();
        after_commit(operation, content_changed, selection_changed);
    };

    if constexpr (std::is_void_v<Result>) {
        run();
        finish();
    } else {
        auto result = run();
        finish();
        return result;
    }
}

void Editor::after_commit(const char* operation, bool content_changed, bool selection_changed) {
    if (content_changed) {
        VLOG_F(1, "%s committed", operation);
        if (on_content_change_) on_content_change_(*this);
    }
    if (selection_changed && on_selection_change_) on_selection_change_(*this);
}

auto Editor::convert(const NodePtr& frame) const -> Block {
    return node_to_block(frame, schema_, &cache_);
}

// -- Block queries --------------------------------------------------------------

auto Editor::top_level_blocks() const -> std::vector<Block> {
    auto guard = read_guard();
    const auto& group = document_.doc()->first_child();
    auto blocks = std::vector<Block>{};
    blocks.reserve(group->child_count());
    for (const auto& frame : group->content()) {
        blocks.push_back(convert(frame));
    }
    return blocks;
}

auto Editor::get_block(const BlockIdentifier& id) const -> std::optional<Block> {
    auto guard = read_guard();
    auto info = find_block(document_.doc(), id.id());
    if (!info) return std::nullopt;
    return convert(info->frame);
}

void Editor::for_each_block(const std::function<bool(const Block&)>& fn, bool reverse) const {
    auto blocks = top_level_blocks();

    struct Level {
        const std::vector<Block>* list;
        std::size_t next;
    };
    auto stack = std::vector<Level>{{&blocks, 0}};
    while (!stack.empty()) {
        auto& top = stack.back();
        if (top.next == top.list->size()) {
            stack.pop_back();
            continue;
        }
        auto i = reverse ? top.list->size() - 1 - top.next : top.next;
        ++top.next;
        const auto& block = (*top.list)[i];
        if (!fn(block)) return;
        if (!block.children.empty()) stack.push_back(Level{&block.children, 0});
    }
}

auto Editor::cursor_context_unlocked(std::size_t pos) const -> std::optional<TextCursorPosition> {
    const auto& doc = document_.doc();
    auto info = block_info_at(doc, pos);
    if (!info) return std::nullopt;

    auto result = TextCursorPosition{.block = convert(info->frame), .prev_block = {}, .next_block = {}};
    if (auto prev = previous_sibling(doc, *info)) result.prev_block = convert(prev->frame);
    if (auto next = next_sibling(doc, *info)) result.next_block = convert(next->frame);
    return result;
}

auto Editor::cursor_context(std::size_t pos) const -> std::optional<TextCursorPosition> {
    auto guard = read_guard();
    return cursor_context_unlocked(pos);
}

auto Editor::blocks_in_range(std::size_t from, std::size_t to) const -> std::vector<Block> {
    auto blocks = std::vector<Block>{};
    for_each_descendant(document_.doc(), [&](const VisitedNode& v) {
        if (v.node->role() != NodeRole::block_content) return Visit::descend;
        if (v.pos + v.node->node_size() >= from && v.pos <= to) {
            blocks.push_back(convert(v.parent));
        }
        return Visit::skip_children;
    });
    return blocks;
}

auto Editor::selection_blocks(std::size_t from, std::size_t to) const -> std::vector<Block> {
    auto guard = read_guard();
    return blocks_in_range(std::min(from, to), std::max(from, to));
}

// -- Cursor and selection -------------------------------------------------------

auto Editor::text_cursor_position() const -> std::optional<TextCursorPosition> {
    auto guard = read_guard();
    return cursor_context_unlocked(document_.selection().from);
}

void Editor::set_text_cursor_position(const BlockIdentifier& target, CursorPlacement placement) {
    mutate("set_text_cursor_position", [&](Transaction& tx) {
        auto info = find_block(tx.doc(), target.id());
        if (!info) {
            throw BlockTreeError{ErrorKind::block_not_found,
                                 "block with id " + target.id() + " not found"};
        }
        auto pos = placement == CursorPlacement::start ? info->content_start() : info->content_end();
        tx.set_selection(TextSelection{.from = pos, .to = pos});
    });
}

auto Editor::selection() const -> Selection {
    auto guard = read_guard();
    auto sel = document_.selection();
    return Selection{.blocks = blocks_in_range(sel.from, sel.to)};
}

auto Editor::text_selection() const -> TextSelection {
    auto guard = read_guard();
    return document_.selection();
}

void Editor::set_selection(std::size_t from, std::size_t to) {
    mutate("set_selection", [&](Transaction& tx) {
        tx.set_selection(TextSelection{.from = from, .to = to});
    });
}

// -- Block mutations ------------------------------------------------------------

auto Editor::insert_blocks(const std::vector<PartialBlock>& blocks, const BlockIdentifier& reference,
                           Placement placement) -> std::vector<std::string> {
    return mutate("insert_blocks", [&](Transaction& tx) {
        auto ids = blocktree_cpp::insert_blocks(tx, context(), blocks, reference, placement);
        VLOG_F(1, "inserting %zu blocks %s %s", ids.size(),
               std::string{to_string_view(placement)}.c_str(), reference.id().c_str());
        return ids;
    });
}

void Editor::update_block(const BlockIdentifier& target, const PartialBlock& update) {
    mutate("update_block", [&](Transaction& tx) {
        blocktree_cpp::update_block(tx, context(), target, update);
    });
}

void Editor::remove_blocks(const std::vector<BlockIdentifier>& targets) {
    mutate("remove_blocks", [&](Transaction& tx) {
        blocktree_cpp::remove_blocks(tx, targets);
        VLOG_F(1, "removing %zu blocks", targets.size());
    });
}

auto Editor::replace_blocks(const std::vector<BlockIdentifier>& targets,
                            const std::vector<PartialBlock>& insertions) -> std::vector<std::string> {
    return mutate("replace_blocks", [&](Transaction& tx) {
        auto ids = blocktree_cpp::replace_blocks(tx, context(), targets, insertions);
        VLOG_F(1, "replacing %zu blocks with %zu", targets.size(), ids.size());
        return ids;
    });
}

// -- Styles and links -----------------------------------------------------------

auto Editor::active_styles() const -> Styles {
    auto guard = read_guard();
    return marks_to_styles(document_.resolve(document_.selection().to).marks());
}

void Editor::add_styles(const Styles& styles) {
    mutate("add_styles", [&](Transaction& tx) {
        auto sel = tx.selection();
        for (const auto& mark : styles_to_marks(styles)) {
            tx.add_mark(sel.from, sel.to, mark);
        }
    });
}

void Editor::remove_styles(const Styles& styles) {
    mutate("remove_styles", [&](Transaction& tx) {
        auto sel = tx.selection();
        for (const auto& mark : styles_to_marks(styles)) {
            tx.remove_mark(sel.from, sel.to, mark.type);
        }
    });
}

void Editor::toggle_styles(const Styles& styles) {
    mutate("toggle_styles", [&](Transaction& tx) {
        auto sel = tx.selection();
        for (const auto& mark : styles_to_marks(styles)) {
            if (range_has_mark(tx.doc(), sel.from, sel.to, mark.type)) {
                tx.remove_mark(sel.from, sel.to, mark.type);
            } else {
                tx.add_mark(sel.from, sel.to, mark);
            }
        }
    });
}

auto Editor::active_link() const -> ActiveLink {
    auto guard = read_guard();
    const auto& doc = document_.doc();
    auto sel = document_.selection();

    auto marks = document_.resolve(sel.from).marks();
    if (!sel.empty()) {
        for_each_descendant(doc, [&](const VisitedNode& v) {
            if (v.pos >= sel.to) return Visit::stop;
            if (v.pos + v.node->node_size() <= sel.from) return Visit::skip_children;
            if (v.node->is_text()) {
                marks = v.node->marks();
                return Visit::stop;
            }
            return Visit::descend;
        });
    }

    auto url = std::string{};
    if (const auto* link = find_mark(marks, "link")) {
        url = get_prop<std::string>(link->attrs, "href").value_or(std::string{});
    }
    return ActiveLink{.text = text_between(doc, sel.from, sel.to), .url = std::move(url)};
}

void Editor::create_link(std::string_view url, std::optional<std::string> text) {
    if (url.empty()) return;
    mutate("create_link", [&](Transaction& tx) {
        auto sel = tx.selection();
        auto content = text && !text->empty() ? *text : text_between(tx.doc(), sel.from, sel.to);
        if (content.empty()) return;
        tx.insert_text(content, sel.from, sel.to);
        tx.add_mark(sel.from, sel.from + detail::utf8::length(content), link_mark(std::string{url}));
    });
}

// -- Nesting --------------------------------------------------------------------

auto Editor::can_nest_block() const -> bool {
    auto guard = read_guard();
    return blocktree_cpp::can_nest_block(document_.doc(), context(), document_.selection().from);
}

void Editor::nest_block() {
    mutate("nest_block", [&](Transaction& tx) {
        blocktree_cpp::nest_block(tx, context(), tx.selection().from);
    });
}

auto Editor::can_unnest_block() const -> bool {
    auto guard = read_guard();
    return blocktree_cpp::can_unnest_block(document_.doc(), document_.selection().from);
}

void Editor::unnest_block() {
    mutate("unnest_block", [&](Transaction& tx) {
        blocktree_cpp::unnest_block(tx, tx.selection().from);
    });
}

// -- Format codecs --------------------------------------------------------------

auto Editor::blocks_to_html(std::vector<Block> blocks) const -> std::future<std::string> {
    return detail::global_executor().async([blocks = std::move(blocks)] {
        return blocktree_cpp::blocks_to_html(blocks);
    });
}

auto Editor::blocks_to_markdown(std::vector<Block> blocks) const -> std::future<std::string> {
    return detail::global_executor().async([blocks = std::move(blocks)] {
        return blocktree_cpp::blocks_to_markdown(blocks);
    });
}

auto Editor::markdown_to_blocks(std::string markdown) const -> std::future<std::vector<Block>> {
    return detail::global_executor().async([schema = schema_, ids = ids_, markdown = std::move(markdown)] {
        auto blocks = std::vector<Block>{};
        for (const auto& partial : blocktree_cpp::markdown_to_blocks(markdown, schema)) {
            blocks.push_back(node_to_block(block_to_node(partial, schema, ids), schema));
        }
        return blocks;
    });
}

auto Editor::html_to_blocks(std::string html) const -> std::future<std::vector<Block>> {
    return detail::global_executor().async([schema = schema_, ids = ids_, html = std::move(html)] {
        auto blocks = std::vector<Block>{};
        for (const auto& partial : blocktree_cpp::html_to_blocks(html, schema)) {
            blocks.push_back(node_to_block(block_to_node(partial, schema, ids), schema));
        }
        return blocks;
    });
}

// -- Flat document access -------------------------------------------------------

auto Editor::doc() const -> NodePtr {
    auto guard = read_guard();
    return document_.doc();
}

auto Editor::to_block(const NodePtr& frame) const -> Block {
    return convert(frame);
}

void Editor::apply_fragment(std::size_t pos, Fragment nodes) {
    mutate("apply_fragment", [&](Transaction& tx) {
        tx.insert(pos, std::move(nodes));
    });
}

auto Editor::version() const -> std::uint64_t {
    auto guard = read_guard();
    return document_.version();
}

auto Editor::cache_stats() const -> BlockCacheStats {
    return cache_.stats();
}

auto Editor::cache_size() const -> std::size_t {
    return cache_.size();
}

}  // namespace blocktree_cpp
