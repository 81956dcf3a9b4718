#include <blocktree-cpp/node_conversions.hpp>
#include <blocktree-cpp/error.hpp>

#include <memory>
#include <string>
#include <string_view>
#include <utility>

namespace blocktree_cpp {

namespace {

auto color_mark(std::string type, const std::string& color) -> Mark {
    return Mark{.type = std::move(type), .attrs = Attrs{{"color", PropValue{color}}}};
}

void append_run(std::vector<StyledText>& runs, const std::string& text, const Styles& styles) {
    if (!runs.empty() && runs.back().styles == styles) {
        runs.back().text += text;
        return;
    }
    runs.push_back(StyledText{.text = text, .styles = styles});
}

void append_text_nodes(Fragment& out, const StyledText& run, const MarkSet& marks) {
    auto rest = std::string_view{run.text};
    while (!rest.empty()) {
        auto nl = rest.find('\n');
        auto line = rest.substr(0, nl);
        if (!line.empty()) append_inline(out, Node::text(std::string{line}, marks));
        if (nl == std::string_view::npos) break;
        out.push_back(Node::hard_break(marks));
        rest.remove_prefix(nl + 1);
    }
}

}  // anonymous namespace

// -- Styles and marks ---------------------------------------------------------

auto styles_to_marks(const Styles& styles) -> MarkSet {
    auto marks = MarkSet{};
    if (styles.bold) marks.push_back(Mark{.type = "bold", .attrs = {}});
    if (styles.italic) marks.push_back(Mark{.type = "italic", .attrs = {}});
    if (styles.underline) marks.push_back(Mark{.type = "underline", .attrs = {}});
    if (styles.strike) marks.push_back(Mark{.type = "strike", .attrs = {}});
    if (styles.code) marks.push_back(Mark{.type = "code", .attrs = {}});
    if (styles.text_color) marks.push_back(color_mark("textColor", *styles.text_color));
    if (styles.background_color) marks.push_back(color_mark("backgroundColor", *styles.background_color));
    return normalize_marks(std::move(marks));
}

auto marks_to_styles(const MarkSet& marks) -> Styles {
    auto styles = Styles{};
    for (const auto& mark : marks) {
        if (mark.type == "bold") styles.bold = true;
        else if (mark.type == "italic") styles.italic = true;
        else if (mark.type == "underline") styles.underline = true;
        else if (mark.type == "strike") styles.strike = true;
        else if (mark.type == "code") styles.code = true;
        else if (mark.type == "textColor") styles.text_color = get_prop<std::string>(mark.attrs, "color");
        else if (mark.type == "backgroundColor") styles.background_color = get_prop<std::string>(mark.attrs, "color");
    }
    return styles;
}

// -- Inline content -----------------------------------------------------------

auto inline_content_to_nodes(const std::vector<InlineContent>& content) -> Fragment {
    auto nodes = Fragment{};
    for (const auto& item : content) {
        std::visit(overload{
            [&](const StyledText& run) {
                append_text_nodes(nodes, run, styles_to_marks(run.styles));
            },
            [&](const Link& link) {
                auto link_mark = Mark{.type = "link", .attrs = Attrs{{"href", PropValue{link.href}}}};
                for (const auto& run : link.content) {
                    append_text_nodes(nodes, run, add_to_set(styles_to_marks(run.styles), link_mark));
                }
            },
        }, item);
    }
    return nodes;
}

auto content_node_to_inline_content(const Node& content_node) -> std::vector<InlineContent> {
    auto result = std::vector<InlineContent>{};
    for (const auto& n : content_node.content()) {
        const auto& text = n->is_text() ? n->text() : std::string{"\n"};
        auto styles = marks_to_styles(n->marks());

        if (const auto* link_mark = find_mark(n->marks(), "link")) {
            auto href = get_prop<std::string>(link_mark->attrs, "href").value_or(std::string{});
            auto* link = result.empty() ? nullptr : std::get_if<Link>(&result.back());
            if (!link || link->href != href) {
                result.emplace_back(Link{.href = std::move(href), .content = {}});
                link = &std::get<Link>(result.back());
            }
            append_run(link->content, text, styles);
            continue;
        }

        auto* last = result.empty() ? nullptr : std::get_if<StyledText>(&result.back());
        if (last && last->styles == styles) {
            last->text += text;
        } else {
            result.emplace_back(StyledText{.text = text, .styles = std::move(styles)});
        }
    }
    return result;
}

// -- Blocks -------------------------------------------------------------------

auto block_to_node(const PartialBlock& block, const BlockSchema& schema,
                   const IdGenerator& ids) -> NodePtr {
    if (!block.type) {
        throw BlockTreeError{ErrorKind::unknown_block_type, "block type is required"};
    }
    const auto& spec = schema.at(*block.type);
    auto props = schema.resolve_props(spec.type, block.props);

    auto inline_nodes = Fragment{};
    if (block.content) {
        inline_nodes = inline_content_to_nodes(*block.content);
        if (spec.content == ContentKind::none && !inline_nodes.empty()) {
            throw BlockTreeError{ErrorKind::invalid_content,
                                 "block type '" + spec.type + "' has no inline content"};
        }
    }

    auto group = NodePtr{};
    if (block.children && !block.children->empty()) {
        if (!spec.allows_children) {
            throw BlockTreeError{ErrorKind::invalid_placement,
                                 "block type '" + spec.type + "' cannot have children"};
        }
        auto frames = Fragment{};
        frames.reserve(block.children->size());
        for (const auto& child : *block.children) {
            frames.push_back(block_to_node(child, schema, ids));
        }
        group = Node::block_group(std::move(frames));
    }

    auto id = std::string{};
    if (block.id && !block.id->empty()) {
        id = *block.id;
    } else if (ids) {
        id = ids();
    } else {
        throw BlockTreeError{ErrorKind::invalid_config, "no id generator for a block without an id"};
    }

    return Node::block_container(std::move(id),
                                 Node::block_content(spec.type, std::move(props), std::move(inline_nodes)),
                                 std::move(group));
}

auto node_to_block(const NodePtr& frame, const BlockSchema& schema, BlockCache* cache) -> Block {
    auto cached = [&](const NodePtr& f) -> std::shared_ptr<const Block> {
        return cache ? cache->get(f) : nullptr;
    };
    if (auto hit = cached(frame)) return *hit;

    struct Pending {
        NodePtr frame;
        Block block;
        std::size_t next_child;
    };

    auto begin = [&](const NodePtr& f) -> Pending {
        if (!f || f->role() != NodeRole::block_container) {
            throw BlockTreeError{ErrorKind::invalid_document, "expected a block container"};
        }
        const auto& content = f->first_child();
        if (!schema.contains(content->type())) {
            throw BlockTreeError{ErrorKind::unknown_block_type,
                                 "unknown block type '" + content->type() + "'"};
        }
        return Pending{
            .frame = f,
            .block = Block{
                .id = f->block_id(),
                .type = content->type(),
                .props = schema.resolve_props(content->type(), content->attrs(), {}, false),
                .content = content_node_to_inline_content(*content),
                .children = {},
            },
            .next_child = 0,
        };
    };

    auto stack = std::vector<Pending>{};
    stack.push_back(begin(frame));
    for (;;) {
        auto& top = stack.back();
        const auto* group = top.frame->child_count() == 2 ? top.frame->last_child().get() : nullptr;
        if (group && top.next_child < group->child_count()) {
            const auto& child = group->child(top.next_child++);
            if (auto hit = cached(child)) {
                top.block.children.push_back(*hit);
            } else {
                stack.push_back(begin(child));
            }
            continue;
        }

        auto done = std::move(top.block);
        auto frame_done = std::move(top.frame);
        stack.pop_back();
        if (!cache) {
            if (stack.empty()) return done;
            stack.back().block.children.push_back(std::move(done));
            continue;
        }
        auto stored = cache->set(frame_done, std::move(done));
        if (stack.empty()) return *stored;
        stack.back().block.children.push_back(*stored);
    }
}

}  // namespace blocktree_cpp
