#include <blocktree-cpp/format.hpp>

#include "utf8.hpp"

#include <algorithm>
#include <array>
#include <charconv>
#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace blocktree_cpp {

namespace {

enum class ListKind : std::uint8_t { none, bullet, numbered };

auto list_kind(const Block& block) -> ListKind {
    if (block.type == "bulletListItem") return ListKind::bullet;
    if (block.type == "numberedListItem") return ListKind::numbered;
    return ListKind::none;
}

auto string_prop(const Block& block, std::string_view name) -> std::string {
    return get_prop<std::string>(block.props, name).value_or(std::string{});
}

// -- HTML -----------------------------------------------------------------------

auto escape_html(std::string_view text) -> std::string {
    auto out = std::string{};
    out.reserve(text.size());
    for (auto c : text) {
        switch (c) {
            case '&':  out += "&amp;"; break;
            case '<':  out += "&lt;"; break;
            case '>':  out += "&gt;"; break;
            case '"':  out += "&quot;"; break;
            case '\'': out += "&#39;"; break;
            default:   out += c; break;
        }
    }
    return out;
}

auto html_run(const StyledText& run) -> std::string {
    auto html = std::string{};
    auto rest = std::string_view{run.text};
    while (true) {
        auto nl = rest.find('\n');
        html += escape_html(rest.substr(0, nl));
        if (nl == std::string_view::npos) break;
        html += "<br>";
        rest.remove_prefix(nl + 1);
    }

    const auto& s = run.styles;
    if (s.code) html = "<code>" + html + "</code>";
    if (s.strike) html = "<s>" + html + "</s>";
    if (s.underline) html = "<u>" + html + "</u>";
    if (s.italic) html = "<em>" + html + "</em>";
    if (s.bold) html = "<strong>" + html + "</strong>";
    if (s.text_color || s.background_color) {
        auto span = std::string{"<span"};
        if (s.text_color) span += " data-text-color=\"" + escape_html(*s.text_color) + "\"";
        if (s.background_color) span += " data-background-color=\"" + escape_html(*s.background_color) + "\"";
        html = span + ">" + html + "</span>";
    }
    return html;
}

auto html_inline(const std::vector<InlineContent>& content) -> std::string {
    auto html = std::string{};
    for (const auto& item : content) {
        std::visit(overload{
            [&](const StyledText& run) { html += html_run(run); },
            [&](const Link& link) {
                html += "<a href=\"" + escape_html(link.href) + "\">";
                for (const auto& run : link.content) html += html_run(run);
                html += "</a>";
            },
        }, item);
    }
    return html;
}

void html_blocks(const std::vector<Block>& blocks, std::string& out);

void html_block(const Block& block, std::string& out) {
    if (block.type == "heading") {
        auto level = std::clamp<std::int64_t>(get_prop<std::int64_t>(block.props, "level").value_or(1), 1, 3);
        auto tag = "h" + std::to_string(level);
        out += "<" + tag + ">" + html_inline(block.content) + "</" + tag + ">";
    } else if (block.type == "image") {
        out += "<img src=\"" + escape_html(string_prop(block, "url")) + "\" alt=\"" +
               escape_html(string_prop(block, "caption")) + "\"";
        if (auto width = get_prop<std::int64_t>(block.props, "width")) {
            out += " width=\"" + std::to_string(*width) + "\"";
        }
        out += ">";
    } else if (block.type == "paragraph") {
        out += "<p>" + html_inline(block.content) + "</p>";
    } else {
        out += "<div data-content-type=\"" + escape_html(block.type) + "\">" +
               html_inline(block.content) + "</div>";
    }
    html_blocks(block.children, out);
}

void html_blocks(const std::vector<Block>& blocks, std::string& out) {
    auto open = ListKind::none;
    auto close_list = [&] {
        if (open == ListKind::bullet) out += "</ul>";
        if (open == ListKind::numbered) out += "</ol>";
        open = ListKind::none;
    };

    for (const auto& block : blocks) {
        auto kind = list_kind(block);
        if (kind != open) {
            close_list();
            if (kind == ListKind::bullet) out += "<ul>";
            if (kind == ListKind::numbered) out += "<ol>";
            open = kind;
        }
        if (kind == ListKind::none) {
            html_block(block, out);
            continue;
        }
        out += "<li>" + html_inline(block.content);
        html_blocks(block.children, out);
        out += "</li>";
    }
    close_list();
}

// -- Markdown output ------------------------------------------------------------

auto escape_markdown(std::string_view text) -> std::string {
    auto out = std::string{};
    out.reserve(text.size());
    for (auto c : text) {
        if (c == '\\' || c == '*' || c == '_' || c == '`' || c == '[' || c == ']' || c == '~') {
            out += '\\';
        }
        out += c;
    }
    return out;
}

/// One styled run. Hard breaks become `line_break`.
auto markdown_run(const StyledText& run, std::string_view line_break) -> std::string {
    const auto& s = run.styles;
    auto md = std::string{};
    auto rest = std::string_view{run.text};
    while (true) {
        auto nl = rest.find('\n');
        auto piece = rest.substr(0, nl);
        md += s.code ? std::string{piece} : escape_markdown(piece);
        if (nl == std::string_view::npos) break;
        md += line_break;
        rest.remove_prefix(nl + 1);
    }
    if (md.empty()) return md;

    if (s.code) md = "`" + md + "`";
    if (s.strike) md = "~~" + md + "~~";
    if (s.italic) md = "*" + md + "*";
    if (s.bold) md = "**" + md + "**";
    return md;
}

auto markdown_inline(const std::vector<InlineContent>& content, std::string_view line_break) -> std::string {
    auto md = std::string{};
    for (const auto& item : content) {
        std::visit(overload{
            [&](const StyledText& run) { md += markdown_run(run, line_break); },
            [&](const Link& link) {
                md += "[";
                for (const auto& run : link.content) md += markdown_run(run, line_break);
                md += "](" + link.href + ")";
            },
        }, item);
    }
    return md;
}

void markdown_blocks(const std::vector<Block>& blocks, const std::string& indent, std::string& out);

void markdown_block(const Block& block, const std::string& indent, std::string& out) {
    auto kind = list_kind(block);
    if (kind != ListKind::none) {
        auto marker = kind == ListKind::bullet ? std::string{"* "} : std::string{"1. "};
        out += indent + marker + markdown_inline(block.content, "\n" + indent + "    ") + "\n";
        // a blank line keeps a nested paragraph from reading as continuation text
        if (!block.children.empty() && list_kind(block.children.front()) == ListKind::none) out += "\n";
        markdown_blocks(block.children, indent + "    ", out);
        return;
    }

    if (block.type == "heading") {
        auto level = std::clamp<std::int64_t>(get_prop<std::int64_t>(block.props, "level").value_or(1), 1, 3);
        out += indent + std::string(static_cast<std::size_t>(level), '#') + " " +
               markdown_inline(block.content, " ") + "\n";
    } else if (block.type == "image") {
        out += indent + "![" + escape_markdown(string_prop(block, "caption")) + "](" +
               string_prop(block, "url") + ")\n";
    } else {
        out += indent + markdown_inline(block.content, "\n" + indent) + "\n";
    }
    if (!block.children.empty()) out += "\n";
    markdown_blocks(block.children, indent, out);
}

void markdown_blocks(const std::vector<Block>& blocks, const std::string& indent, std::string& out) {
    auto previous = std::optional<ListKind>{};
    for (const auto& block : blocks) {
        auto kind = list_kind(block);
        // list items of one list stay on consecutive lines
        if (previous && !(kind != ListKind::none && kind == *previous)) out += "\n";
        markdown_block(block, indent, out);
        previous = kind;
    }
}

// -- Markdown input -------------------------------------------------------------

/// Inline Markdown: backslash escapes, code spans, strong, emphasis, strike
/// and links. A style marker without a closing counterpart reads literally.
class InlineParser {
public:
    explicit InlineParser(std::string_view text) : text_{text} {}

    auto parse() -> std::vector<InlineContent> {
        auto runs = std::vector<StyledText>{};
        parse_runs(runs, false);
        flush(runs);
        return std::move(content_);
    }

private:
    /// Parse up to the end of the text, or up to a "]" when `in_link`.
    void parse_runs(std::vector<StyledText>& runs, bool in_link) {
        while (pos_ < text_.size()) {
            auto c = text_[pos_];
            if (c == '\\' && pos_ + 1 < text_.size()) {
                append(runs, text_.substr(pos_ + 1, 1));
                pos_ += 2;
            } else if (c == '`') {
                code_span(runs);
            } else if (starts_with("**")) {
                toggle(runs, styles_.bold, "**");
            } else if (starts_with("~~")) {
                toggle(runs, styles_.strike, "~~");
            } else if (c == '*' || c == '_') {
                toggle(runs, styles_.italic, text_.substr(pos_, 1));
            } else if (c == ']' && in_link) {
                return;
            } else if (c == '[' && !in_link && link(runs)) {
                continue;
            } else {
                append(runs, text_.substr(pos_, 1));
                ++pos_;
            }
        }
    }

    auto starts_with(std::string_view marker) const -> bool {
        return text_.substr(pos_).starts_with(marker);
    }

    void code_span(std::vector<StyledText>& runs) {
        auto close = text_.find('`', pos_ + 1);
        if (close == std::string_view::npos) {
            append(runs, "`");
            ++pos_;
            return;
        }
        auto saved = styles_;
        styles_ = Styles{.code = true};
        append(runs, text_.substr(pos_ + 1, close - pos_ - 1));
        styles_ = saved;
        pos_ = close + 1;
    }

    void toggle(std::vector<StyledText>& runs, bool& flag, std::string_view marker) {
        if (flag || text_.find(marker, pos_ + marker.size()) != std::string_view::npos) {
            flag = !flag;
        } else {
            append(runs, marker);
        }
        pos_ += marker.size();
    }

    /// Parse "[text](href)" at pos_. Returns false, consuming nothing, when
    /// the brackets do not form a link.
    auto link(std::vector<StyledText>& runs) -> bool {
        auto close = text_.find("](", pos_);
        if (close == std::string_view::npos) return false;
        auto end = text_.find(')', close + 2);
        if (end == std::string_view::npos) return false;

        auto saved_pos = pos_;
        auto saved_styles = styles_;
        auto result = Link{.href = std::string{text_.substr(close + 2, end - close - 2)}, .content = {}};
        ++pos_;
        parse_runs(result.content, true);
        styles_ = saved_styles;
        if (pos_ != close) {
            pos_ = saved_pos;
            return false;
        }
        pos_ = end + 1;
        flush(runs);
        content_.emplace_back(std::move(result));
        return true;
    }

    void append(std::vector<StyledText>& runs, std::string_view text) {
        if (text.empty()) return;
        if (!runs.empty() && runs.back().styles == styles_) {
            runs.back().text += text;
        } else {
            runs.push_back(StyledText{.text = std::string{text}, .styles = styles_});
        }
    }

    void flush(std::vector<StyledText>& runs) {
        for (auto& run : runs) content_.emplace_back(std::move(run));
        runs.clear();
    }

    std::string_view text_;
    std::size_t pos_ = 0;
    Styles styles_;
    std::vector<InlineContent> content_;
};

auto parse_inline(std::string_view text) -> std::vector<InlineContent> {
    return InlineParser{text}.parse();
}

struct Line {
    std::size_t indent;
    std::string_view text;
};

auto split_line(std::string_view raw) -> Line {
    if (!raw.empty() && raw.back() == '\r') raw.remove_suffix(1);
    auto indent = std::size_t{0};
    auto i = std::size_t{0};
    for (; i < raw.size(); ++i) {
        if (raw[i] == ' ') ++indent;
        else if (raw[i] == '\t') indent += 4;
        else break;
    }
    return Line{.indent = indent, .text = raw.substr(i)};
}

auto is_blank(const Line& line) -> bool {
    return line.text.find_first_not_of(" \t") == std::string_view::npos;
}

auto is_thematic_break(std::string_view text) -> bool {
    auto stripped = std::string{};
    for (auto c : text) {
        if (c != ' ') stripped += c;
    }
    return stripped.size() >= 3 &&
           (stripped.find_first_not_of('-') == std::string::npos ||
            stripped.find_first_not_of('*') == std::string::npos ||
            stripped.find_first_not_of('_') == std::string::npos);
}

/// Level of an ATX heading line, or 0.
auto heading_level(std::string_view text) -> std::size_t {
    auto n = text.find_first_not_of('#');
    if (n == 0 || n > 6) return 0;
    if (n == std::string_view::npos) return text.size() <= 6 ? text.size() : 0;
    return text[n] == ' ' ? n : 0;
}

struct ListMarker {
    ListKind kind;
    std::string_view rest;
};

auto list_marker(std::string_view text) -> std::optional<ListMarker> {
    if (text.size() >= 2 && (text[0] == '-' || text[0] == '*' || text[0] == '+') && text[1] == ' ') {
        return ListMarker{.kind = ListKind::bullet, .rest = text.substr(2)};
    }
    auto digits = text.find_first_not_of("0123456789");
    if (digits != 0 && digits != std::string_view::npos && digits <= 9 && digits + 1 < text.size() &&
        (text[digits] == '.' || text[digits] == ')') && text[digits + 1] == ' ') {
        return ListMarker{.kind = ListKind::numbered, .rest = text.substr(digits + 2)};
    }
    return std::nullopt;
}

struct ImageLine {
    std::string caption;
    std::string url;
};

auto image_line(std::string_view text) -> std::optional<ImageLine> {
    while (!text.empty() && text.back() == ' ') text.remove_suffix(1);
    if (!text.starts_with("![") || !text.ends_with(")")) return std::nullopt;
    auto mid = text.find("](");
    if (mid == std::string_view::npos) return std::nullopt;

    auto caption = std::string{};
    for (auto c : text.substr(2, mid - 2)) {
        if (c != '\\') caption += c;
    }
    return ImageLine{.caption = std::move(caption),
                     .url = std::string{text.substr(mid + 2, text.size() - mid - 3)}};
}

/// Build blocks line by line. List items nest under the closest preceding
/// item with a smaller indentation.
class MarkdownReader {
public:
    explicit MarkdownReader(const BlockSchema& schema) : schema_{schema} {}

    void read_line(const Line& line) {
        if (is_blank(line)) {
            end_paragraph();
            blank_ = true;
            return;
        }
        auto after_blank = std::exchange(blank_, false);
        auto text = line.text;

        if (auto marker = list_marker(text); marker && !is_thematic_break(text)) {
            end_paragraph();
            auto type = marker->kind == ListKind::bullet ? "bulletListItem" : "numberedListItem";
            push_item(line.indent, make_block(type, parse_inline(marker->rest)));
            return;
        }

        // continuation text of the current list item
        if (!stack_.empty() && !after_blank && line.indent > stack_.back().indent && paragraph_.empty()) {
            auto& content = *stack_.back().block->content;
            content.push_back(StyledText{.text = "\n", .styles = {}});
            for (auto& item : parse_inline(text)) content.push_back(std::move(item));
            return;
        }

        if (is_thematic_break(text)) {
            end_paragraph();
            stack_.clear();
            return;
        }

        if (auto level = heading_level(text)) {
            end_paragraph();
            auto title = text.substr(std::min(text.size(), level + 1));
            auto block = make_block("heading", parse_inline(title));
            if (block.type == "heading") {
                block.props.insert_or_assign("level", std::min<std::int64_t>(static_cast<std::int64_t>(level), 3));
            }
            add_block(line.indent, std::move(block));
            return;
        }

        if (auto image = image_line(text)) {
            end_paragraph();
            auto block = PartialBlock{};
            if (schema_.contains("image")) {
                block.type = "image";
                block.props = PropMap{{"url", PropValue{image->url}}, {"caption", PropValue{image->caption}}};
            } else {
                block = make_block("paragraph", plain_content(image->caption));
            }
            add_block(line.indent, std::move(block));
            return;
        }

        paragraph_.push_back(text);
        if (paragraph_.size() == 1) paragraph_indent_ = line.indent;
    }

    auto finish() -> std::vector<PartialBlock> {
        end_paragraph();
        stack_.clear();
        return std::move(blocks_);
    }

private:
    struct Open {
        std::size_t indent;
        PartialBlock* block;
    };

    auto make_block(std::string_view type, std::vector<InlineContent> content) const -> PartialBlock {
        auto resolved = schema_.contains(type) ? std::string{type} : std::string{"paragraph"};
        return PartialBlock{.id = {}, .type = std::move(resolved), .props = {},
                            .content = std::move(content), .children = {}};
    }

    auto allows_children(const PartialBlock& block) const -> bool {
        const auto* spec = block.type ? schema_.find(*block.type) : nullptr;
        return spec != nullptr && spec->allows_children;
    }

    void push_item(std::size_t indent, PartialBlock block) {
        while (!stack_.empty() && (stack_.back().indent >= indent || !allows_children(*stack_.back().block))) {
            stack_.pop_back();
        }
        auto* target = &blocks_;
        if (!stack_.empty()) {
            auto& parent = *stack_.back().block;
            if (!parent.children) parent.children.emplace();
            target = &*parent.children;
        }
        target->push_back(std::move(block));
        stack_.push_back(Open{.indent = indent, .block = &target->back()});
    }

    /// A non-list block nests inside an open list item it is indented under.
    void add_block(std::size_t indent, PartialBlock block) {
        while (!stack_.empty() && (stack_.back().indent >= indent || !allows_children(*stack_.back().block))) {
            stack_.pop_back();
        }
        if (stack_.empty()) {
            blocks_.push_back(std::move(block));
            return;
        }
        auto& parent = *stack_.back().block;
        if (!parent.children) parent.children.emplace();
        parent.children->push_back(std::move(block));
    }

    void end_paragraph() {
        if (paragraph_.empty()) return;
        auto content = std::vector<InlineContent>{};
        for (std::size_t i = 0; i < paragraph_.size(); ++i) {
            if (i > 0) content.push_back(StyledText{.text = "\n", .styles = {}});
            for (auto& item : parse_inline(paragraph_[i])) content.push_back(std::move(item));
        }
        paragraph_.clear();
        add_block(paragraph_indent_, make_block("paragraph", std::move(content)));
    }

    const BlockSchema& schema_;
    std::vector<PartialBlock> blocks_;
    std::vector<Open> stack_;
    std::vector<std::string_view> paragraph_;
    std::size_t paragraph_indent_ = 0;
    bool blank_ = false;
};

// -- HTML input -----------------------------------------------------------------

struct HtmlToken {
    enum class Kind : std::uint8_t { start_tag, end_tag, text };

    Kind kind = Kind::text;
    std::string name;  // lowercased
    std::map<std::string, std::string, std::less<>> attributes;
    bool self_closing = false;
    std::string text;  // entities decoded

    auto attribute(std::string_view key) const -> std::optional<std::string> {
        auto it = attributes.find(key);
        if (it == attributes.end()) return std::nullopt;
        return it->second;
    }
};

auto ascii_lower(char c) -> char {
    return (c >= 'A' && c <= 'Z') ? static_cast<char>(c - 'A' + 'a') : c;
}

auto is_html_space(char c) -> bool {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f';
}

auto is_name_char(char c) -> bool {
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') || c == '-' || c == ':';
}

auto named_entity(std::string_view name) -> std::optional<char32_t> {
    if (name == "amp") return U'&';
    if (name == "lt") return U'<';
    if (name == "gt") return U'>';
    if (name == "quot") return U'"';
    if (name == "apos") return U'\'';
    if (name == "nbsp") return U'\u00A0';
    return std::nullopt;
}

/// Decode character references. Unknown or malformed references are kept
/// as written.
auto decode_entities(std::string_view text) -> std::string {
    auto out = std::string{};
    out.reserve(text.size());
    std::size_t i = 0;
    while (i < text.size()) {
        auto amp = text.find('&', i);
        out.append(text.substr(i, amp - i));
        if (amp == std::string_view::npos) break;
        auto semi = text.find(';', amp + 1);
        if (semi == std::string_view::npos || semi - amp > 12) {
            out += '&';
            i = amp + 1;
            continue;
        }
        auto ref = text.substr(amp + 1, semi - amp - 1);
        auto cp = std::optional<char32_t>{};
        if (ref.size() > 1 && ref[0] == '#') {
            auto hex = ref[1] == 'x' || ref[1] == 'X';
            auto digits = ref.substr(hex ? 2 : 1);
            auto value = std::uint32_t{0};
            auto [end, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), value, hex ? 16 : 10);
            if (!digits.empty() && ec == std::errc{} && end == digits.data() + digits.size()) {
                cp = static_cast<char32_t>(value);
            }
        } else {
            cp = named_entity(ref);
        }
        if (!cp) {
            out += '&';
            i = amp + 1;
            continue;
        }
        detail::utf8::append(out, *cp);
        i = semi + 1;
    }
    return out;
}

/// Splits HTML into start tag, end tag and text tokens. Comments, doctypes
/// and processing instructions are dropped, as is the body of script, style,
/// title and template elements.
class HtmlLexer {
public:
    explicit HtmlLexer(std::string_view html) : html_{html} {}

    auto next() -> std::optional<HtmlToken> {
        while (pos_ < html_.size()) {
            if (!raw_end_.empty()) {
                skip_raw_text();
                continue;
            }
            if (html_[pos_] != '<') return text_token();

            auto rest = html_.substr(pos_);
            if (rest.starts_with("<!--")) {
                auto end = html_.find("-->", pos_ + 4);
                pos_ = end == std::string_view::npos ? html_.size() : end + 3;
                continue;
            }
            if (rest.starts_with("<!") || rest.starts_with("<?")) {
                skip_past('>');
                continue;
            }
            if (rest.starts_with("</") && rest.size() > 2 && is_name_char(rest[2])) {
                pos_ += 2;
                auto token = HtmlToken{.kind = HtmlToken::Kind::end_tag, .name = read_name()};
                skip_past('>');
                return token;
            }
            if (rest.size() > 1 && is_name_char(rest[1])) {
                ++pos_;
                return start_tag();
            }
            ++pos_;
            return HtmlToken{.kind = HtmlToken::Kind::text, .text = "<"};
        }
        return std::nullopt;
    }

private:
    auto text_token() -> HtmlToken {
        auto end = html_.find('<', pos_);
        if (end == std::string_view::npos) end = html_.size();
        auto token = HtmlToken{.kind = HtmlToken::Kind::text, .text = decode_entities(html_.substr(pos_, end - pos_))};
        pos_ = end;
        return token;
    }

    auto start_tag() -> HtmlToken {
        auto token = HtmlToken{.kind = HtmlToken::Kind::start_tag, .name = read_name()};
        while (pos_ < html_.size()) {
            skip_spaces();
            if (pos_ >= html_.size()) break;
            if (html_[pos_] == '>') {
                ++pos_;
                break;
            }
            if (html_[pos_] == '/') {
                ++pos_;
                if (pos_ < html_.size() && html_[pos_] == '>') {
                    token.self_closing = true;
                    ++pos_;
                    break;
                }
                continue;
            }
            auto key = read_attribute_name();
            skip_spaces();
            auto value = std::string{};
            if (pos_ < html_.size() && html_[pos_] == '=') {
                ++pos_;
                skip_spaces();
                value = read_attribute_value();
            }
            if (!key.empty()) token.attributes.emplace(std::move(key), std::move(value));
        }
        if (token.name == "script" || token.name == "style" || token.name == "title" || token.name == "template") {
            if (!token.self_closing) raw_end_ = "</" + token.name;
        }
        return token;
    }

    auto read_name() -> std::string {
        auto name = std::string{};
        while (pos_ < html_.size() && is_name_char(html_[pos_])) name += ascii_lower(html_[pos_++]);
        return name;
    }

    auto read_attribute_name() -> std::string {
        auto name = std::string{};
        while (pos_ < html_.size()) {
            auto c = html_[pos_];
            if (is_html_space(c) || c == '=' || c == '>' || c == '/') break;
            name += ascii_lower(c);
            ++pos_;
        }
        if (name.empty()) ++pos_;  // stray character such as a quote
        return name;
    }

    auto read_attribute_value() -> std::string {
        if (pos_ >= html_.size()) return {};
        auto quote = html_[pos_];
        if (quote == '"' || quote == '\'') {
            auto end = html_.find(quote, pos_ + 1);
            if (end == std::string_view::npos) end = html_.size();
            auto value = decode_entities(html_.substr(pos_ + 1, end - pos_ - 1));
            pos_ = std::min(end + 1, html_.size());
            return value;
        }
        auto start = pos_;
        while (pos_ < html_.size() && !is_html_space(html_[pos_]) && html_[pos_] != '>') ++pos_;
        return decode_entities(html_.substr(start, pos_ - start));
    }

    void skip_spaces() {
        while (pos_ < html_.size() && is_html_space(html_[pos_])) ++pos_;
    }

    void skip_past(char c) {
        auto end = html_.find(c, pos_);
        pos_ = end == std::string_view::npos ? html_.size() : end + 1;
    }

    // Leaves pos_ on the matching end tag, or at the end of input.
    void skip_raw_text() {
        auto n = raw_end_.size();
        while (pos_ < html_.size()) {
            auto lt = html_.find('<', pos_);
            if (lt == std::string_view::npos || lt + n > html_.size()) {
                pos_ = html_.size();
                break;
            }
            pos_ = lt;
            auto candidate = html_.substr(lt, n);
            if (std::equal(candidate.begin(), candidate.end(), raw_end_.begin(),
                           [](char a, char b) { return ascii_lower(a) == b; })) {
                break;
            }
            ++pos_;
        }
        raw_end_.clear();
    }

    std::string_view html_;
    std::size_t pos_ = 0;
    std::string raw_end_;
};

/// Build blocks from HTML tokens. Block-level tags open blocks, inline tags
/// push styles, and unrecognized tags are transparent: their text lands in
/// the current block or in a new paragraph.
class HtmlReader {
public:
    explicit HtmlReader(const BlockSchema& schema) : schema_{schema} {}

    void read(const HtmlToken& token) {
        switch (token.kind) {
            case HtmlToken::Kind::start_tag: start_tag(token); break;
            case HtmlToken::Kind::end_tag:   end_tag(token.name); break;
            case HtmlToken::Kind::text:      text(token.text); break;
        }
    }

    auto finish() -> std::vector<PartialBlock> {
        end_block();
        auto blocks = std::vector<PartialBlock>{};
        blocks.reserve(blocks_.size());
        for (auto& draft : blocks_) blocks.push_back(to_partial(*draft));
        return blocks;
    }

private:
    // Drafts are heap-allocated so open list items stay put while siblings
    // and children are appended.
    struct Draft {
        PartialBlock block;
        std::vector<std::unique_ptr<Draft>> children;
    };

    struct ListLevel {
        ListKind kind;
        Draft* item;
    };

    struct OpenStyle {
        std::string tag;
        Styles styles;
    };

    static auto heading_tag_level(std::string_view name) -> std::int64_t {
        if (name.size() == 2 && name[0] == 'h' && name[1] >= '1' && name[1] <= '6') return name[1] - '0';
        return 0;
    }

    static auto is_boundary(std::string_view name) -> bool {
        static constexpr auto tags = std::array<std::string_view, 22>{
            "address", "article", "aside", "blockquote", "dd", "dl", "dt", "fieldset", "figcaption", "figure",
            "footer", "form", "header", "hr", "main", "nav", "section", "table", "tbody", "td", "th", "tr"};
        return std::find(tags.begin(), tags.end(), name) != tags.end();
    }

    static auto inline_style(const HtmlToken& token) -> std::optional<Styles> {
        const auto& n = token.name;
        auto styles = Styles{};
        if (n == "strong" || n == "b") {
            styles.bold = true;
        } else if (n == "em" || n == "i") {
            styles.italic = true;
        } else if (n == "u") {
            styles.underline = true;
        } else if (n == "s" || n == "strike" || n == "del") {
            styles.strike = true;
        } else if (n == "code" || n == "kbd" || n == "samp") {
            styles.code = true;
        } else if (n == "span") {
            styles.text_color = token.attribute("data-text-color");
            styles.background_color = token.attribute("data-background-color");
        } else {
            return std::nullopt;
        }
        return styles;
    }

    static auto to_partial(Draft& draft) -> PartialBlock {
        auto block = std::move(draft.block);
        if (!draft.children.empty()) {
            block.children.emplace();
            for (auto& child : draft.children) block.children->push_back(to_partial(*child));
        }
        return block;
    }

    auto make_block(std::string_view type) const -> PartialBlock {
        auto resolved = schema_.contains(type) ? std::string{type} : std::string{"paragraph"};
        const auto* spec = schema_.find(resolved);
        auto block = PartialBlock{.id = {}, .type = std::move(resolved), .props = {}, .content = {}, .children = {}};
        if (spec == nullptr || spec->content == ContentKind::inline_content) block.content.emplace();
        return block;
    }

    auto allows_children(const Draft& draft) const -> bool {
        const auto* spec = draft.block.type ? schema_.find(*draft.block.type) : nullptr;
        return spec != nullptr && spec->allows_children;
    }

    // New blocks nest in the innermost open list item that takes children.
    auto container() -> std::vector<std::unique_ptr<Draft>>& {
        for (auto it = lists_.rbegin(); it != lists_.rend(); ++it) {
            if (it->item != nullptr && allows_children(*it->item)) return it->item->children;
        }
        return blocks_;
    }

    auto add(PartialBlock block) -> Draft* {
        auto& target = container();
        target.push_back(std::make_unique<Draft>(Draft{.block = std::move(block), .children = {}}));
        return target.back().get();
    }

    // The block takes inline text only when its type has inline content.
    void open(PartialBlock block) {
        end_block();
        auto inline_text = block.content.has_value();
        auto* draft = add(std::move(block));
        if (inline_text) current_ = draft;
    }

    auto open_item() const -> Draft* {
        return lists_.empty() ? nullptr : lists_.back().item;
    }

    void start_tag(const HtmlToken& token) {
        const auto& name = token.name;
        if (name == "p") {
            // <li><p>text</p></li> keeps the text on the item itself
            if (current_ != nullptr && current_ == open_item() && current_->block.content->empty()) return;
            open(make_block("paragraph"));
        } else if (auto level = heading_tag_level(name)) {
            auto block = make_block("heading");
            if (block.type == "heading") block.props.insert_or_assign("level", std::min<std::int64_t>(level, 3));
            open(std::move(block));
        } else if (name == "ul" || name == "ol") {
            end_block();
            lists_.push_back(ListLevel{.kind = name == "ul" ? ListKind::bullet : ListKind::numbered, .item = nullptr});
        } else if (name == "li") {
            end_block();
            if (lists_.empty()) lists_.push_back(ListLevel{.kind = ListKind::bullet, .item = nullptr});
            lists_.back().item = nullptr;
            auto type = lists_.back().kind == ListKind::numbered ? "numberedListItem" : "bulletListItem";
            auto block = make_block(type);
            auto inline_text = block.content.has_value();
            auto* item = add(std::move(block));
            lists_.back().item = item;
            if (inline_text) current_ = item;
        } else if (name == "img") {
            image(token);
        } else if (name == "br") {
            if (current_ != nullptr) append("\n");
        } else if (name == "a") {
            link_href_ = token.attribute("href").value_or(std::string{});
            link_started_ = false;
        } else if (name == "div") {
            auto type = token.attribute("data-content-type");
            if (type && !type->empty()) {
                open(make_block(*type));
            } else {
                end_block();
            }
        } else if (name == "pre") {
            end_block();
            ++preformatted_;
        } else if (is_boundary(name)) {
            end_block();
        } else if (auto styles = inline_style(token); styles && !token.self_closing) {
            styles_.push_back(OpenStyle{.tag = name, .styles = std::move(*styles)});
        }
    }

    void end_tag(std::string_view name) {
        if (name == "li") {
            end_block();
            if (!lists_.empty()) lists_.back().item = nullptr;
        } else if (name == "ul" || name == "ol") {
            end_block();
            if (!lists_.empty()) lists_.pop_back();
        } else if (name == "a") {
            link_href_.reset();
            link_started_ = false;
        } else if (name == "pre") {
            end_block();
            if (preformatted_ > 0) --preformatted_;
        } else if (name == "p" || name == "div" || heading_tag_level(name) != 0 || is_boundary(name)) {
            end_block();
        } else {
            auto it = std::find_if(styles_.rbegin(), styles_.rend(), [&](const auto& s) { return s.tag == name; });
            if (it != styles_.rend()) styles_.erase(std::next(it).base());
        }
    }

    void image(const HtmlToken& token) {
        auto alt = token.attribute("alt").value_or(std::string{});
        if (!schema_.contains("image")) {
            auto block = make_block("paragraph");
            block.content = plain_content(std::move(alt));
            open(std::move(block));
            end_block();
            return;
        }
        auto block = PartialBlock{.id = {}, .type = "image", .props = {}, .content = {}, .children = {}};
        block.props.insert_or_assign("url", PropValue{token.attribute("src").value_or(std::string{})});
        block.props.insert_or_assign("caption", PropValue{std::move(alt)});
        if (auto width = token.attribute("width")) {
            auto value = std::int64_t{0};
            auto [end, ec] = std::from_chars(width->data(), width->data() + width->size(), value);
            if (ec == std::errc{} && end == width->data() + width->size()) {
                block.props.insert_or_assign("width", PropValue{value});
            }
        }
        end_block();
        add(std::move(block));
    }

    void text(std::string_view raw) {
        auto text = std::string{};
        if (preformatted_ > 0) {
            text = raw;
        } else {
            // collapse whitespace runs to one space
            for (auto c : raw) {
                if (is_html_space(c)) {
                    if (text.empty() || text.back() != ' ') text += ' ';
                } else {
                    text += c;
                }
            }
            auto last = last_char();
            if (!last || *last == ' ' || *last == '\n') {
                auto first = text.find_first_not_of(' ');
                text.erase(0, first == std::string::npos ? text.size() : first);
            }
        }
        if (text.empty()) return;
        if (current_ == nullptr) {
            auto* draft = add(make_block("paragraph"));
            if (!draft->block.content) return;
            current_ = draft;
        }
        append(text);
    }

    auto current_styles() const -> Styles {
        auto styles = Styles{};
        for (const auto& entry : styles_) {
            const auto& s = entry.styles;
            styles.bold = styles.bold || s.bold;
            styles.italic = styles.italic || s.italic;
            styles.underline = styles.underline || s.underline;
            styles.strike = styles.strike || s.strike;
            styles.code = styles.code || s.code;
            if (s.text_color) styles.text_color = s.text_color;
            if (s.background_color) styles.background_color = s.background_color;
        }
        return styles;
    }

    static void append_run(std::vector<StyledText>& runs, std::string_view text, const Styles& styles) {
        if (!runs.empty() && runs.back().styles == styles) {
            runs.back().text += text;
        } else {
            runs.push_back(StyledText{.text = std::string{text}, .styles = styles});
        }
    }

    void append(std::string_view text) {
        auto& content = *current_->block.content;
        auto styles = current_styles();
        if (link_href_) {
            if (!link_started_) {
                content.push_back(Link{.href = *link_href_, .content = {}});
                link_started_ = true;
            }
            append_run(std::get<Link>(content.back()).content, text, styles);
            return;
        }
        if (!content.empty()) {
            if (auto* run = std::get_if<StyledText>(&content.back()); run && run->styles == styles) {
                run->text += text;
                return;
            }
        }
        content.push_back(StyledText{.text = std::string{text}, .styles = std::move(styles)});
    }

    auto last_run() -> StyledText* {
        if (current_ == nullptr || current_->block.content->empty()) return nullptr;
        auto& last = current_->block.content->back();
        if (auto* run = std::get_if<StyledText>(&last)) return run;
        auto& link = std::get<Link>(last);
        return link.content.empty() ? nullptr : &link.content.back();
    }

    auto last_char() -> std::optional<char> {
        auto* run = last_run();
        if (run == nullptr || run->text.empty()) return std::nullopt;
        return run->text.back();
    }

    // Drops the trailing collapsed space and closes the block for text.
    void end_block() {
        if (current_ != nullptr && preformatted_ == 0) {
            if (auto* run = last_run(); run && !run->text.empty() && run->text.back() == ' ') {
                run->text.pop_back();
                if (run->text.empty()) {
                    auto& content = *current_->block.content;
                    if (auto* link = std::get_if<Link>(&content.back())) {
                        link->content.pop_back();
                        if (link->content.empty()) content.pop_back();
                    } else {
                        content.pop_back();
                    }
                }
            }
        }
        current_ = nullptr;
        link_started_ = false;
    }

    const BlockSchema& schema_;
    std::vector<std::unique_ptr<Draft>> blocks_;
    std::vector<ListLevel> lists_;
    std::vector<OpenStyle> styles_;
    Draft* current_ = nullptr;
    std::optional<std::string> link_href_;
    bool link_started_ = false;
    int preformatted_ = 0;
};

}  // anonymous namespace

auto blocks_to_html(const std::vector<Block>& blocks) -> std::string {
    auto out = std::string{};
    html_blocks(blocks, out);
    return out;
}

auto html_to_blocks(std::string_view html, const BlockSchema& schema) -> std::vector<PartialBlock> {
    auto lexer = HtmlLexer{html};
    auto reader = HtmlReader{schema};
    while (auto token = lexer.next()) reader.read(*token);
    return reader.finish();
}

auto blocks_to_markdown(const std::vector<Block>& blocks) -> std::string {
    auto out = std::string{};
    markdown_blocks(blocks, "", out);
    return out;
}

auto markdown_to_blocks(std::string_view markdown, const BlockSchema& schema) -> std::vector<PartialBlock> {
    auto reader = MarkdownReader{schema};
    while (!markdown.empty()) {
        auto nl = markdown.find('\n');
        reader.read_line(split_line(markdown.substr(0, nl)));
        if (nl == std::string_view::npos) break;
        markdown.remove_prefix(nl + 1);
    }
    return reader.finish();
}

}  // namespace blocktree_cpp
