#include <blocktree-cpp/block.hpp>
#include <blocktree-cpp/error.hpp>

namespace blocktree_cpp {

BlockIdentifier::BlockIdentifier(const PartialBlock& block) {
    if (!block.id) {
        throw BlockTreeError{ErrorKind::block_not_found, "partial block without an id"};
    }
    id_ = *block.id;
}

auto plain_content(std::string text) -> std::vector<InlineContent> {
    auto content = std::vector<InlineContent>{};
    if (!text.empty()) content.emplace_back(StyledText{.text = std::move(text), .styles = {}});
    return content;
}

auto plain_text(const std::vector<InlineContent>& content) -> std::string {
    auto result = std::string{};
    for (const auto& item : content) {
        std::visit(overload{
            [&](const StyledText& t) { result += t.text; },
            [&](const Link& l) {
                for (const auto& t : l.content) result += t.text;
            },
        }, item);
    }
    return result;
}

}  // namespace blocktree_cpp
