#include <blocktree-cpp/mark.hpp>

#include <algorithm>
#include <array>
#include <iterator>
#include <ranges>

namespace blocktree_cpp {

namespace {

constexpr auto known_marks = std::array<std::string_view, 8>{
    "link", "bold", "italic", "underline", "strike", "code", "textColor", "backgroundColor",
};

}  // anonymous namespace

auto mark_rank(std::string_view type) noexcept -> int {
    auto it = std::ranges::find(known_marks, type);
    if (it == known_marks.end()) return static_cast<int>(known_marks.size());
    return static_cast<int>(it - known_marks.begin());
}

auto normalize_marks(MarkSet marks) -> MarkSet {
    // Keep the last mark of every type, then order by rank (name breaks ties
    // between unknown mark types).
    auto result = MarkSet{};
    result.reserve(marks.size());
    for (auto& m : marks | std::views::reverse) {
        if (!find_mark(result, m.type)) result.push_back(std::move(m));
    }
    std::ranges::sort(result, [](const Mark& a, const Mark& b) {
        auto ra = mark_rank(a.type);
        auto rb = mark_rank(b.type);
        if (ra != rb) return ra < rb;
        return a.type < b.type;
    });
    return result;
}

auto add_to_set(const MarkSet& marks, const Mark& mark) -> MarkSet {
    auto result = remove_from_set(marks, mark.type);
    result.push_back(mark);
    return normalize_marks(std::move(result));
}

auto remove_from_set(const MarkSet& marks, std::string_view type) -> MarkSet {
    auto result = MarkSet{};
    result.reserve(marks.size());
    std::ranges::copy_if(marks, std::back_inserter(result),
        [&](const Mark& m) { return m.type != type; });
    return result;
}

auto find_mark(const MarkSet& marks, std::string_view type) -> const Mark* {
    auto it = std::ranges::find(marks, type, &Mark::type);
    return it != marks.end() ? &*it : nullptr;
}

}  // namespace blocktree_cpp
