#include <blocktree-cpp/value.hpp>

#include <charconv>
#include <string>

namespace blocktree_cpp {

auto to_string(const PropValue& v) -> std::string {
    return std::visit(overload{
        [](const std::string& s) { return s; },
        [](std::int64_t i) { return std::to_string(i); },
        [](double d) {
            char buf[32];
            auto [end, ec] = std::to_chars(buf, buf + sizeof(buf), d);
            if (ec != std::errc{}) return std::to_string(d);
            return std::string{buf, end};
        },
        [](bool b) { return std::string{b ? "true" : "false"}; },
    }, v);
}

}  // namespace blocktree_cpp
