#include <blocktree-cpp/id_generator.hpp>

#include <array>
#include <atomic>
#include <memory>
#include <mutex>
#include <random>
#include <string_view>

namespace blocktree_cpp {

namespace {

struct RandomSource {
    std::mutex mutex;
    std::mt19937_64 engine{std::random_device{}()};
};

}  // anonymous namespace

auto random_id_generator() -> IdGenerator {
    auto source = std::make_shared<RandomSource>();
    return [source]() {
        auto bytes = std::array<std::uint8_t, 16>{};
        {
            auto lock = std::lock_guard{source->mutex};
            for (std::size_t i = 0; i < bytes.size(); i += 8) {
                auto word = source->engine();
                for (std::size_t j = 0; j < 8; ++j) {
                    bytes[i + j] = static_cast<std::uint8_t>(word >> (j * 8));
                }
            }
        }
        bytes[6] = static_cast<std::uint8_t>((bytes[6] & 0x0F) | 0x40);  // version 4
        bytes[8] = static_cast<std::uint8_t>((bytes[8] & 0x3F) | 0x80);  // RFC 4122 variant

        static constexpr auto hex = std::string_view{"0123456789abcdef"};
        auto id = std::string{};
        id.reserve(36);
        for (std::size_t i = 0; i < bytes.size(); ++i) {
            if (i == 4 || i == 6 || i == 8 || i == 10) id += '-';
            id += hex[bytes[i] >> 4];
            id += hex[bytes[i] & 0x0F];
        }
        return id;
    };
}

auto sequential_id_generator(std::string prefix, std::uint64_t start) -> IdGenerator {
    auto counter = std::make_shared<std::atomic<std::uint64_t>>(start);
    return [prefix = std::move(prefix), counter]() {
        return prefix + std::to_string(counter->fetch_add(1, std::memory_order_relaxed));
    };
}

}  // namespace blocktree_cpp
