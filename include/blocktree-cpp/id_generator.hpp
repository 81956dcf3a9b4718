/// @file id_generator.hpp
/// @brief Block id generators.

#pragma once

#include <cstdint>
#include <functional>
#include <string>

namespace blocktree_cpp {

/// Produces a new, globally unique block id on every call. Called once per
/// inserted block that has no id of its own. Generators must be safe to
/// call from several threads.
using IdGenerator = std::function<std::string()>;

/// Random version-4 UUIDs ("xxxxxxxx-xxxx-4xxx-yxxx-xxxxxxxxxxxx").
auto random_id_generator() -> IdGenerator;

/// Decimal ids counting up from `start`, each prefixed with `prefix`.
/// Deterministic; meant for tests and reproducible documents.
auto sequential_id_generator(std::string prefix = {}, std::uint64_t start = 0) -> IdGenerator;

}  // namespace blocktree_cpp
