#pragma once

#include <iosfwd>
#include <optional>
#include <string>
#include <vector>

namespace app::core {

// Prints a numbered list of terrains and reads a choice (1-based) from `in`.
// Re-prompts on invalid input; returns std::nullopt on end of input, "q"
// or an empty list.
std::optional<std::string> choose_terrain(const std::vector<std::string>& terrains,
                                          std::istream& in,
                                          std::ostream& out);

} // namespace app::core
