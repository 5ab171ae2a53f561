#include "terrain_menu.hpp"

#include <istream>
#include <stdexcept>
#include <ostream>
#include <string>

namespace app::core {

std::optional<std::string> choose_terrain(const std::vector<std::string>& terrains,
                                          std::istream& in,
                                          std::ostream& out) {
    if (terrains.empty()) {
        out << "No custom terrains found.\n";
        return std::nullopt;
    }

    out << "Available terrains:\n";
    for (std::size_t i = 0; i < terrains.size(); ++i) {
        out << "  " << (i + 1) << ") " << terrains[i] << "\n";
    }

    std::string line;
    for (;;) {
        out << "Select a terrain [1-" << terrains.size() << ", q to quit]: " << std::flush;
        if (!std::getline(in, line)) {
            return std::nullopt;
        }

        if (line == "q" || line == "Q") {
            return std::nullopt;
        }

        try {
            std::size_t idx = 0;
            const long choice = std::stol(line, &idx, 10);
            if (idx == line.size() && choice >= 1 && static_cast<std::size_t>(choice) <= terrains.size()) {
                return terrains[static_cast<std::size_t>(choice - 1)];
            }
        } catch (const std::exception&) {
            // Not a number; prompt again.
        }

        out << "Invalid choice '" << line << "'.\n";
    }
}

} // namespace app::core
