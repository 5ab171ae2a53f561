#pragma once

#include "core/log.hpp"

#include <string>

namespace app::core {

struct PathsConfig {
    // Empty values mean "detect".
    std::string steam_dir{};
    std::string game_dir{};

    // Custom terrain archive name inside dota/maps (e.g. "dota_desert.vpk").
    std::string terrain{};

    // Output archive; defaults to <game>/dota_tempcontent/maps/dota.vpk.
    std::string output{};
};

struct ArchiveConfig {
    bool verify_crc{false};
};

struct AppConfig {
    PathsConfig paths{};
    shared::core::LoggingConfig logging{};
    ArchiveConfig archive{};
};

class Config {
public:
    static Config& instance();

    Config();

    // Reads an INI file. Returns false if it cannot be opened; defaults stay in place.
    bool load_from_file(const std::string& path);

    // Same as load_from_file, for text already in memory.
    void load_from_string(const std::string& text);

    const std::string& loaded_from_path() const { return loaded_from_path_; }

    AppConfig& mutable_get() { return config_; }

    const PathsConfig& paths() const { return config_.paths; }
    const shared::core::LoggingConfig& logging() const { return config_.logging; }
    const ArchiveConfig& archive() const { return config_.archive; }

    static shared::core::LogLevel log_level_from_string(const std::string& v, shared::core::LogLevel default_value);

private:
    AppConfig config_{};

    std::string loaded_from_path_{};

    static std::string trim(std::string s);
    static std::string to_lower(std::string s);
    static std::string strip_quotes(std::string s);

    static bool parse_bool(const std::string& v, bool default_value);

    void apply_kv(const std::string& section, const std::string& key, const std::string& value);
};

} // namespace app::core
