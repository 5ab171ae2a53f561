#include "config.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <sstream>
#include <unordered_map>

namespace app::core {

using shared::core::LogLevel;

Config& Config::instance() {
    static Config inst;
    return inst;
}

Config::Config() {
    config_.logging.enabled = true;
    config_.logging.level = LogLevel::Info;
    config_.logging.file = "";

    config_.archive.verify_crc = false;
}

std::string Config::trim(std::string s) {
    auto is_space = [](unsigned char c) { return std::isspace(c) != 0; };

    while (!s.empty() && is_space(static_cast<unsigned char>(s.front()))) s.erase(s.begin());
    while (!s.empty() && is_space(static_cast<unsigned char>(s.back()))) s.pop_back();

    return s;
}

std::string Config::to_lower(std::string s) {
    for (char& c : s) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return s;
}

std::string Config::strip_quotes(std::string s) {
    s = trim(std::move(s));

    if (s.size() >= 2) {
        const char a = s.front();
        const char b = s.back();
        if ((a == '"' && b == '"') || (a == '\'' && b == '\'')) {
            return s.substr(1, s.size() - 2);
        }
    }
    return s;
}

bool Config::parse_bool(const std::string& v, bool default_value) {
    std::string s = to_lower(trim(v));
    if (s == "1" || s == "true" || s == "yes" || s == "on") return true;
    if (s == "0" || s == "false" || s == "no" || s == "off") return false;
    return default_value;
}

LogLevel Config::log_level_from_string(const std::string& v, LogLevel default_value) {
    std::string s = to_lower(strip_quotes(v));

    static const std::unordered_map<std::string, LogLevel> map = {
        {"all", LogLevel::All},
        {"trace", LogLevel::Trace},
        {"debug", LogLevel::Debug},
        {"info", LogLevel::Info},
        {"warning", LogLevel::Warning}, {"warn", LogLevel::Warning},
        {"error", LogLevel::Error},
        {"fatal", LogLevel::Fatal},
        {"none", LogLevel::None}, {"off", LogLevel::None},
    };

    auto it = map.find(s);
    if (it != map.end()) return it->second;

    return default_value;
}

void Config::apply_kv(const std::string& section, const std::string& key, const std::string& value) {
    const std::string sec = to_lower(trim(section));
    const std::string k = to_lower(trim(key));
    const std::string v = strip_quotes(value);

    if (sec == "paths") {
        if (k == "steam_dir") config_.paths.steam_dir = v;
        else if (k == "game_dir") config_.paths.game_dir = v;
        else if (k == "terrain") config_.paths.terrain = v;
        else if (k == "output") config_.paths.output = v;
        return;
    }

    if (sec == "logging") {
        if (k == "enabled") config_.logging.enabled = parse_bool(v, config_.logging.enabled);
        else if (k == "level") config_.logging.level = log_level_from_string(v, config_.logging.level);
        else if (k == "file") config_.logging.file = v;
        return;
    }

    if (sec == "archive") {
        if (k == "verify_crc") config_.archive.verify_crc = parse_bool(v, config_.archive.verify_crc);
        return;
    }
}

void Config::load_from_string(const std::string& text) {
    std::istringstream in(text);

    std::string section;
    std::string line;

    while (std::getline(in, line)) {
        // Strip comments (# or ;). Paths with those characters must not be used here.
        auto hash = line.find('#');
        auto semi = line.find(';');
        std::size_t cut = std::string::npos;
        if (hash != std::string::npos) cut = hash;
        if (semi != std::string::npos) cut = (cut == std::string::npos) ? semi : std::min(cut, semi);
        if (cut != std::string::npos) line = line.substr(0, cut);

        line = trim(line);
        if (line.empty()) continue;

        if (line.front() == '[' && line.back() == ']') {
            section = trim(line.substr(1, line.size() - 2));
            continue;
        }

        auto eq = line.find('=');
        if (eq == std::string::npos) continue;

        std::string key = trim(line.substr(0, eq));
        std::string value = trim(line.substr(eq + 1));
        if (key.empty()) continue;

        apply_kv(section, key, value);
    }
}

bool Config::load_from_file(const std::string& path) {
    std::ifstream in(path);
    if (!in.is_open()) {
        return false;
    }

    std::stringstream ss;
    ss << in.rdbuf();
    load_from_string(ss.str());

    loaded_from_path_ = path;
    return true;
}

} // namespace app::core
