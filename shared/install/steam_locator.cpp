#include "steam_locator.hpp"

#include "../core/log.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <system_error>

namespace shared::install {

namespace fs = std::filesystem;

using core::ErrorKind;
using core::LogLevel;
using core::fail;
using core::logf;

namespace {

// ============================================================================
// Minimal KeyValues (VDF) text reader
// ============================================================================

struct KvNode {
    std::string key;
    std::string value;
    std::vector<KvNode> children;
    bool isBlock{false};
};

enum class TokenKind { String, Open, Close };

struct Token {
    TokenKind kind;
    std::string text;
};

bool tokenize(const std::string& text, std::vector<Token>* out) {
    std::size_t i = 0;
    while (i < text.size()) {
        const char c = text[i];

        if (std::isspace(static_cast<unsigned char>(c)) != 0) {
            ++i;
            continue;
        }
        if (c == '/' && i + 1 < text.size() && text[i + 1] == '/') {
            while (i < text.size() && text[i] != '\n') ++i;
            continue;
        }
        if (c == '{') {
            out->push_back({TokenKind::Open, {}});
            ++i;
            continue;
        }
        if (c == '}') {
            out->push_back({TokenKind::Close, {}});
            ++i;
            continue;
        }

        std::string s;
        if (c == '"') {
            ++i;
            bool closed = false;
            while (i < text.size()) {
                char ch = text[i++];
                if (ch == '"') {
                    closed = true;
                    break;
                }
                if (ch == '\\' && i < text.size()) {
                    const char esc = text[i++];
                    switch (esc) {
                        case 'n': ch = '\n'; break;
                        case 't': ch = '\t'; break;
                        default: ch = esc; break;
                    }
                }
                s.push_back(ch);
            }
            if (!closed) return false;
        } else {
            while (i < text.size() && std::isspace(static_cast<unsigned char>(text[i])) == 0 &&
                   text[i] != '{' && text[i] != '}' && text[i] != '"') {
                s.push_back(text[i++]);
            }
        }
        out->push_back({TokenKind::String, std::move(s)});
    }
    return true;
}

// Parses `key value` / `key { ... }` pairs until a closing brace or the end.
bool parse_pairs(const std::vector<Token>& tokens, std::size_t* pos, std::vector<KvNode>* out, bool nested) {
    while (*pos < tokens.size()) {
        const Token& t = tokens[*pos];
        if (t.kind == TokenKind::Close) {
            if (!nested) return false;
            ++*pos;
            return true;
        }
        if (t.kind != TokenKind::String) return false;

        KvNode node;
        node.key = t.text;
        ++*pos;
        if (*pos >= tokens.size()) return false;

        const Token& v = tokens[*pos];
        if (v.kind == TokenKind::String) {
            node.value = v.text;
            ++*pos;
        } else if (v.kind == TokenKind::Open) {
            ++*pos;
            node.isBlock = true;
            if (!parse_pairs(tokens, pos, &node.children, true)) return false;
        } else {
            return false;
        }
        out->push_back(std::move(node));
    }
    return !nested;
}

std::string to_lower(std::string s) {
    for (char& c : s) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return s;
}

bool is_number(const std::string& s) {
    return !s.empty() && std::all_of(s.begin(), s.end(), [](unsigned char c) { return std::isdigit(c) != 0; });
}

bool has_app_manifest(const fs::path& library, const char* appId) {
    std::error_code ec;
    return fs::exists(library / "steamapps" / (std::string("appmanifest_") + appId + ".acf"), ec);
}

fs::path game_dir_in(const fs::path& library) {
    return library / "steamapps" / "common" / "dota 2 beta" / "game";
}

} // namespace

bool find_steam_dir(const fs::path& overrideDir, fs::path* outDir, core::Error* outError) {
    std::error_code ec;

    if (!overrideDir.empty()) {
        if (!fs::is_directory(overrideDir, ec)) {
            return fail(outError, ErrorKind::NotFound, "Steam directory " + overrideDir.string() + " does not exist");
        }
        *outDir = overrideDir;
        return true;
    }

    const char* home = std::getenv("HOME");
    if (!home || !*home) {
        return fail(outError, ErrorKind::NotFound, "HOME is not set; pass --steam-dir");
    }

    const fs::path candidates[] = {
        fs::path(home) / ".steam" / "steam",
        fs::path(home) / ".local" / "share" / "Steam",
    };

    for (const auto& dir : candidates) {
        if (fs::is_directory(dir / "steamapps", ec)) {
            *outDir = dir;
            return true;
        }
    }

    return fail(outError, ErrorKind::NotFound, "Steam installation not found; pass --steam-dir");
}

bool parse_library_folders(const std::string& text, std::vector<SteamLibrary>* outLibraries, core::Error* outError) {
    std::vector<Token> tokens;
    if (!tokenize(text, &tokens)) {
        return fail(outError, ErrorKind::NotFound, "libraryfolders.vdf: unterminated string");
    }

    std::vector<KvNode> roots;
    std::size_t pos = 0;
    if (!parse_pairs(tokens, &pos, &roots, false)) {
        return fail(outError, ErrorKind::NotFound, "libraryfolders.vdf: malformed KeyValues");
    }

    auto root = std::find_if(roots.begin(), roots.end(), [](const KvNode& n) {
        return n.isBlock && to_lower(n.key) == "libraryfolders";
    });
    if (root == roots.end()) {
        return fail(outError, ErrorKind::NotFound, "libraryfolders.vdf: no \"libraryfolders\" block");
    }

    std::vector<SteamLibrary> libraries;
    for (const auto& child : root->children) {
        if (!is_number(child.key)) continue;

        SteamLibrary lib;
        if (!child.isBlock) {
            // Old layout: "1" "D:\\SteamLibrary"
            lib.path = child.value;
        } else {
            for (const auto& field : child.children) {
                const std::string k = to_lower(field.key);
                if (k == "path" && !field.isBlock) {
                    lib.path = field.value;
                } else if (k == "apps" && field.isBlock) {
                    for (const auto& app : field.children) {
                        lib.appIds.push_back(app.key);
                    }
                }
            }
        }

        if (!lib.path.empty()) {
            libraries.push_back(std::move(lib));
        }
    }

    *outLibraries = std::move(libraries);
    return true;
}

bool locate_install_base_directory(const fs::path& steamDir, fs::path* outGameDir, core::Error* outError) {
    const fs::path vdfPath = steamDir / "steamapps" / "libraryfolders.vdf";

    std::ifstream in(vdfPath);
    if (!in.is_open()) {
        return fail(outError, ErrorKind::IoError, "cannot read " + vdfPath.string());
    }
    std::stringstream ss;
    ss << in.rdbuf();

    std::vector<SteamLibrary> libraries;
    if (!parse_library_folders(ss.str(), &libraries, outError)) {
        return false;
    }

    logf(LogLevel::Debug, "steam", "%zu libraries listed in %s", libraries.size(), vdfPath.string().c_str());

    for (const auto& lib : libraries) {
        if (std::find(lib.appIds.begin(), lib.appIds.end(), kDotaAppId) != lib.appIds.end()) {
            *outGameDir = game_dir_in(lib.path);
            logf(LogLevel::Info, "steam", "Dota 2 found in library %s", lib.path.string().c_str());
            return true;
        }
    }

    // Old layouts carry no app lists; the Steam root is an implicit library.
    std::vector<fs::path> fallback{steamDir};
    for (const auto& lib : libraries) {
        fallback.push_back(lib.path);
    }
    for (const auto& dir : fallback) {
        if (has_app_manifest(dir, kDotaAppId)) {
            *outGameDir = game_dir_in(dir);
            logf(LogLevel::Info, "steam", "Dota 2 manifest found in %s", dir.string().c_str());
            return true;
        }
    }

    return fail(outError, ErrorKind::NotFound, "no Steam library contains Dota 2 (app 570)");
}

fs::path maps_dir(const fs::path& gameDir) {
    return gameDir / "dota" / "maps";
}

TerrainPaths build_paths(const fs::path& gameDir, const std::string& terrain) {
    TerrainPaths paths;
    paths.base = maps_dir(gameDir) / "dota.vpk";
    paths.target = maps_dir(gameDir) / terrain;
    paths.output = gameDir / "dota_tempcontent" / "maps" / "dota.vpk";
    return paths;
}

std::vector<std::string> list_available_terrains(const fs::path& gameDir) {
    std::vector<std::string> result;

    const fs::path dir = maps_dir(gameDir);
    std::error_code ec;
    if (!fs::is_directory(dir, ec)) {
        return result;
    }

    for (const auto& entry : fs::directory_iterator(dir, ec)) {
        if (ec) break;
        if (!entry.is_regular_file(ec)) continue;
        const fs::path file = entry.path();
        if (file.extension() != ".vpk") continue;
        if (file.filename() == "dota.vpk") continue;

        result.push_back(file.filename().string());
    }

    std::sort(result.begin(), result.end());
    return result;
}

} // namespace shared::install
