#include "patch_merger.hpp"

namespace shared::patch {

namespace {

bool ends_with(const std::string& s, const std::string& suffix) {
    return s.size() >= suffix.size() && s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

} // namespace

std::string find_map_file(const vpk::FileSet& files) {
    std::string best;
    for (const auto& [path, data] : files) {
        (void)data;
        if (!ends_with(path, kMapFileSuffix)) continue;
        if (best.empty() || path < best) {
            best = path;
        }
    }
    return best;
}

std::string canonical_map_path(const std::string& mapPath) {
    const auto slash = mapPath.rfind('/');
    if (slash == std::string::npos) {
        return kMapFileName;
    }
    return mapPath.substr(0, slash + 1) + kMapFileName;
}

bool merge_file_sets(vpk::FileSet base,
                     vpk::FileSet target,
                     vpk::FileSet* outMerged,
                     core::Error* outError) {
    if (!outMerged) {
        return core::fail(outError, core::ErrorKind::IoError, "merge_file_sets: no output file set");
    }

    const std::string mapPath = find_map_file(target);
    if (mapPath.empty()) {
        return core::fail(outError, core::ErrorKind::NoMapFile,
                          "override archive contains no *.vmap_c file");
    }

    const std::string canonical = canonical_map_path(mapPath);
    if (canonical != mapPath) {
        auto node = target.extract(mapPath);
        target.insert_or_assign(canonical, std::move(node.mapped()));
    }

    for (auto& [path, data] : base) {
        // try_emplace leaves existing override entries untouched.
        target.try_emplace(path, std::move(data));
    }

    *outMerged = std::move(target);
    return true;
}

} // namespace shared::patch
