#include "terrain_loader.hpp"

#include "patch_merger.hpp"
#include "../core/log.hpp"
#include "../io/file_io.hpp"
#include "../vpk/archive_writer.hpp"

#include <exception>
#include <future>
#include <system_error>
#include <thread>

namespace shared::patch {

using core::LogLevel;
using core::logf;

namespace {

struct LoadResult {
    bool ok{false};
    vpk::FileSet files;
    core::Error error;
};

LoadResult load_one(std::vector<std::uint8_t> data, const vpk::ReadOptions& opts) {
    LoadResult result;
    result.ok = vpk::read_archive(std::move(data), &result.files, &result.error, opts);
    return result;
}

// load_one() with exceptions (allocation failure) turned into a failed result.
LoadResult load_one_guarded(std::vector<std::uint8_t> data, const vpk::ReadOptions& opts) {
    try {
        return load_one(std::move(data), opts);
    } catch (const std::exception& e) {
        LoadResult result;
        core::fail(&result.error, core::ErrorKind::SystemError, e.what());
        return result;
    }
}

// Prefixes an error with the archive it came from.
core::Error tag_error(const char* which, core::Error err) {
    err.message = std::string(which) + " archive: " + err.message;
    return err;
}

} // namespace

bool load_archive_pair(std::vector<std::uint8_t> baseData,
                       std::vector<std::uint8_t> overrideData,
                       vpk::FileSet* outBase,
                       vpk::FileSet* outOverride,
                       core::Error* outError,
                       const vpk::ReadOptions& opts) {
    if (!outBase || !outOverride) {
        return core::fail(outError, core::ErrorKind::IoError, "load_archive_pair: no output file set");
    }

    std::promise<LoadResult> handoff;
    std::future<LoadResult> overrideFuture = handoff.get_future();

    std::thread worker;
    try {
        worker = std::thread([&handoff, data = std::move(overrideData), opts]() mutable {
            handoff.set_value(load_one_guarded(std::move(data), opts));
        });
    } catch (const std::system_error& e) {
        return core::fail(outError, core::ErrorKind::SystemError,
                          std::string("cannot start loader thread: ") + e.what());
    }

    LoadResult base = load_one_guarded(std::move(baseData), opts);

    // Single join point: block until the worker has delivered its result.
    LoadResult over = overrideFuture.get();
    worker.join();

    if (!base.ok) {
        if (outError) *outError = tag_error("base", std::move(base.error));
        return false;
    }
    if (!over.ok) {
        if (outError) *outError = tag_error("override", std::move(over.error));
        return false;
    }

    *outBase = std::move(base.files);
    *outOverride = std::move(over.files);
    return true;
}

bool create_terrain(const std::filesystem::path& basePath,
                    const std::filesystem::path& targetPath,
                    std::vector<std::uint8_t>* outArchive,
                    core::Error* outError,
                    const vpk::ReadOptions& opts) {
    std::vector<std::uint8_t> baseData;
    std::vector<std::uint8_t> targetData;
    if (!io::read_whole_file(basePath, &baseData, outError) ||
        !io::read_whole_file(targetPath, &targetData, outError)) {
        return false;
    }

    logf(LogLevel::Info, "load", "base %s (%zu bytes), override %s (%zu bytes)",
         basePath.string().c_str(), baseData.size(),
         targetPath.string().c_str(), targetData.size());

    vpk::FileSet base;
    vpk::FileSet target;
    if (!load_archive_pair(std::move(baseData), std::move(targetData), &base, &target, outError, opts)) {
        return false;
    }

    logf(LogLevel::Info, "load", "base has %zu files, override has %zu files", base.size(), target.size());

    const std::string mapPath = find_map_file(target);
    vpk::FileSet merged;
    if (!merge_file_sets(std::move(base), std::move(target), &merged, outError)) {
        return false;
    }

    logf(LogLevel::Info, "patch", "map %s -> %s, merged set has %zu files",
         mapPath.c_str(), canonical_map_path(mapPath).c_str(), merged.size());

    if (!vpk::write_archive(merged, outArchive, outError)) {
        return false;
    }

    logf(LogLevel::Info, "write", "encoded archive of %zu bytes", outArchive->size());
    return true;
}

} // namespace shared::patch
