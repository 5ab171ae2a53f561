#include "file_io.hpp"

#include <fstream>
#include <system_error>

namespace shared::io {

namespace fs = std::filesystem;

using core::ErrorKind;
using core::fail;

bool read_whole_file(const fs::path& path, std::vector<std::uint8_t>* outData, core::Error* outError) {
    std::ifstream in(path, std::ios::binary | std::ios::ate);
    if (!in) {
        return fail(outError, ErrorKind::IoError, "cannot open " + path.string() + " for reading");
    }

    const std::streamoff size = in.tellg();
    if (size < 0) {
        return fail(outError, ErrorKind::IoError, "cannot determine size of " + path.string());
    }
    in.seekg(0, std::ios::beg);

    std::vector<std::uint8_t> data(static_cast<std::size_t>(size));
    if (size > 0) {
        if (!in.read(reinterpret_cast<char*>(data.data()), static_cast<std::streamsize>(size))) {
            return fail(outError, ErrorKind::IoError, "short read from " + path.string());
        }
    }

    *outData = std::move(data);
    return true;
}

bool write_whole_file(const fs::path& path, std::span<const std::uint8_t> data, core::Error* outError) {
    std::error_code ec;
    const fs::path parent = path.parent_path();
    if (!parent.empty()) {
        fs::create_directories(parent, ec);
        if (ec) {
            return fail(outError, ErrorKind::IoError,
                        "cannot create directory " + parent.string() + ": " + ec.message());
        }
    }

    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out) {
        return fail(outError, ErrorKind::IoError, "cannot open " + path.string() + " for writing");
    }

    if (!data.empty()) {
        out.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
    }
    out.flush();
    if (!out) {
        return fail(outError, ErrorKind::IoError, "write to " + path.string() + " failed");
    }

    return true;
}

bool extract_files(const vpk::FileSet& files, const fs::path& outputDir, core::Error* outError) {
    for (const auto& [name, data] : files) {
        const fs::path rel = fs::path(name).lexically_normal();
        if (rel.empty() || rel.is_absolute() || *rel.begin() == "..") {
            return fail(outError, ErrorKind::InvalidPath, "refusing to extract '" + name + "'");
        }

        if (!write_whole_file(outputDir / rel, data, outError)) {
            return false;
        }
    }
    return true;
}

} // namespace shared::io
