#include "archive_reader.hpp"

#include "../core/byte_buffer.hpp"
#include "../crypto/checksum.hpp"

#include <cstdio>
#include <set>
#include <stdexcept>
#include <string_view>

namespace shared::vpk {

using core::ErrorKind;
using core::fail;

namespace {

std::string hex32(std::uint32_t v) {
    char buf[16];
    std::snprintf(buf, sizeof(buf), "0x%08X", v);
    return buf;
}

} // namespace

ArchiveReader::ArchiveReader() = default;

ArchiveReader::~ArchiveReader() {
    close();
}

ArchiveReader::ArchiveReader(ArchiveReader&& other) noexcept
    : data_(std::move(other.data_))
    , header_(other.header_)
    , entries_(std::move(other.entries_))
    , pathIndex_(std::move(other.pathIndex_))
    , open_(other.open_) {
    other.open_ = false;
}

ArchiveReader& ArchiveReader::operator=(ArchiveReader&& other) noexcept {
    if (this != &other) {
        close();
        data_ = std::move(other.data_);
        header_ = other.header_;
        entries_ = std::move(other.entries_);
        pathIndex_ = std::move(other.pathIndex_);
        open_ = other.open_;
        other.open_ = false;
    }
    return *this;
}

bool ArchiveReader::open(std::vector<std::uint8_t> data, core::Error* outError) {
    close();

    data_ = std::move(data);
    core::ByteReader in(data_);

    if (!read_header(in, outError) || !read_tree(in, outError)) {
        close();
        return false;
    }

    open_ = true;
    return true;
}

void ArchiveReader::close() {
    data_.clear();
    data_.shrink_to_fit();
    header_ = VpkHeader{};
    entries_.clear();
    pathIndex_.clear();
    open_ = false;
}

bool ArchiveReader::read_header(core::ByteReader& in, core::Error* outError) {
    if (in.size() < VPK_HEADER_SIZE) {
        return fail(outError, ErrorKind::InvalidSignature,
                    "archive is " + std::to_string(in.size()) + " bytes, smaller than a VPK header");
    }

    header_.signature = in.read_u32();
    if (header_.signature != VPK_SIGNATURE) {
        return fail(outError, ErrorKind::InvalidSignature,
                    "bad signature " + hex32(header_.signature) + ", expected " + hex32(VPK_SIGNATURE));
    }

    header_.version = in.read_u32();
    header_.treeLength = in.read_u32();
    header_.embedLength = in.read_u32();
    header_.chunkHashLength = in.read_u32();
    header_.selfHashLength = in.read_u32();
    header_.signatureLength = in.read_u32();
    return true;
}

bool ArchiveReader::read_tree(core::ByteReader& in, core::Error* outError) {
    const std::size_t treeEnd = VPK_HEADER_SIZE + static_cast<std::size_t>(header_.treeLength);

    // Version 0 archives carry no usable tree length, so only later versions are bounded.
    const bool bounded = header_.version > 0;

    auto overran = [&]() {
        if (bounded && in.position() > treeEnd) {
            fail(outError, ErrorKind::IndexCorrupt,
                 "tree walk reached offset " + std::to_string(in.position()) +
                 " past declared end " + std::to_string(treeEnd));
            return true;
        }
        return false;
    };

    try {
        in.seek(VPK_HEADER_SIZE);

        // extension -> directory -> file name, each level closed by an empty string.
        for (;;) {
            std::string ext = in.read_cstring();
            if (overran()) return false;
            if (ext.empty()) break;
            if (ext == VPK_EMPTY_NAME) ext.clear();

            for (;;) {
                const std::string dir = in.read_cstring();
                if (overran()) return false;
                if (dir.empty()) break;

                const std::string prefix = (dir == VPK_EMPTY_NAME) ? std::string{} : dir + "/";

                for (;;) {
                    const std::string name = in.read_cstring();
                    if (overran()) return false;
                    if (name.empty()) break;

                    VpkEntry entry;
                    entry.path = prefix + name;
                    if (!ext.empty()) {
                        entry.path += '.';
                        entry.path += ext;
                    }

                    entry.crc = in.read_u32();
                    const std::uint16_t preloadLength = in.read_u16();
                    entry.archiveIndex = in.read_u16();
                    entry.offset = in.read_u32();
                    entry.length = in.read_u32();
                    entry.terminator = in.read_u16();

                    const auto preload = in.read_bytes(preloadLength);
                    entry.preload.assign(preload.begin(), preload.end());
                    if (overran()) return false;

                    if (!validate_entry(entry, outError)) {
                        return false;
                    }

                    pathIndex_[entry.path] = entries_.size();
                    entries_.push_back(std::move(entry));
                }
            }
        }
    } catch (const std::out_of_range& e) {
        return fail(outError, ErrorKind::IndexCorrupt, std::string("truncated tree: ") + e.what());
    }

    return true;
}

bool ArchiveReader::validate_entry(VpkEntry& entry, core::Error* outError) const {
    if (entry.terminator != VPK_ENTRY_TERMINATOR) {
        return fail(outError, ErrorKind::IndexCorrupt,
                    "entry '" + entry.path + "' has terminator " + hex32(entry.terminator) +
                    ", expected " + hex32(VPK_ENTRY_TERMINATOR));
    }

    // Inline payload offsets are relative to the end of the tree.
    if (entry.archiveIndex == VPK_INLINE_ARCHIVE_INDEX) {
        entry.offset += VPK_HEADER_SIZE + static_cast<std::uint64_t>(header_.treeLength);
    }

    return true;
}

bool ArchiveReader::read_payload(const VpkEntry& entry,
                                 std::vector<std::uint8_t>* out,
                                 core::Error* outError,
                                 const ReadOptions& opts) const {
    if (entry.archiveIndex != VPK_INLINE_ARCHIVE_INDEX) {
        return fail(outError, ErrorKind::UnsupportedArchivePart,
                    "entry '" + entry.path + "' is stored in archive part " +
                    std::to_string(entry.archiveIndex));
    }

    const std::uint64_t size = static_cast<std::uint64_t>(entry.length) + entry.preload.size();
    if (entry.offset > data_.size() || size > data_.size() - entry.offset) {
        return fail(outError, ErrorKind::IndexCorrupt,
                    "entry '" + entry.path + "' spans [" + std::to_string(entry.offset) + ", " +
                    std::to_string(entry.offset + size) + ") outside archive of " +
                    std::to_string(data_.size()) + " bytes");
    }

    const auto first = data_.begin() + static_cast<std::ptrdiff_t>(entry.offset);
    out->assign(first, first + static_cast<std::ptrdiff_t>(size));

    if (opts.verify_crc) {
        const std::uint32_t actual = crypto::crc32(*out);
        if (actual != entry.crc) {
            return fail(outError, ErrorKind::ChecksumMismatch,
                        "entry '" + entry.path + "' has CRC " + hex32(actual) +
                        ", tree says " + hex32(entry.crc));
        }
    }

    return true;
}

bool ArchiveReader::has_file(const std::string& path) const {
    return pathIndex_.find(path) != pathIndex_.end();
}

const VpkEntry* ArchiveReader::get_entry(const std::string& path) const {
    auto it = pathIndex_.find(path);
    if (it == pathIndex_.end()) {
        return nullptr;
    }
    return &entries_[it->second];
}

std::optional<std::vector<std::uint8_t>> ArchiveReader::extract(const std::string& path,
                                                                 core::Error* outError,
                                                                 const ReadOptions& opts) const {
    const VpkEntry* entry = get_entry(path);
    if (!entry) {
        fail(outError, ErrorKind::NotFound, "no entry '" + path + "' in archive");
        return std::nullopt;
    }

    std::vector<std::uint8_t> data;
    if (!read_payload(*entry, &data, outError, opts)) {
        return std::nullopt;
    }
    return data;
}

bool ArchiveReader::load_all(FileSet* outFiles, core::Error* outError, const ReadOptions& opts) const {
    if (!outFiles) {
        return fail(outError, ErrorKind::IoError, "load_all: no output file set");
    }

    FileSet files;
    files.reserve(entries_.size());

    for (const auto& entry : entries_) {
        std::vector<std::uint8_t> data;
        if (!read_payload(entry, &data, outError, opts)) {
            return false;
        }
        // Duplicate paths: the later record wins, as in pathIndex_.
        files.insert_or_assign(entry.path, std::move(data));
    }

    *outFiles = std::move(files);
    return true;
}

std::vector<std::string> ArchiveReader::list_directory(const std::string& dirPath) const {
    std::set<std::string> children;

    // Normalize directory path.
    std::string prefix = dirPath;
    if (!prefix.empty() && prefix.back() != '/') {
        prefix += '/';
    }
    if (prefix == "/") {
        prefix.clear();
    }

    const std::size_t prefixLen = prefix.length();

    for (const auto& entry : entries_) {
        if (entry.path.length() <= prefixLen) {
            continue;
        }
        if (prefixLen > 0 && entry.path.compare(0, prefixLen, prefix) != 0) {
            continue;
        }

        std::string_view remainder(entry.path.data() + prefixLen, entry.path.length() - prefixLen);

        // Direct child file, or the first directory level below prefix.
        auto slashPos = remainder.find('/');
        std::string childName = (slashPos == std::string_view::npos)
            ? std::string(remainder)
            : std::string(remainder.substr(0, slashPos + 1));

        children.insert(std::move(childName));
    }

    return std::vector<std::string>(children.begin(), children.end());
}

bool read_archive(std::vector<std::uint8_t> data,
                  FileSet* outFiles,
                  core::Error* outError,
                  const ReadOptions& opts) {
    ArchiveReader reader;
    if (!reader.open(std::move(data), outError)) {
        return false;
    }
    return reader.load_all(outFiles, outError, opts);
}

} // namespace shared::vpk
