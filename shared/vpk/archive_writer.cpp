#include "archive_writer.hpp"

#include "../core/byte_buffer.hpp"
#include "../crypto/checksum.hpp"

#include <algorithm>
#include <exception>
#include <limits>

namespace shared::vpk {

using core::ErrorKind;
using core::fail;

namespace {

constexpr std::uint64_t kMaxU32 = std::numeric_limits<std::uint32_t>::max();

// Inverse of split_path().
std::string join_path(const std::string& dir, const std::string& name, const std::string& ext) {
    std::string path;
    if (dir != VPK_EMPTY_NAME) {
        path = dir + "/";
    }
    path += name;
    if (ext != VPK_EMPTY_NAME) {
        path += '.';
        path += ext;
    }
    return path;
}

} // namespace

bool split_path(const std::string& path,
                std::string* outDir,
                std::string* outName,
                std::string* outExt,
                core::Error* outError) {
    if (path.empty()) {
        return fail(outError, ErrorKind::InvalidPath, "empty path");
    }
    if (path.find('\0') != std::string::npos) {
        return fail(outError, ErrorKind::InvalidPath, "path contains a NUL byte");
    }
    if (path.front() == '/') {
        return fail(outError, ErrorKind::InvalidPath, "absolute path '" + path + "'");
    }

    const auto slash = path.rfind('/');
    std::string dir = (slash == std::string::npos) ? std::string{} : path.substr(0, slash);
    const std::string file = (slash == std::string::npos) ? path : path.substr(slash + 1);
    if (file.empty()) {
        return fail(outError, ErrorKind::InvalidPath, "path '" + path + "' has no file name");
    }

    // "a.b.c" -> ("a.b", "c"). A leading or trailing dot is part of the name.
    std::string name = file;
    std::string ext;
    const auto dot = file.rfind('.');
    if (dot != std::string::npos && dot != 0 && dot + 1 < file.size()) {
        name = file.substr(0, dot);
        ext = file.substr(dot + 1);
    }

    // A literal " " would read back as root / no extension.
    if (dir == VPK_EMPTY_NAME || ext == VPK_EMPTY_NAME) {
        return fail(outError, ErrorKind::InvalidPath, "path '" + path + "' is ambiguous in a VPK tree");
    }

    *outDir = dir.empty() ? std::string(VPK_EMPTY_NAME) : std::move(dir);
    *outName = std::move(name);
    *outExt = ext.empty() ? std::string(VPK_EMPTY_NAME) : std::move(ext);
    return true;
}

bool build_directory_tree(const FileSet& files, DirectoryTree* outTree, core::Error* outError) {
    DirectoryTree tree;

    for (const auto& [path, data] : files) {
        (void)data;
        std::string dir;
        std::string name;
        std::string ext;
        if (!split_path(path, &dir, &name, &ext, outError)) {
            return false;
        }
        tree[ext][dir].push_back(std::move(name));
    }

    // FileSet is unordered; sort names so output is reproducible.
    for (auto& [ext, dirs] : tree) {
        for (auto& [dir, names] : dirs) {
            std::sort(names.begin(), names.end());
        }
    }

    *outTree = std::move(tree);
    return true;
}

std::uint64_t compute_tree_length(const DirectoryTree& tree) {
    std::uint64_t length = 1;  // Final empty extension.

    for (const auto& [ext, dirs] : tree) {
        length += ext.size() + 2;  // NUL + closing empty directory.

        for (const auto& [dir, names] : dirs) {
            length += dir.size() + 2;  // NUL + closing empty name.

            for (const auto& name : names) {
                length += name.size() + 1 + VPK_ENTRY_RECORD_SIZE;
            }
        }
    }

    return length;
}

bool write_archive(const FileSet& files, std::vector<std::uint8_t>* outArchive, core::Error* outError) {
    if (!outArchive) {
        return fail(outError, ErrorKind::IoError, "write_archive: no output buffer");
    }

    DirectoryTree tree;
    if (!build_directory_tree(files, &tree, outError)) {
        return false;
    }

    const std::uint64_t treeLength = compute_tree_length(tree);
    if (treeLength > kMaxU32) {
        return fail(outError, ErrorKind::InvalidPath,
                    "tree section of " + std::to_string(treeLength) + " bytes is too large");
    }

    core::ByteWriter treeOut(static_cast<std::size_t>(treeLength));
    core::ByteWriter payloadOut;
    std::uint64_t payloadOffset = 0;  // Relative to the end of the tree.

    for (const auto& [ext, dirs] : tree) {
        treeOut.write_cstring(ext);

        for (const auto& [dir, names] : dirs) {
            treeOut.write_cstring(dir);

            for (const auto& name : names) {
                const std::string path = join_path(dir, name, ext);
                const auto it = files.find(path);
                if (it == files.end()) {
                    return fail(outError, ErrorKind::InvalidPath,
                                "path '" + path + "' does not round-trip through the tree");
                }

                const auto& data = it->second;
                if (payloadOffset + data.size() > kMaxU32) {
                    return fail(outError, ErrorKind::InvalidPath,
                                "payload exceeds 4 GiB at '" + path + "'");
                }

                treeOut.write_cstring(name);
                treeOut.write_u32(crypto::crc32(data));
                treeOut.write_u16(0);  // Preload length.
                treeOut.write_u16(VPK_INLINE_ARCHIVE_INDEX);
                treeOut.write_u32(static_cast<std::uint32_t>(payloadOffset));
                treeOut.write_u32(static_cast<std::uint32_t>(data.size()));
                treeOut.write_u16(VPK_ENTRY_TERMINATOR);

                payloadOut.write_bytes(data);
                payloadOffset += data.size();
            }

            treeOut.write_u8(0);  // End of directory.
        }

        treeOut.write_u8(0);  // End of extension.
    }

    treeOut.write_u8(0);  // End of tree.

    core::ByteWriter header(VPK_HEADER_SIZE);
    header.write_u32(VPK_SIGNATURE);
    header.write_u32(VPK_VERSION);
    header.write_u32(static_cast<std::uint32_t>(treeLength));
    header.write_u32(static_cast<std::uint32_t>(payloadOffset));  // Embedded data length.
    header.write_u32(0);                                          // Chunk hashes length.
    header.write_u32(static_cast<std::uint32_t>(VPK_SELF_HASH_SIZE));
    header.write_u32(0);                                          // Signature length.

    crypto::Md5Digest treeDigest{};
    crypto::Md5Digest chunkDigest{};
    crypto::Md5Digest fileDigest{};
    try {
        treeDigest = crypto::md5(treeOut.data());
        chunkDigest = crypto::md5({});

        crypto::Md5 fileHash;
        fileHash.update(header.data());
        fileHash.update(treeOut.data());
        fileHash.update(payloadOut.data());
        fileHash.update(treeDigest);
        fileHash.update(chunkDigest);
        fileDigest = fileHash.finalize();
    } catch (const std::exception& e) {
        return fail(outError, ErrorKind::SystemError, std::string("cannot hash archive: ") + e.what());
    }

    const auto headerBytes = header.data();
    const auto treeBytes = treeOut.data();
    const auto payloadBytes = payloadOut.data();

    std::vector<std::uint8_t> out;
    out.reserve(headerBytes.size() + treeBytes.size() + payloadBytes.size() + VPK_SELF_HASH_SIZE);
    out.insert(out.end(), headerBytes.begin(), headerBytes.end());
    out.insert(out.end(), treeBytes.begin(), treeBytes.end());
    out.insert(out.end(), payloadBytes.begin(), payloadBytes.end());
    out.insert(out.end(), treeDigest.begin(), treeDigest.end());
    out.insert(out.end(), chunkDigest.begin(), chunkDigest.end());
    out.insert(out.end(), fileDigest.begin(), fileDigest.end());

    *outArchive = std::move(out);
    return true;
}

ArchiveWriter::ArchiveWriter() = default;

ArchiveWriter::~ArchiveWriter() = default;

void ArchiveWriter::add_file(const std::string& archivePath, std::vector<std::uint8_t> data) {
    files_.insert_or_assign(archivePath, std::move(data));
}

void ArchiveWriter::add_files(FileSet files) {
    for (auto& [path, data] : files) {
        files_.insert_or_assign(path, std::move(data));
    }
}

bool ArchiveWriter::build(std::vector<std::uint8_t>* outArchive, core::Error* outError) const {
    return write_archive(files_, outArchive, outError);
}

} // namespace shared::vpk
