#pragma once

#include <string>
#include <utility>

namespace shared::core {

enum class ErrorKind {
    None,
    InvalidSignature,        // Header magic is not 0x55AA1234.
    IndexCorrupt,            // Bad entry terminator, tree overrun or truncated data.
    UnsupportedArchivePart,  // Payload lives in a numbered _NNN.vpk part.
    ChecksumMismatch,        // Stored CRC-32 differs from the payload (opt-in check).
    InvalidPath,             // Path cannot be split into directory/name/extension.
    NoMapFile,               // Override archive carries no .vmap_c entry.
    NotFound,                // Steam or game installation not located.
    IoError,                 // Reading or writing a file on disk failed.
    SystemError,             // Thread start, allocation or crypto backend failure.
};

struct Error {
    ErrorKind kind{ErrorKind::None};
    std::string message;
};

const char* error_kind_name(ErrorKind kind);

// Fills outError (if provided) and returns false, so callers can write
// `return fail(outError, ErrorKind::IoError, "...");`.
inline bool fail(Error* outError, ErrorKind kind, std::string message) {
    if (outError) {
        outError->kind = kind;
        outError->message = std::move(message);
    }
    return false;
}

} // namespace shared::core
