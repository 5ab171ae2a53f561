#include "error.hpp"

namespace shared::core {

const char* error_kind_name(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::None: return "None";
        case ErrorKind::InvalidSignature: return "InvalidSignature";
        case ErrorKind::IndexCorrupt: return "IndexCorrupt";
        case ErrorKind::UnsupportedArchivePart: return "UnsupportedArchivePart";
        case ErrorKind::ChecksumMismatch: return "ChecksumMismatch";
        case ErrorKind::InvalidPath: return "InvalidPath";
        case ErrorKind::NoMapFile: return "NoMapFile";
        case ErrorKind::NotFound: return "NotFound";
        case ErrorKind::IoError: return "IoError";
        case ErrorKind::SystemError: return "SystemError";
        default: break;
    }
    return "Unknown";
}

} // namespace shared::core
