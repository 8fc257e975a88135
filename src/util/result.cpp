#include "util/result.hpp"

#include <cerrno>

namespace packsmith {

std::string_view ErrorKindName(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::None:                 return "None";
        case ErrorKind::SourceUnreachable:    return "SourceUnreachable";
        case ErrorKind::NoMatchingAsset:      return "NoMatchingAsset";
        case ErrorKind::AmbiguousMatch:       return "AmbiguousMatch";
        case ErrorKind::AmbiguousSourceMatch: return "AmbiguousSourceMatch";
        case ErrorKind::UnsafeArchivePath:    return "UnsafeArchivePath";
        case ErrorKind::ArchiveCorrupt:       return "ArchiveCorrupt";
        case ErrorKind::StepExecutionFailed:  return "StepExecutionFailed";
        case ErrorKind::RestoreConflict:      return "RestoreConflict";
        case ErrorKind::InsufficientSpace:    return "InsufficientSpace";
        case ErrorKind::ManifestCorrupt:      return "ManifestCorrupt";
        case ErrorKind::DefinitionInvalid:    return "DefinitionInvalid";
        case ErrorKind::UnsupportedAction:    return "UnsupportedAction";
        case ErrorKind::HttpError:            return "HttpError";
        case ErrorKind::Cancelled:            return "Cancelled";
        case ErrorKind::NotFound:             return "NotFound";
        case ErrorKind::Io:                   return "Io";
    }
    return "Unknown";
}

ErrorKind ErrorKindFromErrno(int e) {
    switch (e) {
        case ENOSPC:
        case EDQUOT:
            return ErrorKind::InsufficientSpace;
        case ENOENT:
            return ErrorKind::NotFound;
        default:
            return ErrorKind::Io;
    }
}

} // namespace packsmith
