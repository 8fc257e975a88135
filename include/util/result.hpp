#pragma once
#include <string>
#include <string_view>
#include <utility>

namespace packsmith {

enum class ErrorKind : int {
    None = 0,
    SourceUnreachable,
    NoMatchingAsset,
    AmbiguousMatch,
    AmbiguousSourceMatch,
    UnsafeArchivePath,
    ArchiveCorrupt,
    StepExecutionFailed,
    RestoreConflict,
    InsufficientSpace,
    ManifestCorrupt,
    DefinitionInvalid,
    UnsupportedAction,
    HttpError,
    Cancelled,
    NotFound,
    Io,
};

std::string_view ErrorKindName(ErrorKind kind);

// Maps an errno from a failed filesystem call to the matching kind.
ErrorKind ErrorKindFromErrno(int e);

struct Result {
    bool ok{true};
    ErrorKind kind{ErrorKind::None};
    int err{0};
    std::string msg;

    bool is_ok() const { return ok; }
    const std::string& message() const { return msg; }

    static Result Ok() { return {}; }
    static Result Fail(ErrorKind k, std::string m, int e = -1) {
        return {.ok = false, .kind = k, .err = e, .msg = std::move(m)};
    }
};

} // namespace packsmith
