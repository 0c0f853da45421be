#pragma once
#include <string>
#include <utility>

namespace bpm {

enum class Errc : int {
    None = 0,
    InvalidArgument,
    ConfigInvalid,
    ManifestUnreadable,
    ManifestMalformed,
    PackageNotFound,
    VersionNotFound,
    CycleDetected,
    StateCorrupt,
    StateWriteFailed,
    LockFailed,
    BinaryCopyFailed,
    BinaryDeleteFailed,
    CatalogFailed,
    IoError,
    Cancelled,
};

const char* ToString(Errc code);

struct Result {
    bool ok{true};
    Errc code{Errc::None};
    int err{0};
    std::string msg;

    bool is_ok() const { return ok; }
    const std::string& message() const { return msg; }

    static Result Ok() { return {}; }
    static Result Fail(Errc c, std::string m, int e = 0) {
        return {.ok = false, .code = c, .err = e, .msg = std::move(m)};
    }
};

} // namespace bpm
