#pragma once
#include <string>
#include <utility>

namespace updsrv {

enum class ErrorKind : int {
    None = 0,
    NotFound,
    InvalidInput,
    CorruptAsset,
    DependencyCycle,
    SourceMissing,
    IntegrityMismatch,
    PermissionDenied,
    Io,
    Cancelled,
};

const char* ToString(ErrorKind kind);

struct Result {
    bool ok{true};
    int err{0};
    ErrorKind kind{ErrorKind::None};
    std::string msg;

    bool is_ok() const { return ok; }
    const std::string& message() const { return msg; }

    static Result Ok() { return {}; }
    static Result Fail(int e, std::string m) {
        return {.ok = false, .err = e, .kind = ErrorKind::Io, .msg = std::move(m)};
    }
    static Result Fail(ErrorKind k, std::string m) {
        return {.ok = false, .err = -1, .kind = k, .msg = std::move(m)};
    }
};

} // namespace updsrv
