#pragma once

#include "util/result.hpp"

#include <string>
#include <string_view>

namespace updsrv {

// Owning file descriptor.
class Fd {
  public:
    Fd() = default;
    explicit Fd(int fd) : fd_(fd) {}

    Fd(const Fd&) = delete;
    Fd& operator=(const Fd&) = delete;

    Fd(Fd&& other) noexcept;
    Fd& operator=(Fd&& other) noexcept;

    ~Fd();

    // open(2) with O_CLOEXEC added. `what` names the file's role in errors
    // ("input", "output", ...).
    static Result Open(const std::string& path, int flags, unsigned mode, std::string_view what, Fd& out);

    int Get() const { return fd_; }
    bool Valid() const { return fd_ >= 0; }

    void Reset(int fd);
    int Release();

    // Reports the close(2) error, unlike the destructor.
    Result Close();

  private:
    int fd_{-1};
};

// NotFound, PermissionDenied or Io for an errno value from a path operation.
ErrorKind ErrorKindFromErrno(int err);

} // namespace updsrv
