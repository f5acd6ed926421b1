#include "io/fd.hpp"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <unistd.h>

namespace updsrv {

ErrorKind ErrorKindFromErrno(int err) {
    switch (err) {
        case ENOENT:
        case ENOTDIR:
            return ErrorKind::NotFound;
        case EACCES:
        case EPERM:
        case EROFS:
            return ErrorKind::PermissionDenied;
        default:
            return ErrorKind::Io;
    }
}

Fd::Fd(Fd&& other) noexcept : fd_(other.fd_) { other.fd_ = -1; }

Fd& Fd::operator=(Fd&& other) noexcept {
    if (this != &other) {
        Reset(other.Release());
    }
    return *this;
}

Fd::~Fd() {
    if (fd_ >= 0) ::close(fd_);
}

Result Fd::Open(const std::string& path, int flags, unsigned mode, std::string_view what, Fd& out) {
    int fd;
    do {
        fd = ::open(path.c_str(), flags | O_CLOEXEC, mode);
    } while (fd < 0 && errno == EINTR);

    if (fd < 0) {
        const int e = errno;
        Result r = Result::Fail(ErrorKindFromErrno(e),
                                "Failed to open " + std::string(what) + ": " + path + " (" + std::strerror(e) + ")");
        r.err = e;
        return r;
    }
    out.Reset(fd);
    return Result::Ok();
}

void Fd::Reset(int fd) {
    if (fd_ >= 0 && fd_ != fd) ::close(fd_);
    fd_ = fd;
}

int Fd::Release() {
    const int fd = fd_;
    fd_ = -1;
    return fd;
}

Result Fd::Close() {
    if (fd_ < 0) return Result::Ok();
    if (::close(Release()) != 0) {
        const int e = errno;
        return Result::Fail(e, std::string("close failed (") + std::strerror(e) + ")");
    }
    return Result::Ok();
}

} // namespace updsrv
