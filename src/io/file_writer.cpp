#include "io/file_writer.hpp"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <unistd.h>

namespace updsrv {

Result FileWriter::Open(std::string path, FileWriter& out, unsigned mode) {
    out.path_ = std::move(path);
    return Fd::Open(out.path_, O_WRONLY | O_CREAT | O_TRUNC, mode, "output", out.fd_);
}

Result FileWriter::WriteAll(std::span<const std::uint8_t> in) {
    size_t rem = in.size();
    const std::uint8_t* p = in.data();

    while (rem > 0) {
        ssize_t n = ::write(fd_.Get(), p, rem);
        if (n > 0) {
            p += static_cast<size_t>(n);
            rem -= static_cast<size_t>(n);
            continue;
        }
        if (n == -1 && errno == EINTR) {
            continue;
        }
        const int e = errno;
        if (e == ENOSPC) {
            return Result::Fail(e, "No space left writing " + path_);
        }
        return Result::Fail(e, "Write failed: " + path_ + " (" + std::strerror(e) + ")");
    }

    return Result::Ok();
}

Result FileWriter::FsyncNow() {
    if (::fsync(fd_.Get()) == -1) {
        const int e = errno;
        return Result::Fail(e, "fsync failed: " + path_ + " (" + std::strerror(e) + ")");
    }
    return Result::Ok();
}

Result FileWriter::Close() {
    auto r = fd_.Close();
    if (!r.is_ok()) r.msg += ": " + path_;
    return r;
}

} // namespace updsrv
