#include "io/file_reader.hpp"

#include <array>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace updsrv {

Result FileReader::Open(std::string path, FileReader& out) {
    out.path_ = std::move(path);
    out.size_.reset();

    auto r = Fd::Open(out.path_, O_RDONLY, 0, "input", out.fd_);
    if (!r.is_ok()) return r;

    struct stat st{};
    if (::fstat(out.fd_.Get(), &st) == 0 && S_ISREG(st.st_mode)) {
        out.size_ = static_cast<std::uint64_t>(st.st_size);
    }
    return Result::Ok();
}

Result FileReader::ReadText(const std::string& path, std::string& out, std::uint64_t max_bytes) {
    out.clear();

    FileReader reader;
    auto r = Open(path, reader);
    if (!r.is_ok()) return r;
    if (reader.size_ && *reader.size_ > max_bytes) {
        return Result::Fail(ErrorKind::InvalidInput, "file too large: " + path);
    }

    std::array<std::uint8_t, 8192> buf{};
    while (true) {
        const ssize_t n = reader.Read(buf);
        if (n < 0) {
            const int e = errno;
            return Result::Fail(e, "read failed: " + path + " (" + std::strerror(e) + ")");
        }
        if (n == 0) break;
        out.append(reinterpret_cast<const char*>(buf.data()), static_cast<std::size_t>(n));
        if (out.size() > max_bytes) return Result::Fail(ErrorKind::InvalidInput, "file too large: " + path);
    }
    return Result::Ok();
}

ssize_t FileReader::Read(std::span<std::uint8_t> out) {
    while (true) {
        const ssize_t n = ::read(fd_.Get(), out.data(), out.size());
        if (n >= 0 || errno != EINTR) return n;
    }
}

} // namespace updsrv
