#include "io/file_copy.hpp"

#include "io/file_reader.hpp"
#include "io/file_writer.hpp"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <filesystem>
#include <sys/stat.h>
#include <vector>

namespace updsrv {

namespace fs = std::filesystem;

Result CopyFile(const std::string& src,
                const std::string& dst,
                const CancelToken& cancel,
                std::uint64_t* copied) {
    struct stat st{};
    if (::stat(src.c_str(), &st) != 0) {
        const int err = errno;
        return Result::Fail(err == ENOENT ? ErrorKind::NotFound : ErrorKind::Io,
                            "stat failed: " + src + " (" + std::strerror(err) + ")");
    }

    FileReader reader;
    auto r = FileReader::Open(src, reader);
    if (!r.is_ok()) return r;

    FileWriter writer;
    r = FileWriter::Open(dst, writer, (st.st_mode & S_IXUSR) ? 0755 : 0644);
    if (!r.is_ok()) return r;

    std::vector<std::uint8_t> buf(64 * 1024);
    std::uint64_t total = 0;
    for (;;) {
        if (cancel.IsCancelled()) return Result::Fail(ErrorKind::Cancelled, "copy cancelled: " + src);

        const ssize_t n = reader.Read(buf);
        if (n < 0) return Result::Fail(errno, "read failed: " + src);
        if (n == 0) break;

        r = writer.WriteAll(std::span<const std::uint8_t>(buf.data(), static_cast<size_t>(n)));
        if (!r.is_ok()) return r;
        total += static_cast<std::uint64_t>(n);
    }

    r = writer.Close();
    if (!r.is_ok()) return r;

    if (copied) *copied = total;
    return Result::Ok();
}

Result CopyTree(const std::string& src_dir, const std::string& dst_dir, const CancelToken& cancel) {
    const fs::path root(src_dir);
    std::error_code ec;
    if (!fs::is_directory(root, ec)) {
        return Result::Fail(ErrorKind::NotFound, "Directory not found: " + src_dir);
    }

    std::vector<fs::path> files;
    for (fs::recursive_directory_iterator it(root, ec), end; !ec && it != end; it.increment(ec)) {
        if (it->is_regular_file(ec)) files.push_back(it->path());
    }
    if (ec) return Result::Fail(ErrorKind::Io, "cannot walk " + src_dir + ": " + ec.message());
    std::sort(files.begin(), files.end());

    for (const auto& file : files) {
        const fs::path dst = fs::path(dst_dir) / fs::relative(file, root);
        fs::create_directories(dst.parent_path(), ec);
        if (ec) return Result::Fail(ErrorKind::Io, "mkdir failed: " + dst.parent_path().string());

        auto r = CopyFile(file.string(), dst.string(), cancel);
        if (!r.is_ok()) return r;
    }
    return Result::Ok();
}

} // namespace updsrv
