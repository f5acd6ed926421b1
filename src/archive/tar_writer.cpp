#include "archive/tar_writer.hpp"

#include "io/fd.hpp"
#include "io/file_reader.hpp"
#include "util/logger.hpp"

#include <archive_entry.h>

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <filesystem>
#include <memory>
#include <sys/stat.h>
#include <vector>

namespace updsrv {

namespace fs = std::filesystem;

namespace {

struct ArchiveEntryDeleter {
    void operator()(archive_entry* e) const {
        if (e) archive_entry_free(e);
    }
};

} // namespace

TarWriter::TarWriter(IWriter& out, CancelToken cancel)
    : cancel_(cancel), bridge_(out, std::move(cancel)) {}

Result TarWriter::Failure(const char* where) const {
    if (!bridge_.SinkResult().is_ok()) return bridge_.SinkResult();
    return Result::Fail(ErrorKind::Io, std::string(where) + ": " + ArchiveErr(aw_.get()));
}

Result TarWriter::EnsureOpen() {
    if (opened_) return Result::Ok();

    aw_.reset(archive_write_new());
    if (!aw_) return Result::Fail(ErrorKind::Io, "archive_write_new failed");
    if (archive_write_set_format_pax_restricted(aw_.get()) != ARCHIVE_OK) return Failure("archive_write_set_format");
    if (archive_write_add_filter_none(aw_.get()) != ARCHIVE_OK) return Failure("archive_write_add_filter");
    // No padding to a 10K record; the gzip layer has no use for it.
    archive_write_set_bytes_in_last_block(aw_.get(), 1);
    if (bridge_.Open(aw_.get()) != ARCHIVE_OK) return Failure("archive_write_open");

    opened_ = true;
    return Result::Ok();
}

Result TarWriter::AddFile(const std::string& entry_name, const std::string& source_path) {
    if (finished_) return Result::Fail(ErrorKind::Io, "tar stream already finished");
    if (cancel_.IsCancelled()) return Result::Fail(ErrorKind::Cancelled, "archive encoding cancelled");

    struct stat st{};
    if (::stat(source_path.c_str(), &st) != 0) {
        const int e = errno;
        return Result::Fail(ErrorKindFromErrno(e), "stat failed: " + source_path + " (" + std::strerror(e) + ")");
    }
    if (!S_ISREG(st.st_mode)) {
        return Result::Fail(ErrorKind::InvalidInput, "not a regular file: " + source_path);
    }

    FileReader reader;
    auto r = FileReader::Open(source_path, reader);
    if (!r.is_ok()) return r;

    r = EnsureOpen();
    if (!r.is_ok()) return r;

    std::unique_ptr<archive_entry, ArchiveEntryDeleter> hdr(archive_entry_new());
    if (!hdr) return Result::Fail(ErrorKind::Io, "archive_entry_new failed");
    const auto size = static_cast<std::uint64_t>(st.st_size);
    archive_entry_set_pathname(hdr.get(), entry_name.c_str());
    archive_entry_set_filetype(hdr.get(), AE_IFREG);
    archive_entry_set_perm(hdr.get(), (st.st_mode & S_IXUSR) ? 0755 : 0644);
    archive_entry_set_size(hdr.get(), static_cast<la_int64_t>(size));
    archive_entry_set_mtime(hdr.get(), st.st_mtime, 0);

    if (archive_write_header(aw_.get(), hdr.get()) != ARCHIVE_OK) return Failure("archive_write_header");

    std::vector<std::uint8_t> buf(64 * 1024);
    std::uint64_t remaining = size;
    while (remaining > 0) {
        if (cancel_.IsCancelled()) return Result::Fail(ErrorKind::Cancelled, "archive encoding cancelled");

        const size_t want = static_cast<size_t>(std::min<std::uint64_t>(remaining, buf.size()));
        const ssize_t n = reader.Read(std::span<std::uint8_t>(buf.data(), want));
        if (n < 0) return Result::Fail(errno, "read failed: " + source_path);
        if (n == 0) {
            return Result::Fail(ErrorKind::Io, "file shrank while archiving: " + source_path);
        }
        if (archive_write_data(aw_.get(), buf.data(), static_cast<size_t>(n)) != n) {
            return Failure("archive_write_data");
        }
        remaining -= static_cast<std::uint64_t>(n);
    }

    if (archive_write_finish_entry(aw_.get()) != ARCHIVE_OK) return Failure("archive_write_finish_entry");

    ++entries_;
    LogDebug("tar: added %s (%llu bytes)", entry_name.c_str(), (unsigned long long)size);
    return Result::Ok();
}

Result TarWriter::AddDirectory(const std::string& root_dir) {
    const fs::path root(root_dir);
    std::error_code ec;
    if (!fs::is_directory(root, ec)) {
        return Result::Fail(ErrorKind::NotFound, "Source directory does not exist: " + root_dir);
    }

    std::vector<std::pair<std::string, std::string>> files;
    for (fs::recursive_directory_iterator it(root, ec), end; !ec && it != end; it.increment(ec)) {
        if (!it->is_regular_file(ec)) continue;
        files.emplace_back(fs::relative(it->path(), root).generic_string(), it->path().string());
    }
    if (ec) return Result::Fail(ErrorKind::Io, "cannot walk " + root_dir + ": " + ec.message());

    std::sort(files.begin(), files.end());
    for (const auto& [rel, abs] : files) {
        auto r = AddFile(rel, abs);
        if (!r.is_ok()) return r;
    }
    return Result::Ok();
}

Result TarWriter::Finish() {
    if (finished_) return Result::Ok();
    auto r = EnsureOpen();
    if (!r.is_ok()) return r;
    finished_ = true;
    if (archive_write_close(aw_.get()) != ARCHIVE_OK) return Failure("archive_write_close");
    return Result::Ok();
}

} // namespace updsrv
