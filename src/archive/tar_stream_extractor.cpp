#include "archive/tar_stream_extractor.hpp"

#include "archive/archive_path_policy.hpp"
#include "archive/archive_stream_adapter.hpp"
#include "io/fd.hpp"
#include "util/logger.hpp"

#include <archive_entry.h>

#include <filesystem>

namespace updsrv {

namespace {

// Maps a libarchive read failure onto our error kinds.
Result ReadFailure(const ArchiveReaderBridge& bridge, archive* ar, const char* where) {
    if (bridge.Cancelled()) return Result::Fail(ErrorKind::Cancelled, "extraction cancelled");
    if (bridge.ReadFailed()) return Result::Fail(ErrorKind::Io, std::string(where) + ": " + ArchiveErr(ar));
    return Result::Fail(ErrorKind::CorruptAsset, std::string(where) + ": " + ArchiveErr(ar));
}

Result DiskFailure(archive* aw, const char* where) {
    const int e = archive_errno(aw);
    return Result::Fail(e > 0 ? ErrorKindFromErrno(e) : ErrorKind::Io, std::string(where) + ": " + ArchiveErr(aw));
}

} // namespace

Result TarStreamExtractor::ExtractToDir(IReader& tar_stream,
                                        const std::string& dst_dir,
                                        std::string_view tag,
                                        Stats* stats) const {
    namespace fs = std::filesystem;

    if (cancel_.IsCancelled()) return Result::Fail(ErrorKind::Cancelled, "extraction cancelled");

    const fs::path base_dir(dst_dir);
    std::error_code ec;
    fs::create_directories(base_dir, ec);
    if (!fs::is_directory(base_dir, ec)) {
        return Result::Fail(ErrorKind::Io, "Destination path is not a directory: " + dst_dir);
    }

    // Declared before the handles so it outlives archive_read_free.
    ArchiveReaderBridge bridge(tar_stream, cancel_);

    ArchiveReadPtr ar(archive_read_new());
    if (!ar) return Result::Fail(ErrorKind::Io, "archive_read_new failed");
    archive_read_support_filter_all(ar.get());
    archive_read_support_format_tar(ar.get());
    archive_read_support_format_gnutar(ar.get());

    if (bridge.Open(ar.get()) != ARCHIVE_OK) return ReadFailure(bridge, ar.get(), "archive_read_open");

    ArchiveWritePtr aw(archive_write_disk_new());
    if (!aw) return Result::Fail(ErrorKind::Io, "archive_write_disk_new failed");

    int flags = 0;
    flags |= ARCHIVE_EXTRACT_UNLINK;
    flags |= ARCHIVE_EXTRACT_PERM;
    flags |= ARCHIVE_EXTRACT_TIME;
    flags |= ARCHIVE_EXTRACT_SECURE_NODOTDOT;
    flags |= ARCHIVE_EXTRACT_SECURE_SYMLINKS;
    // Entry paths are rewritten to absolute paths under dst_dir, so
    // NOABSOLUTEPATHS would reject every valid target.
    archive_write_disk_set_options(aw.get(), flags);
    archive_write_disk_set_standard_lookup(aw.get());

    Stats local;
    Stats& st = stats ? *stats : local;
    const ArchivePathPolicy path_policy(base_dir);

    archive_entry* entry = nullptr;
    while (true) {
        if (cancel_.IsCancelled()) return Result::Fail(ErrorKind::Cancelled, "extraction cancelled");

        const int r = archive_read_next_header(ar.get(), &entry);
        if (r == ARCHIVE_EOF) break;
        if (r == ARCHIVE_WARN) {
            LogWarn("[%.*s] %s", (int)tag.size(), tag.data(), ArchiveErr(ar.get()).c_str());
        } else if (r != ARCHIVE_OK) {
            return ReadFailure(bridge, ar.get(), "archive_read_next_header");
        }

        const char* raw = archive_entry_pathname(entry);
        const std::string name = raw ? raw : "";
        const auto type = archive_entry_filetype(entry);

        std::string rel;
        fs::path target;
        if (!path_policy.ResolveEntryPath(name, rel, target).is_ok()) {
            LogWarn("[%.*s] skipping entry with suspicious path: %s", (int)tag.size(), tag.data(), name.c_str());
            st.skipped.push_back(name);
            if (archive_read_data_skip(ar.get()) != ARCHIVE_OK) {
                return ReadFailure(bridge, ar.get(), "archive_read_data_skip");
            }
            continue;
        }

        if (rel.empty() || (type != AE_IFREG && type != AE_IFDIR)) {
            LogDebug("[%.*s] ignoring entry: %s", (int)tag.size(), tag.data(), name.c_str());
            if (archive_read_data_skip(ar.get()) != ARCHIVE_OK) {
                return ReadFailure(bridge, ar.get(), "archive_read_data_skip");
            }
            continue;
        }

        archive_entry_set_pathname(entry, target.c_str());
        const auto perm = archive_entry_perm(entry) & 0777;
        if (type == AE_IFDIR) {
            // Directories must stay traversable for the entries that follow.
            archive_entry_set_perm(entry, perm == 0 ? 0755 : (perm | 0700));
        } else if (perm == 0) {
            archive_entry_set_perm(entry, 0644);
        }

        if (archive_write_header(aw.get(), entry) != ARCHIVE_OK) {
            return DiskFailure(aw.get(), "archive_write_header");
        }

        std::uint64_t entry_bytes = 0;
        const void* buff = nullptr;
        size_t size = 0;
        la_int64_t offset = 0;
        while (true) {
            const int rr = archive_read_data_block(ar.get(), &buff, &size, &offset);
            if (rr == ARCHIVE_EOF) break;
            if (rr != ARCHIVE_OK) return ReadFailure(bridge, ar.get(), "archive_read_data_block");

            if (archive_write_data_block(aw.get(), buff, size, offset) != ARCHIVE_OK) {
                return DiskFailure(aw.get(), "archive_write_data_block");
            }
            entry_bytes += static_cast<std::uint64_t>(size);
        }

        if (archive_write_finish_entry(aw.get()) != ARCHIVE_OK) {
            return DiskFailure(aw.get(), "archive_write_finish_entry");
        }

        if (type == AE_IFREG) {
            LogDebug("[%.*s] entry: %s (%llu bytes)",
                     (int)tag.size(), tag.data(), target.c_str(), (unsigned long long)entry_bytes);
            ++st.files_written;
            st.bytes_written += entry_bytes;
        }
    }

    if (archive_write_close(aw.get()) != ARCHIVE_OK) return DiskFailure(aw.get(), "archive_write_close");
    return Result::Ok();
}

} // namespace updsrv
