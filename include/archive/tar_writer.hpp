#pragma once

#include "archive/archive_stream_adapter.hpp"
#include "io/io.hpp"
#include "util/cancel.hpp"
#include "util/result.hpp"

#include <cstdint>
#include <string>

namespace updsrv {

// Streams a POSIX (pax restricted) TAR archive of regular files into a writer
// through libarchive. Compression is left to the writer.
//
// Headers are plain ustar wherever the entry fits: the checksum field holds
// six octal digits followed by NUL then space. Names longer than the ustar
// name/prefix split allows go into a pax extended header (typeflag 'x')
// ahead of the entry; GNU longlink records are never emitted.
class TarWriter {
  public:
    explicit TarWriter(IWriter& out, CancelToken cancel = {});

    TarWriter(const TarWriter&) = delete;
    TarWriter& operator=(const TarWriter&) = delete;

    Result AddFile(const std::string& entry_name, const std::string& source_path);

    // Every regular file below `root_dir`, ordered by relative path.
    Result AddDirectory(const std::string& root_dir);

    // Writes the end-of-archive marker. Further AddFile calls fail.
    Result Finish();

    std::uint64_t EntriesWritten() const { return entries_; }

  private:
    Result EnsureOpen();
    Result Failure(const char* where) const;

    CancelToken cancel_;
    ArchiveWriterBridge bridge_;
    ArchiveWritePtr aw_;
    bool opened_ = false;
    bool finished_ = false;
    std::uint64_t entries_ = 0;
};

} // namespace updsrv
