#pragma once

#include "io/io.hpp"
#include "util/cancel.hpp"
#include "util/result.hpp"

#include <archive.h>

#include <memory>
#include <string>
#include <vector>

namespace updsrv {

struct ArchiveReadDeleter {
    void operator()(archive* a) const {
        if (a) archive_read_free(a);
    }
};

struct ArchiveWriteDeleter {
    void operator()(archive* a) const {
        if (a) archive_write_free(a);
    }
};

using ArchiveReadPtr = std::unique_ptr<archive, ArchiveReadDeleter>;
using ArchiveWritePtr = std::unique_ptr<archive, ArchiveWriteDeleter>;

// Feeds libarchive from an IReader. Must outlive the archive it is opened on.
class ArchiveReaderBridge {
  public:
    ArchiveReaderBridge(IReader& reader, CancelToken cancel, size_t buffer_size = 64 * 1024)
        : reader_(reader), cancel_(std::move(cancel)), buffer_(buffer_size) {}

    int Open(archive* ar);

    bool Cancelled() const { return cancelled_; }
    bool ReadFailed() const { return read_failed_; }

  private:
    static la_ssize_t ReadCb(archive*, void* client_data, const void** out_buf);

    IReader& reader_;
    CancelToken cancel_;
    std::vector<std::uint8_t> buffer_;
    bool cancelled_ = false;
    bool read_failed_ = false;
};

// Drains libarchive output into an IWriter. The first sink failure is kept
// so callers can report it instead of libarchive's generic message.
class ArchiveWriterBridge {
  public:
    ArchiveWriterBridge(IWriter& writer, CancelToken cancel) : writer_(writer), cancel_(std::move(cancel)) {}

    int Open(archive* aw);

    const Result& SinkResult() const { return sink_res_; }

  private:
    static la_ssize_t WriteCb(archive*, void* client_data, const void* buf, size_t len);

    IWriter& writer_;
    CancelToken cancel_;
    Result sink_res_ = Result::Ok();
};

std::string ArchiveErr(archive* ar);

} // namespace updsrv
