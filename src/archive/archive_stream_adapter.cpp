#include "archive/archive_stream_adapter.hpp"

#include <cerrno>

namespace updsrv {

la_ssize_t ArchiveReaderBridge::ReadCb(archive* ar, void* client_data, const void** out_buf) {
    auto* self = static_cast<ArchiveReaderBridge*>(client_data);
    if (self->cancel_.IsCancelled()) {
        self->cancelled_ = true;
        archive_set_error(ar, EINTR, "cancelled");
        return -1;
    }

    const ssize_t n = self->reader_.Read(std::span<std::uint8_t>(self->buffer_.data(), self->buffer_.size()));
    if (n < 0) {
        self->read_failed_ = true;
        archive_set_error(ar, EIO, "read error on archive input");
        return -1;
    }

    *out_buf = self->buffer_.data();
    return static_cast<la_ssize_t>(n);
}

int ArchiveReaderBridge::Open(archive* ar) {
    return archive_read_open(ar, this, nullptr, ReadCb, nullptr);
}

la_ssize_t ArchiveWriterBridge::WriteCb(archive* aw, void* client_data, const void* buf, size_t len) {
    auto* self = static_cast<ArchiveWriterBridge*>(client_data);
    if (self->cancel_.IsCancelled()) {
        if (self->sink_res_.is_ok()) {
            self->sink_res_ = Result::Fail(ErrorKind::Cancelled, "archive encoding cancelled");
        }
        archive_set_error(aw, EINTR, "cancelled");
        return -1;
    }

    auto r = self->writer_.WriteAll(std::span<const std::uint8_t>(static_cast<const std::uint8_t*>(buf), len));
    if (!r.is_ok()) {
        archive_set_error(aw, r.err > 0 ? r.err : EIO, "%s", r.msg.c_str());
        self->sink_res_ = std::move(r);
        return -1;
    }
    return static_cast<la_ssize_t>(len);
}

int ArchiveWriterBridge::Open(archive* aw) {
    return archive_write_open(aw, this, nullptr, WriteCb, nullptr);
}

std::string ArchiveErr(archive* ar) {
    const char* s = ar ? archive_error_string(ar) : nullptr;
    return s ? std::string(s) : std::string("unknown");
}

} // namespace updsrv
