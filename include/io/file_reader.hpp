#pragma once

#include "io/fd.hpp"
#include "io/io.hpp"
#include "util/result.hpp"

#include <cstdint>
#include <optional>
#include <span>
#include <string>

namespace updsrv {

class FileReader final : public IReader {
public:
    static Result Open(std::string path, FileReader& out);

    // Whole file into `out`; InvalidInput when it exceeds `max_bytes`.
    static Result ReadText(const std::string& path, std::string& out, std::uint64_t max_bytes = 1 << 20);

    std::optional<std::uint64_t> TotalSize() const override { return size_; }
    ssize_t Read(std::span<std::uint8_t> out) override;

    const std::string& Path() const { return path_; }

private:
    std::string path_;
    Fd fd_;
    std::optional<std::uint64_t> size_;
};

} // namespace updsrv
