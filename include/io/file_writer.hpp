#pragma once

#include "io/fd.hpp"
#include "io/io.hpp"
#include "util/result.hpp"

#include <span>
#include <string>

namespace updsrv {

// Writes a regular file, created (or truncated) with the given mode.
class FileWriter final : public IWriter {
  public:
    static Result Open(std::string path, FileWriter& out, unsigned mode = 0644);

    Result WriteAll(std::span<const std::uint8_t> in) override;
    Result FsyncNow() override;
    Result Close();

    const std::string& Path() const { return path_; }

  private:
    std::string path_;
    Fd fd_;
};

} // namespace updsrv
