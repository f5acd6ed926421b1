#pragma once

#include "util/result.hpp"

#include <string>
#include <string_view>

namespace updsrv {

// Uniquely named directory removed recursively on destruction.
class ScratchDir {
  public:
    static Result Create(const std::string& base_dir, std::string_view prefix, ScratchDir& out);

    ScratchDir() = default;
    ScratchDir(const ScratchDir&) = delete;
    ScratchDir& operator=(const ScratchDir&) = delete;
    ScratchDir(ScratchDir&& other) noexcept;
    ScratchDir& operator=(ScratchDir&& other) noexcept;
    ~ScratchDir();

    const std::string& Path() const { return path_; }

  private:
    void Cleanup();

    std::string path_;
};

// Uniquely named file (`<dir>/<prefix>XXXXXX<suffix>`), unlinked on
// destruction unless released to the caller.
class TempFile {
  public:
    static Result Create(const std::string& dir,
                         std::string_view prefix,
                         std::string_view suffix,
                         TempFile& out);

    TempFile() = default;
    TempFile(const TempFile&) = delete;
    TempFile& operator=(const TempFile&) = delete;
    TempFile(TempFile&& other) noexcept;
    TempFile& operator=(TempFile&& other) noexcept;
    ~TempFile();

    const std::string& Path() const { return path_; }

    // Stops tracking the file; the caller owns it from now on.
    std::string Release();

  private:
    void Cleanup();

    std::string path_;
};

// Process temp directory, "/tmp" when it cannot be determined.
std::string TempRoot();

} // namespace updsrv
