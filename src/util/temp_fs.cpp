#include "util/temp_fs.hpp"

#include "io/fd.hpp"
#include "util/logger.hpp"

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <unistd.h>
#include <vector>

namespace updsrv {

namespace fs = std::filesystem;

namespace {

std::vector<char> Template(const std::string& dir, std::string_view prefix, std::string_view suffix) {
    const std::string tmpl = (fs::path(dir) / (std::string(prefix) + "XXXXXX" + std::string(suffix))).string();
    std::vector<char> buf(tmpl.begin(), tmpl.end());
    buf.push_back('\0');
    return buf;
}

} // namespace

std::string TempRoot() {
    std::error_code ec;
    auto p = fs::temp_directory_path(ec);
    if (ec || p.empty()) return "/tmp";
    return p.string();
}

Result ScratchDir::Create(const std::string& base_dir, std::string_view prefix, ScratchDir& out) {
    std::error_code ec;
    fs::create_directories(base_dir, ec);

    auto buf = Template(base_dir, prefix, "");
    char* created = ::mkdtemp(buf.data());
    if (!created) {
        const int err = errno;
        return Result::Fail(err, "mkdtemp failed: " + std::string(std::strerror(err)));
    }

    ScratchDir d;
    d.path_ = created;
    out = std::move(d);
    return Result::Ok();
}

ScratchDir::ScratchDir(ScratchDir&& other) noexcept { *this = std::move(other); }

ScratchDir& ScratchDir::operator=(ScratchDir&& other) noexcept {
    if (this != &other) {
        Cleanup();
        path_ = std::move(other.path_);
        other.path_.clear();
    }
    return *this;
}

ScratchDir::~ScratchDir() { Cleanup(); }

void ScratchDir::Cleanup() {
    if (path_.empty()) return;
    std::error_code ec;
    fs::remove_all(path_, ec);
    if (ec) LogWarn("failed to remove scratch dir %s: %s", path_.c_str(), ec.message().c_str());
    path_.clear();
}

Result TempFile::Create(const std::string& dir,
                        std::string_view prefix,
                        std::string_view suffix,
                        TempFile& out) {
    auto buf = Template(dir, prefix, suffix);
    Fd fd(::mkstemps(buf.data(), static_cast<int>(suffix.size())));
    if (!fd.Valid()) {
        const int err = errno;
        Result r = Result::Fail(ErrorKindFromErrno(err),
                                "cannot create file in " + dir + " (" + std::strerror(err) + ")");
        r.err = err;
        return r;
    }

    TempFile t;
    t.path_ = buf.data();
    out = std::move(t);
    return Result::Ok();
}

TempFile::TempFile(TempFile&& other) noexcept { *this = std::move(other); }

TempFile& TempFile::operator=(TempFile&& other) noexcept {
    if (this != &other) {
        Cleanup();
        path_ = std::move(other.path_);
        other.path_.clear();
    }
    return *this;
}

TempFile::~TempFile() { Cleanup(); }

std::string TempFile::Release() {
    std::string p = std::move(path_);
    path_.clear();
    return p;
}

void TempFile::Cleanup() {
    if (path_.empty()) return;
    ::unlink(path_.c_str());
    path_.clear();
}

} // namespace updsrv
