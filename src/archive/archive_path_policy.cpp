#include "archive/archive_path_policy.hpp"

#include "util/path_utils.hpp"

namespace updsrv {

Result ArchivePathPolicy::ResolveEntryPath(const std::string& raw_path,
                                           std::string& out_relative,
                                           std::filesystem::path& out_absolute) const {
    out_relative = NormalizeTarPath(raw_path);
    while (!out_relative.empty() && out_relative.back() == '/') out_relative.pop_back();
    if (out_relative.empty() || out_relative == ".") {
        out_relative.clear();
        out_absolute = root_;
        return Result::Ok();
    }

    namespace fs = std::filesystem;
    out_absolute = (root_ / fs::path(out_relative)).lexically_normal();
    const fs::path inside = fs::absolute(out_absolute).lexically_relative(fs::absolute(root_).lexically_normal());
    if (!IsWithinRoot(root_, out_absolute) || inside.empty() || inside == ".") {
        return Result::Fail(ErrorKind::InvalidInput, "Unsafe path in archive: " + out_relative);
    }
    return Result::Ok();
}

} // namespace updsrv
