#pragma once

#include <cstdint>
#include <ctime>
#include <expected>
#include <string>
#include <string_view>
#include <vector>

namespace updsrv {

enum class PrereleaseTag : int {
    None = 0,
    Alpha,
    Beta,
    Preview,
    Rc,
};

// Version identifier of an app or updater artifact:
// [v]N.N[.N[.N]][-tag[.buildId]], tag one of alpha, beta, preview, rc.
class AppVersion {
public:
    AppVersion() = default;
    AppVersion(std::uint32_t major, std::uint32_t minor, std::uint32_t patch);

    static std::expected<AppVersion, std::string> Parse(std::string_view text);

    // <0, 0, >0. Missing trailing components count as 0, a release outranks
    // every pre-release with the same numbers, alpha < beta == preview < rc.
    static int Compare(const AppVersion& a, const AppVersion& b);

    // Two-level ordering used when ranking files: version first, then the
    // modification time as secondary key.
    static int CompareWithTime(const AppVersion& a, std::time_t a_mtime,
                               const AppVersion& b, std::time_t b_mtime);

    static int TagRank(PrereleaseTag tag);
    static const char* TagName(PrereleaseTag tag);

    std::string ToString() const;

    const std::vector<std::uint32_t>& Components() const { return components_; }
    PrereleaseTag Tag() const { return tag_; }
    const std::string& BuildId() const { return build_id_; }
    bool IsPrerelease() const { return tag_ != PrereleaseTag::None; }

    bool operator==(const AppVersion& o) const { return Compare(*this, o) == 0; }
    bool operator!=(const AppVersion& o) const { return Compare(*this, o) != 0; }
    bool operator<(const AppVersion& o) const { return Compare(*this, o) < 0; }
    bool operator<=(const AppVersion& o) const { return Compare(*this, o) <= 0; }
    bool operator>(const AppVersion& o) const { return Compare(*this, o) > 0; }
    bool operator>=(const AppVersion& o) const { return Compare(*this, o) >= 0; }

private:
    std::vector<std::uint32_t> components_{0, 0, 0};
    PrereleaseTag tag_ = PrereleaseTag::None;
    std::string build_id_;
};

} // namespace updsrv
