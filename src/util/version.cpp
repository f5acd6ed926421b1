#include "util/version.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>

namespace updsrv {

namespace {

constexpr std::size_t kMinComponents = 2;
constexpr std::size_t kMaxComponents = 4;

bool ParseTag(std::string_view s, PrereleaseTag& out) {
    std::string lower(s);
    std::transform(lower.begin(), lower.end(), lower.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    if (lower == "alpha") out = PrereleaseTag::Alpha;
    else if (lower == "beta") out = PrereleaseTag::Beta;
    else if (lower == "preview") out = PrereleaseTag::Preview;
    else if (lower == "rc") out = PrereleaseTag::Rc;
    else return false;
    return true;
}

bool IsBuildIdChar(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '.' || c == '_';
}

} // namespace

AppVersion::AppVersion(std::uint32_t major, std::uint32_t minor, std::uint32_t patch)
    : components_{major, minor, patch} {}

std::expected<AppVersion, std::string> AppVersion::Parse(std::string_view text) {
    std::string_view s = text;
    if (!s.empty() && (s.front() == 'v' || s.front() == 'V')) s.remove_prefix(1);
    if (s.empty()) return std::unexpected("empty version string: '" + std::string(text) + "'");

    std::string_view numbers = s;
    std::string_view suffix;
    if (const auto dash = s.find('-'); dash != std::string_view::npos) {
        numbers = s.substr(0, dash);
        suffix = s.substr(dash + 1);
        if (suffix.empty()) return std::unexpected("dangling '-' in version: " + std::string(text));
    }

    AppVersion v;
    v.components_.clear();
    while (true) {
        const auto dot = numbers.find('.');
        const auto part = numbers.substr(0, dot);
        if (part.empty()) return std::unexpected("empty component in version: " + std::string(text));

        std::uint32_t value = 0;
        const auto [ptr, ec] = std::from_chars(part.data(), part.data() + part.size(), value);
        if (ec != std::errc{} || ptr != part.data() + part.size()) {
            return std::unexpected("non-numeric component in version: " + std::string(text));
        }
        v.components_.push_back(value);
        if (v.components_.size() > kMaxComponents) {
            return std::unexpected("too many components in version: " + std::string(text));
        }
        if (dot == std::string_view::npos) break;
        numbers.remove_prefix(dot + 1);
    }
    if (v.components_.size() < kMinComponents) {
        return std::unexpected("version needs at least major.minor: " + std::string(text));
    }

    if (!suffix.empty()) {
        const auto dot = suffix.find('.');
        if (!ParseTag(suffix.substr(0, dot), v.tag_)) {
            return std::unexpected("unknown pre-release tag in version: " + std::string(text));
        }
        if (dot != std::string_view::npos) {
            const auto build = suffix.substr(dot + 1);
            if (build.empty() || !std::all_of(build.begin(), build.end(), IsBuildIdChar)) {
                return std::unexpected("invalid build id in version: " + std::string(text));
            }
            v.build_id_ = std::string(build);
        }
    }

    return v;
}

int AppVersion::TagRank(PrereleaseTag tag) {
    switch (tag) {
        case PrereleaseTag::Alpha:   return 1;
        case PrereleaseTag::Beta:    return 2;
        case PrereleaseTag::Preview: return 2;
        case PrereleaseTag::Rc:      return 3;
        case PrereleaseTag::None:    return 4;
    }
    return 0;
}

const char* AppVersion::TagName(PrereleaseTag tag) {
    switch (tag) {
        case PrereleaseTag::Alpha:   return "alpha";
        case PrereleaseTag::Beta:    return "beta";
        case PrereleaseTag::Preview: return "preview";
        case PrereleaseTag::Rc:      return "rc";
        case PrereleaseTag::None:    return "";
    }
    return "";
}

int AppVersion::Compare(const AppVersion& a, const AppVersion& b) {
    const std::size_t n = std::max(a.components_.size(), b.components_.size());
    for (std::size_t i = 0; i < n; ++i) {
        const std::uint32_t av = i < a.components_.size() ? a.components_[i] : 0;
        const std::uint32_t bv = i < b.components_.size() ? b.components_[i] : 0;
        if (av != bv) return av < bv ? -1 : 1;
    }

    const int ar = TagRank(a.tag_);
    const int br = TagRank(b.tag_);
    if (ar != br) return ar < br ? -1 : 1;
    return 0;
}

int AppVersion::CompareWithTime(const AppVersion& a, std::time_t a_mtime,
                                const AppVersion& b, std::time_t b_mtime) {
    if (const int c = Compare(a, b); c != 0) return c;
    if (a_mtime == b_mtime) return 0;
    return a_mtime < b_mtime ? -1 : 1;
}

std::string AppVersion::ToString() const {
    std::string out;
    const std::size_t n = std::max<std::size_t>(3, components_.size());
    for (std::size_t i = 0; i < n; ++i) {
        if (i) out.push_back('.');
        out += std::to_string(i < components_.size() ? components_[i] : 0);
    }
    if (tag_ != PrereleaseTag::None) {
        out.push_back('-');
        out += TagName(tag_);
        if (!build_id_.empty()) {
            out.push_back('.');
            out += build_id_;
        }
    }
    return out;
}

} // namespace updsrv
