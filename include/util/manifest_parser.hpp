#pragma once

#include "util/manifest.hpp"

#include <expected>
#include <string>

namespace updsrv {

class ManifestParser {
  public:
    std::expected<UpgradeManifest, std::string> Parse(const std::string& json_input) const;

    // camelCase JSON, indented for readability on the client.
    static std::string Serialize(const UpgradeManifest& manifest);
    static std::string Serialize(const PackageManifest& manifest);
};

} // namespace updsrv
