#include "util/manifest_parser.hpp"

#include <nlohmann/json.hpp>

namespace updsrv {

using json = nlohmann::json;

namespace {

constexpr int kJsonIndent = 2;

std::optional<std::string> OptString(const json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) return std::nullopt;
    return it->get<std::string>();
}

std::vector<std::string> StringList(const json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) return {};
    if (!it->is_array()) throw std::invalid_argument(std::string("'") + key + "' must be an array");
    return it->get<std::vector<std::string>>();
}

std::expected<std::vector<FileDirective>, std::string> ParseFilesArray(const json& arr) {
    if (!arr.is_array()) {
        return std::unexpected("'files' must be an array");
    }

    std::vector<FileDirective> out;
    out.reserve(arr.size());

    for (const auto& item : arr) {
        if (!item.is_object()) return std::unexpected("'files' entries must be objects");
        FileDirective f;
        f.path = item.value("path", "");
        f.target = OptString(item, "target");
        f.permissions = item.contains("permissions") && item["permissions"].is_string()
                            ? item["permissions"].get<std::string>()
                            : "";
        f.required = item.value("required", false);
        f.executable = item.value("executable", false);
        f.explode = item.value("explode", false);
        f.backup = item.value("backup", false);
        f.run_order = item.value("runOrder", 0);
        const auto size = item.value("size", 0LL);
        if (size < 0) return std::unexpected("negative file size for: " + f.path);
        f.size = static_cast<std::uint64_t>(size);
        f.checksum = OptString(item, "checksum").value_or("");
        if (f.path.empty()) return std::unexpected("file directive missing path");
        out.push_back(std::move(f));
    }

    return out;
}

void ApplyKind(UpgradeManifest& m) {
    auto it = m.metadata.find(kMetadataTypeKey);
    if (it == m.metadata.end()) return;

    std::string type;
    try {
        const auto v = json::parse(it->second);
        if (v.is_string()) type = v.get<std::string>();
    } catch (const json::exception&) {
        return;
    }

    if (type == kAppUpdateType) {
        m.kind = AppUpdate{.target_version = m.version};
    } else if (type == kSelfUpdateType) {
        SelfUpdate s{.updater_version = m.version, .staging_dir = {}};
        if (!m.files.empty() && m.files.front().target) s.staging_dir = *m.files.front().target;
        m.kind = s;
    }
}

json ToJson(const UpgradeManifest& m) {
    json j;
    j["id"] = m.id;
    j["name"] = m.name;
    j["description"] = m.description;
    j["version"] = m.version;
    j["type"] = m.type.empty() ? json() : json(m.type);
    if (m.applies_to) {
        json r;
        r["minVersion"] = m.applies_to->min_version ? json(*m.applies_to->min_version) : json();
        r["maxVersion"] = m.applies_to->max_version ? json(*m.applies_to->max_version) : json();
        r["excludeVersions"] = m.applies_to->exclude_versions;
        j["appliesTo"] = r;
    } else {
        j["appliesTo"] = nullptr;
    }
    j["targetVersion"] = m.target_version ? json(*m.target_version) : json();
    j["priority"] = m.priority;
    j["dependencies"] = m.dependencies;
    j["conflicts"] = m.conflicts;
    if (m.storage) {
        j["storage"] = {{"type", m.storage->type},
                        {"basePath", m.storage->base_path},
                        {"path", m.storage->path}};
    } else {
        j["storage"] = nullptr;
    }

    json files = json::array();
    for (const auto& f : m.files) {
        files.push_back({{"path", f.path},
                         {"target", f.target ? json(*f.target) : json()},
                         {"permissions", f.permissions.empty() ? json() : json(f.permissions)},
                         {"required", f.required},
                         {"executable", f.executable},
                         {"explode", f.explode},
                         {"backup", f.backup},
                         {"runOrder", f.run_order},
                         {"size", f.size},
                         {"checksum", f.checksum.empty() ? json() : json(f.checksum)}});
    }
    j["files"] = files;

    j["preInstallScript"] = m.pre_install_script ? json(*m.pre_install_script) : json();
    j["postInstallScript"] = m.post_install_script ? json(*m.post_install_script) : json();
    j["rollbackScript"] = m.rollback_script ? json(*m.rollback_script) : json();
    if (m.checksum) {
        j["checksum"] = {{"algorithm", m.checksum->algorithm}, {"value", m.checksum->value}};
    } else {
        j["checksum"] = nullptr;
    }

    json meta = json::object();
    for (const auto& [key, value] : m.metadata) {
        meta[key] = json::parse(value, nullptr, /*allow_exceptions=*/false);
        if (meta[key].is_discarded()) meta[key] = value;
    }
    if (std::holds_alternative<AppUpdate>(m.kind)) {
        meta[kMetadataTypeKey] = kAppUpdateType;
    } else if (std::holds_alternative<SelfUpdate>(m.kind)) {
        meta[kMetadataTypeKey] = kSelfUpdateType;
    }
    j["metadata"] = meta.empty() ? json() : meta;
    return j;
}

} // namespace

std::expected<UpgradeManifest, std::string> ManifestParser::Parse(const std::string& json_input) const {
    try {
        if (json_input.find_first_not_of(" \t\n\r") == std::string::npos) {
            return std::unexpected("Empty input");
        }

        auto j = json::parse(json_input);
        if (!j.is_object()) {
            return std::unexpected("JSON root must be an object");
        }

        UpgradeManifest m;
        m.id = OptString(j, "id").value_or("");
        if (m.id.empty()) return std::unexpected("manifest missing id");
        m.name = OptString(j, "name").value_or("");
        m.description = OptString(j, "description").value_or("");
        m.version = OptString(j, "version").value_or("");
        m.type = OptString(j, "type").value_or("");
        m.target_version = OptString(j, "targetVersion");
        m.priority = j.value("priority", 0);
        m.dependencies = StringList(j, "dependencies");
        m.conflicts = StringList(j, "conflicts");
        m.pre_install_script = OptString(j, "preInstallScript");
        m.post_install_script = OptString(j, "postInstallScript");
        m.rollback_script = OptString(j, "rollbackScript");

        if (auto it = j.find("appliesTo"); it != j.end() && !it->is_null()) {
            if (!it->is_object()) return std::unexpected("'appliesTo' must be an object");
            VersionRange r;
            r.min_version = OptString(*it, "minVersion");
            r.max_version = OptString(*it, "maxVersion");
            r.exclude_versions = StringList(*it, "excludeVersions");
            m.applies_to = std::move(r);
        }

        if (auto it = j.find("storage"); it != j.end() && !it->is_null()) {
            if (!it->is_object()) return std::unexpected("'storage' must be an object");
            m.storage = UpgradeStorage{.type = OptString(*it, "type").value_or(""),
                                       .base_path = OptString(*it, "basePath").value_or(""),
                                       .path = OptString(*it, "path").value_or("")};
        }

        if (auto it = j.find("files"); it != j.end() && !it->is_null()) {
            auto parsed = ParseFilesArray(*it);
            if (!parsed)
                return std::unexpected(parsed.error());
            m.files = std::move(*parsed);
        }

        if (auto it = j.find("checksum"); it != j.end() && !it->is_null()) {
            if (!it->is_object()) return std::unexpected("'checksum' must be an object");
            m.checksum = UpgradeChecksum{.algorithm = OptString(*it, "algorithm").value_or(""),
                                         .value = OptString(*it, "value").value_or("")};
        }

        if (auto it = j.find("metadata"); it != j.end() && !it->is_null()) {
            if (!it->is_object()) return std::unexpected("'metadata' must be an object");
            for (const auto& [key, val] : it->items()) {
                m.metadata.emplace(key, val.dump());
            }
        }

        ApplyKind(m);
        return m;
    } catch (const json::parse_error& e) {
        return std::unexpected(std::string("Syntax Error: ") + e.what());
    } catch (const std::exception& e) {
        return std::unexpected(std::string("Internal Error: ") + e.what());
    }
}

std::string ManifestParser::Serialize(const UpgradeManifest& manifest) {
    return ToJson(manifest).dump(kJsonIndent);
}

std::string ManifestParser::Serialize(const PackageManifest& manifest) {
    json j;
    j["fromVersion"] = manifest.from_version;
    j["toVersion"] = manifest.to_version;
    j["upgrades"] = manifest.upgrades;
    return j.dump(kJsonIndent);
}

} // namespace updsrv
