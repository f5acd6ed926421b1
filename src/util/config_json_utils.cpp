#include "util/config_json_utils.hpp"

#include "io/file_reader.hpp"

#include <cstdint>
#include <utility>

namespace updsrv::config::detail {

namespace {

constexpr std::uint64_t kMaxConfigBytes = 256 * 1024;

} // namespace

bool ParseJsonObject(const std::string& text, nlohmann::json& out, std::string& err) {
    try {
        out = nlohmann::json::parse(text);
    } catch (const nlohmann::json::parse_error& e) {
        err = std::string("invalid JSON: ") + e.what();
        return false;
    }
    if (!out.is_object()) {
        err = "root must be JSON object";
        return false;
    }
    return true;
}

bool LoadJsonObjectFromFile(const std::string& path, nlohmann::json& out, std::string& err) {
    std::string text;
    Result r = FileReader::ReadText(path, text, kMaxConfigBytes);
    if (!r.ok) {
        err = "cannot read " + path + ": " + r.msg;
        return false;
    }
    if (!ParseJsonObject(text, out, err)) {
        err += " (" + path + ")";
        return false;
    }
    return true;
}

bool ReadString(const nlohmann::json& j, const char* key, std::string& out, std::string& err) {
    auto it = j.find(key);
    if (it == j.end())
        return true;
    if (!it->is_string()) {
        err = std::string(key) + " must be a string";
        return false;
    }
    out = it->get<std::string>();
    return true;
}

bool ReadNonEmptyString(const nlohmann::json& j, const char* key, std::string& out, std::string& err) {
    std::string value = out;
    if (!ReadString(j, key, value, err))
        return false;
    if (value.empty()) {
        err = std::string(key) + " must not be empty";
        return false;
    }
    out = std::move(value);
    return true;
}

bool ReadStringMap(const nlohmann::json& j,
                   const char* key,
                   std::map<std::string, std::string>& out,
                   std::string& err) {
    auto it = j.find(key);
    if (it == j.end())
        return true;
    if (!it->is_object()) {
        err = std::string(key) + " must be a JSON object";
        return false;
    }
    for (const auto& [name, value] : it->items()) {
        if (!value.is_string()) {
            err = std::string(key) + "." + name + " must be a string";
            return false;
        }
        out[name] = value.get<std::string>();
    }
    return true;
}

bool ReadLogLevel(const nlohmann::json& j, const char* key, std::optional<LogLevel>& out, std::string& err) {
    std::string name;
    auto it = j.find(key);
    if (it == j.end())
        return true;
    if (!ReadString(j, key, name, err))
        return false;
    out = ParseLogLevel(name);
    if (!out) {
        err = std::string("unknown ") + key + ": " + name;
        return false;
    }
    return true;
}

} // namespace updsrv::config::detail
