#pragma once

#include "util/logger.hpp"

#include <nlohmann/json.hpp>
#include <map>
#include <optional>
#include <string>

namespace updsrv::config::detail {

// Parses `text` and requires an object at the root.
bool ParseJsonObject(const std::string& text, nlohmann::json& out, std::string& err);
bool LoadJsonObjectFromFile(const std::string& path, nlohmann::json& out, std::string& err);

// The Read* helpers leave `out` untouched when `key` is absent and fail only
// when the key is present with the wrong type.
bool ReadString(const nlohmann::json& j, const char* key, std::string& out, std::string& err);
bool ReadNonEmptyString(const nlohmann::json& j, const char* key, std::string& out, std::string& err);
bool ReadStringMap(const nlohmann::json& j,
                   const char* key,
                   std::map<std::string, std::string>& out,
                   std::string& err);
bool ReadLogLevel(const nlohmann::json& j, const char* key, std::optional<LogLevel>& out, std::string& err);

} // namespace updsrv::config::detail
