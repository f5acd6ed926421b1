#pragma once

#include <map>
#include <optional>
#include <string>

namespace updsrv {

// Read-only app name -> folder name lookup.
class IAppFolderMap {
  public:
    virtual ~IAppFolderMap() = default;
    virtual std::optional<std::string> Lookup(const std::string& app_name) const = 0;
};

class ConfigAppFolderMap final : public IAppFolderMap {
  public:
    ConfigAppFolderMap() = default;
    explicit ConfigAppFolderMap(std::map<std::string, std::string> entries)
        : entries_(std::move(entries)) {}

    std::optional<std::string> Lookup(const std::string& app_name) const override {
        auto it = entries_.find(app_name);
        if (it == entries_.end()) return std::nullopt;
        return it->second;
    }

  private:
    std::map<std::string, std::string> entries_;
};

} // namespace updsrv
