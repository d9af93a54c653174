#pragma once

#include "types.h"

#include <filesystem>
#include <map>
#include <optional>
#include <string>

namespace gitshort {

/// Persisted user configuration: repository path, tracked branch, remote
/// and commit identity, stored as a flat YAML map.
class Config {
public:
    static constexpr const char* REPOSITORY = "repository";
    static constexpr const char* BRANCH     = "branch";
    static constexpr const char* UPSTREAM   = "upstream";
    static constexpr const char* AUTHOR     = "author";
    static constexpr const char* EMAIL      = "email";
    static constexpr const char* LOG_LEVEL  = "log_level";

    /// `$GITSHORT_CONFIG`, else `$XDG_CONFIG_HOME/gitshort/config.yaml`,
    /// else `$HOME/.config/gitshort/config.yaml`.
    static std::filesystem::path default_path();

    /// Read `path`. A missing file yields an empty configuration.
    /// @throws ConfigError if the file is not a YAML map of scalars.
    static Config load(const std::filesystem::path& path);

    /// load(default_path()).
    static Config load_default();

    std::optional<std::string> get(const std::string& key) const;
    bool has(const std::string& key) const;
    void set(const std::string& key, const std::string& value);

    /// Every stored key/value pair, sorted by key.
    const std::map<std::string, std::string>& all() const { return values_; }

    /// Write the configuration back, creating parent directories.
    /// @throws IoError on write failure.
    void save() const;

    /// StoreOptions built from the stored values and their defaults.
    StoreOptions store_options() const;

    const std::filesystem::path& path() const { return path_; }

private:
    explicit Config(std::filesystem::path path);

    std::filesystem::path              path_;
    std::map<std::string, std::string> values_;
};

} // namespace gitshort
