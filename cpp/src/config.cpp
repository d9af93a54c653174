#include "gitshort/config.h"
#include "gitshort/error.h"

#include <yaml-cpp/yaml.h>

#include <cstdlib>
#include <fstream>
#include <string>
#include <system_error>

namespace gitshort {

namespace {

const char* env(const char* name) {
    const char* v = std::getenv(name);
    return (v && *v) ? v : nullptr;
}

} // anonymous namespace

std::filesystem::path Config::default_path() {
    if (const char* explicit_path = env("GITSHORT_CONFIG")) return explicit_path;
    if (const char* xdg = env("XDG_CONFIG_HOME"))
        return std::filesystem::path(xdg) / "gitshort" / "config.yaml";
    if (const char* home = env("HOME"))
        return std::filesystem::path(home) / ".config" / "gitshort" / "config.yaml";
    return std::filesystem::path(".gitshort.yaml");
}

Config::Config(std::filesystem::path path) : path_(std::move(path)) {}

Config Config::load(const std::filesystem::path& path) {
    Config cfg(path);
    if (!std::filesystem::exists(path)) return cfg;

    YAML::Node root;
    try {
        root = YAML::LoadFile(path.string());
    } catch (const YAML::Exception& e) {
        throw ConfigError(path.string() + ": " + e.what());
    }
    if (root.IsNull()) return cfg;
    if (!root.IsMap()) throw ConfigError(path.string() + ": expected a key/value map");

    for (const auto& item : root) {
        if (!item.first.IsScalar() || !item.second.IsScalar()) {
            throw ConfigError(path.string() + ": values must be plain scalars");
        }
        cfg.values_[item.first.Scalar()] = item.second.Scalar();
    }
    return cfg;
}

Config Config::load_default() {
    return load(default_path());
}

std::optional<std::string> Config::get(const std::string& key) const {
    auto it = values_.find(key);
    if (it == values_.end()) return std::nullopt;
    return it->second;
}

bool Config::has(const std::string& key) const {
    return values_.count(key) != 0;
}

void Config::set(const std::string& key, const std::string& value) {
    values_[key] = value;
}

void Config::save() const {
    if (path_.has_parent_path()) {
        std::error_code ec;
        std::filesystem::create_directories(path_.parent_path(), ec);
        if (ec) {
            throw IoError("cannot create " + path_.parent_path().string() +
                          ": " + ec.message());
        }
    }

    YAML::Emitter out;
    out << YAML::BeginMap;
    for (const auto& [key, value] : values_) {
        out << YAML::Key << key << YAML::Value << value;
    }
    out << YAML::EndMap;

    std::ofstream f(path_, std::ios::trunc);
    if (!f) throw IoError("cannot open " + path_.string());
    f << out.c_str() << "\n";
    if (!f) throw IoError("write failed: " + path_.string());
}

StoreOptions Config::store_options() const {
    StoreOptions opts;
    opts.path   = get(REPOSITORY).value_or(".");
    opts.branch = get(BRANCH).value_or("master");
    opts.remote = get(UPSTREAM).value_or("origin");
    if (auto author = get(AUTHOR)) opts.author = *author;
    if (auto email = get(EMAIL))   opts.email  = *email;
    return opts;
}

} // namespace gitshort
