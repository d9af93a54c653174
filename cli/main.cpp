/**
 * short: command-line front end for a gitshort record store.
 * Usage: short [options] <command> [args]   (see usage())
 */

#include <gitshort/gitshort.h>
#include <nlohmann/json.hpp>

#include <iostream>
#include <optional>
#include <string>
#include <vector>

using json = nlohmann::json;

static void usage() {
    std::cerr
        << "Usage:\n"
        << "  short [options] <url> [description...] [--meta key=value]... [--sync]\n"
        << "  short [options] info <id>\n"
        << "  short [options] list [--from <rev>] [--until <rev>]\n"
        << "  short [options] publish [--output-dir <dir>] [--from <rev>] [--until <rev>]\n"
        << "                          [--template <file>]\n"
        << "  short [options] sync\n"
        << "  short [options] init\n"
        << "  short [options] config [key] [value] | --all\n"
        << "\n"
        << "Options:\n"
        << "  --config <file>   configuration file\n"
        << "  --repo <path>     repository path\n"
        << "  --branch <name>   tracked branch\n"
        << "  --remote <name>   remote used by sync\n"
        << "  --verbose         debug logging\n";
}

static json to_json(const gitshort::Record& r) {
    json j = json::object();
    for (const auto& [key, value] : r.extra) j[key] = value;
    j["id"]          = r.id;
    j["shortId"]     = r.short_id;
    j["url"]         = r.url;
    j["description"] = r.description;
    j["created"]     = gitshort::format_time(r.created);
    j["creator"]     = r.creator;
    return j;
}

/// Remove `--name value` from `args`, returning the value if present.
static std::optional<std::string> take_option(std::vector<std::string>& args,
                                              const std::string& name) {
    for (size_t i = 0; i < args.size(); ++i) {
        if (args[i] != name) continue;
        if (i + 1 >= args.size()) {
            throw gitshort::ValidationError(name + " requires a value");
        }
        std::string value = args[i + 1];
        args.erase(args.begin() + static_cast<std::ptrdiff_t>(i),
                   args.begin() + static_cast<std::ptrdiff_t>(i + 2));
        return value;
    }
    return std::nullopt;
}

/// Remove every `--name value` from `args`.
static std::vector<std::string> take_all(std::vector<std::string>& args,
                                         const std::string& name) {
    std::vector<std::string> values;
    while (auto v = take_option(args, name)) values.push_back(*v);
    return values;
}

/// Remove `--name` from `args`, returning whether it was present.
static bool take_flag(std::vector<std::string>& args, const std::string& name) {
    for (size_t i = 0; i < args.size(); ++i) {
        if (args[i] == name) {
            args.erase(args.begin() + static_cast<std::ptrdiff_t>(i));
            return true;
        }
    }
    return false;
}

static gitshort::Range take_range(std::vector<std::string>& args) {
    gitshort::Range range;
    range.from  = take_option(args, "--from");
    range.until = take_option(args, "--until");
    return range;
}

static int cmd_config(gitshort::Config& config, std::vector<std::string>& args) {
    if (take_flag(args, "--all")) {
        for (const auto& [key, value] : config.all()) {
            std::cout << key << "=" << value << "\n";
        }
        return 0;
    }
    if (args.empty()) {
        std::cerr << "error: key must be specified if --all is not set\n";
        return 1;
    }

    const std::string& key = args[0];
    if (args.size() > 1) {
        config.set(key, args[1]);
        config.save();
    }
    std::cout << key << "=" << config.get(key).value_or("") << "\n";
    return 0;
}

static int cmd_create(gitshort::StoreOptions opts, std::vector<std::string>& args) {
    gitshort::RecordFields fields;
    for (const auto& kv : take_all(args, "--meta")) {
        auto eq = kv.find('=');
        if (eq == std::string::npos || eq == 0) {
            throw gitshort::ValidationError("--meta expects key=value, got '" + kv + "'");
        }
        fields.extra[kv.substr(0, eq)] = kv.substr(eq + 1);
    }
    bool push = take_flag(args, "--sync");

    if (args.empty()) {
        usage();
        return 1;
    }
    fields.url = args[0];
    for (size_t i = 1; i < args.size(); ++i) {
        if (i > 1) fields.description += " ";
        fields.description += args[i];
    }

    auto store = gitshort::RecordStore::open(opts);
    auto record = store.create(fields);
    if (push) store.sync();
    std::cout << to_json(record).dump(2) << "\n";
    return 0;
}

static int run(int argc, char* argv[]) {
    std::vector<std::string> args(argv + 1, argv + argc);
    if (args.empty() || take_flag(args, "--help") || take_flag(args, "-h")) {
        usage();
        return args.empty() ? 1 : 0;
    }

    auto config_path = take_option(args, "--config");
    auto config = config_path ? gitshort::Config::load(*config_path)
                              : gitshort::Config::load_default();

    bool verbose = take_flag(args, "--verbose");
    gitshort::init_logging(verbose ? "debug" : config.get(gitshort::Config::LOG_LEVEL).value_or(""));

    auto opts = config.store_options();
    if (auto repo = take_option(args, "--repo"))     opts.path   = *repo;
    if (auto branch = take_option(args, "--branch")) opts.branch = *branch;
    if (auto remote = take_option(args, "--remote")) opts.remote = *remote;

    if (args.empty()) {
        usage();
        return 1;
    }
    std::string command = args[0];

    if (command == "config") {
        args.erase(args.begin());
        return cmd_config(config, args);
    }

    if (command == "info") {
        if (args.size() != 2) {
            usage();
            return 1;
        }
        auto store = gitshort::RecordStore::open(opts);
        std::cout << to_json(store.get(args[1])).dump(2) << "\n";
        return 0;
    }

    if (command == "list") {
        args.erase(args.begin());
        auto range = take_range(args);
        auto store = gitshort::RecordStore::open(opts);
        auto walker = store.all(range);
        while (auto record = walker.next()) {
            std::cout << to_json(*record).dump() << "\n";
        }
        return 0;
    }

    if (command == "publish") {
        args.erase(args.begin());
        auto range = take_range(args);
        auto output_dir = take_option(args, "--output-dir").value_or(".");
        auto template_path = take_option(args, "--template");

        auto store = gitshort::RecordStore::open(opts);
        auto publisher = template_path
            ? gitshort::Publisher::from_template_file(output_dir, *template_path)
            : gitshort::Publisher(output_dir);
        auto walker = store.all(range);
        while (auto record = walker.next()) {
            std::cout << publisher.publish(*record).string() << "\n";
        }
        return 0;
    }

    if (command == "sync") {
        auto store = gitshort::RecordStore::open(opts);
        auto result = store.sync();
        std::cout << (result.merged ? "merged and pushed " : "pushed ")
                  << store.branch() << " at " << result.tip << "\n";
        return 0;
    }

    if (command == "init") {
        opts.create = true;
        auto store = gitshort::RecordStore::open(opts);
        std::cout << "initialised " << store.path().string()
                  << " on " << store.branch() << "\n";
        return 0;
    }

    return cmd_create(opts, args);
}

int main(int argc, char* argv[]) {
    try {
        return run(argc, argv);
    } catch (const std::exception& e) {
        std::cerr << "error: " << e.what() << "\n";
        return 1;
    }
}
