#pragma once
/// Shared fixtures for the gitshort test suite.

#include <gitshort/gitshort.h>
#include <git2.h>

#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

namespace fs = std::filesystem;

namespace testing {

/// A fresh, not-yet-existing path under the system temp directory.
inline fs::path make_temp_path(const std::string& prefix = "gitshort_test_") {
    static std::atomic<unsigned> counter{0};
    return fs::temp_directory_path() /
           (prefix + std::to_string(
                std::hash<std::thread::id>{}(std::this_thread::get_id())
                ^ static_cast<size_t>(
                      std::chrono::steady_clock::now()
                          .time_since_epoch()
                          .count())) +
            "_" + std::to_string(counter++));
}

/// Removes its directory on scope exit.
struct TempDir {
    fs::path path;

    explicit TempDir(const std::string& prefix = "gitshort_test_")
        : path(make_temp_path(prefix)) {}
    ~TempDir() {
        std::error_code ec;
        fs::remove_all(path, ec);
    }
    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;
};

/// Lists object ids by scanning the object database directly, so tests do
/// not depend on a git executable.
class OdbDisambiguator : public gitshort::Disambiguator {
public:
    std::vector<std::string>
    candidates(const fs::path& workdir, const std::string& hex_prefix) override {
        ++calls;

        git_repository* repo = nullptr;
        if (git_repository_open(&repo, workdir.string().c_str()) != 0)
            throw std::runtime_error("cannot open " + workdir.string());
        git_odb* odb = nullptr;
        if (git_repository_odb(&odb, repo) != 0) {
            git_repository_free(repo);
            throw std::runtime_error("cannot open object database");
        }

        Scan scan{hex_prefix, {}};
        git_odb_foreach(odb, &OdbDisambiguator::visit, &scan);

        git_odb_free(odb);
        git_repository_free(repo);
        return scan.found;
    }

    int calls = 0;

private:
    struct Scan {
        std::string              prefix;
        std::vector<std::string> found;
    };

    static int visit(const git_oid* id, void* payload) {
        auto* scan = static_cast<Scan*>(payload);
        char buf[GIT_OID_HEXSZ + 1];
        git_oid_tostr(buf, sizeof(buf), id);
        std::string hex(buf);
        if (hex.compare(0, scan->prefix.size(), scan->prefix) == 0)
            scan->found.push_back(hex);
        return 0;
    }
};

inline gitshort::StoreOptions store_options(const fs::path& path,
                                            const std::string& branch = "master") {
    gitshort::StoreOptions opts;
    opts.path = path;
    opts.branch = branch;
    opts.author = "Test Author";
    opts.email = "test@example.com";
    opts.disambiguator = std::make_shared<OdbDisambiguator>();
    return opts;
}

/// Create (or open) a store at `path` with an initial commit on `branch`.
inline gitshort::RecordStore make_store(const fs::path& path,
                                        const std::string& branch = "master") {
    auto opts = store_options(path, branch);
    opts.create = true;
    return gitshort::RecordStore::open(opts);
}

inline gitshort::RecordFields fields(const std::string& url,
                                     const std::string& description = "") {
    gitshort::RecordFields f;
    f.url = url;
    f.description = description;
    return f;
}

/// Append a commit that is not a record to `branch`, reusing the tip's tree.
inline std::string commit_raw(gitshort::RecordStore& store,
                              const std::string& message) {
    git_repository* repo = store.inner()->repo;
    std::string refname = "refs/heads/" + store.branch();

    git_oid tip;
    if (git_reference_name_to_id(&tip, repo, refname.c_str()) != 0)
        throw std::runtime_error("no tip on " + refname);
    git_commit* parent = nullptr;
    git_commit_lookup(&parent, repo, &tip);
    git_tree* tree = nullptr;
    git_commit_tree(&tree, parent);

    git_signature* sig = nullptr;
    git_signature_now(&sig, "Someone Else", "else@example.com");
    const git_commit* parents[] = {parent};
    git_oid oid;
    int rc = git_commit_create(&oid, repo, refname.c_str(), sig, sig, "UTF-8",
                               message.c_str(), tree, 1, parents);
    git_signature_free(sig);
    git_tree_free(tree);
    git_commit_free(parent);
    if (rc != 0) throw std::runtime_error("git_commit_create failed");

    char buf[GIT_OID_HEXSZ + 1];
    git_oid_tostr(buf, sizeof(buf), &oid);
    return buf;
}

inline void write_file(const fs::path& path, const std::string& content) {
    fs::create_directories(path.parent_path());
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    out << content;
}

inline std::string read_file(const fs::path& path) {
    std::ifstream in(path, std::ios::binary);
    return std::string(std::istreambuf_iterator<char>(in),
                       std::istreambuf_iterator<char>());
}

} // namespace testing
