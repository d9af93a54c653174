#include "gitshort/resolver.h"
#include "gitshort/ids.h"
#include "internal.h"

#include <git2.h>
#include <spdlog/spdlog.h>

#include <string>
#include <utility>
#include <vector>

namespace gitshort {

// ---------------------------------------------------------------------------
// GitProcessDisambiguator
// ---------------------------------------------------------------------------

std::vector<std::string>
GitProcessDisambiguator::candidates(const std::filesystem::path& workdir,
                                    const std::string& hex_prefix) {
    // The prefix is spliced into a shell command line.
    if (!CommitResolver::is_disambiguable(hex_prefix)) {
        throw ValidationError("refusing to disambiguate '" + hex_prefix + "'");
    }

    std::string cmd = "git -C " + proc::shell_quote(workdir.string()) +
                      " rev-parse --disambiguate=" + hex_prefix + " 2>/dev/null";
    auto result = proc::run(cmd);
    if (result.status != 0) {
        throw GitError("git rev-parse --disambiguate=" + hex_prefix +
                       " exited with status " + std::to_string(result.status));
    }
    return proc::lines(result.out);
}

// ---------------------------------------------------------------------------
// CommitResolver
// ---------------------------------------------------------------------------

CommitResolver::CommitResolver(git_repository* repo,
                               std::filesystem::path workdir,
                               std::shared_ptr<Disambiguator> disambiguator)
    : repo_(repo), workdir_(std::move(workdir)),
      disambiguator_(std::move(disambiguator)) {
    if (!disambiguator_) disambiguator_ = std::make_shared<GitProcessDisambiguator>();
}

bool CommitResolver::is_disambiguable(const std::string& hex_prefix) {
    return hex_prefix.size() >= MIN_PREFIX_HEX && is_hex(hex_prefix);
}

CommitResolver::Lookup
CommitResolver::lookup_prefix(const std::string& hex_prefix, std::string& out) {
    if (!is_hex(hex_prefix) || hex_prefix.size() > GIT_OID_HEXSZ)
        return Lookup::NotFound;

    git_oid oid;
    if (git_oid_fromstrn(&oid, hex_prefix.c_str(), hex_prefix.size()) != 0)
        return Lookup::NotFound;

    git::CommitGuard cg;
    int rc = git_commit_lookup_prefix(&cg.c, repo_, &oid, hex_prefix.size());
    if (rc == 0) {
        out = git::oid_hex(git_commit_id(cg.c));
        return Lookup::Found;
    }
    // Prefixes shorter than libgit2's minimum also report as ambiguous.
    if (rc == GIT_EAMBIGUOUS) return Lookup::Ambiguous;
    if (rc == GIT_ENOTFOUND || rc == GIT_EINVALIDSPEC) return Lookup::NotFound;
    git::throw_error("git_commit_lookup_prefix (" + hex_prefix + ")");
}

std::vector<std::string>
CommitResolver::commit_candidates(const std::string& hex_prefix) {
    if (!is_disambiguable(hex_prefix)) {
        spdlog::debug("ambiguous prefix '{}' not eligible for disambiguation",
                      hex_prefix);
        return {};
    }

    spdlog::debug("disambiguating prefix {}", hex_prefix);
    std::vector<std::string> commits;
    for (const auto& id : disambiguator_->candidates(workdir_, hex_prefix)) {
        git_oid oid;
        if (id.size() != GIT_OID_HEXSZ || git_oid_fromstr(&oid, id.c_str()) != 0)
            continue;
        git::CommitGuard cg;
        if (git_commit_lookup(&cg.c, repo_, &oid) != 0) continue;
        commits.push_back(git::oid_hex(git_commit_id(cg.c)));
    }
    return commits;
}

std::optional<std::string> CommitResolver::resolve(const std::string& hex_prefix) {
    std::string found;
    switch (lookup_prefix(hex_prefix, found)) {
        case Lookup::Found:
            return found;
        case Lookup::NotFound:
            return std::nullopt;
        case Lookup::Ambiguous: {
            auto commits = commit_candidates(hex_prefix);
            if (commits.empty()) return std::nullopt;
            return commits.front();
        }
    }
    return std::nullopt; // unreachable
}

bool CommitResolver::resolves_uniquely(const std::string& hex_prefix,
                                       const std::string& commit_hex) {
    std::string found;
    switch (lookup_prefix(hex_prefix, found)) {
        case Lookup::Found:
            return found == commit_hex;
        case Lookup::NotFound:
            return false;
        case Lookup::Ambiguous: {
            // Other object types may share the prefix; only commits count.
            auto commits = commit_candidates(hex_prefix);
            return commits.size() == 1 && commits.front() == commit_hex;
        }
    }
    return false; // unreachable
}

} // namespace gitshort
