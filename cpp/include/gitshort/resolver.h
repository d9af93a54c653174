#pragma once

#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

struct git_repository;

namespace gitshort {

// ---------------------------------------------------------------------------
// Disambiguator
// ---------------------------------------------------------------------------

/// Lists every object id sharing a hex prefix. libgit2 can tell that a
/// prefix is ambiguous but cannot enumerate the matches, so this is asked
/// on the rare ambiguous path only.
///
/// Implementations receive prefixes already checked by CommitResolver
/// (hex only, at least MIN_PREFIX_HEX characters).
class Disambiguator {
public:
    virtual ~Disambiguator() = default;

    /// Full 40-char hex ids of all objects whose id starts with `hex_prefix`.
    virtual std::vector<std::string>
    candidates(const std::filesystem::path& workdir,
               const std::string& hex_prefix) = 0;
};

/// Runs `git -C <workdir> rev-parse --disambiguate=<prefix>`.
class GitProcessDisambiguator : public Disambiguator {
public:
    /// @throws IoError if the process cannot be started.
    /// @throws GitError if git exits non-zero.
    std::vector<std::string>
    candidates(const std::filesystem::path& workdir,
               const std::string& hex_prefix) override;
};

// ---------------------------------------------------------------------------
// CommitResolver
// ---------------------------------------------------------------------------

/// Resolves hex prefixes (or full hashes) to commits.
///
/// The resolver borrows the repository handle; the owner must keep it
/// alive and serialise access.
class CommitResolver {
public:
    CommitResolver(git_repository* repo,
                   std::filesystem::path workdir,
                   std::shared_ptr<Disambiguator> disambiguator);

    /// Full hash of the commit `hex_prefix` names, or nullopt.
    ///
    /// An ambiguous prefix falls back to the disambiguator and yields the
    /// first candidate that is a commit.
    std::optional<std::string> resolve(const std::string& hex_prefix);

    /// True if `hex_prefix` names `commit_hex` and no other commit.
    bool resolves_uniquely(const std::string& hex_prefix,
                           const std::string& commit_hex);

    /// True if `hex_prefix` may be handed to the disambiguator.
    static bool is_disambiguable(const std::string& hex_prefix);

private:
    enum class Lookup { Found, NotFound, Ambiguous };

    Lookup lookup_prefix(const std::string& hex_prefix, std::string& out);
    std::vector<std::string> commit_candidates(const std::string& hex_prefix);

    git_repository*                repo_;
    std::filesystem::path          workdir_;
    std::shared_ptr<Disambiguator> disambiguator_;
};

} // namespace gitshort
