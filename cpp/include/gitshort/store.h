#pragma once

#include "error.h"
#include "resolver.h"
#include "types.h"

#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

// Forward-declare libgit2 types to avoid pulling the header into every TU.
struct git_repository;
struct git_revwalk;

namespace gitshort {

class RecordWalker;

// ---------------------------------------------------------------------------
// RecordStoreInner: shared state
// ---------------------------------------------------------------------------

/// Internal state shared via shared_ptr across RecordStore copies and
/// live walkers. Not part of the public API.
struct RecordStoreInner {
    git_repository*          repo;      ///< Raw libgit2 handle (owned).
    std::filesystem::path    workdir;   ///< Working tree root.
    std::string              branch;    ///< Tracked branch short name.
    std::string              remote;    ///< Remote name used by sync().
    std::optional<Signature> signature; ///< Explicit author, if configured.
    CommitResolver           resolver;  ///< Borrows `repo`.
    std::mutex               mutex;     ///< Serialises all access to `repo`.

    // Non-copyable, non-movable; always held by shared_ptr.
    RecordStoreInner(const RecordStoreInner&) = delete;
    RecordStoreInner& operator=(const RecordStoreInner&) = delete;

    RecordStoreInner(git_repository* r, std::filesystem::path wd,
                     const StoreOptions& opts);
    ~RecordStoreInner();

    /// `refs/heads/<branch>`.
    std::string branch_ref() const { return "refs/heads/" + branch; }
};

// ---------------------------------------------------------------------------
// RecordStore
// ---------------------------------------------------------------------------

/// An append-only store of redirect records kept as commits on one branch
/// of a git working repository. Each record is a commit whose tree equals
/// its parent's tree; the record lives entirely in the commit message.
///
/// Cheap to copy; internally holds a shared_ptr<RecordStoreInner>.
///
/// Usage:
/// @code
///     gitshort::StoreOptions opts;
///     opts.path = "/srv/links";
///     auto store  = gitshort::RecordStore::open(opts);
///     auto record = store.create({"https://example.com/", "example", {}});
///     auto again  = store.get(record.short_id);
/// @endcode
class RecordStore {
public:
    // -- Construction -------------------------------------------------------

    /// Open the working repository containing `opts.path`, or create one
    /// there (with an initial empty commit on `opts.branch`) when
    /// `opts.create` is set.
    ///
    /// @throws NotFoundError if no repository exists and opts.create is false.
    /// @throws RepositoryStateError if the repository is bare.
    /// @throws GitError on libgit2 failures.
    static RecordStore open(const StoreOptions& opts);

    // -- Reads --------------------------------------------------------------

    /// Look up a record by id or short id.
    /// @throws NotFoundError if nothing resolves or the commit is not a record.
    Record get(const std::string& id);

    /// Walk records from oldest to newest over `range`.
    RecordWalker all(const Range& range = {});

    // -- Writes -------------------------------------------------------------

    /// Append a new record commit to the tracked branch.
    ///
    /// Checks, in order: the URL is valid (ValidationError); the tracked
    /// branch can be checked out; the index has no conflicts; the index has
    /// no staged changes; the branch has a tip; no merge, rebase or
    /// cherry-pick is in progress (RepositoryStateError). Nothing is
    /// written unless every check passes.
    ///
    /// @return The record as read back from the new commit.
    Record create(const RecordFields& fields);

    /// Push the tracked branch to the configured remote, merging the
    /// remote branch and retrying once when the push is not a fast-forward.
    /// @throws SyncError when the push cannot be completed.
    SyncResult sync();

    // -- Identifiers --------------------------------------------------------

    /// base58 id of the full commit hash.
    std::string canonical_id(const std::string& commit_hex) const;

    /// Current minimal unique id for a commit.
    std::string short_id(const std::string& commit_hex);

    /// Full hash of the commit an id or short id names, or nullopt.
    std::optional<std::string> resolve(const std::string& id);

    // -- Metadata -----------------------------------------------------------

    /// Working tree root.
    const std::filesystem::path& path() const;

    /// Tracked branch name.
    const std::string& branch() const;

    /// Hex hash of the tracked branch tip, or nullopt if the branch is unborn.
    std::optional<std::string> tip();

    /// Access the shared inner state (used by RecordWalker).
    std::shared_ptr<RecordStoreInner> inner() const { return inner_; }

private:
    explicit RecordStore(std::shared_ptr<RecordStoreInner> inner);

    std::shared_ptr<RecordStoreInner> inner_;
};

// ---------------------------------------------------------------------------
// RecordWalker
// ---------------------------------------------------------------------------

/// Pull-based, single-pass iterator over the records of a range, oldest
/// first. Commits that are not records are skipped.
///
/// @code
///     auto walker = store.all();
///     while (auto record = walker.next()) {
///         publish(*record);
///     }
/// @endcode
class RecordWalker {
public:
    RecordWalker(std::shared_ptr<RecordStoreInner> inner, const Range& range);
    ~RecordWalker();

    RecordWalker(RecordWalker&& other) noexcept;
    RecordWalker& operator=(RecordWalker&& other) noexcept;
    RecordWalker(const RecordWalker&) = delete;
    RecordWalker& operator=(const RecordWalker&) = delete;

    /// The next record, or nullopt once the range is exhausted.
    /// Exhaustion is sticky; walker errors other than exhaustion throw GitError.
    std::optional<Record> next();

    /// True once next() has returned nullopt.
    bool exhausted() const { return walk_ == nullptr; }

private:
    void release();

    std::shared_ptr<RecordStoreInner> inner_;
    git_revwalk*                      walk_ = nullptr;
};

} // namespace gitshort
