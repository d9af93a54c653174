#pragma once
/// Internal helpers shared between gitshort source files.
/// Not part of the public API.

#include "gitshort/error.h"
#include "gitshort/store.h"
#include "gitshort/types.h"

#include <git2.h>

#include <optional>
#include <string>
#include <vector>

namespace gitshort {

// ---------------------------------------------------------------------------
// git: libgit2 error and handle helpers
// ---------------------------------------------------------------------------

namespace git {

/// Throw GitError with the last libgit2 error message.
[[noreturn]] void throw_error(const std::string& context);

/// The last libgit2 error message, or `fallback` if none is set.
std::string last_error(const std::string& fallback = "unknown error");

/// Convert a raw OID to a 40-char lowercase hex string.
std::string oid_hex(const git_oid* oid);

/// Parse a 40-char hex string into a git_oid.
/// @throws InvalidIdError on failure.
git_oid hex_to_oid(const std::string& hex);

struct CommitGuard {
    git_commit* c = nullptr;
    ~CommitGuard() { if (c) git_commit_free(c); }
};

struct TreeGuard {
    git_tree* t = nullptr;
    ~TreeGuard() { if (t) git_tree_free(t); }
};

struct RefGuard {
    git_reference* r = nullptr;
    ~RefGuard() { if (r) git_reference_free(r); }
};

struct IndexGuard {
    git_index* i = nullptr;
    ~IndexGuard() { if (i) git_index_free(i); }
};

struct SigGuard {
    git_signature* s = nullptr;
    ~SigGuard() { if (s) git_signature_free(s); }
};

struct RemoteGuard {
    git_remote* r = nullptr;
    ~RemoteGuard() { if (r) git_remote_free(r); }
};

struct ObjectGuard {
    git_object* o = nullptr;
    ~ObjectGuard() { if (o) git_object_free(o); }
};

/// Tip commit hash of `refname`, or empty if the ref does not exist.
std::string ref_target(git_repository* repo, const std::string& refname);

/// Signature for new commits: the explicit one when set, else the
/// repository's user.name/user.email, else the built-in default.
/// Caller owns the returned signature.
git_signature* make_signature(git_repository* repo,
                              const std::optional<Signature>& explicit_sig);

} // namespace git

// ---------------------------------------------------------------------------
// records: commit → Record read path
// ---------------------------------------------------------------------------

namespace records {

/// Decode `commit` into a Record, computing both ids.
/// @throws DecodeError if the commit message is not a record.
Record from_commit(RecordStoreInner& inner, const git_commit* commit);

/// Look up `commit_hex` and decode it.
Record read(RecordStoreInner& inner, const std::string& commit_hex);

} // namespace records

// ---------------------------------------------------------------------------
// sync: push / fetch / merge
// ---------------------------------------------------------------------------

namespace sync {

/// Push the tracked branch, merging and retrying once on non-fast-forward.
/// Caller holds `inner.mutex`.
SyncResult run(RecordStoreInner& inner);

} // namespace sync

// ---------------------------------------------------------------------------
// proc: child processes
// ---------------------------------------------------------------------------

namespace proc {

struct Output {
    int         status = 0; ///< Exit status (0 on success).
    std::string out;        ///< Captured stdout.
};

/// Run a shell command and capture its stdout.
/// @throws IoError if the process cannot be started.
Output run(const std::string& cmd);

/// Single-quote `s` for /bin/sh.
std::string shell_quote(const std::string& s);

/// Split `text` into trimmed, non-empty lines.
std::vector<std::string> lines(const std::string& text);

} // namespace proc

} // namespace gitshort
