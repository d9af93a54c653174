#pragma once

#include <cstdint>
#include <filesystem>
#include <map>
#include <memory>
#include <optional>
#include <string>

namespace gitshort {

class Disambiguator;

// ---------------------------------------------------------------------------
// Constants
// ---------------------------------------------------------------------------

/// Shortest hex prefix ever used as a short id (two whole bytes).
constexpr size_t MIN_PREFIX_HEX = 4;

/// Hex length of a full SHA-1 commit hash.
constexpr size_t FULL_HASH_HEX = 40;

// ---------------------------------------------------------------------------
// Signature
// ---------------------------------------------------------------------------

/// Author/committer identity used for new commits.
struct Signature {
    std::string name  = "gitshort";
    std::string email = "gitshort@localhost";
};

// ---------------------------------------------------------------------------
// RecordFields
// ---------------------------------------------------------------------------

/// Caller-supplied content of a new record.
struct RecordFields {
    std::string                        url;         ///< Absolute http/https/ftp URL.
    std::string                        description; ///< Free text, may be empty.
    std::map<std::string, std::string> extra;       ///< Open extension fields.
};

// ---------------------------------------------------------------------------
// Record
// ---------------------------------------------------------------------------

/// A redirect stored as one commit.
///
/// `id` encodes the full commit hash and never changes. `short_id` is the
/// shortest whole-byte prefix that is unique *now*; it may grow as the
/// repository grows, so it must not be persisted as a key.
struct Record {
    std::string id;             ///< base58 of the full hash.
    std::string short_id;       ///< base58 of the minimal unique prefix.
    std::string url;
    std::string description;
    int64_t     created = 0;    ///< Author time shifted by the UTC offset (seconds).
    int         created_offset = 0; ///< Author UTC offset in minutes.
    std::string creator;        ///< Author display name.
    std::string creator_email;
    std::string commit_hash;    ///< 40-char hex hash of the record commit.
    std::map<std::string, std::string> extra;
};

// ---------------------------------------------------------------------------
// Range
// ---------------------------------------------------------------------------

/// Revision range for history traversal. Both ends accept anything
/// git_revparse_single understands (branch names, hex hashes, ...).
struct Range {
    std::optional<std::string> from;  ///< Inclusive lower bound; unbounded if unset.
    std::optional<std::string> until; ///< Upper bound; the tracked branch tip if unset.
};

// ---------------------------------------------------------------------------
// SyncResult
// ---------------------------------------------------------------------------

/// Outcome of RecordStore::sync().
struct SyncResult {
    bool        merged = false; ///< True when a fetch+merge was needed before the push.
    std::string tip;            ///< 40-char hex tip of the branch that was pushed.
};

// ---------------------------------------------------------------------------
// StoreOptions
// ---------------------------------------------------------------------------

/// Explicit configuration for opening a RecordStore. Built once per
/// invocation (see Config::store_options) and passed in.
struct StoreOptions {
    std::filesystem::path      path   = ".";      ///< Working tree (or any path inside it).
    std::string                branch = "master"; ///< Tracked branch.
    std::string                remote = "origin"; ///< Remote used by sync().
    bool                       create = false;    ///< Initialise the repository if missing.
    std::optional<std::string> author;            ///< Commit author name override.
    std::optional<std::string> email;             ///< Commit author email override.

    /// Fallback used for ambiguous prefixes; GitProcessDisambiguator if null.
    std::shared_ptr<Disambiguator> disambiguator;
};

} // namespace gitshort
