#pragma once

#include <stdexcept>
#include <string>

namespace gitshort {

// ---------------------------------------------------------------------------
// Base exception
// ---------------------------------------------------------------------------

/// Base class for all gitshort exceptions.
class Error : public std::runtime_error {
public:
    explicit Error(const std::string& msg) : std::runtime_error(msg) {}
};

// ---------------------------------------------------------------------------
// Specific exception types
// ---------------------------------------------------------------------------

/// Input to a write was rejected before anything was touched
/// (e.g. a URL outside the http/https/ftp allow-list).
class ValidationError : public Error {
public:
    explicit ValidationError(const std::string& msg)
        : Error("validation failed: " + msg) {}
};

/// No record exists for an identifier, or the commit it names is not a record.
class NotFoundError : public Error {
public:
    explicit NotFoundError(const std::string& key)
        : Error("not found: " + key), key_(key) {}
    const std::string& key() const { return key_; }
private:
    std::string key_;
};

/// The repository is not in a state that allows appending a record
/// (conflicts, staged changes, unborn branch, merge in progress, ...).
class RepositoryStateError : public Error {
public:
    explicit RepositoryStateError(const std::string& msg)
        : Error("repository state: " + msg) {}
};

/// Pushing the tracked branch failed and could not be reconciled.
class SyncError : public Error {
public:
    explicit SyncError(const std::string& msg)
        : Error("sync failed: " + msg) {}
};

/// A commit message is not a well-formed record.
class DecodeError : public Error {
public:
    explicit DecodeError(const std::string& msg)
        : Error("not a record: " + msg) {}
};

/// An identifier contains characters outside the base58 alphabet.
class InvalidIdError : public Error {
public:
    explicit InvalidIdError(const std::string& id)
        : Error("invalid id: " + id), id_(id) {}
    const std::string& id() const { return id_; }
private:
    std::string id_;
};

/// A low-level libgit2 operation failed.
class GitError : public Error {
public:
    explicit GitError(const std::string& msg)
        : Error("git error: " + msg) {}
};

/// A filesystem or process I/O error occurred.
class IoError : public Error {
public:
    explicit IoError(const std::string& msg)
        : Error("io error: " + msg) {}
};

/// The configuration file could not be read.
class ConfigError : public Error {
public:
    explicit ConfigError(const std::string& msg)
        : Error("config error: " + msg) {}
};

} // namespace gitshort
