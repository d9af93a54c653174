#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace gitshort {

class CommitResolver;

// ---------------------------------------------------------------------------
// base58 (Bitcoin alphabet)
// ---------------------------------------------------------------------------

/// Encode raw bytes as base58. Leading zero bytes become leading '1's.
std::string base58_encode(const std::vector<uint8_t>& bytes);

/// Decode a base58 string back to raw bytes.
/// @throws InvalidIdError on characters outside the alphabet.
std::vector<uint8_t> base58_decode(const std::string& text);

// ---------------------------------------------------------------------------
// hex helpers
// ---------------------------------------------------------------------------

/// Lowercase hex rendering of `bytes`.
std::string bytes_to_hex(const std::vector<uint8_t>& bytes);

/// Parse an even-length hex string.
/// @throws InvalidIdError on odd length or non-hex characters.
std::vector<uint8_t> hex_to_bytes(const std::string& hex);

/// True if `s` is non-empty and made only of hex digits.
bool is_hex(const std::string& s);

// ---------------------------------------------------------------------------
// Identifiers
// ---------------------------------------------------------------------------

/// The permanent id of a commit: base58 of the whole hash.
std::string canonical_id(const std::string& commit_hex);

/// The shortest whole-byte prefix of `commit_hex`, starting at two bytes,
/// that currently resolves uniquely to that commit, base58 encoded.
std::string short_id(CommitResolver& resolver, const std::string& commit_hex);

/// Turn an id or short id back into the hex prefix it encodes.
/// @throws InvalidIdError if `id` is not valid base58 or is empty.
std::string decode_id(const std::string& id);

} // namespace gitshort
