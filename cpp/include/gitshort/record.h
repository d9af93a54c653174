#pragma once

#include "types.h"

#include <map>
#include <string>

namespace gitshort {

// ---------------------------------------------------------------------------
// URL validation
// ---------------------------------------------------------------------------

/// Return true if `url` parses strictly as an absolute URL whose scheme
/// (case-insensitive) is http, https or ftp. Never throws.
bool is_valid_url(const std::string& url);

// ---------------------------------------------------------------------------
// Commit message codec
// ---------------------------------------------------------------------------

/// The stored part of a record as carried by a commit message.
struct DecodedMessage {
    std::string                        url;
    std::string                        description;
    std::map<std::string, std::string> extra;
};

/// Serialize `fields` into a commit message: a `---` delimited YAML header
/// holding `url` and the extension fields, followed by the description.
///
/// @throws ValidationError if an extension field is named `url`.
std::string encode_message(const RecordFields& fields);

/// Parse a commit message produced by encode_message().
///
/// @throws DecodeError if the message has no header, the header is not a
///         YAML map, or `url` is missing or fails is_valid_url().
DecodedMessage decode_message(const std::string& message);

} // namespace gitshort
