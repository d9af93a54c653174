#include "gitshort/record.h"
#include "gitshort/error.h"

#include <yaml-cpp/yaml.h>

#include <string>

namespace gitshort {

namespace {

const std::string MARKER = "---";

std::string trim(const std::string& s) {
    const char* ws = " \t\r\n";
    size_t start = s.find_first_not_of(ws);
    if (start == std::string::npos) return {};
    size_t end = s.find_last_not_of(ws);
    return s.substr(start, end - start + 1);
}

bool is_marker_line(std::string line) {
    while (!line.empty() && (line.back() == '\r' || line.back() == ' ' ||
                             line.back() == '\t'))
        line.pop_back();
    return line == MARKER;
}

/// Render a non-scalar header value the way it would appear inline.
std::string flow_text(const YAML::Node& node) {
    YAML::Emitter out;
    out << YAML::Flow << node;
    return out.c_str();
}

} // anonymous namespace

std::string encode_message(const RecordFields& fields) {
    if (fields.extra.count("url")) {
        throw ValidationError("'url' cannot be used as an extension field");
    }

    YAML::Emitter out;
    out << YAML::BeginMap;
    out << YAML::Key << "url" << YAML::Value << fields.url;
    for (const auto& [key, value] : fields.extra) {
        out << YAML::Key << key << YAML::Value << value;
    }
    out << YAML::EndMap;
    if (!out.good()) {
        throw ValidationError(std::string("cannot encode header: ") +
                              out.GetLastError());
    }

    return MARKER + "\n" + out.c_str() + "\n" + MARKER + "\n" + fields.description;
}

DecodedMessage decode_message(const std::string& message) {
    std::string msg = trim(message);

    // Opening marker must be the whole first line.
    size_t eol = msg.find('\n');
    if (eol == std::string::npos || !is_marker_line(msg.substr(0, eol))) {
        throw DecodeError("missing header block");
    }

    // Find the closing marker line.
    size_t header_start = eol + 1;
    size_t pos = header_start;
    std::string header, body;
    bool closed = false;
    while (pos <= msg.size()) {
        size_t end = msg.find('\n', pos);
        std::string line = msg.substr(pos, end == std::string::npos
                                               ? std::string::npos
                                               : end - pos);
        if (is_marker_line(line)) {
            header = msg.substr(header_start, pos - header_start);
            body   = end == std::string::npos ? "" : msg.substr(end + 1);
            closed = true;
            break;
        }
        if (end == std::string::npos) break;
        pos = end + 1;
    }
    if (!closed) throw DecodeError("unterminated header block");

    YAML::Node root;
    try {
        root = YAML::Load(header);
    } catch (const YAML::Exception& e) {
        throw DecodeError(std::string("malformed header: ") + e.what());
    }
    if (!root.IsMap()) throw DecodeError("header is not a key/value map");

    const YAML::Node& fields = root;
    DecodedMessage decoded;
    decoded.description = body;

    try {
        const YAML::Node url = fields["url"];
        if (!url || !url.IsScalar()) throw DecodeError("missing url");
        decoded.url = url.Scalar();

        for (const auto& item : fields) {
            std::string key = item.first.as<std::string>();
            if (key == "url") continue;
            const YAML::Node& value = item.second;
            if (value.IsScalar())    decoded.extra[key] = value.Scalar();
            else if (value.IsNull()) decoded.extra[key] = "";
            else                     decoded.extra[key] = flow_text(value);
        }
    } catch (const YAML::Exception& e) {
        throw DecodeError(std::string("malformed header: ") + e.what());
    }

    if (!is_valid_url(decoded.url)) {
        throw DecodeError("invalid url '" + decoded.url + "'");
    }
    return decoded;
}

} // namespace gitshort
