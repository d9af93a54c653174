#include "gitshort/publish.h"
#include "gitshort/error.h"

#include <spdlog/spdlog.h>

#include <ctime>
#include <fstream>
#include <sstream>
#include <string>
#include <system_error>

namespace gitshort {

namespace {

const std::string DEFAULT_TEMPLATE = R"(<!DOCTYPE html>
<html>
<head>
<meta charset="utf-8">
<title>{{short_id}}</title>
<link rel="canonical" href="{{url}}">
<meta http-equiv="refresh" content="0; url={{url}}">
<meta name="description" content="{{description}}">
<meta name="author" content="{{creator}}">
<meta name="date" content="{{created}}">
</head>
<body>
<p>Redirecting to <a href="{{url}}">{{url}}</a></p>
</body>
</html>
)";

std::map<std::string, std::string> template_values(const Record& r) {
    std::map<std::string, std::string> values = r.extra;
    values["id"]          = r.id;
    values["short_id"]    = r.short_id;
    values["url"]         = r.url;
    values["description"] = r.description;
    values["creator"]     = r.creator;
    values["created"]     = format_time(r.created);
    return values;
}

std::string trim(const std::string& s) {
    size_t start = s.find_first_not_of(" \t");
    if (start == std::string::npos) return {};
    size_t end = s.find_last_not_of(" \t");
    return s.substr(start, end - start + 1);
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// Helpers
// ---------------------------------------------------------------------------

std::string html_escape(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (char c : s) {
        switch (c) {
            case '&':  out += "&amp;";  break;
            case '<':  out += "&lt;";   break;
            case '>':  out += "&gt;";   break;
            case '"':  out += "&quot;"; break;
            case '\'': out += "&#39;";  break;
            default:   out += c;
        }
    }
    return out;
}

std::string render_template(const std::string& tmpl,
                            const std::map<std::string, std::string>& values) {
    std::string out;
    out.reserve(tmpl.size());
    size_t pos = 0;
    while (pos < tmpl.size()) {
        size_t open = tmpl.find("{{", pos);
        if (open == std::string::npos) break;
        size_t close = tmpl.find("}}", open + 2);
        if (close == std::string::npos) break;

        out.append(tmpl, pos, open - pos);
        auto it = values.find(trim(tmpl.substr(open + 2, close - open - 2)));
        if (it != values.end()) out += html_escape(it->second);
        pos = close + 2;
    }
    out.append(tmpl, pos, std::string::npos);
    return out;
}

std::string format_time(int64_t seconds) {
    std::time_t t = static_cast<std::time_t>(seconds);
    std::tm tm{};
    gmtime_r(&t, &tm);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &tm);
    return buf;
}

// ---------------------------------------------------------------------------
// Publisher
// ---------------------------------------------------------------------------

Publisher::Publisher(std::filesystem::path output_dir)
    : output_dir_(std::move(output_dir)), template_(DEFAULT_TEMPLATE) {}

Publisher::Publisher(std::filesystem::path output_dir, std::string template_text)
    : output_dir_(std::move(output_dir)), template_(std::move(template_text)) {}

Publisher Publisher::from_template_file(std::filesystem::path output_dir,
                                        const std::filesystem::path& template_path) {
    std::ifstream in(template_path, std::ios::binary);
    if (!in) throw IoError("cannot read template " + template_path.string());
    std::ostringstream ss;
    ss << in.rdbuf();
    return Publisher(std::move(output_dir), ss.str());
}

const std::string& Publisher::default_template() {
    return DEFAULT_TEMPLATE;
}

std::string Publisher::render(const Record& record) const {
    return render_template(template_, template_values(record));
}

std::filesystem::path Publisher::publish(const Record& record) const {
    if (record.short_id.empty()) {
        throw IoError("record " + record.id + " has no short id to publish under");
    }
    auto dir = output_dir_ / record.short_id;
    std::error_code ec;
    std::filesystem::create_directories(dir, ec);
    if (ec) throw IoError("cannot create " + dir.string() + ": " + ec.message());

    auto page = dir / "index.html";
    std::ofstream out(page, std::ios::binary | std::ios::trunc);
    if (!out) throw IoError("cannot open " + page.string());
    std::string html = render(record);
    out.write(html.data(), static_cast<std::streamsize>(html.size()));
    if (!out) throw IoError("write failed: " + page.string());

    spdlog::info("published {}", page.string());
    return page;
}

} // namespace gitshort
