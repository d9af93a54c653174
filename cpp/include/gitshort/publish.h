#pragma once

#include "types.h"

#include <filesystem>
#include <map>
#include <string>

namespace gitshort {

/// Writes static redirect pages, one `<output_dir>/<short_id>/index.html`
/// per record.
class Publisher {
public:
    /// Publisher using the built-in redirect template.
    explicit Publisher(std::filesystem::path output_dir);

    /// Publisher using `template_text`; `{{name}}` placeholders are
    /// replaced with HTML-escaped record fields.
    Publisher(std::filesystem::path output_dir, std::string template_text);

    /// Load the template from a file.
    /// @throws IoError if the file cannot be read.
    static Publisher from_template_file(std::filesystem::path output_dir,
                                        const std::filesystem::path& template_path);

    /// Render and write the page for `record`.
    /// @return Path of the written file.
    /// @throws IoError if the page cannot be written.
    std::filesystem::path publish(const Record& record) const;

    /// Render the page for `record` without writing it.
    std::string render(const Record& record) const;

    const std::filesystem::path& output_dir() const { return output_dir_; }

    /// The template used when none is given.
    static const std::string& default_template();

private:
    std::filesystem::path output_dir_;
    std::string           template_;
};

/// Replace `{{name}}` placeholders in `tmpl` with HTML-escaped values from
/// `values`. Unknown names render as the empty string.
std::string render_template(const std::string& tmpl,
                            const std::map<std::string, std::string>& values);

/// Escape `&`, `<`, `>`, `"` and `'` for HTML text and attribute values.
std::string html_escape(const std::string& s);

/// ISO-8601 rendering (`YYYY-MM-DDTHH:MM:SSZ`) of a seconds-since-epoch value.
std::string format_time(int64_t seconds);

} // namespace gitshort
