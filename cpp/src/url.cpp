#include "gitshort/record.h"

#include <curl/curl.h>

#include <algorithm>
#include <cctype>
#include <string>

namespace gitshort {

namespace {

constexpr const char* VALID_SCHEMES[] = {"http", "https", "ftp"};

/// RAII wrapper for CURLU*.
struct UrlGuard {
    CURLU* u = curl_url();
    ~UrlGuard() { if (u) curl_url_cleanup(u); }
};

/// RAII wrapper for strings handed out by curl_url_get.
struct CurlString {
    char* s = nullptr;
    ~CurlString() { if (s) curl_free(s); }
};

std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

} // anonymous namespace

bool is_valid_url(const std::string& url) {
    if (url.empty()) return false;
    // curl tolerates surrounding whitespace and control bytes in places a
    // strict parser does not.
    for (unsigned char c : url) {
        if (c <= 0x20 || c == 0x7f) return false;
    }

    UrlGuard h;
    if (!h.u) return false;

    // Parse any scheme so the allow-list below decides, not curl's
    // built-in protocol table.
    if (curl_url_set(h.u, CURLUPART_URL, url.c_str(),
                     CURLU_NON_SUPPORT_SCHEME) != CURLUE_OK) {
        return false;
    }

    CurlString scheme;
    if (curl_url_get(h.u, CURLUPART_SCHEME, &scheme.s, 0) != CURLUE_OK || !scheme.s)
        return false;

    CurlString host;
    if (curl_url_get(h.u, CURLUPART_HOST, &host.s, 0) != CURLUE_OK || !host.s ||
        host.s[0] == '\0')
        return false;

    std::string s = lower(scheme.s);
    return std::any_of(std::begin(VALID_SCHEMES), std::end(VALID_SCHEMES),
                       [&](const char* v) { return s == v; });
}

} // namespace gitshort
