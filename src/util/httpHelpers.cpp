#include "util/httpHelpers.hpp"

#include <algorithm>
#include <cctype>
#include <mutex>
#include <stdexcept>

namespace cw::util {

void ensureCurlGlobalInit() {
    static std::once_flag once;
    std::call_once(once, [] {
        if (curl_global_init(CURL_GLOBAL_DEFAULT) != CURLE_OK)
            throw std::runtime_error("curl_global_init failed");
    });
}

size_t writeToString(const char* ptr, const size_t size, const size_t nmemb, void* userdata) {
    auto* out = static_cast<std::string*>(userdata);
    out->append(ptr, size * nmemb);
    return size * nmemb;
}

bool extractETag(const std::string& respHdr, std::string& etagOut) {
    static constexpr std::string_view key = "etag:";

    size_t lineStart = 0;
    while (lineStart < respHdr.size()) {
        auto lineEnd = respHdr.find_first_of("\r\n", lineStart);
        if (lineEnd == std::string::npos) lineEnd = respHdr.size();

        const std::string_view line(respHdr.data() + lineStart, lineEnd - lineStart);
        const bool match = line.size() >= key.size() &&
            std::equal(key.begin(), key.end(), line.begin(), [](const char a, const char b) {
                return a == std::tolower(static_cast<unsigned char>(b));
            });

        if (match) {
            etagOut.assign(line.substr(key.size()));
            trimInPlace(etagOut);
            if (!etagOut.empty()) return true;
        }

        lineStart = respHdr.find_first_not_of("\r\n", lineEnd);
        if (lineStart == std::string::npos) break;
    }
    return false;
}

void trimInPlace(std::string& s) {
    // Trim start
    s.erase(s.begin(), std::ranges::find_if(s.begin(), s.end(), [](const unsigned char ch) {
        return !std::isspace(ch);
    }));

    // Trim end
    s.erase(std::find_if(s.rbegin(), s.rend(), [](const unsigned char ch) {
        return !std::isspace(ch);
    }).base(), s.end());
}

std::string escapeSegment(CURL* curl, const std::string& segment) {
    char* esc = curl_easy_escape(curl, segment.c_str(), static_cast<int>(segment.length()));
    if (!esc) throw std::runtime_error("curl_easy_escape failed for: " + segment);
    std::string out(esc);
    curl_free(esc);
    return out;
}

std::string joinUrl(const std::string_view base, const std::string_view path) {
    std::string out(base);
    while (!out.empty() && out.back() == '/') out.pop_back();
    if (path.empty()) return out;
    if (path.front() != '/') out += '/';
    out += path;
    return out;
}

std::string redactQuery(const std::string& url) {
    const auto q = url.find('?');
    if (q == std::string::npos) return url;
    return url.substr(0, q) + "?<redacted>";
}

}
