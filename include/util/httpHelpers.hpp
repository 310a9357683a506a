#pragma once

#include <string>
#include <string_view>
#include <vector>
#include <curl/curl.h>

namespace cw::util {

size_t writeToString(const char* ptr, size_t size, size_t nmemb, void* userdata);

// Header names are matched case-insensitively; surrounding whitespace is stripped, quotes are kept.
[[nodiscard]] bool extractETag(const std::string& respHdr, std::string& etagOut);

void trimInPlace(std::string& s);

std::string escapeSegment(CURL* curl, const std::string& segment);

// Joins a base url and a path without doubling or dropping the '/'.
std::string joinUrl(std::string_view base, std::string_view path);

// Redacts the query string of a presigned url so signatures never reach the logs.
std::string redactQuery(const std::string& url);

void ensureCurlGlobalInit();

}
