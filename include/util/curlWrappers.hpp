#pragma once

#include "util/httpHelpers.hpp"

#include <curl/curl.h>
#include <stdexcept>
#include <string>
#include <vector>

namespace cw::util {

class CurlEasy {
public:
    CurlEasy() : h_(curl_easy_init()) {
        if (!h_) throw std::runtime_error("curl_easy_init failed");
        curl_easy_setopt(h_, CURLOPT_NOPROGRESS, 1L);
        curl_easy_setopt(h_, CURLOPT_FOLLOWLOCATION, 1L);
        curl_easy_setopt(h_, CURLOPT_NOSIGNAL, 1L);   // worker threads
    }
    ~CurlEasy() { curl_easy_cleanup(h_); }

    CurlEasy(const CurlEasy&) = delete;
    CurlEasy& operator=(const CurlEasy&) = delete;

    operator CURL*()       { return h_; }
    operator const CURL*() const { return h_; }

    void setTimeouts(const long totalSeconds, const long connectSeconds) {
        curl_easy_setopt(h_, CURLOPT_TIMEOUT, totalSeconds);
        curl_easy_setopt(h_, CURLOPT_CONNECTTIMEOUT, connectSeconds);
    }

    void disableTlsVerification() {
        curl_easy_setopt(h_, CURLOPT_SSL_VERIFYPEER, 0L);
        curl_easy_setopt(h_, CURLOPT_SSL_VERIFYHOST, 0L);
    }

    // Request body for POST/PUT; the buffer must outlive perform().
    void setBody(const std::string& body) {
        curl_easy_setopt(h_, CURLOPT_POSTFIELDS, body.data());
        curl_easy_setopt(h_, CURLOPT_POSTFIELDSIZE_LARGE, static_cast<curl_off_t>(body.size()));
    }

    // Streams the request body from read(); seek() lets libcurl rewind on redirects. Implies PUT.
    void setUploadSource(curl_read_callback read, curl_seek_callback seek, void* data, const curl_off_t size) {
        curl_easy_setopt(h_, CURLOPT_UPLOAD, 1L);
        curl_easy_setopt(h_, CURLOPT_READFUNCTION, read);
        curl_easy_setopt(h_, CURLOPT_READDATA, data);
        curl_easy_setopt(h_, CURLOPT_SEEKFUNCTION, seek);
        curl_easy_setopt(h_, CURLOPT_SEEKDATA, data);
        curl_easy_setopt(h_, CURLOPT_INFILESIZE_LARGE, size);
    }

private:
    CURL* h_;
};

class SList {
public:
    SList() = default;
    SList(const SList&) = delete;
    SList& operator=(const SList&) = delete;

    void add(std::string s) {
        store_.push_back(std::move(s));
        head_ = curl_slist_append(head_, store_.back().c_str());
    }
    ~SList() { curl_slist_free_all(head_); }
    curl_slist* get() const { return head_; }

private:
    std::vector<std::string> store_;
    curl_slist*              head_ = nullptr;
};

struct HttpResponse {
    CURLcode curl  = CURLE_OK;
    long     http  = 0;
    std::string body;
    std::string hdr;

    bool ok() const { return curl == CURLE_OK && http / 100 == 2; }

    // Transport failures never produced a status; they report 0 so retry classification sees them.
    [[nodiscard]] long status() const { return curl == CURLE_OK ? http : 0; }

    [[nodiscard]] std::string describe() const {
        if (curl != CURLE_OK) return curl_easy_strerror(curl);
        return "HTTP " + std::to_string(http);
    }
};

// setup receives the handle after the body and header sinks are wired.
template <class SetupFn>
HttpResponse performCurl(SetupFn&& setup) {
    ensureCurlGlobalInit();

    CurlEasy h;
    std::string bodyBuf, hdrBuf;

    curl_easy_setopt(h, CURLOPT_WRITEFUNCTION, writeToString);
    curl_easy_setopt(h, CURLOPT_WRITEDATA,  &bodyBuf);
    curl_easy_setopt(h, CURLOPT_HEADERFUNCTION, writeToString);
    curl_easy_setopt(h, CURLOPT_HEADERDATA, &hdrBuf);

    setup(h);

    HttpResponse r;
    r.curl = curl_easy_perform(h);
    curl_easy_getinfo(h, CURLINFO_RESPONSE_CODE, &r.http);
    r.body.swap(bodyBuf);
    r.hdr.swap(hdrBuf);
    return r;
}

}
