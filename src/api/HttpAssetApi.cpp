#include "api/HttpAssetApi.hpp"
#include "api/HttpError.hpp"
#include "util/curlWrappers.hpp"
#include "fs/FileHandle.hpp"
#include "log/Registry.hpp"

#include <algorithm>
#include <cstdio>
#include <stdexcept>
#include <nlohmann/json.hpp>
#include <fmt/core.h>

using namespace cw::api;
using namespace cw::util;
using namespace cw::log;

static void applyApiOptions(CurlEasy& h, const cw::config::ApiConfig& cfg) {
    h.setTimeouts(static_cast<long>(cfg.request_timeout.count()), static_cast<long>(cfg.connect_timeout.count()));
    if (!cfg.verify_tls) h.disableTlsVerification();
}

namespace {

struct PartReader {
    const PartBody& body;
    uint64_t pos = 0;
    std::string error;
};

// libcurl callbacks must not throw; a read failure aborts the transfer and is rethrown after perform.
size_t readPart(char* buf, const size_t size, const size_t nitems, void* userp) {
    auto* r = static_cast<PartReader*>(userp);
    const auto want = static_cast<size_t>(std::min<uint64_t>(size * nitems, r->body.end - r->pos));
    if (want == 0) return 0;

    try {
        const auto n = r->body.file->read(r->pos, buf, want);
        if (n == 0) {
            r->error = fmt::format("file ended at offset {}, expected {} bytes", r->pos, r->body.end);
            return CURL_READFUNC_ABORT;
        }
        r->pos += n;
        return n;
    } catch (const std::exception& e) {
        r->error = e.what();
        return CURL_READFUNC_ABORT;
    }
}

int seekPart(void* userp, const curl_off_t offset, const int origin) {
    auto* r = static_cast<PartReader*>(userp);
    if (origin != SEEK_SET) return CURL_SEEKFUNC_CANTSEEK;
    if (offset < 0 || static_cast<uint64_t>(offset) > r->body.size()) return CURL_SEEKFUNC_FAIL;
    r->pos = r->body.start + static_cast<uint64_t>(offset);
    return CURL_SEEKFUNC_OK;
}

}

HttpAssetApi::HttpAssetApi(config::ApiConfig cfg) : cfg_(std::move(cfg)) {
    ensureCurlGlobalInit();
}

std::string HttpAssetApi::escape(const std::string& segment) const {
    CurlEasy h;
    return escapeSegment(h, segment);
}

nlohmann::json HttpAssetApi::sendJson(const char* method, const std::string& path, const nlohmann::json* body) const {
    const auto url = joinUrl(cfg_.base_url, path);
    const std::string payload = body ? body->dump() : std::string{};

    SList headers;
    headers.add("Accept: application/json");
    if (body) headers.add("Content-Type: application/json");
    if (!cfg_.auth_token.empty()) headers.add("Authorization: Bearer " + cfg_.auth_token);

    const auto res = performCurl([&](CurlEasy& h) {
        curl_easy_setopt(h, CURLOPT_URL, url.c_str());
        curl_easy_setopt(h, CURLOPT_CUSTOMREQUEST, method);
        curl_easy_setopt(h, CURLOPT_HTTPHEADER, headers.get());
        if (body) h.setBody(payload);
        applyApiOptions(h, cfg_);
    });

    if (!res.ok()) {
        Registry::http()->error("[HttpAssetApi] {} {} failed: CURL={} HTTP={} Response:\n{}",
                                method, path, static_cast<int>(res.curl), res.http, res.body);
        throw HttpError(res.status(), fmt::format("{} {}: {}", method, path, res.describe()), res.body);
    }

    Registry::http()->debug("[HttpAssetApi] {} {} -> {}", method, path, res.http);

    if (res.body.empty()) return nlohmann::json::object();
    try {
        return nlohmann::json::parse(res.body);
    } catch (const nlohmann::json::parse_error& e) {
        throw std::runtime_error(fmt::format("{} {}: malformed JSON response: {}", method, path, e.what()));
    }
}

model::CreateAssetResponse HttpAssetApi::createAsset(const model::CreateAssetRequest& req) {
    const nlohmann::json body = req;
    return sendJson("POST", "/assets", &body).get<model::CreateAssetResponse>();
}

void HttpAssetApi::addMetadata(const std::string& databaseId, const std::string& assetId,
                               const model::Metadata& metadata) {
    const nlohmann::json body = {{"metadata", metadata}};
    const auto path = fmt::format("/database/{}/assets/{}/metadata", escape(databaseId), escape(assetId));
    sendJson("PUT", path, &body);
}

model::CreateAssetLinkResponse HttpAssetApi::createAssetLink(const model::CreateAssetLinkRequest& req) {
    const nlohmann::json body = req;
    return sendJson("POST", "/asset-links", &body).get<model::CreateAssetLinkResponse>();
}

void HttpAssetApi::createAssetLinkMetadata(const std::string& assetLinkId, const model::LinkMetadataEntry& entry) {
    const nlohmann::json body = entry;
    sendJson("POST", fmt::format("/asset-links/{}/metadata", escape(assetLinkId)), &body);
}

model::InitializeUploadResponse HttpAssetApi::initializeUpload(const model::InitializeUploadRequest& req) {
    const nlohmann::json body = req;
    return sendJson("POST", "/uploads", &body).get<model::InitializeUploadResponse>();
}

model::CompleteUploadResponse HttpAssetApi::completeUpload(const std::string& uploadId,
                                                           const model::CompleteUploadRequest& req) {
    const nlohmann::json body = req;
    return sendJson("POST", fmt::format("/uploads/{}/complete", escape(uploadId)), &body)
        .get<model::CompleteUploadResponse>();
}

CurlPartTransport::CurlPartTransport(config::ApiConfig cfg) : cfg_(std::move(cfg)) {
    ensureCurlGlobalInit();
}

std::string CurlPartTransport::putPart(const std::string& url, const PartBody& body) {
    SList headers;
    headers.add("Content-Type: application/octet-stream");

    PartReader reader{.body = body, .pos = body.start};
    const auto res = performCurl([&](CurlEasy& h) {
        curl_easy_setopt(h, CURLOPT_URL, url.c_str());
        curl_easy_setopt(h, CURLOPT_HTTPHEADER, headers.get());
        h.setUploadSource(readPart, seekPart, &reader, static_cast<curl_off_t>(body.size()));
        applyApiOptions(h, cfg_);
    });

    if (!reader.error.empty())
        throw std::runtime_error(fmt::format("reading {} for upload: {}", body.file->describe(), reader.error));

    if (!res.ok()) {
        Registry::http()->warn("[CurlPartTransport] PUT {} failed: CURL={} HTTP={} Response:\n{}",
                               redactQuery(url), static_cast<int>(res.curl), res.http, res.body);
        throw HttpError(res.status(), fmt::format("PUT part: {}", res.describe()), res.body);
    }

    std::string etag;
    if (!extractETag(res.hdr, etag))
        throw HttpError(res.http, "PUT part: response carried no ETag header", res.body);
    return etag;
}
