#pragma once

#include <cstdint>
#include <memory>
#include <string>

namespace cw::fs { class FileHandle; }

namespace cw::api {

// Byte range [start, end) of a file, read only while the request is sent.
struct PartBody {
    std::shared_ptr<const fs::FileHandle> file;
    uint64_t start = 0;
    uint64_t end = 0;

    [[nodiscard]] uint64_t size() const { return end - start; }
};

class PartTransport {
public:
    virtual ~PartTransport() = default;

    // PUT the part to a presigned url and return the ETag. Throws HttpError; local read
    // failures surface as std::runtime_error.
    virtual std::string putPart(const std::string& url, const PartBody& body) = 0;
};

}
