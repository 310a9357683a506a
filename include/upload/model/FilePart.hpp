#pragma once

#include <cstdint>
#include <string>
#include <string_view>

namespace cw::upload::model {

struct FilePart {
    enum class Status : uint8_t {
        PENDING,
        IN_PROGRESS,
        COMPLETED,
        FAILED,
        CANCELLED
    };

    unsigned int fileIndex = 0;
    unsigned int partNumber = 0;
    uint64_t startByte = 0;
    uint64_t endByte = 0;
    std::string uploadUrl;
    Status status = Status::PENDING;
    std::string etag;
    unsigned int retryCount = 0;
    unsigned int sequenceId = 0;
    std::string lastError;

    [[nodiscard]] uint64_t size() const { return endByte - startByte; }
    [[nodiscard]] bool isTerminal() const { return status == Status::COMPLETED || status == Status::CANCELLED; }

    static std::string_view toString(Status s) noexcept;
};

// Ledger key; one worker owns a key for the lifetime of an attempt.
struct PartKey {
    unsigned int fileIndex = 0;
    unsigned int partNumber = 0;

    auto operator<=>(const PartKey&) const = default;
};

}
