#pragma once

#include <cstdint>

namespace cw::upload::model {

struct PartInfo {
    unsigned int partNumber = 0;   // 1-based
    uint64_t startByte = 0;
    uint64_t endByte = 0;          // exclusive
    uint64_t size = 0;

    bool operator==(const PartInfo&) const = default;
};

}
