#include "util/bytes.hpp"

#include <fmt/core.h>

namespace cw::util {

std::string formatFileSize(const std::uint64_t bytes) {
    if (bytes == 0) return "0 B";

    static const char* kUnits[] = {"B", "KB", "MB", "GB", "TB"};
    int u = 0;
    auto v = static_cast<double>(bytes);
    while (v >= 1024.0 && u < 4) { v /= 1024.0; ++u; }
    return fmt::format("{:.2f} {}", v, kUnits[u]);
}

}
