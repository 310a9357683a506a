#pragma once

#include <cstdint>
#include <string>

namespace cw::util {

constexpr std::uint64_t operator"" _KiB(unsigned long long v) { return v * 1024ULL; }
constexpr std::uint64_t operator"" _MiB(unsigned long long v) { return v * 1024ULL * 1024ULL; }
constexpr std::uint64_t operator"" _GiB(unsigned long long v) { return v * 1024ULL * 1024ULL * 1024ULL; }

// "0 B", otherwise two decimals in the largest base-1024 unit up to TB, e.g. "150.00 MB".
std::string formatFileSize(std::uint64_t bytes);

}
