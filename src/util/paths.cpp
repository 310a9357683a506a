#include "util/paths.hpp"

#include <cstdlib>
#include <string>
#include <unistd.h>

namespace fs = std::filesystem;

namespace cw::paths {

static fs::path testLogPath_;

static fs::path envPath(const char* name) {
    const char* v = std::getenv(name);
    return v && *v ? fs::path(v) : fs::path{};
}

fs::path getConfigPath() {
    if (auto p = envPath("CHUNKWISE_CONFIG"); !p.empty()) return p;
    if (auto p = envPath("XDG_CONFIG_HOME"); !p.empty()) return p / "chunkwise" / "config.yaml";
    if (auto p = envPath("HOME"); !p.empty()) return p / ".config" / "chunkwise" / "config.yaml";
    return fs::current_path() / "chunkwise.yaml";
}

fs::path getLogPath() {
    if (!testLogPath_.empty()) return testLogPath_;
    if (auto p = envPath("XDG_STATE_HOME"); !p.empty()) return p / "chunkwise" / "logs";
    if (auto p = envPath("HOME"); !p.empty()) return p / ".local" / "state" / "chunkwise" / "logs";
    return fs::temp_directory_path() / "chunkwise" / "logs";
}

void setLogPathForTesting() {
    testLogPath_ = fs::temp_directory_path() / ("chunkwise_test_logs_" + std::to_string(::getpid()));
}

}
