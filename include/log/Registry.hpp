#pragma once

#include "config/Config.hpp"

#include <memory>
#include <string>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <filesystem>

namespace cw::log {

class Registry {
public:
    // Initialize all loggers from ConfigRegistry.
    static void init();
    static void init(const config::LoggingConfig& cnf);

    // Generic access by name. Before init() this hands back spdlog's default logger.
    static std::shared_ptr<spdlog::logger> get(const std::string& name);

    // Subsystem shorthands
    static std::shared_ptr<spdlog::logger> chunkwise() { return get("chunkwise"); }
    static std::shared_ptr<spdlog::logger> planner()   { return get("planner"); }
    static std::shared_ptr<spdlog::logger> engine()    { return get("engine"); }
    static std::shared_ptr<spdlog::logger> sequence()  { return get("sequence"); }
    static std::shared_ptr<spdlog::logger> workflow()  { return get("workflow"); }
    static std::shared_ptr<spdlog::logger> http()      { return get("http"); }

    [[nodiscard]] static bool isInitialized();
    [[nodiscard]] static const std::filesystem::path& logFile();

    // Shut the file sink down and drop every registered logger.
    static void shutdown();

private:
    static constexpr const auto* LOG_FORMAT = "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%n] %v";

    static inline bool initialized_ = false;

    static inline std::filesystem::path log_dir_;
    static inline std::filesystem::path main_log_path_;

    static inline std::shared_ptr<spdlog::sinks::stdout_color_sink_mt> console_sink_;
    static inline std::shared_ptr<spdlog::sinks::rotating_file_sink_mt> main_file_sink_;

    static inline size_t main_max_bytes_ = 10 * 1024 * 1024; // 10 MiB
    static inline size_t main_max_files_ = 5;
};

}
