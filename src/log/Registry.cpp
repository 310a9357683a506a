#include "log/Registry.hpp"
#include "config/ConfigRegistry.hpp"
#include "util/paths.hpp"

#include <filesystem>
#include <stdexcept>
#include <vector>

namespace cw::log {

void Registry::init() {
    init(config::ConfigRegistry::get().logging);
}

void Registry::init(const config::LoggingConfig& cnf) {
    if (initialized_) {
        spdlog::warn("[LogRegistry] Already initialized, ignoring second init()");
        return;
    }

    // console
    console_sink_ = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    console_sink_->set_level(cnf.levels.console_log_level);
    console_sink_->set_color_mode(spdlog::color_mode::automatic);
    console_sink_->set_pattern(LOG_FORMAT);

    std::vector<spdlog::sink_ptr> sinks{console_sink_};

    if (cnf.log_to_file) {
        log_dir_ = cnf.log_dir.empty() ? paths::getLogPath() : cnf.log_dir;
        main_log_path_ = log_dir_ / "chunkwise.log";

        namespace fs = std::filesystem;
        if (!fs::exists(log_dir_)) fs::create_directories(log_dir_);

        main_file_sink_ = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            main_log_path_.string(), main_max_bytes_, main_max_files_);
        main_file_sink_->set_level(cnf.levels.file_log_level);
        main_file_sink_->set_pattern(LOG_FORMAT);
        sinks.push_back(main_file_sink_);
    }

    auto makeLogger = [&](const std::string& name,
                          const spdlog::level::level_enum lvl = spdlog::level::debug) {
        const auto logger = std::make_shared<spdlog::logger>(name, sinks.begin(), sinks.end());
        logger->set_level(lvl);
        logger->flush_on(spdlog::level::warn);
        spdlog::register_logger(logger);
    };

    const auto& sub_levels = cnf.levels.subsystem_levels;
    makeLogger("chunkwise", sub_levels.chunkwise);
    makeLogger("planner",   sub_levels.planner);
    makeLogger("engine",    sub_levels.engine);
    makeLogger("sequence",  sub_levels.sequence);
    makeLogger("workflow",  sub_levels.workflow);
    makeLogger("http",      sub_levels.http);

    initialized_ = true;
    spdlog::get("chunkwise")->debug("[LogRegistry] Initialized (file sink: {})",
                                    main_file_sink_ ? main_log_path_.string() : "disabled");
}

std::shared_ptr<spdlog::logger> Registry::get(const std::string& name) {
    if (!initialized_) return spdlog::default_logger();
    auto logger = spdlog::get(name);
    if (!logger) throw std::runtime_error("[LogRegistry] Logger not found: " + name);
    return logger;
}

bool Registry::isInitialized() { return initialized_; }

const std::filesystem::path& Registry::logFile() { return main_log_path_; }

void Registry::shutdown() {
    if (!initialized_) return;
    spdlog::apply_all([](const std::shared_ptr<spdlog::logger>& lg) { lg->flush(); });
    for (const auto* name : {"chunkwise", "planner", "engine", "sequence", "workflow", "http"})
        spdlog::drop(name);
    main_file_sink_.reset();
    console_sink_.reset();
    initialized_ = false;
}

}
