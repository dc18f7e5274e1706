#include "log/Registry.hpp"
#include "config/ConfigRegistry.hpp"

#include <stdexcept>
#include <vector>

namespace bc::log {

void Registry::init() {
    if (initialized_) {
        spdlog::warn("[Registry] Already initialized, ignoring second init()");
        return;
    }

    const auto& cnf = config::ConfigRegistry::get().logging;

    console_sink_ = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    console_sink_->set_level(cnf.console_log_level);
    console_sink_->set_color_mode(spdlog::color_mode::automatic);
    console_sink_->set_pattern(LOG_FORMAT);

    report_sink_ = std::make_shared<spdlog::sinks::stdout_sink_mt>();
    report_sink_->set_pattern(REPORT_FORMAT);

    if (!cnf.log_dir.empty()) {
        log_dir_ = cnf.log_dir;
        main_log_path_ = log_dir_ / "blamecheck.log";

        namespace fs = std::filesystem;
        if (!fs::exists(log_dir_)) fs::create_directories(log_dir_);

        main_file_sink_ = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            main_log_path_.string(), main_max_bytes_, main_max_files_);
        main_file_sink_->set_level(cnf.file_log_level);
        main_file_sink_->set_pattern(LOG_FORMAT);
    }

    auto makeLogger = [&](const std::string& name, const spdlog::level::level_enum lvl) {
        std::vector<spdlog::sink_ptr> sinks = { console_sink_ };
        if (main_file_sink_) sinks.push_back(main_file_sink_);
        const auto logger = std::make_shared<spdlog::logger>(name, sinks.begin(), sinks.end());
        logger->set_level(lvl);
        logger->flush_on(spdlog::level::warn);
        spdlog::register_logger(logger);
    };

    const auto& sub_levels = cnf.subsystem_levels;
    makeLogger("blamecheck", sub_levels.blamecheck);
    makeLogger("git",        sub_levels.git);
    makeLogger("invoke",     sub_levels.invoke);
    makeLogger("compare",    sub_levels.compare);

    // report: stdout, flushed per line so progress interleaves with subprocess runs
    {
        std::vector<spdlog::sink_ptr> sinks = { report_sink_ };
        if (main_file_sink_ && cnf.report_to_file) sinks.push_back(main_file_sink_);
        const auto logger = std::make_shared<spdlog::logger>("report", sinks.begin(), sinks.end());
        logger->set_level(spdlog::level::info);
        logger->flush_on(spdlog::level::info);
        spdlog::register_logger(logger);
    }

    initialized_ = true;
    blamecheck()->debug("[Registry] Initialized");
}

std::shared_ptr<spdlog::logger> Registry::get(const std::string& name) {
    auto logger = spdlog::get(name);
    if (!logger) {
        if (!initialized_) throw std::runtime_error("[Registry] Registry not initialized, cannot get logger: " + name);
        throw std::runtime_error("[Registry] Logger not found: " + name);
    }
    return logger;
}

bool Registry::isInitialized() { return initialized_; }

} // namespace bc::log
