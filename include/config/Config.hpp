#pragma once

#include <cstddef>
#include <filesystem>
#include <string>
#include <string_view>
#include <spdlog/spdlog.h>

namespace bc::config {

enum class HashMatch { Exact, Prefix };
enum class BlameFormat { Auto, Gix, Git };
enum class ProgressStyle { Lines, Dots };

struct RepositoryConfig {
    std::string git_executable = "git";
    std::string work_tree_env = "GIT_WORK_TREE";
};

struct ComparisonConfig {
    HashMatch hash_match = HashMatch::Exact;
    BlameFormat baseline_format = BlameFormat::Auto;
    BlameFormat candidate_format = BlameFormat::Auto;
    bool parallel_invocations = false;
    std::string extra_args; // whitespace separated, inserted after "blame"
};

struct InvocationConfig {
    size_t stderr_snippet_bytes = 512;
};

struct SubsystemLogLevelsConfig {
    spdlog::level::level_enum blamecheck = spdlog::level::info;  // Startup, totals, fatal errors
    spdlog::level::level_enum git        = spdlog::level::info;  // Tracked file query
    spdlog::level::level_enum invoke     = spdlog::level::warn;  // Subprocess launch and exit status
    spdlog::level::level_enum compare    = spdlog::level::warn;  // Parse failures, per line detail
};

struct LoggingConfig {
    spdlog::level::level_enum console_log_level = spdlog::level::info;
    spdlog::level::level_enum file_log_level = spdlog::level::debug;
    std::filesystem::path log_dir; // empty = console only
    bool report_to_file = false;
    SubsystemLogLevelsConfig subsystem_levels;
};

struct ReportConfig {
    ProgressStyle progress = ProgressStyle::Lines;
    bool fail_on_mismatch = false;
};

struct Config {
    RepositoryConfig repository;
    ComparisonConfig comparison;
    InvocationConfig invocation;
    LoggingConfig logging;
    ReportConfig report;
};

Config loadConfig(const std::filesystem::path& path);
Config loadConfigFromString(const std::string& yaml);
std::string dumpConfig(const Config& cfg);

HashMatch parseHashMatch(std::string_view s);
BlameFormat parseBlameFormat(std::string_view s);
ProgressStyle parseProgressStyle(std::string_view s);

std::string to_string(HashMatch m);
std::string to_string(BlameFormat f);
std::string to_string(ProgressStyle p);

} // namespace bc::config
