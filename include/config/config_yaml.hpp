#pragma once

#include "config/Config.hpp"
#include <yaml-cpp/yaml.h>

namespace YAML {

using namespace bc::config;

template<>
struct convert<RepositoryConfig> {
    static Node encode(const RepositoryConfig& rhs) {
        Node node;
        node["git_executable"] = rhs.git_executable;
        node["work_tree_env"] = rhs.work_tree_env;
        return node;
    }

    static bool decode(const Node& node, RepositoryConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.git_executable = node["git_executable"].as<std::string>("git");
        rhs.work_tree_env = node["work_tree_env"].as<std::string>("GIT_WORK_TREE");
        return true;
    }
};

template<>
struct convert<ComparisonConfig> {
    static Node encode(const ComparisonConfig& rhs) {
        Node node;
        node["hash_match"] = to_string(rhs.hash_match);
        node["baseline_format"] = to_string(rhs.baseline_format);
        node["candidate_format"] = to_string(rhs.candidate_format);
        node["parallel_invocations"] = rhs.parallel_invocations;
        node["extra_args"] = rhs.extra_args;
        return node;
    }

    static bool decode(const Node& node, ComparisonConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.hash_match = parseHashMatch(node["hash_match"].as<std::string>("exact"));
        rhs.baseline_format = parseBlameFormat(node["baseline_format"].as<std::string>("auto"));
        rhs.candidate_format = parseBlameFormat(node["candidate_format"].as<std::string>("auto"));
        rhs.parallel_invocations = node["parallel_invocations"].as<bool>(false);
        rhs.extra_args = node["extra_args"].as<std::string>("");
        return true;
    }
};

template<>
struct convert<InvocationConfig> {
    static Node encode(const InvocationConfig& rhs) {
        Node node;
        node["stderr_snippet_bytes"] = rhs.stderr_snippet_bytes;
        return node;
    }

    static bool decode(const Node& node, InvocationConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.stderr_snippet_bytes = node["stderr_snippet_bytes"].as<size_t>(512);
        return true;
    }
};

static std::string to_std_string(const spdlog::string_view_t sv) { return {sv.data(), sv.size()}; }

template<>
struct convert<SubsystemLogLevelsConfig> {
    static Node encode(const SubsystemLogLevelsConfig& rhs) {
        Node node;
        node["blamecheck"] = to_std_string(spdlog::level::to_string_view(rhs.blamecheck));
        node["git"]        = to_std_string(spdlog::level::to_string_view(rhs.git));
        node["invoke"]     = to_std_string(spdlog::level::to_string_view(rhs.invoke));
        node["compare"]    = to_std_string(spdlog::level::to_string_view(rhs.compare));
        return node;
    }

    static bool decode(const Node& node, SubsystemLogLevelsConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.blamecheck = spdlog::level::from_str(node["blamecheck"].as<std::string>("info"));
        rhs.git = spdlog::level::from_str(node["git"].as<std::string>("info"));
        rhs.invoke = spdlog::level::from_str(node["invoke"].as<std::string>("warn"));
        rhs.compare = spdlog::level::from_str(node["compare"].as<std::string>("warn"));
        return true;
    }
};

template<>
struct convert<LoggingConfig> {
    static Node encode(const LoggingConfig& rhs) {
        Node node;
        node["console_log_level"] = to_std_string(spdlog::level::to_string_view(rhs.console_log_level));
        node["file_log_level"]    = to_std_string(spdlog::level::to_string_view(rhs.file_log_level));
        node["log_dir"]           = rhs.log_dir.string();
        node["report_to_file"]    = rhs.report_to_file;
        node["subsystem_levels"]  = rhs.subsystem_levels;
        return node;
    }

    static bool decode(const Node& node, LoggingConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.console_log_level = spdlog::level::from_str(node["console_log_level"].as<std::string>("info"));
        rhs.file_log_level = spdlog::level::from_str(node["file_log_level"].as<std::string>("debug"));
        rhs.log_dir = node["log_dir"].as<std::string>("");
        rhs.report_to_file = node["report_to_file"].as<bool>(false);
        if (node["subsystem_levels"]) rhs.subsystem_levels = node["subsystem_levels"].as<SubsystemLogLevelsConfig>();
        return true;
    }
};

template<>
struct convert<ReportConfig> {
    static Node encode(const ReportConfig& rhs) {
        Node node;
        node["progress"] = to_string(rhs.progress);
        node["fail_on_mismatch"] = rhs.fail_on_mismatch;
        return node;
    }

    static bool decode(const Node& node, ReportConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.progress = parseProgressStyle(node["progress"].as<std::string>("lines"));
        rhs.fail_on_mismatch = node["fail_on_mismatch"].as<bool>(false);
        return true;
    }
};

} // namespace YAML
