#include "config/Config.hpp"
#include "config/config_yaml.hpp"

#include <fmt/core.h>
#include <stdexcept>
#include <yaml-cpp/yaml.h>

namespace bc::config {

namespace {

template <typename T>
void decodeSection(const YAML::Node& root, const char* key, T& out) {
    const auto node = root[key];
    if (!node) return;
    if (!YAML::convert<T>::decode(node, out))
        throw std::runtime_error(fmt::format("config: section '{}' must be a map", key));
}

Config decodeRoot(const YAML::Node& root) {
    Config cfg;
    if (!root || root.IsNull()) return cfg;
    if (!root.IsMap()) throw std::runtime_error("config: top level must be a map");

    decodeSection(root, "repository", cfg.repository);
    decodeSection(root, "comparison", cfg.comparison);
    decodeSection(root, "invocation", cfg.invocation);
    decodeSection(root, "logging", cfg.logging);
    decodeSection(root, "report", cfg.report);

    return cfg;
}

} // namespace

Config loadConfig(const std::filesystem::path& path) {
    return decodeRoot(YAML::LoadFile(path.string()));
}

Config loadConfigFromString(const std::string& yaml) {
    return decodeRoot(YAML::Load(yaml));
}

std::string dumpConfig(const Config& cfg) {
    YAML::Node root;
    root["repository"] = cfg.repository;
    root["comparison"] = cfg.comparison;
    root["invocation"] = cfg.invocation;
    root["logging"] = cfg.logging;
    root["report"] = cfg.report;

    YAML::Emitter out;
    out << root;
    return {out.c_str()};
}

HashMatch parseHashMatch(const std::string_view s) {
    if (s == "exact") return HashMatch::Exact;
    if (s == "prefix") return HashMatch::Prefix;
    throw std::invalid_argument(fmt::format("config: unknown hash_match '{}' (expected exact or prefix)", s));
}

BlameFormat parseBlameFormat(const std::string_view s) {
    if (s == "auto") return BlameFormat::Auto;
    if (s == "gix") return BlameFormat::Gix;
    if (s == "git") return BlameFormat::Git;
    throw std::invalid_argument(fmt::format("config: unknown blame format '{}' (expected auto, gix or git)", s));
}

ProgressStyle parseProgressStyle(const std::string_view s) {
    if (s == "lines") return ProgressStyle::Lines;
    if (s == "dots") return ProgressStyle::Dots;
    throw std::invalid_argument(fmt::format("config: unknown progress style '{}' (expected lines or dots)", s));
}

std::string to_string(const HashMatch m) {
    return m == HashMatch::Prefix ? "prefix" : "exact";
}

std::string to_string(const BlameFormat f) {
    switch (f) {
    case BlameFormat::Gix: return "gix";
    case BlameFormat::Git: return "git";
    default: return "auto";
    }
}

std::string to_string(const ProgressStyle p) {
    return p == ProgressStyle::Dots ? "dots" : "lines";
}

} // namespace bc::config
