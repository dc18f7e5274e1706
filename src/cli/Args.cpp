#include "cli/Args.hpp"

#include <algorithm>
#include <boost/algorithm/string.hpp>
#include <fmt/core.h>
#include <limits>

namespace bc::cli {

namespace {

const std::unordered_set<std::string> BOOL_FLAGS = {"parallel", "prefix-hashes", "dots", "help", "h"};
const std::unordered_set<std::string> VALUE_FLAGS = {"config", "git-work-tree", "args"};

bool looks_negative_number(const std::string_view s) {
    if (s.size() < 2 || s[0] != '-') return false;
    return std::ranges::all_of(s.substr(1), [](const char c) { return c >= '0' && c <= '9'; });
}

void pushFlag(std::vector<Token>& out, std::string k) {
    k.erase(0, k.find_first_not_of('-'));
    out.push_back({TokenType::Flag, std::move(k)});
}

void pushWord(std::vector<Token>& out, std::string v) {
    out.push_back({TokenType::Word, std::move(v)});
}

// Upsert a flag (last wins)
void setOpt(CommandCall& c, const std::string& key, const std::optional<std::string>& val) {
    for (auto& [k, v] : c.options) if (k == key) { v = val; return; }
    c.options.push_back(FlagKV{key, val});
}

int64_t parseCount(const std::string& s, const char* what) {
    const auto v = parseUInt(s);
    if (!v || *v > static_cast<uint64_t>(std::numeric_limits<int64_t>::max()))
        throw UsageError(fmt::format("{} must be a non-negative integer, got '{}'", what, s));
    return static_cast<int64_t>(*v);
}

} // namespace

std::vector<Token> tokenize(const std::vector<std::string>& args, const std::unordered_set<std::string>& valueFlags) {
    std::vector<Token> out;
    out.reserve(args.size() + 2);
    bool stop = false;

    for (size_t i = 0; i < args.size(); ++i) {
        const auto& a = args[i];
        if (stop || a == "--") {
            if (a == "--" && !stop) stop = true;
            pushWord(out, a);
            continue;
        }

        if (a.rfind("--", 0) == 0) {
            if (const auto eq = a.find('='); eq != std::string::npos) {
                pushFlag(out, a.substr(0, eq));
                pushWord(out, a.substr(eq + 1));
            } else {
                pushFlag(out, a);
                // "--args -w": the value is taken verbatim, even when it looks like a flag
                if (valueFlags.contains(out.back().text) && i + 1 < args.size()) pushWord(out, args[++i]);
            }
            continue;
        }

        if (a.size() > 1 && a[0] == '-' && !looks_negative_number(a)) {
            pushFlag(out, a);
            continue;
        }

        pushWord(out, a);
    }

    return out;
}

CommandCall parseTokens(const std::vector<Token>& toks, const std::unordered_set<std::string>& boolFlags) {
    CommandCall call;
    call.options.reserve(8);
    call.positionals.reserve(8);

    bool stop_flags = false;

    for (size_t i = 0; i < toks.size(); ++i) {
        const Token& t = toks[i];

        // Sentinel: "--" arrives as a Word from the tokenizer
        if (!stop_flags && t.type == TokenType::Word && t.text == "--") {
            stop_flags = true;
            continue;
        }

        if (!stop_flags && t.type == TokenType::Flag) {
            const bool takesValue = !boolFlags.contains(t.text);
            if (takesValue && i + 1 < toks.size() && toks[i + 1].type == TokenType::Word && toks[i + 1].text != "--") {
                setOpt(call, t.text, toks[i + 1].text);
                ++i; // consumed value
            } else {
                setOpt(call, t.text, std::nullopt);
            }
            continue;
        }

        call.positionals.push_back(t.text);
    }

    return call;
}

std::optional<std::string> optVal(const CommandCall& c, const std::string& key) {
    for (const auto& [k, v] : c.options) if (k == key) return v.value_or(std::string{});
    return std::nullopt;
}

std::optional<std::string> optVal(const CommandCall& c, const std::vector<std::string>& keys) {
    for (const auto& k : keys) if (const auto v = optVal(c, k)) return v;
    return std::nullopt;
}

bool hasFlag(const CommandCall& c, const std::string& key) {
    return std::ranges::any_of(c.options, [&key](const auto& kv) { return kv.key == key; });
}

bool hasFlag(const CommandCall& c, const std::vector<std::string>& keys) {
    return std::ranges::any_of(keys, [&c](const auto& k) { return hasFlag(c, k); });
}

std::optional<uint64_t> parseUInt(const std::string_view s) {
    if (s.empty()) return std::nullopt;

    uint64_t v = 0;
    for (const char c : s) {
        if (c < '0' || c > '9') return std::nullopt;
        const auto digit = static_cast<uint64_t>(c - '0');
        if (v > (std::numeric_limits<uint64_t>::max() - digit) / 10) return std::nullopt; // overflow
        v = v * 10 + digit;
    }

    return v;
}

std::vector<std::string> splitArgs(const std::string& s) {
    std::vector<std::string> parts;
    const auto trimmed = boost::algorithm::trim_copy(s);
    if (trimmed.empty()) return parts;
    boost::algorithm::split(parts, trimmed, boost::algorithm::is_any_of(" \t\n"), boost::algorithm::token_compress_on);
    return parts;
}

Args parseArgs(const int argc, const char* const* argv) {
    std::vector<std::string> args;
    for (int i = 1; i < argc; ++i) args.emplace_back(argv[i]);
    return parseArgs(args);
}

Args parseArgs(const std::vector<std::string>& raw) {
    const auto call = parseTokens(tokenize(raw, VALUE_FLAGS), BOOL_FLAGS);

    Args args;
    args.help = hasFlag(call, std::vector<std::string>{"help", "h"});
    if (args.help) return args;

    for (const auto& [k, v] : call.options) {
        if (BOOL_FLAGS.contains(k)) continue;
        if (!VALUE_FLAGS.contains(k)) throw UsageError(fmt::format("unknown option --{}", k));
        if (!v) throw UsageError(fmt::format("option --{} requires a value", k));
    }

    if (call.positionals.size() != 4)
        throw UsageError(fmt::format("expected 4 arguments, got {}", call.positionals.size()));

    args.baseline_executable = call.positionals[0];
    args.comparison_executable = call.positionals[1];
    args.limit = parseCount(call.positionals[2], "limit");
    args.offset = parseCount(call.positionals[3], "offset");

    if (const auto v = optVal(call, "config")) args.config_path = *v;
    if (const auto v = optVal(call, "git-work-tree")) args.git_work_tree = *v;
    if (const auto v = optVal(call, "args")) args.extra_args = *v;
    args.parallel = hasFlag(call, "parallel");
    args.prefix_hashes = hasFlag(call, "prefix-hashes");
    args.dots = hasFlag(call, "dots");

    return args;
}

void applyOverrides(const Args& args, config::Config& cfg) {
    if (args.extra_args) cfg.comparison.extra_args = *args.extra_args;
    if (args.parallel) cfg.comparison.parallel_invocations = true;
    if (args.prefix_hashes) cfg.comparison.hash_match = config::HashMatch::Prefix;
    if (args.dots) cfg.report.progress = config::ProgressStyle::Dots;
}

std::string usage() {
    return "usage: blamecheck <baseline_executable> <comparison_executable> <limit> <offset> [options]\n"
           "\n"
           "options:\n"
           "  --config <file>         YAML configuration\n"
           "  --git-work-tree <dir>   working tree root (default: $GIT_WORK_TREE)\n"
           "  --args <extra>          extra arguments passed to both blame invocations\n"
           "  --parallel              run baseline and candidate concurrently per file\n"
           "  --prefix-hashes         treat abbreviated hashes as matching\n"
           "  --dots                  one character of progress per file\n"
           "  -h, --help              show this message\n";
}

} // namespace bc::cli
