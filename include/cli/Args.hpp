#pragma once

#include "config/Config.hpp"

#include <cstdint>
#include <filesystem>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <unordered_set>
#include <vector>

namespace bc::cli {

class UsageError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

enum class TokenType { Word, Flag };

struct Token {
    TokenType type;
    std::string text;
};

struct FlagKV {
    std::string key;
    std::optional<std::string> value;
};

struct CommandCall {
    std::vector<FlagKV> options;
    std::vector<std::string> positionals;
};

// "--key=value" -> Flag(key), Word(value); "-1" stays a Word; "--" stays a Word sentinel.
// A "--key" named in `valueFlags` takes the next argument as its value unconditionally.
std::vector<Token> tokenize(const std::vector<std::string>& args, const std::unordered_set<std::string>& valueFlags = {});

// Flags named in `boolFlags` never consume the following word.
CommandCall parseTokens(const std::vector<Token>& toks, const std::unordered_set<std::string>& boolFlags);

std::optional<std::string> optVal(const CommandCall& c, const std::string& key);
std::optional<std::string> optVal(const CommandCall& c, const std::vector<std::string>& keys);
bool hasFlag(const CommandCall& c, const std::string& key);
bool hasFlag(const CommandCall& c, const std::vector<std::string>& keys);

std::optional<uint64_t> parseUInt(std::string_view s);

// Whitespace separated, empty pieces dropped
std::vector<std::string> splitArgs(const std::string& s);

struct Args {
    std::filesystem::path baseline_executable;
    std::filesystem::path comparison_executable;
    int64_t limit = 0;
    int64_t offset = 0;

    std::optional<std::filesystem::path> config_path;
    std::optional<std::filesystem::path> git_work_tree;
    std::optional<std::string> extra_args;
    bool parallel = false;
    bool prefix_hashes = false;
    bool dots = false;
    bool help = false;
};

// argv[0] is skipped. Throws UsageError.
Args parseArgs(int argc, const char* const* argv);
Args parseArgs(const std::vector<std::string>& args);

void applyOverrides(const Args& args, config::Config& cfg);

std::string usage();

} // namespace bc::cli
