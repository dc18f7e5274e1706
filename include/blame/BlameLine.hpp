#pragma once

#include "config/Config.hpp"

#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <variant>

namespace bc::blame {

// Output shape of a blame executable
enum class LineFormat {
    Gix,    // <hash> <int> <int> <content>
    Git     // [^]<hash> [<file>] (<author> <date> <time> <tz> <lineno>) <content>
};

struct BlameRecord {
    std::string commit_hash;
    int64_t field_a = 0;
    int64_t field_b = 0;
    std::string content;

    bool operator==(const BlameRecord&) const = default;
};

struct Malformed {
    std::string raw_line;

    bool operator==(const Malformed&) const = default;
};

using ParseResult = std::variant<BlameRecord, Malformed>;

ParseResult parse(std::string_view line);
ParseResult parseGitLine(std::string_view line);
ParseResult parse(std::string_view line, LineFormat format);

// Auto: "git" by executable file name, gix shape for everything else
LineFormat resolveFormat(config::BlameFormat configured, const std::filesystem::path& executable);

[[nodiscard]] inline bool isRecord(const ParseResult& r) { return std::holds_alternative<BlameRecord>(r); }

} // namespace bc::blame
