#include "blame/BlameLine.hpp"

#include <charconv>

namespace bc::blame {

namespace {

bool isDigit(const char c) { return c >= '0' && c <= '9'; }

// Commit ids are lowercase hex; fixtures use short lowercase labels, so any
// lowercase alphanumeric run is accepted.
bool isIdChar(const char c) { return isDigit(c) || (c >= 'a' && c <= 'z'); }

class Cursor {
public:
    explicit Cursor(const std::string_view s) : s_(s) {}

    [[nodiscard]] bool done() const { return pos_ >= s_.size(); }
    [[nodiscard]] size_t pos() const { return pos_; }
    [[nodiscard]] std::string_view rest() const { return s_.substr(pos_); }

    bool consume(const char c) {
        if (done() || s_[pos_] != c) return false;
        ++pos_;
        return true;
    }

    template <typename Pred>
    std::string_view takeWhile(Pred pred) {
        const size_t start = pos_;
        while (!done() && pred(s_[pos_])) ++pos_;
        return s_.substr(start, pos_ - start);
    }

    bool takeInt(int64_t& out) {
        const auto digits = takeWhile(isDigit);
        if (digits.empty()) return false;
        const auto [ptr, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), out);
        return ec == std::errc() && ptr == digits.data() + digits.size();
    }

    void seek(const size_t pos) { pos_ = pos; }

private:
    std::string_view s_;
    size_t pos_ = 0;
};

Malformed malformed(const std::string_view line) { return Malformed{std::string(line)}; }

// Position of the first ')' closing "(... <digits>)" at or after `from`, npos if none.
size_t findLineNumberClose(const std::string_view line, const size_t from, int64_t& lineNo) {
    for (auto close = line.find(')', from); close != std::string_view::npos; close = line.find(')', close + 1)) {
        size_t d = close;
        while (d > from && isDigit(line[d - 1])) --d;
        if (d == close || d == from || line[d - 1] != ' ') continue;
        const auto [ptr, ec] = std::from_chars(line.data() + d, line.data() + close, lineNo);
        if (ec != std::errc() || ptr != line.data() + close) continue;
        if (close + 1 < line.size() && line[close + 1] != ' ') continue;
        return close;
    }
    return std::string_view::npos;
}

} // namespace

ParseResult parse(const std::string_view line) {
    Cursor c(line);
    BlameRecord rec;

    const auto hash = c.takeWhile(isIdChar);
    if (hash.empty() || !c.consume(' ')) return malformed(line);
    if (!c.takeInt(rec.field_a) || !c.consume(' ')) return malformed(line);
    if (!c.takeInt(rec.field_b) || !c.consume(' ')) return malformed(line);

    rec.commit_hash = std::string(hash);
    rec.content = std::string(c.rest());
    return rec;
}

ParseResult parseGitLine(const std::string_view line) {
    Cursor c(line);
    BlameRecord rec;

    c.consume('^'); // boundary commit marker
    const auto hash = c.takeWhile([](const char ch) { return isDigit(ch) || (ch >= 'a' && ch <= 'f'); });
    if (hash.empty() || !c.consume(' ')) return malformed(line);

    // Optional file name column precedes the parenthesised metadata
    const auto open = line.find('(', c.pos());
    if (open == std::string_view::npos) return malformed(line);

    int64_t lineNo = 0;
    const auto close = findLineNumberClose(line, open + 1, lineNo);
    if (close == std::string_view::npos) return malformed(line);

    c.seek(close + 1);
    c.consume(' ');

    rec.commit_hash = std::string(hash);
    rec.field_a = lineNo;
    rec.field_b = lineNo;
    rec.content = std::string(c.rest());
    return rec;
}

ParseResult parse(const std::string_view line, const LineFormat format) {
    return format == LineFormat::Git ? parseGitLine(line) : parse(line);
}

LineFormat resolveFormat(const config::BlameFormat configured, const std::filesystem::path& executable) {
    switch (configured) {
    case config::BlameFormat::Gix: return LineFormat::Gix;
    case config::BlameFormat::Git: return LineFormat::Git;
    default: return executable.filename() == "git" ? LineFormat::Git : LineFormat::Gix;
    }
}

} // namespace bc::blame
