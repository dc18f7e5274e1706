#pragma once

#include "git/Repository.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace bc::git {

enum class TextAttribute { Text, Binary, Unspecified };

struct FileCandidate {
    std::string path;   // relative to the work tree
    TextAttribute text_attribute = TextAttribute::Unspecified;

    bool operator==(const FileCandidate&) const = default;
};

// "-text" anywhere in the eolinfo attribute marks a binary file.
TextAttribute classify(std::string_view attr);

// One record of `git ls-files -z --format="%(path) %(eolinfo:index)"`.
FileCandidate parseLsFilesLine(std::string_view line);

[[nodiscard]] inline bool isComparable(const FileCandidate& f) {
    return f.text_attribute != TextAttribute::Binary;
}

// Drops binary files, keeps tracked order.
std::vector<FileCandidate> filterComparable(const std::vector<FileCandidate>& files);

class FileEnumerator {
public:
    explicit FileEnumerator(Repository repo, std::string gitExecutable = "git");

    // Every tracked file, classified. Throws std::runtime_error if the query cannot run.
    [[nodiscard]] std::vector<FileCandidate> listTracked() const;

    [[nodiscard]] std::vector<FileCandidate> listComparable() const { return filterComparable(listTracked()); }

private:
    Repository repo_;
    std::string gitExecutable_;
};

std::string to_string(TextAttribute a);

} // namespace bc::git
