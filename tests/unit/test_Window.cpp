#include <gtest/gtest.h>
#include "compare/Window.hpp"

#include <algorithm>
#include <stdexcept>
#include <string>

using namespace bc::compare;
using bc::git::FileCandidate;
using bc::git::TextAttribute;

class WindowTest : public ::testing::Test {
protected:
    std::vector<FileCandidate> files;

    void SetUp() override {
        for (int i = 0; i < 7; ++i) files.push_back({"file" + std::to_string(i) + ".txt", TextAttribute::Text});
    }
};

TEST_F(WindowTest, SkipThenTake) {
    const auto w = window(files, 2, 3);
    ASSERT_EQ(w.size(), 3u);
    EXPECT_EQ(w[0].index, 2u);
    EXPECT_EQ(w[0].file.path, "file2.txt");
    EXPECT_EQ(w[2].index, 4u);
    EXPECT_EQ(w[2].file.path, "file4.txt");
}

TEST_F(WindowTest, SizeIsMinOfLimitAndRemaining) {
    const auto len = static_cast<int64_t>(files.size());
    for (int64_t offset = 0; offset <= len + 2; ++offset) {
        for (int64_t limit = 0; limit <= len + 2; ++limit) {
            const auto w = window(files, offset, limit);
            const auto expected = std::min(limit, std::max<int64_t>(0, len - offset));
            ASSERT_EQ(static_cast<int64_t>(w.size()), expected) << "offset " << offset << " limit " << limit;
            for (size_t i = 0; i < w.size(); ++i) {
                EXPECT_EQ(w[i].index, static_cast<size_t>(offset) + i);
                EXPECT_EQ(w[i].file, files[w[i].index]);
            }
        }
    }
}

TEST_F(WindowTest, OffsetPastEndIsEmpty) {
    EXPECT_TRUE(window(files, 7, 10).empty());
    EXPECT_TRUE(window(files, 100, 1).empty());
}

TEST_F(WindowTest, EmptyInput) {
    EXPECT_TRUE(window({}, 0, 5).empty());
}

TEST_F(WindowTest, NegativeArgumentsAreRejected) {
    EXPECT_THROW(window(files, -1, 3), std::invalid_argument);
    EXPECT_THROW(window(files, 0, -3), std::invalid_argument);
}
