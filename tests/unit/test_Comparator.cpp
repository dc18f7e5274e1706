#include <gtest/gtest.h>
#include "compare/Comparator.hpp"
#include "compare/Outcome.hpp"

using namespace bc::compare;
using bc::blame::LineFormat;
using bc::config::HashMatch;

class ComparatorTest : public ::testing::Test {
protected:
    std::vector<std::string> blame = {
        "1111111 1 1 #include <cstdio>",
        "1111111 2 2 ",
        "2222222 3 3 int main() {",
        "3333333 4 4     std::puts(\"hi\");",
        "2222222 5 5 }",
    };
    Comparator comparator;
};

TEST_F(ComparatorTest, IdenticalHashesHaveNoMismatches) {
    const auto r = comparator.compare(blame, blame);
    EXPECT_FALSE(r.length_mismatch);
    EXPECT_TRUE(r.mismatches.empty());
    EXPECT_TRUE(r.parse_failures.empty());
    EXPECT_TRUE(r.matches());
    EXPECT_EQ(classify(r), Outcome::BlamesMatch);
}

TEST_F(ComparatorTest, LengthMismatchShortCircuits) {
    auto candidate = blame;
    candidate.pop_back();
    candidate[0] = "not a blame line";
    candidate[1] = "9999999 2 2 ";

    const auto r = comparator.compare(blame, candidate);
    EXPECT_TRUE(r.length_mismatch);
    EXPECT_TRUE(r.mismatches.empty());
    EXPECT_TRUE(r.parse_failures.empty());
    EXPECT_EQ(r.baseline_line_count, 5u);
    EXPECT_EQ(r.candidate_line_count, 4u);
    EXPECT_EQ(classify(r), Outcome::DifferingLineNumbers);
}

TEST_F(ComparatorTest, SingleDifferingHashIsReportedAtItsIndex) {
    auto candidate = blame;
    candidate[3] = "4444444 4 4     std::puts(\"hi\");";

    const auto r = comparator.compare(blame, candidate);
    ASSERT_EQ(r.mismatches.size(), 1u);
    EXPECT_EQ(r.mismatches[0].line_index, 3u);
    EXPECT_EQ(r.mismatches[0].baseline_hash, "3333333");
    EXPECT_EQ(r.mismatches[0].candidate_hash, "4444444");
    EXPECT_EQ(r.mismatches[0].content, "    std::puts(\"hi\");");
    EXPECT_EQ(classify(r), Outcome::HashesDidNotMatch);
}

TEST_F(ComparatorTest, OnlyHashesAreCompared) {
    auto candidate = blame;
    candidate[2] = "2222222 30 31 int main(void) {";

    EXPECT_TRUE(comparator.compare(blame, candidate).matches());
}

TEST_F(ComparatorTest, MismatchCarriesCandidateContent) {
    auto candidate = blame;
    candidate[4] = "5555555 5 5 } // end";

    const auto r = comparator.compare(blame, candidate);
    ASSERT_EQ(r.mismatches.size(), 1u);
    EXPECT_EQ(r.mismatches[0].content, "} // end");
}

TEST_F(ComparatorTest, MalformedBaselineLineIsSkipped) {
    auto baseline = blame;
    baseline[1] = "fatal: something odd";
    auto candidate = blame;
    candidate[1] = "9999999 2 2 ";

    const auto r = comparator.compare(baseline, candidate);
    EXPECT_TRUE(r.mismatches.empty());
    ASSERT_EQ(r.parse_failures.size(), 1u);
    EXPECT_EQ(r.parse_failures[0].line_index, 1u);
    EXPECT_EQ(r.parse_failures[0].side, Side::Baseline);
    EXPECT_EQ(r.parse_failures[0].raw_line, "fatal: something odd");
    EXPECT_EQ(classify(r), Outcome::LineDidNotMatchPattern);
}

TEST_F(ComparatorTest, MalformedCandidateLineIsSkippedAndOthersStillCompared) {
    auto candidate = blame;
    candidate[0] = "garbage";
    candidate[4] = "7777777 5 5 }";

    const auto r = comparator.compare(blame, candidate);
    ASSERT_EQ(r.parse_failures.size(), 1u);
    EXPECT_EQ(r.parse_failures[0].side, Side::Candidate);
    ASSERT_EQ(r.mismatches.size(), 1u);
    EXPECT_EQ(r.mismatches[0].line_index, 4u);
    EXPECT_EQ(classify(r), Outcome::HashesDidNotMatch);
}

TEST_F(ComparatorTest, EmptyOutputsMatch) {
    EXPECT_TRUE(comparator.compare({}, {}).matches());
}

TEST_F(ComparatorTest, PrefixModeToleratesAbbreviatedHashes) {
    const std::vector<std::string> full = {"1a2b3c4d5e6f 1 1 x"};
    const std::vector<std::string> abbrev = {"1a2b3c4 1 1 x"};

    EXPECT_EQ(comparator.compare(full, abbrev).mismatches.size(), 1u);

    const Comparator prefix({HashMatch::Prefix, LineFormat::Gix, LineFormat::Gix});
    EXPECT_TRUE(prefix.compare(full, abbrev).matches());
    EXPECT_TRUE(prefix.compare(abbrev, full).matches());
    EXPECT_EQ(prefix.compare(full, {"1a2b3c5 1 1 x"}).mismatches.size(), 1u);
}

TEST_F(ComparatorTest, NativeGitBaselineAgainstGixCandidate) {
    const Comparator mixed({HashMatch::Prefix, LineFormat::Git, LineFormat::Gix});
    const std::vector<std::string> git = {
        "^1a2b3c4 (A U Thor 2024-01-02 10:11:12 +0000 1) first",
        "5f6e7d8c (A U Thor 2024-02-03 10:11:12 +0000 2) second",
    };
    const std::vector<std::string> gix = {
        "1a2b3c4d9 1 1 first",
        "0000000 2 2 second",
    };

    const auto r = mixed.compare(git, gix);
    EXPECT_TRUE(r.parse_failures.empty());
    ASSERT_EQ(r.mismatches.size(), 1u);
    EXPECT_EQ(r.mismatches[0].line_index, 1u);
    EXPECT_EQ(r.mismatches[0].baseline_hash, "5f6e7d8c");
}

TEST(ComparatorHashTest, HashesAgree) {
    EXPECT_TRUE(Comparator::hashesAgree("abc", "abc", HashMatch::Exact));
    EXPECT_FALSE(Comparator::hashesAgree("abc", "abcd", HashMatch::Exact));
    EXPECT_TRUE(Comparator::hashesAgree("abc", "abcd", HashMatch::Prefix));
    EXPECT_TRUE(Comparator::hashesAgree("abcd", "abc", HashMatch::Prefix));
    EXPECT_FALSE(Comparator::hashesAgree("abce", "abcd", HashMatch::Prefix));
}
