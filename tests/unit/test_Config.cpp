#include <gtest/gtest.h>
#include "config/Config.hpp"
#include "config/ConfigRegistry.hpp"
#include "TestSupport.hpp"

#include <stdexcept>

using namespace bc::config;

TEST(ConfigTest, EmptyDocumentGivesDefaults) {
    const auto cfg = loadConfigFromString("");
    EXPECT_EQ(cfg.repository.git_executable, "git");
    EXPECT_EQ(cfg.repository.work_tree_env, "GIT_WORK_TREE");
    EXPECT_EQ(cfg.comparison.hash_match, HashMatch::Exact);
    EXPECT_EQ(cfg.comparison.baseline_format, BlameFormat::Auto);
    EXPECT_FALSE(cfg.comparison.parallel_invocations);
    EXPECT_EQ(cfg.invocation.stderr_snippet_bytes, 512u);
    EXPECT_EQ(cfg.report.progress, ProgressStyle::Lines);
    EXPECT_TRUE(cfg.logging.log_dir.empty());
}

TEST(ConfigTest, SectionsAreDecoded) {
    const auto cfg = loadConfigFromString(R"(
repository:
  git_executable: /usr/local/bin/git
  work_tree_env: GITOXIDE_TREE
comparison:
  hash_match: prefix
  baseline_format: git
  candidate_format: gix
  parallel_invocations: true
  extra_args: "-w"
invocation:
  stderr_snippet_bytes: 64
logging:
  console_log_level: warn
  log_dir: /tmp/blamecheck-logs
  subsystem_levels:
    compare: debug
report:
  progress: dots
  fail_on_mismatch: true
)");

    EXPECT_EQ(cfg.repository.git_executable, "/usr/local/bin/git");
    EXPECT_EQ(cfg.repository.work_tree_env, "GITOXIDE_TREE");
    EXPECT_EQ(cfg.comparison.hash_match, HashMatch::Prefix);
    EXPECT_EQ(cfg.comparison.baseline_format, BlameFormat::Git);
    EXPECT_EQ(cfg.comparison.candidate_format, BlameFormat::Gix);
    EXPECT_TRUE(cfg.comparison.parallel_invocations);
    EXPECT_EQ(cfg.comparison.extra_args, "-w");
    EXPECT_EQ(cfg.invocation.stderr_snippet_bytes, 64u);
    EXPECT_EQ(cfg.logging.console_log_level, spdlog::level::warn);
    EXPECT_EQ(cfg.logging.log_dir, std::filesystem::path("/tmp/blamecheck-logs"));
    EXPECT_EQ(cfg.logging.subsystem_levels.compare, spdlog::level::debug);
    EXPECT_EQ(cfg.logging.subsystem_levels.invoke, spdlog::level::warn);
    EXPECT_EQ(cfg.report.progress, ProgressStyle::Dots);
    EXPECT_TRUE(cfg.report.fail_on_mismatch);
}

TEST(ConfigTest, UnknownEnumValueIsRejected) {
    EXPECT_THROW(loadConfigFromString("comparison:\n  hash_match: fuzzy\n"), std::invalid_argument);
    EXPECT_THROW(loadConfigFromString("report:\n  progress: spinner\n"), std::invalid_argument);
}

TEST(ConfigTest, NonMapSectionIsRejected) {
    EXPECT_THROW(loadConfigFromString("comparison: 3\n"), std::runtime_error);
    EXPECT_THROW(loadConfigFromString("- a\n- b\n"), std::runtime_error);
}

TEST(ConfigTest, LoadsFromFile) {
    const bc::test::TempDir dir;
    const auto path = bc::test::writeFile(dir.path() / "blamecheck.yaml", "comparison:\n  hash_match: prefix\n");
    EXPECT_EQ(loadConfig(path).comparison.hash_match, HashMatch::Prefix);
}

TEST(ConfigTest, DumpedConfigLoadsBack) {
    Config cfg;
    cfg.repository.work_tree_env = "TREE";
    cfg.comparison.candidate_format = BlameFormat::Gix;
    cfg.comparison.extra_args = "-w -M";
    cfg.logging.subsystem_levels.git = spdlog::level::err;
    cfg.report.fail_on_mismatch = true;

    const auto back = loadConfigFromString(dumpConfig(cfg));
    EXPECT_EQ(back.repository.work_tree_env, "TREE");
    EXPECT_EQ(back.comparison.candidate_format, BlameFormat::Gix);
    EXPECT_EQ(back.comparison.extra_args, "-w -M");
    EXPECT_EQ(back.logging.subsystem_levels.git, spdlog::level::err);
    EXPECT_TRUE(back.report.fail_on_mismatch);
}

TEST(ConfigTest, EnumRoundTripNames) {
    EXPECT_EQ(parseHashMatch(to_string(HashMatch::Prefix)), HashMatch::Prefix);
    EXPECT_EQ(parseBlameFormat(to_string(BlameFormat::Git)), BlameFormat::Git);
    EXPECT_EQ(parseProgressStyle(to_string(ProgressStyle::Dots)), ProgressStyle::Dots);
}

TEST(ConfigRegistryTest, InitializedByTestMain) {
    EXPECT_EQ(ConfigRegistry::get().repository.git_executable, "git");
}
