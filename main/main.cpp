#include "cli/Args.hpp"
#include "config/ConfigRegistry.hpp"
#include "log/Registry.hpp"
#include "runtime/Driver.hpp"

#include <cstdlib>
#include <filesystem>
#include <utility>
#include <fmt/core.h>

using namespace bc;

int main(const int argc, char** argv) {
    cli::Args args;
    try {
        args = cli::parseArgs(argc, argv);
    } catch (const cli::UsageError& e) {
        fmt::print("{}\n{}", e.what(), cli::usage());
        return EXIT_FAILURE;
    }

    if (args.help) {
        fmt::print("{}", cli::usage());
        return EXIT_SUCCESS;
    }

    try {
        config::ConfigRegistry::init(args.config_path.value_or(std::filesystem::path{}));
        log::Registry::init();

        auto cfg = config::ConfigRegistry::get();
        cli::applyOverrides(args, cfg);

        log::Registry::blamecheck()->debug("[*] Effective configuration:\n{}", config::dumpConfig(cfg));

        std::filesystem::path workTree;
        if (args.git_work_tree) workTree = *args.git_work_tree;
        else if (const char* env = std::getenv(cfg.repository.work_tree_env.c_str()); env && *env) workTree = env;
        else {
            fmt::print("env variable {} not set\n{}", cfg.repository.work_tree_env, cli::usage());
            return EXIT_FAILURE;
        }

        runtime::DriverOptions opts;
        opts.repo = git::Repository(workTree);
        opts.baseline_executable = args.baseline_executable;
        opts.candidate_executable = args.comparison_executable;
        opts.limit = args.limit;
        opts.offset = args.offset;

        log::Registry::blamecheck()->debug("[*] Comparing {} against {} in {}",
                                           opts.candidate_executable.string(), opts.baseline_executable.string(),
                                           opts.repo.work_tree.string());

        runtime::Driver driver(std::move(opts), cfg);
        const auto summary = driver.run();

        if (cfg.report.fail_on_mismatch && summary.nonMatches() > 0) return EXIT_FAILURE;
        return EXIT_SUCCESS;
    } catch (const std::exception& e) {
        if (log::Registry::isInitialized()) log::Registry::blamecheck()->error("[-] {}", e.what());
        else fmt::print(stderr, "blamecheck: {}\n", e.what());
        return EXIT_FAILURE;
    }
}
