#include <iostream>
#include <filesystem>
#include <spdlog/spdlog.h>
#include "dir_tree/cli.hpp"
#include "dir_tree/log.hpp"
#include "dir_tree/render.hpp"
#include "dir_tree/collector.hpp"

int main(int argc, char* argv[]) {
    auto options = dir_tree::parse_cli(argc, argv);

    if (!options.valid) {
        std::cerr << "\033[1;31m" << options.error_message << "\033[0m\n";
        std::cerr << "\033[1;31mUsage: " << argv[0] << " [options] <path>\033[0m\n";
        return 1;
    }

    if (options.show_help || !options.path) {
        dir_tree::print_help(argv[0]);
        return 0;
    }

    dir_tree::LogOptions log_options;
    log_options.verbose = options.verbose;
    log_options.logfile = options.logfile;

    std::shared_ptr<spdlog::logger> logger;
    try {
        logger = dir_tree::setup_logger(log_options);
    } catch (const spdlog::spdlog_ex& error) {
        std::cerr << "\033[1;31mError: Unable to open log file: " << error.what() << "\033[0m\n";
        return 1;
    }

    logger->info("Building directory tree for {} (depth={}, human_readable={})",
                 *options.path, options.depth, options.human_readable ? "true" : "false");

    dir_tree::TreeOptions tree_options;
    tree_options.depth = options.depth;
    tree_options.human_readable = options.human_readable;

    const std::filesystem::path target_path = *options.path;
    dir_tree::TreeReport report = dir_tree::collect_dir_tree(target_path, tree_options, logger);

    if (report.error) {
        logger->error("Error while building directory tree: {}", *report.error);
        spdlog::shutdown();
        return 1;
    }

    dir_tree::render_json(report, std::cout);
    std::cout.flush();

    logger->info("Directory tree successfully generated.");
    logger->debug("Collected {} files and {} directories ({} skipped, {} warnings)",
                  report.stats.file_count, report.stats.directory_count,
                  report.stats.skipped_count, report.stats.warning_count);
    spdlog::shutdown();
    return 0;
}
