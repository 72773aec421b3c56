/**
 * @file main.cpp
 * @brief task_orchestrator runner entry point.
 *
 * Wires config → logger → orchestrator, schedules every task of a TOML
 * manifest in file order, then waits until the graph drains or a
 * SIGINT/SIGTERM arrives.
 */

#include "core/config.hpp"
#include "core/logger.hpp"
#include "core/types.hpp"
#include "orchestrator/orchestrator.hpp"
#include "workload/manifest.hpp"

#include <chrono>
#include <csignal>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>

using namespace task_orchestrator;

namespace {

volatile std::sig_atomic_t g_shutdown_requested = 0;

void signal_handler(int /*signal*/) {
    g_shutdown_requested = 1;
}

struct CLIArgs {
    std::filesystem::path config_path;
    std::filesystem::path manifest_path;
    std::string log_dir;
    std::string output_dir;
    bool verbose = false;
};

void print_usage() {
    std::cout << "Usage: task_orchestrator --manifest <path> [OPTIONS]\n"
              << "  --manifest <path>    TOML file of [[task]] entries to schedule\n"
              << "  --config <path>      Configuration file (defaults used when omitted)\n"
              << "  --log-dir <path>     Log output directory (stdout when unset)\n"
              << "  --output-dir <path>  Directory receiving per-task output files\n"
              << "  --verbose            Log at debug level\n"
              << "  --help, -h           Show this help message\n";
}

CLIArgs parse_args(int argc, char* argv[]) {
    CLIArgs args;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc) {
            args.config_path = argv[++i];
        } else if (arg == "--manifest" && i + 1 < argc) {
            args.manifest_path = argv[++i];
        } else if (arg == "--log-dir" && i + 1 < argc) {
            args.log_dir = argv[++i];
        } else if (arg == "--output-dir" && i + 1 < argc) {
            args.output_dir = argv[++i];
        } else if (arg == "--verbose") {
            args.verbose = true;
        } else if (arg == "--help" || arg == "-h") {
            print_usage();
            std::exit(0);
        } else {
            std::cerr << "Unknown argument: " << arg << "\n";
            print_usage();
            std::exit(2);
        }
    }
    return args;
}

}  // namespace

int main(int argc, char* argv[]) {
    auto args = parse_args(argc, argv);
    if (args.manifest_path.empty()) {
        print_usage();
        return 2;
    }

    // Load configuration
    Config config = default_config();
    if (!args.config_path.empty()) {
        auto config_result = load_config(args.config_path);
        if (!config_result) {
            std::cerr << "Failed to load config: " << config_result.error().message << std::endl;
            return 1;
        }
        config = *config_result;
    }

    // Apply CLI overrides
    if (!args.log_dir.empty()) config.telemetry.log_dir = args.log_dir;
    if (!args.output_dir.empty()) config.output.dir = args.output_dir;
    if (args.verbose) config.telemetry.log_level = LogLevel::Debug;

    auto orchestrator_result = Orchestrator::create(Orchestrator::Options{.config = config});
    if (!orchestrator_result) {
        std::cerr << "Cannot start orchestrator: "
                  << orchestrator_result.error().message << std::endl;
        return 1;
    }
    auto orchestrator = std::move(*orchestrator_result);
    auto& logger = orchestrator->logger();

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    // ── Schedule the manifest ────────────────
    auto manifest = load_manifest(args.manifest_path, orchestrator->clock().now_ms());
    if (!manifest) {
        logger.error("Cannot load manifest: " + manifest.error().message);
        return 1;
    }
    logger.info("Loaded " + std::to_string(manifest->size()) + " tasks from "
                + args.manifest_path.string());

    size_t rejected = 0;
    for (auto& request : *manifest) {
        auto name = request.name;
        auto wait = orchestrator->schedule(std::move(request));
        if (!wait) {
            ++rejected;
            logger.error("Not scheduled: " + wait.error().message, name);
        }
    }

    // ── Wait for the graph to drain ──────────
    logger.info("Waiting for " + std::to_string(orchestrator->size())
                + " tasks. Press Ctrl+C to stop.");
    while (!g_shutdown_requested) {
        if (orchestrator->wait_until_empty(std::chrono::milliseconds(200))) break;
    }

    if (g_shutdown_requested) {
        logger.warn("Shutdown requested with " + std::to_string(orchestrator->size())
                    + " tasks not finished");
    }

    auto counters = orchestrator->events().counters();
    logger.info("Summary: " + std::to_string(counters.admitted) + " admitted, "
                + std::to_string(counters.finished) + " finished ("
                + std::to_string(counters.failed) + " failed), "
                + std::to_string(counters.cancelled) + " cancelled, "
                + std::to_string(rejected) + " rejected");

    orchestrator->shutdown();
    return (rejected > 0 || g_shutdown_requested) ? 1 : 0;
}
