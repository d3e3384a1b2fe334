#include "core/config.hpp"
#include "engine/replay_engine.hpp"
#include <csignal>
#include <iostream>
#include <memory>
#include <optional>
#include <spdlog/spdlog.h>
#include <string>

namespace {

std::unique_ptr<flowscope::ReplayEngine> g_engine;

void signal_handler(int signal) {
    if (signal == SIGINT || signal == SIGTERM) {
        if (g_engine) {
            g_engine->request_shutdown();
        }
    }
}

void print_usage(const char* program) {
    std::cout << "Usage: " << program << " [options]\n"
              << "\nOptions:\n"
              << "  -c, --config <path>  Load configuration from JSON file\n"
              << "  -i, --input <path>   Event file, one JSON object per line (default: stdin)\n"
              << "      --compare        Also run the volume-ratio reference and print a summary\n"
              << "  -h, --help           Show this help message\n"
              << "  -v, --version        Show version information\n"
              << "\nEnvironment Variables:\n"
              << "  FLOWSCOPE_WINDOW_MS            Window length in milliseconds\n"
              << "  FLOWSCOPE_IDLE_TIMEOUT_MS      Idle key eviction timeout\n"
              << "  FLOWSCOPE_LOOKBACK_DAYS        Baseline lookback in days\n"
              << "  FLOWSCOPE_BASELINE_DIR         Baseline persistence directory\n"
              << "  FLOWSCOPE_MIN_PRESSURE_RATIO   Minimum ask/bid ratio gate\n"
              << "  FLOWSCOPE_MIN_VOLUME           Minimum window volume gate\n"
              << "  FLOWSCOPE_MIN_DATA_QUALITY     Minimum window completeness gate\n"
              << "  FLOWSCOPE_COORDINATION_RADIUS  Strike radius for coordination\n"
              << "  FLOWSCOPE_ALGORITHM            institutional | volume_ratio\n"
              << "  FLOWSCOPE_LOG_LEVEL            trace | debug | info | warn | error\n"
              << "\nPriority: CLI args > Environment > Config file > Defaults\n"
              << std::endl;
}

void print_version() {
    std::cout << "flowscope v1.0.0\n"
              << "Institutional option-flow signal engine\n"
              << std::endl;
}

struct CliArgs {
    std::optional<std::string> config_path;
    std::optional<std::string> input_path;
    bool compare = false;
    bool show_help = false;
    bool show_version = false;
};

CliArgs parse_args(int argc, char* argv[]) {
    CliArgs args;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "-h" || arg == "--help") {
            args.show_help = true;
        } else if (arg == "-v" || arg == "--version") {
            args.show_version = true;
        } else if ((arg == "-c" || arg == "--config") && i + 1 < argc) {
            args.config_path = argv[++i];
        } else if ((arg == "-i" || arg == "--input") && i + 1 < argc) {
            args.input_path = argv[++i];
        } else if (arg == "--compare") {
            args.compare = true;
        } else {
            std::cerr << "Unknown argument: " << arg << std::endl;
            args.show_help = true;
        }
    }

    return args;
}

}  // namespace

int main(int argc, char* argv[]) {
    auto args = parse_args(argc, argv);

    if (args.show_help) {
        print_usage(argv[0]);
        return 0;
    }

    if (args.show_version) {
        print_version();
        return 0;
    }

    // Load configuration with priority: CLI > env > file > defaults
    auto config = flowscope::Config::load(args.config_path);

    std::cerr << "Configuration:\n"
              << "  Algorithm: " << config.engine.algorithm << (args.compare ? " (+ comparison)" : "") << "\n"
              << "  Window: " << config.window.length.count() << " ms\n"
              << "  Lookback: " << config.baseline.lookback_days << " days\n"
              << "  Baseline storage: "
              << (config.baseline.storage_dir.empty() ? "memory" : config.baseline.storage_dir) << "\n"
              << std::endl;

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    try {
        flowscope::ReplayOptions options;
        options.input_path = args.input_path.value_or("-");
        options.compare = args.compare;

        g_engine = std::make_unique<flowscope::ReplayEngine>(config, options);
        const int exit_code = g_engine->run();
        g_engine.reset();

        spdlog::shutdown();
        return exit_code;

    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << std::endl;
        spdlog::shutdown();
        return 1;
    }
}
