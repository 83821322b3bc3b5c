// =============================================================================
// covec CLI - co-occurrence latent vector features
// =============================================================================
//
// Usage:
//   covec <command> [options]
//
// Commands:
//   features    Generate a feature set for a train/test pair of CSV files
//   list        List the registered feature generators
//   version     Show version information
//   help        Show this help message
//
// Examples:
//   covec features --feature cooc_lda5 --train train.csv --test test.csv -o out/
//   covec features -f keyed_lda30 --config covec.conf
//   covec list
//
// =============================================================================

#include <cstring>
#include <exception>
#include <iostream>
#include <string>
#include <vector>

#include <Eigen/Core>

#include "covec/config.hpp"
#include "covec/error.hpp"
#include "covec/feature_generator.hpp"
#include "covec/logging.hpp"
#include "covec/table_io.hpp"

namespace covec::cli {
    int cmd_features(int argc, char* argv[]);
    int cmd_list(int argc, char* argv[]);
    int cmd_version(int argc, char* argv[]);
    int cmd_help(int argc, char* argv[]);
}

// =============================================================================
// Version Info
// =============================================================================

#define COVEC_VERSION_MAJOR 1
#define COVEC_VERSION_MINOR 0
#define COVEC_VERSION_PATCH 0
#define COVEC_VERSION_STRING "1.0.0"

// =============================================================================
// Command Registry
// =============================================================================

struct Command {
    const char* name;
    const char* description;
    int (*handler)(int argc, char* argv[]);
};

static const Command g_commands[] = {
    {"features", "Generate a feature set for train and test CSV files", covec::cli::cmd_features},
    {"list",     "List the registered feature generators", covec::cli::cmd_list},
    {"version",  "Show version information", covec::cli::cmd_version},
    {"help",     "Show this help message", covec::cli::cmd_help},
    {nullptr, nullptr, nullptr}
};

// =============================================================================
// Global Options
// =============================================================================

struct GlobalOptions {
    std::string config_file;
    bool verbose = false;
    bool quiet = false;
};

static GlobalOptions g_options;

// Strips global options from argv; leaves argv[0] at the command name
static void parse_global_options(int& argc, char**& argv) {
    std::vector<char*> rest;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if ((arg == "-c" || arg == "--config") && i + 1 < argc) {
            g_options.config_file = argv[++i];
        } else if (arg == "-v" || arg == "--verbose") {
            g_options.verbose = true;
        } else if (arg == "-q" || arg == "--quiet") {
            g_options.quiet = true;
        } else {
            rest.push_back(argv[i]);
        }
    }
    for (size_t i = 0; i < rest.size(); ++i) {
        argv[i + 1] = rest[i];
    }
    argc = static_cast<int>(rest.size());
    ++argv;
}

namespace covec::cli {

// =============================================================================
// Help Command
// =============================================================================

int cmd_help([[maybe_unused]] int argc, [[maybe_unused]] char* argv[]) {
    std::cout << "covec - co-occurrence latent vector features for categorical data\n";
    std::cout << "Version " << COVEC_VERSION_STRING << "\n\n";
    std::cout << "Usage: covec [global options] <command> [options]\n\n";
    std::cout << "Commands:\n";

    for (const Command* cmd = g_commands; cmd->name; ++cmd) {
        std::cout << "  " << cmd->name;
        for (size_t i = strlen(cmd->name); i < 12; ++i) std::cout << ' ';
        std::cout << cmd->description << "\n";
    }

    std::cout << "\nGlobal Options:\n";
    std::cout << "  -c, --config <file>     key = value configuration file\n";
    std::cout << "  -v, --verbose           Debug logging\n";
    std::cout << "  -q, --quiet             Errors only\n";
    std::cout << "\nfeatures Options:\n";
    std::cout << "  -f, --feature <name>    Feature generator (see 'covec list')\n";
    std::cout << "      --train <path>      Train CSV (config: data.train)\n";
    std::cout << "      --test <path>       Test CSV (config: data.test)\n";
    std::cout << "  -o, --output <dir>      Output directory (config: output.dir)\n";
    std::cout << "\nEnvironment:\n";
    std::cout << "  COVEC_LOG_LEVEL         debug, info, warn, error or off\n";
    std::cout << "  COVEC_LOG_FILE          Append log lines to this file\n";
    std::cout << "  COVEC_TRAIN_PATH        Default train CSV\n";
    std::cout << "  COVEC_TEST_PATH         Default test CSV\n";
    std::cout << "  COVEC_OUTPUT_DIR        Default output directory\n";
    std::cout << "\nExamples:\n";
    std::cout << "  covec features -f cooc_lda5 --train train.csv --test test.csv -o out\n";
    std::cout << "  covec list\n";

    return 0;
}

// =============================================================================
// Version Command
// =============================================================================

int cmd_version([[maybe_unused]] int argc, [[maybe_unused]] char* argv[]) {
    std::cout << "covec " << COVEC_VERSION_STRING << "\n";
    std::cout << "Eigen " << EIGEN_WORLD_VERSION << "." << EIGEN_MAJOR_VERSION << "."
              << EIGEN_MINOR_VERSION << "\n";
    return 0;
}

// =============================================================================
// List Command
// =============================================================================

int cmd_list([[maybe_unused]] int argc, [[maybe_unused]] char* argv[]) {
    for (const auto& info : feature_generator_catalog()) {
        std::cout << "  " << info.name;
        for (size_t i = info.name.size(); i < 20; ++i) std::cout << ' ';
        std::cout << info.description << "\n";
    }
    return 0;
}

// =============================================================================
// Features Command
// =============================================================================

int cmd_features(int argc, char* argv[]) {
    Config& config = Config::getInstance();
    std::string feature;

    for (int i = 0; i < argc; ++i) {
        std::string arg = argv[i];
        if ((arg == "-f" || arg == "--feature") && i + 1 < argc) {
            feature = argv[++i];
        } else if (arg == "--train" && i + 1 < argc) {
            config.set("data.train", argv[++i]);
        } else if (arg == "--test" && i + 1 < argc) {
            config.set("data.test", argv[++i]);
        } else if ((arg == "-o" || arg == "--output") && i + 1 < argc) {
            config.set("output.dir", argv[++i]);
        } else {
            std::cerr << "Unknown option for 'features': " << arg << "\n";
            return 1;
        }
    }

    if (feature.empty()) {
        std::cerr << "Missing --feature; run 'covec list' for the choices\n";
        return 1;
    }

    const std::string train_path = config.get<std::string>("data.train");
    const std::string test_path = config.get<std::string>("data.test");
    const std::string output_dir = config.get<std::string>("output.dir", ".");
    if (train_path.empty() || test_path.empty()) {
        std::cerr << "Both --train and --test (or COVEC_TRAIN_PATH / COVEC_TEST_PATH) are required\n";
        return 1;
    }

    io::CsvDatasetSource train(train_path);
    io::CsvDatasetSource test(test_path);
    FeatureTables tables = io::run_features(feature, train, test, output_dir);

    if (!g_options.quiet) {
        std::cout << feature << ": " << tables.train.rows() << " train rows, "
                  << tables.test.rows() << " test rows, " << tables.train.cols()
                  << " columns written to " << output_dir << "\n";
    }
    return 0;
}

} // namespace covec::cli

// =============================================================================
// Main Entry Point
// =============================================================================

int main(int argc, char* argv[]) {
    parse_global_options(argc, argv);

    if (!covec::init_config(g_options.config_file)) {
        return 1;
    }
    if (g_options.verbose) {
        covec::set_log_level(covec::LogLevel::DEBUG);
    } else if (g_options.quiet) {
        covec::set_log_level(covec::LogLevel::ERROR);
    }

    if (argc < 1) {
        covec::cli::cmd_help(0, nullptr);
        return 1;
    }

    const char* cmd_name = argv[0];
    ++argv;
    --argc;

    for (const Command* cmd = g_commands; cmd->name; ++cmd) {
        if (strcmp(cmd->name, cmd_name) == 0) {
            try {
                return cmd->handler(argc, argv);
            } catch (const covec::CovecException& e) {
                LOG_ERROR(e.what());
                return 2;
            } catch (const std::exception& e) {
                LOG_ERROR("Unexpected failure: ", e.what());
                return 2;
            }
        }
    }

    std::cerr << "Unknown command: " << cmd_name << "\n";
    std::cerr << "Run 'covec help' for usage.\n";
    return 1;
}
