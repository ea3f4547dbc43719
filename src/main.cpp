/// @file main.cpp
/// @brief modkit entry point - loads base content, applies mods, reports the result
///
/// Flow:
/// - Configuration: defaults, then --config TOML file, then MODKIT_* environment,
///   then command-line flags
/// - Logging configured from the result
/// - Base content loaded from the content directory (one subfolder per content type)
/// - ModLoader discovers, orders and loads mods from the mods directory
/// - Load order printed; --dump prints one patched document, --graph prints
///   the dependency graph

#include <modkit/core/config.hpp>
#include <modkit/core/error.hpp>
#include <modkit/core/log.hpp>
#include <modkit/mod/mod.hpp>

#include <spdlog/spdlog.h>

#include <filesystem>
#include <iostream>
#include <optional>
#include <string>

namespace fs = std::filesystem;

namespace {

struct CommandLine {
    std::optional<fs::path> config_path;
    std::optional<fs::path> mods_directory;
    std::optional<fs::path> content_directory;
    std::optional<std::string> log_level;
    std::optional<std::string> dump_key;
    bool graph = false;
};

void print_usage(const char* program_name) {
    std::cerr << "Usage: " << program_name << " [OPTIONS]\n"
              << "\n"
              << "Options:\n"
              << "  --config <file>     TOML configuration file\n"
              << "  --mods <dir>        Mods directory (default: Mods)\n"
              << "  --content <dir>     Base content directory\n"
              << "  --dump <key>        Print a content document after patching\n"
              << "  --graph             Print the mod dependency graph (GraphViz DOT)\n"
              << "  --log-level <lvl>   trace, debug, info, warn, error, critical, off\n"
              << "  --help, -h          Show this help message\n"
              << "  --version, -v       Show version information\n"
              << "\n"
              << "Environment:\n"
              << "  MODKIT_MODS_DIR, MODKIT_CONTENT_DIR, MODKIT_MANIFEST_FILE, MODKIT_LOG_LEVEL\n"
              << "\n"
              << "Examples:\n"
              << "  " << program_name << " --content Content --mods Mods\n"
              << "  " << program_name << " --config modkit.toml --dump Templates/npc_guard.json\n";
}

void print_version() {
    std::cout << "modkit 0.1.0\n"
              << "Mod load-ordering and content-patch engine\n";
}

/// Options that take a value
bool take_value(int argc, char** argv, int& i, std::string& out) {
    if (i + 1 >= argc) {
        std::cerr << "Missing value for " << argv[i] << "\n";
        return false;
    }
    out = argv[++i];
    return true;
}

} // anonymous namespace

// =============================================================================
// Main
// =============================================================================

int main(int argc, char** argv) {
    CommandLine cli;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        std::string value;

        if (arg == "--help" || arg == "-h") {
            print_usage(argv[0]);
            return 0;
        } else if (arg == "--version" || arg == "-v") {
            print_version();
            return 0;
        } else if (arg == "--graph") {
            cli.graph = true;
        } else if (arg == "--config" || arg == "--mods" || arg == "--content" ||
                   arg == "--dump" || arg == "--log-level") {
            if (!take_value(argc, argv, i, value)) {
                print_usage(argv[0]);
                return 1;
            }
            if (arg == "--config") cli.config_path = value;
            else if (arg == "--mods") cli.mods_directory = value;
            else if (arg == "--content") cli.content_directory = value;
            else if (arg == "--dump") cli.dump_key = value;
            else cli.log_level = value;
        } else {
            std::cerr << "Unknown option: " << arg << "\n";
            print_usage(argv[0]);
            return 1;
        }
    }

    modkit_core::init_logging();

    // Configuration layers
    modkit_core::LoaderConfig config;
    if (cli.config_path) {
        auto loaded = modkit_core::load_config_file(*cli.config_path);
        if (!loaded) {
            spdlog::error("Failed to load configuration: {}", modkit_core::build_error_chain(loaded.error()));
            return 1;
        }
        config = std::move(*loaded);
    }
    modkit_core::apply_environment(config);

    if (cli.mods_directory) config.mods_directory = *cli.mods_directory;
    if (cli.content_directory) config.content_directory = *cli.content_directory;
    if (cli.log_level) {
        auto level = modkit_core::parse_log_level(*cli.log_level);
        if (!level) {
            std::cerr << "Unknown log level: " << *cli.log_level << "\n";
            return 1;
        }
        config.logging.level = *level;
    }

    modkit_core::configure_logging(config.logging);

    // Base content
    modkit_mod::DocumentStore store;
    if (!config.content_directory.empty()) {
        auto loaded = store.load_content_root(config.content_directory);
        if (!loaded) {
            spdlog::error("Failed to load base content: {}", modkit_core::build_error_chain(loaded.error()));
            modkit_core::shutdown_logging();
            return 1;
        }
    }

    // Mods
    modkit_mod::ModLoader loader(config, store);

    if (cli.graph) {
        std::cout << modkit_mod::ModDependencyResolver::to_dot_graph(loader.discover_mods());
    }

    auto loaded = loader.load_all();
    if (!loaded) {
        spdlog::error("Mod loading aborted: {}", modkit_core::build_error_chain(loaded.error()));
        modkit_core::shutdown_logging();
        return 2;
    }

    std::cout << "Loaded " << *loaded << " mod(s)\n";
    std::size_t position = 1;
    for (const auto& id : loader.load_order()) {
        const auto* manifest = loader.get_manifest(id);
        std::cout << "  " << position++ << ". " << manifest->to_string() << "\n";
    }

    int exit_code = 0;
    if (cli.dump_key) {
        const auto* document = store.get(*cli.dump_key);
        if (document) {
            std::cout << document->dump(2) << "\n";
        } else {
            spdlog::error("No content document '{}'", *cli.dump_key);
            exit_code = 1;
        }
    }

    if (modkit_core::debug::total_error_count() > 0) {
        spdlog::info("{}", modkit_core::debug::error_stats_summary());
    }

    modkit_core::shutdown_logging();
    return exit_code;
}
