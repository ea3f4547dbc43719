#pragma once

/// @file config.hpp
/// @brief Loader configuration for modkit
///
/// Configuration is layered, lowest precedence first:
/// - Built-in defaults
/// - Configuration file (TOML, `[loader]` and `[logging]` tables)
/// - Environment variables (`MODKIT_*`)
/// - Command-line flags (applied by the caller)

#include "fwd.hpp"
#include "error.hpp"
#include "log.hpp"

#include <filesystem>
#include <string>

namespace modkit_core {

// =============================================================================
// Config Keys
// =============================================================================

namespace config_keys {

constexpr const char* MODS_DIRECTORY = "loader.mods_directory";
constexpr const char* MANIFEST_FILE = "loader.manifest_file";
constexpr const char* CONTENT_DIRECTORY = "loader.content_directory";
constexpr const char* CREATE_MODS_DIRECTORY = "loader.create_missing_mods_directory";
constexpr const char* LOG_LEVEL = "logging.level";
constexpr const char* LOG_CONSOLE = "logging.console";
constexpr const char* LOG_FILE = "logging.file";
constexpr const char* LOG_DIRECTORY = "logging.directory";

} // namespace config_keys

// =============================================================================
// LoaderConfig
// =============================================================================

/// Settings for one mod loading session
struct LoaderConfig {
    std::filesystem::path mods_directory = "Mods";
    std::string manifest_file = "mod.json";
    std::filesystem::path content_directory;    ///< Base content; empty means none
    bool create_missing_mods_directory = true;

    LogConfig logging;
};

/// Load configuration from a TOML file on top of the defaults
///
/// Relative directories in the file are resolved against the file's directory.
///
/// @param path Path to the configuration file
/// @return Loaded configuration or error
[[nodiscard]] Result<LoaderConfig> load_config_file(const std::filesystem::path& path);

/// Parse configuration from a TOML string on top of the defaults
[[nodiscard]] Result<LoaderConfig> parse_config_string(
    const std::string& content,
    const std::string& source_name = "config");

/// Override values from environment variables
///
/// Recognized: `<prefix>MODS_DIR`, `<prefix>CONTENT_DIR`,
/// `<prefix>MANIFEST_FILE`, `<prefix>LOG_LEVEL`.
void apply_environment(LoaderConfig& config, const std::string& prefix = "MODKIT_");

} // namespace modkit_core
