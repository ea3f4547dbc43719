/// @file config.cpp
/// @brief Loader configuration implementation

#include <modkit/core/config.hpp>

#include <toml++/toml.hpp>

#include <cstdlib>
#include <fstream>
#include <sstream>

namespace modkit_core {

namespace {

void parse_loader_table(const toml::table& tbl, LoaderConfig& config) {
    if (auto dir = tbl["mods_directory"].value<std::string>()) {
        config.mods_directory = *dir;
    }
    if (auto file = tbl["manifest_file"].value<std::string>()) {
        config.manifest_file = *file;
    }
    if (auto dir = tbl["content_directory"].value<std::string>()) {
        config.content_directory = *dir;
    }
    if (auto create = tbl["create_missing_mods_directory"].value<bool>()) {
        config.create_missing_mods_directory = *create;
    }
}

Result<void> parse_logging_table(const toml::table& tbl, LogConfig& config) {
    if (auto level = tbl["level"].value<std::string>()) {
        auto parsed = parse_log_level(*level);
        if (!parsed) {
            return Err(Error(ErrorCode::ValidationError,
                "Unknown log level '" + *level + "' (key " + config_keys::LOG_LEVEL + ")"));
        }
        config.level = *parsed;
    }
    if (auto console = tbl["console"].value<bool>()) {
        config.console_enabled = *console;
    }
    if (auto file = tbl["file"].value<bool>()) {
        config.file_enabled = *file;
    }
    if (auto dir = tbl["directory"].value<std::string>()) {
        config.log_directory = *dir;
    }
    return Ok();
}

} // anonymous namespace

Result<LoaderConfig> parse_config_string(const std::string& content, const std::string& source_name) {
    LoaderConfig config;

    try {
        toml::table tbl = toml::parse(content, source_name);

        if (auto loader = tbl["loader"].as_table()) {
            parse_loader_table(*loader, config);
        }

        if (auto logging = tbl["logging"].as_table()) {
            auto result = parse_logging_table(*logging, config.logging);
            if (!result) {
                return Err<LoaderConfig>(result.error());
            }
        }
    } catch (const toml::parse_error& err) {
        return Err<LoaderConfig>(Error(ErrorCode::ParseError,
            "TOML parse error in " + source_name + ": " + std::string(err.what())));
    }

    return Ok(std::move(config));
}

Result<LoaderConfig> load_config_file(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return Err<LoaderConfig>(Error(ErrorCode::IOError,
            "Failed to open config file: " + path.string()));
    }

    std::stringstream buffer;
    buffer << file.rdbuf();

    auto result = parse_config_string(buffer.str(), path.string());
    if (!result) {
        return result;
    }

    auto base = path.parent_path();
    auto& config = result.value();
    if (config.mods_directory.is_relative()) {
        config.mods_directory = base / config.mods_directory;
    }
    if (!config.content_directory.empty() && config.content_directory.is_relative()) {
        config.content_directory = base / config.content_directory;
    }
    if (!config.logging.log_directory.empty() &&
        std::filesystem::path(config.logging.log_directory).is_relative()) {
        config.logging.log_directory = (base / config.logging.log_directory).string();
    }

    return result;
}

void apply_environment(LoaderConfig& config, const std::string& prefix) {
    if (const char* value = std::getenv((prefix + "MODS_DIR").c_str())) {
        config.mods_directory = value;
    }
    if (const char* value = std::getenv((prefix + "CONTENT_DIR").c_str())) {
        config.content_directory = value;
    }
    if (const char* value = std::getenv((prefix + "MANIFEST_FILE").c_str())) {
        config.manifest_file = value;
    }
    if (const char* value = std::getenv((prefix + "LOG_LEVEL").c_str())) {
        if (auto level = parse_log_level(value)) {
            config.logging.level = *level;
        } else {
            MODKIT_LOG_WARN("Ignoring unknown log level '{}' from {}LOG_LEVEL", value, prefix);
        }
    }
}

} // namespace modkit_core
