#pragma once

/// @file manifest.hpp
/// @brief Mod manifest (mod.json) parsing and validation
///
/// Manifest format:
/// @code
/// {
///   "id": "better-guards",
///   "name": "Better Guards",
///   "author": "someone",
///   "version": "1.2.0",
///   "description": "Tougher town guards",
///   "dependencies": ["core-content >= 1.0.0"],
///   "loadBefore": [],
///   "loadAfter": ["ui-tweaks"],
///   "priority": 10,
///   "scripts": ["Scripts/guard_ai.csx"],
///   "permissions": ["world.read"],
///   "patches": ["Patches/guard_stats.json"],
///   "contentFolders": { "Templates": "Content/Templates" }
/// }
/// @endcode
///
/// Field names match case-insensitively and unknown fields are ignored.

#include "fwd.hpp"
#include "version.hpp"
#include <modkit/core/error.hpp>

#include <filesystem>
#include <map>
#include <string>
#include <vector>

namespace modkit_mod {

/// Validated description of one mod
struct ModManifest {
    // Identity
    std::string id;
    std::string name;
    std::string author;
    std::string version;       ///< Starts with major.minor.patch
    std::string description;

    // Ordering
    std::vector<DependencySpec> dependencies;  ///< Hard dependencies, in manifest order
    std::vector<std::string> load_before;      ///< Stored, not used for ordering
    std::vector<std::string> load_after;       ///< Soft: ordered after these when present
    int priority = 0;                          ///< Lower loads earlier

    // Payload (paths relative to directory)
    std::vector<std::string> scripts;
    std::vector<std::string> permissions;  ///< Stored, never enforced
    std::vector<std::string> patches;
    std::map<std::string, std::string> content_folders;  ///< Content type -> folder

    /// Mod root directory, stamped at parse time
    std::filesystem::path directory;

    // =========================================================================
    // Loading
    // =========================================================================

    /// Read, parse and validate a manifest file
    ///
    /// @param path Manifest file
    /// @param directory Mod root directory to stamp on the manifest
    [[nodiscard]] static modkit_core::Result<ModManifest> load(
        const std::filesystem::path& path,
        const std::filesystem::path& directory);

    /// Parse and validate manifest text
    [[nodiscard]] static modkit_core::Result<ModManifest> from_json_string(
        const std::string& json_str,
        const std::filesystem::path& directory,
        const std::string& source_name = "<memory>");

    /// Check required fields and the version format
    [[nodiscard]] modkit_core::Result<void> validate(const std::string& source_name = "<memory>") const;

    // =========================================================================
    // Queries
    // =========================================================================

    /// Parsed version (valid for any manifest that passed validate())
    [[nodiscard]] modkit_core::Result<SemanticVersion> semantic_version() const {
        return SemanticVersion::parse(version);
    }

    /// Dependency ids in manifest order
    [[nodiscard]] std::vector<std::string> dependency_ids() const;

    /// "name (id) v1.2.3"
    [[nodiscard]] std::string to_string() const;
};

// =============================================================================
// LoadedMod
// =============================================================================

/// A manifest together with the directory it was loaded from
struct LoadedMod {
    ModManifest manifest;
    std::filesystem::path root_path;

    /// Get full path to a file within the mod
    [[nodiscard]] std::filesystem::path resolve_path(const std::filesystem::path& relative) const {
        return root_path / relative;
    }
};

} // namespace modkit_mod
