#pragma once

/// @file loader.hpp
/// @brief Mod discovery, ordering and loading
///
/// ModLoader drives one session of mod loading against a DocumentStore:
/// - Discovers mod directories under the mods root (sorted by name)
/// - Parses and validates their manifests, skipping bad ones
/// - Resolves the load order; a resolution failure loads nothing
/// - Loads each mod in order: patches, content folders, patch application,
///   scripts
///
/// Per-mod state moves Discovered -> Validated -> Ordered -> Loaded and
/// back and forth between Loaded and Unloaded via unload() and reload().
///
/// Thread-safety: ModLoader is NOT thread-safe, and it is the only writer
/// of the DocumentStore while a load is in progress.

#include "fwd.hpp"
#include "document_store.hpp"
#include "manifest.hpp"
#include "patch_loader.hpp"
#include "resolver.hpp"
#include "script_host.hpp"
#include <modkit/core/config.hpp>
#include <modkit/core/error.hpp>
#include <modkit/document/patch.hpp>
#include <modkit/document/patch_applicator.hpp>

#include <cstddef>
#include <filesystem>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace modkit_mod {

class ModLoader {
public:
    // =========================================================================
    // Construction
    // =========================================================================

    /// @param config Mods root, manifest file name and directory creation policy
    /// @param store Content documents that mods add to and patch
    /// @param script_host Scripting runtime; scripts are skipped when null
    ModLoader(const modkit_core::LoaderConfig& config,
              DocumentStore& store,
              ScriptHost* script_host = nullptr);

    // Non-copyable, non-movable (holds a reference to the store)
    ModLoader(const ModLoader&) = delete;
    ModLoader& operator=(const ModLoader&) = delete;
    ModLoader(ModLoader&&) = delete;
    ModLoader& operator=(ModLoader&&) = delete;

    // =========================================================================
    // Loading
    // =========================================================================

    /// Discover, order and load every mod under the mods root
    ///
    /// Mods whose id is already loaded are skipped with a warning.
    ///
    /// @return Number of mods loaded by this call, or the resolution error
    [[nodiscard]] modkit_core::Result<std::size_t> load_all();

    /// Scan the mods root and return every valid manifest in discovery order
    [[nodiscard]] std::vector<ModManifest> discover_mods() const;

    /// Unload a mod
    ///
    /// Script unload hooks run; patches already applied to the store stay.
    [[nodiscard]] modkit_core::Result<void> unload(const std::string& id);

    /// Unload a mod and load it again from its stored manifest
    [[nodiscard]] modkit_core::Result<void> reload(const std::string& id);

    // =========================================================================
    // Queries
    // =========================================================================

    [[nodiscard]] bool is_loaded(const std::string& id) const;

    /// Manifest of a loaded mod, or nullptr
    [[nodiscard]] const ModManifest* get_manifest(const std::string& id) const;

    /// Patches parsed for a loaded mod (empty if none)
    [[nodiscard]] const std::vector<modkit_doc::ModPatch>& get_patches(const std::string& id) const;

    /// Content type -> absolute folder for a loaded mod
    [[nodiscard]] std::map<std::string, std::filesystem::path> get_content_folders(const std::string& id) const;

    /// Absolute folder for one content type of a loaded mod
    [[nodiscard]] std::optional<std::filesystem::path> get_content_folder_path(
        const std::string& id, const std::string& content_type) const;

    /// All loaded mods by id
    [[nodiscard]] const std::map<std::string, LoadedMod>& loaded_mods() const noexcept { return m_loaded; }

    /// Ids of loaded mods in the order they were loaded
    [[nodiscard]] const std::vector<std::string>& load_order() const noexcept { return m_load_order; }

    [[nodiscard]] const std::filesystem::path& mods_root() const noexcept { return m_mods_root; }

private:
    /// Load one mod whose dependencies are already loaded
    void load_mod(const ModManifest& manifest);

    void load_content_folders(const LoadedMod& mod);
    void apply_patches(const LoadedMod& mod, const std::vector<modkit_doc::ModPatch>& patches);
    std::vector<std::shared_ptr<ScriptInstance>> load_scripts(const LoadedMod& mod);

    std::filesystem::path m_mods_root;
    std::string m_manifest_file;
    bool m_create_missing_root;

    DocumentStore& m_store;
    ScriptHost* m_script_host;

    ModDependencyResolver m_resolver;
    PatchFileLoader m_patch_loader;
    modkit_doc::PatchApplicator m_applicator;

    std::map<std::string, LoadedMod> m_loaded;
    std::map<std::string, std::vector<modkit_doc::ModPatch>> m_patches;
    std::map<std::string, std::vector<std::shared_ptr<ScriptInstance>>> m_scripts;
    std::vector<std::string> m_load_order;
};

} // namespace modkit_mod
