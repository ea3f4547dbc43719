/// @file loader.cpp
/// @brief Mod loader implementation

#include <modkit/mod/loader.hpp>
#include <modkit/core/log.hpp>

#include <algorithm>

namespace modkit_mod {

namespace {

const std::vector<modkit_doc::ModPatch>& empty_patches() {
    static const std::vector<modkit_doc::ModPatch> empty;
    return empty;
}

} // anonymous namespace

// =============================================================================
// Construction
// =============================================================================

ModLoader::ModLoader(const modkit_core::LoaderConfig& config,
                     DocumentStore& store,
                     ScriptHost* script_host)
    : m_mods_root(config.mods_directory)
    , m_manifest_file(config.manifest_file)
    , m_create_missing_root(config.create_missing_mods_directory)
    , m_store(store)
    , m_script_host(script_host) {}

// =============================================================================
// Loading
// =============================================================================

modkit_core::Result<std::size_t> ModLoader::load_all() {
    MODKIT_LOG_SCOPE("ModLoader::load_all");
    auto log = modkit_core::mod_logger();
    log->info("Scanning for mods in {}", m_mods_root.string());

    std::error_code ec;
    if (!std::filesystem::is_directory(m_mods_root, ec)) {
        if (!m_create_missing_root) {
            log->warn("Mods directory not found: {}", m_mods_root.string());
            return modkit_core::Ok(std::size_t{0});
        }
        log->warn("Mods directory not found: {}. Creating it", m_mods_root.string());
        std::filesystem::create_directories(m_mods_root, ec);
        if (ec) {
            return modkit_core::Err<std::size_t>(modkit_core::Error(modkit_core::ErrorCode::IOError,
                "Failed to create mods directory " + m_mods_root.string() + ": " + ec.message()));
        }
        return modkit_core::Ok(std::size_t{0});
    }

    auto manifests = discover_mods();
    if (manifests.empty()) {
        log->info("No mods found in {}", m_mods_root.string());
        return modkit_core::Ok(std::size_t{0});
    }
    log->info("Found {} mod(s)", manifests.size());

    auto ordered = m_resolver.resolve(manifests);
    if (!ordered) {
        log->error("Failed to resolve mod dependencies: {}", modkit_core::build_error_chain(ordered.error()));
        return modkit_core::Err<std::size_t>(ordered.error());
    }

    std::size_t loaded = 0;
    for (const auto& manifest : *ordered) {
        if (auto existing = m_loaded.find(manifest.id); existing != m_loaded.end()) {
            log->warn("Mod '{}' is already loaded. Skipping duplicate", manifest.id);
            modkit_core::log_structured(spdlog::level::warn, modkit_core::log_names::MODS, "duplicate_mod_skipped", {
                {"id", manifest.id},
                {"skipped_directory", manifest.directory.string()},
                {"kept_directory", existing->second.root_path.string()},
            });
            continue;
        }
        load_mod(manifest);
        ++loaded;
    }

    log->info("Loaded {} mod(s)", loaded);
    return modkit_core::Ok(loaded);
}

std::vector<ModManifest> ModLoader::discover_mods() const {
    auto log = modkit_core::mod_logger();
    std::vector<ModManifest> manifests;

    std::error_code ec;
    std::vector<std::filesystem::path> directories;
    for (auto it = std::filesystem::directory_iterator(m_mods_root, ec);
         !ec && it != std::filesystem::directory_iterator(); it.increment(ec)) {
        if (it->is_directory(ec)) {
            directories.push_back(it->path());
        }
    }
    if (ec) {
        log->error("Failed to scan {}: {}", m_mods_root.string(), ec.message());
    }
    std::sort(directories.begin(), directories.end());

    for (const auto& directory : directories) {
        auto manifest_path = directory / m_manifest_file;
        if (!std::filesystem::is_regular_file(manifest_path, ec)) {
            log->debug("Skipping {} (no {})", directory.string(), m_manifest_file);
            continue;
        }

        auto manifest = ModManifest::load(manifest_path, directory);
        if (!manifest) {
            modkit_core::debug::record_error(manifest.error());
            log->error("Invalid manifest at {}: {}", manifest_path.string(), manifest.error().message());
            continue;
        }

        log->debug("Parsed manifest: {}", manifest->to_string());
        manifests.push_back(std::move(*manifest));
    }

    return manifests;
}

void ModLoader::load_mod(const ModManifest& manifest) {
    auto log = modkit_core::mod_logger();
    log->info("Loading mod: {}", manifest.to_string());

    LoadedMod mod{manifest, manifest.directory};

    std::vector<modkit_doc::ModPatch> patches;
    if (!manifest.patches.empty()) {
        patches = m_patch_loader.load_mod_patches(mod);
        log->info("Loaded {} patch(es) for mod '{}'", patches.size(), manifest.id);
    }

    load_content_folders(mod);
    apply_patches(mod, patches);
    auto scripts = load_scripts(mod);

    modkit_core::log_structured(spdlog::level::info, modkit_core::log_names::MODS, "Mod loaded", {
        {"id", manifest.id},
        {"name", manifest.name},
        {"scripts", std::to_string(scripts.size())},
        {"patches", std::to_string(patches.size())},
        {"contentFolders", std::to_string(manifest.content_folders.size())},
    });

    if (!patches.empty()) {
        m_patches[manifest.id] = std::move(patches);
    }
    if (!scripts.empty()) {
        m_scripts[manifest.id] = std::move(scripts);
    }
    m_loaded.emplace(manifest.id, std::move(mod));
    m_load_order.push_back(manifest.id);
}

void ModLoader::load_content_folders(const LoadedMod& mod) {
    auto log = modkit_core::mod_logger();

    for (const auto& [content_type, relative] : mod.manifest.content_folders) {
        auto folder = mod.resolve_path(relative);
        auto result = m_store.load_folder(folder, content_type);
        if (!result) {
            log->warn("Content folder '{}' of mod '{}' not loaded: {}",
                content_type, mod.manifest.id, result.error().message());
            continue;
        }
        log->debug("Loaded {} '{}' document(s) from mod '{}'", *result, content_type, mod.manifest.id);
    }

    if (!mod.manifest.content_folders.empty()) {
        log->info("Registered {} content folder(s) for mod '{}'",
            mod.manifest.content_folders.size(), mod.manifest.id);
    }
}

void ModLoader::apply_patches(const LoadedMod& mod, const std::vector<modkit_doc::ModPatch>& patches) {
    auto log = modkit_core::patch_logger();

    for (const auto& patch : patches) {
        modkit_doc::Document* document = m_store.get(patch.target);
        if (!document) {
            log->warn("Patch target '{}' of mod '{}' not found", patch.target, mod.manifest.id);
            continue;
        }

        auto applied = m_applicator.apply(*document, patch);
        if (!applied) {
            auto err = applied.error();
            err.with_context("mod", mod.manifest.id);
            log->error("Failed to apply patch '{}' of mod '{}': {}",
                patch.source_path.filename().string(), mod.manifest.id, modkit_core::build_error_chain(err));
            continue;
        }
        log->debug("Applied {} operation(s) from mod '{}' to '{}'", *applied, mod.manifest.id, patch.target);
    }
}

std::vector<std::shared_ptr<ScriptInstance>> ModLoader::load_scripts(const LoadedMod& mod) {
    auto log = modkit_core::mod_logger();
    std::vector<std::shared_ptr<ScriptInstance>> instances;

    if (mod.manifest.scripts.empty()) {
        return instances;
    }
    if (!m_script_host) {
        log->warn("No script host; {} script(s) of mod '{}' not loaded",
            mod.manifest.scripts.size(), mod.manifest.id);
        return instances;
    }

    ScriptContext context{mod.manifest.id, mod.root_path};
    for (const auto& script : mod.manifest.scripts) {
        auto script_path = mod.resolve_path(script);
        std::error_code ec;
        if (!std::filesystem::is_regular_file(script_path, ec)) {
            log->error("Script file not found for mod '{}': {}", mod.manifest.id, script_path.string());
            continue;
        }

        auto relative = script_path.lexically_relative(m_mods_root);
        auto instance = m_script_host->load_script(relative);
        if (!instance) {
            log->error("Failed to load script '{}' for mod '{}'", script, mod.manifest.id);
            continue;
        }

        m_script_host->initialize_script(*instance, context);
        log->debug("Loaded and initialized script: {} ({})", script, instance->type_name());
        instances.push_back(std::move(instance));
    }

    return instances;
}

modkit_core::Result<void> ModLoader::unload(const std::string& id) {
    auto log = modkit_core::mod_logger();

    auto it = m_loaded.find(id);
    if (it == m_loaded.end()) {
        log->warn("Mod '{}' is not loaded", id);
        return modkit_core::Err(modkit_core::Error(modkit_core::ErrorCode::NotFound,
            "Mod '" + id + "' is not loaded"));
    }

    log->info("Unloading mod: {}", id);

    if (auto scripts = m_scripts.find(id); scripts != m_scripts.end()) {
        for (const auto& instance : scripts->second) {
            auto result = instance->on_unload();
            if (!result) {
                log->warn("Error unloading script instance {} for mod '{}': {}",
                    instance->type_name(), id, result.error().message());
            }
        }
        m_scripts.erase(scripts);
    }

    m_patches.erase(id);
    m_loaded.erase(it);
    m_load_order.erase(std::remove(m_load_order.begin(), m_load_order.end(), id), m_load_order.end());

    log->info("Mod '{}' unloaded", id);
    return modkit_core::Ok();
}

modkit_core::Result<void> ModLoader::reload(const std::string& id) {
    auto it = m_loaded.find(id);
    if (it == m_loaded.end()) {
        modkit_core::mod_logger()->warn("Cannot reload mod '{}': not loaded", id);
        return modkit_core::Err(modkit_core::Error(modkit_core::ErrorCode::NotFound,
            "Cannot reload mod '" + id + "': not loaded"));
    }

    modkit_core::mod_logger()->info("Reloading mod: {}", id);

    ModManifest manifest = it->second.manifest;
    auto unloaded = unload(id);
    if (!unloaded) {
        return unloaded;
    }
    load_mod(manifest);
    return modkit_core::Ok();
}

// =============================================================================
// Queries
// =============================================================================

bool ModLoader::is_loaded(const std::string& id) const {
    return m_loaded.count(id) > 0;
}

const ModManifest* ModLoader::get_manifest(const std::string& id) const {
    auto it = m_loaded.find(id);
    return it != m_loaded.end() ? &it->second.manifest : nullptr;
}

const std::vector<modkit_doc::ModPatch>& ModLoader::get_patches(const std::string& id) const {
    auto it = m_patches.find(id);
    return it != m_patches.end() ? it->second : empty_patches();
}

std::map<std::string, std::filesystem::path> ModLoader::get_content_folders(const std::string& id) const {
    std::map<std::string, std::filesystem::path> result;

    auto it = m_loaded.find(id);
    if (it == m_loaded.end()) {
        return result;
    }
    for (const auto& [content_type, relative] : it->second.manifest.content_folders) {
        result[content_type] = it->second.resolve_path(relative);
    }
    return result;
}

std::optional<std::filesystem::path> ModLoader::get_content_folder_path(
    const std::string& id, const std::string& content_type) const {

    auto it = m_loaded.find(id);
    if (it == m_loaded.end()) {
        return std::nullopt;
    }
    auto folder = it->second.manifest.content_folders.find(content_type);
    if (folder == it->second.manifest.content_folders.end()) {
        return std::nullopt;
    }
    return it->second.resolve_path(folder->second);
}

} // namespace modkit_mod
