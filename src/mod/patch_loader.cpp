/// @file patch_loader.cpp
/// @brief Patch file loader implementation

#include <modkit/mod/patch_loader.hpp>
#include <modkit/core/log.hpp>

namespace modkit_mod {

std::vector<modkit_doc::ModPatch> PatchFileLoader::load_mod_patches(const LoadedMod& mod) const {
    std::vector<modkit_doc::ModPatch> patches;
    patches.reserve(mod.manifest.patches.size());

    for (const auto& relative : mod.manifest.patches) {
        auto path = mod.resolve_path(relative);

        auto patch = modkit_doc::ModPatch::load(path);
        if (!patch) {
            modkit_core::patch_logger()->error("Skipping patch file '{}' of mod '{}': {}",
                relative, mod.manifest.id, patch.error().message());
            continue;
        }

        auto valid = patch->validate();
        if (!valid) {
            modkit_core::patch_logger()->error("Skipping patch file '{}' of mod '{}': {}",
                relative, mod.manifest.id, modkit_core::build_error_chain(valid.error()));
            continue;
        }

        modkit_core::patch_logger()->debug("Loaded patch '{}' -> '{}' ({} operation(s))",
            relative, patch->target, patch->operations.size());
        patches.push_back(std::move(*patch));
    }

    return patches;
}

} // namespace modkit_mod
