#pragma once

/// @file patch_loader.hpp
/// @brief Reads the patch files a mod manifest lists

#include "fwd.hpp"
#include "manifest.hpp"
#include <modkit/document/patch.hpp>

#include <vector>

namespace modkit_mod {

/// Loads a mod's patch files in manifest order
class PatchFileLoader {
public:
    PatchFileLoader() = default;

    /// Parse every patch file listed in the mod's manifest
    ///
    /// A file that is missing, fails to parse, or contains an operation with
    /// an invalid shape is logged and left out; the others are still returned.
    [[nodiscard]] std::vector<modkit_doc::ModPatch> load_mod_patches(const LoadedMod& mod) const;
};

} // namespace modkit_mod
