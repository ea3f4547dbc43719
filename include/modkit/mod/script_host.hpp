#pragma once

/// @file script_host.hpp
/// @brief Interface to the scripting runtime that runs mod scripts
///
/// modkit does not compile or execute scripts. The loader hands each script
/// path listed in a manifest to a ScriptHost and keeps the instances it
/// returns so they can be torn down when the mod unloads.

#include "fwd.hpp"
#include <modkit/core/error.hpp>

#include <filesystem>
#include <memory>
#include <string>

namespace modkit_mod {

// =============================================================================
// ScriptInstance
// =============================================================================

/// A script produced by the scripting runtime
class ScriptInstance {
public:
    virtual ~ScriptInstance() = default;

    /// Name of the script's type, for diagnostics
    [[nodiscard]] virtual std::string type_name() const = 0;

    /// Called when the owning mod unloads
    virtual modkit_core::Result<void> on_unload() {
        return modkit_core::Ok();
    }
};

// =============================================================================
// ScriptContext
// =============================================================================

/// Information passed to a script when it is initialized
struct ScriptContext {
    std::string mod_id;
    std::filesystem::path mod_root;
};

// =============================================================================
// ScriptHost
// =============================================================================

/// Scripting runtime seen from the mod loader
class ScriptHost {
public:
    virtual ~ScriptHost() = default;

    /// Compile or load a script
    ///
    /// @param relative_path Script path relative to the mods root
    /// @return The instance, or nullptr if the script could not be loaded
    [[nodiscard]] virtual std::shared_ptr<ScriptInstance> load_script(
        const std::filesystem::path& relative_path) = 0;

    /// Prepare a freshly loaded script for use
    virtual void initialize_script(ScriptInstance& instance, const ScriptContext& context) = 0;
};

} // namespace modkit_mod
