#pragma once

/// @file fwd.hpp
/// @brief Forward declarations for modkit_mod module

#include <cstdint>

namespace modkit_mod {

// =============================================================================
// Version Types
// =============================================================================

struct SemanticVersion;
struct VersionConstraint;
struct DependencySpec;

// =============================================================================
// Manifest Types
// =============================================================================

struct ModManifest;

// =============================================================================
// Resolver Types
// =============================================================================

/// DFS visitation state of a mod during resolution
enum class VisitState : std::uint8_t {
    Unvisited,
    Visiting,
    Done
};

struct DependencyCycle;
class ModDependencyResolver;

// =============================================================================
// Content Types
// =============================================================================

class DocumentStore;
class PatchFileLoader;

// =============================================================================
// Scripting Types
// =============================================================================

class ScriptInstance;
struct ScriptContext;
class ScriptHost;

// =============================================================================
// Loader Types
// =============================================================================

struct LoadedMod;
class ModLoader;

} // namespace modkit_mod
