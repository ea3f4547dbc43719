#pragma once

/// @file resolver.hpp
/// @brief Mod load-order resolution
///
/// The resolver orders mods so that every hard dependency loads before its
/// dependent and `loadAfter` targets that exist load earlier too:
/// - Mods are first stable-sorted by priority (lower first); ties keep
///   discovery order
/// - A depth-first visit in that order appends each mod once its hard
///   dependencies and present `loadAfter` targets are done
/// - A missing hard dependency, a cycle through dependency or present
///   `loadAfter` edges, or a dependency whose version fails its constraint
///   aborts the whole pass
///
/// `loadBefore` is kept on the manifest but does not affect the order.

#include "fwd.hpp"
#include "manifest.hpp"
#include <modkit/core/error.hpp>

#include <cstddef>
#include <string>
#include <unordered_map>
#include <vector>

namespace modkit_mod {

// =============================================================================
// DependencyCycle
// =============================================================================

/// Mod ids forming an ordering cycle (first id repeated at the end)
struct DependencyCycle {
    std::vector<std::string> cycle_path;

    /// "a -> b -> a"
    [[nodiscard]] std::string format() const;
};

// =============================================================================
// ModDependencyResolver
// =============================================================================

/// Computes a deterministic load order for discovered mods
///
/// Holds no state between calls.
class ModDependencyResolver {
public:
    ModDependencyResolver() = default;

    /// Order manifests for loading
    ///
    /// Every input manifest appears exactly once in the output, including
    /// manifests that share an id (lookups by id resolve to the first one
    /// discovered).
    ///
    /// @return Manifests in load order, or a ResolveError with context keys
    ///         `mod` and `dependency`
    [[nodiscard]] modkit_core::Result<std::vector<ModManifest>> resolve(
        const std::vector<ModManifest>& manifests) const;

    /// GraphViz DOT rendering of the dependency graph
    ///
    /// Hard dependencies are solid edges, `loadAfter` hints dashed and
    /// dependencies on absent mods red.
    [[nodiscard]] static std::string to_dot_graph(const std::vector<ModManifest>& manifests);

private:
    struct VisitContext {
        const std::vector<ModManifest>& manifests;
        std::unordered_map<std::string, std::size_t> index_by_id;
        std::vector<VisitState> states;
        std::vector<std::size_t> stack;
        std::vector<ModManifest> order;
    };

    [[nodiscard]] modkit_core::Result<void> visit(std::size_t index, VisitContext& ctx) const;

    /// Order `target` before `mod`; a target still being visited closes a cycle
    [[nodiscard]] modkit_core::Result<void> visit_edge(const ModManifest& mod, std::size_t target,
                                                       VisitContext& ctx) const;

    [[nodiscard]] modkit_core::Result<void> check_version(const ModManifest& mod,
                                                          const DependencySpec& dep,
                                                          const ModManifest& found) const;
};

} // namespace modkit_mod
