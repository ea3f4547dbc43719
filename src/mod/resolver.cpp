/// @file resolver.cpp
/// @brief Mod load-order resolver implementation

#include <modkit/mod/resolver.hpp>
#include <modkit/core/log.hpp>

#include <algorithm>
#include <numeric>
#include <sstream>
#include <unordered_set>

namespace modkit_mod {

using modkit_core::ResolveError;

namespace {

/// Escape text for a double-quoted DOT string
std::string dot_escape(const std::string& text) {
    std::string out;
    out.reserve(text.size());
    for (char c : text) {
        if (c == '"' || c == '\\') {
            out += '\\';
        }
        out += c;
    }
    return out;
}

} // anonymous namespace

std::string DependencyCycle::format() const {
    std::ostringstream oss;
    for (std::size_t i = 0; i < cycle_path.size(); ++i) {
        if (i > 0) oss << " -> ";
        oss << cycle_path[i];
    }
    return oss.str();
}

// =============================================================================
// ModDependencyResolver Implementation
// =============================================================================

modkit_core::Result<std::vector<ModManifest>> ModDependencyResolver::resolve(
    const std::vector<ModManifest>& manifests) const {

    VisitContext ctx{manifests, {}, std::vector<VisitState>(manifests.size(), VisitState::Unvisited), {}, {}};
    ctx.order.reserve(manifests.size());

    for (std::size_t i = 0; i < manifests.size(); ++i) {
        ctx.index_by_id.emplace(manifests[i].id, i);  // first discovered wins
    }

    std::vector<std::size_t> visit_order(manifests.size());
    std::iota(visit_order.begin(), visit_order.end(), std::size_t{0});
    std::stable_sort(visit_order.begin(), visit_order.end(), [&](std::size_t a, std::size_t b) {
        return manifests[a].priority < manifests[b].priority;
    });

    for (std::size_t index : visit_order) {
        if (ctx.states[index] != VisitState::Unvisited) {
            continue;
        }
        auto result = visit(index, ctx);
        if (!result) {
            modkit_core::debug::record_error(result.error());
            return modkit_core::Err<std::vector<ModManifest>>(result.error());
        }
    }

    if (modkit_core::mod_logger()->should_log(spdlog::level::debug)) {
        std::string ids;
        for (const auto& m : ctx.order) {
            if (!ids.empty()) ids += ", ";
            ids += m.id;
        }
        modkit_core::mod_logger()->debug("Resolved load order: [{}]", ids);
    }

    return modkit_core::Ok(std::move(ctx.order));
}

modkit_core::Result<void> ModDependencyResolver::visit(std::size_t index, VisitContext& ctx) const {
    const ModManifest& mod = ctx.manifests[index];
    ctx.states[index] = VisitState::Visiting;
    ctx.stack.push_back(index);

    for (const auto& dep : mod.dependencies) {
        auto it = ctx.index_by_id.find(dep.id);
        if (it == ctx.index_by_id.end()) {
            modkit_core::Error err(ResolveError::missing_dependency(mod.id, dep.id));
            err.with_context("mod", mod.id).with_context("dependency", dep.id);
            return modkit_core::Err(std::move(err));
        }

        std::size_t dep_index = it->second;
        auto version_ok = check_version(mod, dep, ctx.manifests[dep_index]);
        if (!version_ok) {
            return version_ok;
        }

        auto result = visit_edge(mod, dep_index, ctx);
        if (!result) {
            return result;
        }
    }

    // loadAfter targets are ordered exactly like dependencies when present
    for (const auto& after : mod.load_after) {
        auto it = ctx.index_by_id.find(after);
        if (it == ctx.index_by_id.end()) {
            continue;
        }
        auto result = visit_edge(mod, it->second, ctx);
        if (!result) {
            return result;
        }
    }

    ctx.stack.pop_back();
    ctx.states[index] = VisitState::Done;
    ctx.order.push_back(mod);
    return modkit_core::Ok();
}

modkit_core::Result<void> ModDependencyResolver::visit_edge(const ModManifest& mod, std::size_t target,
                                                            VisitContext& ctx) const {
    switch (ctx.states[target]) {
        case VisitState::Unvisited:
            return visit(target, ctx);
        case VisitState::Visiting: {
            const std::string& target_id = ctx.manifests[target].id;
            DependencyCycle cycle;
            auto start = std::find(ctx.stack.begin(), ctx.stack.end(), target);
            for (auto s = start; s != ctx.stack.end(); ++s) {
                cycle.cycle_path.push_back(ctx.manifests[*s].id);
            }
            cycle.cycle_path.push_back(target_id);

            modkit_core::Error err(ResolveError::circular_dependency(mod.id, target_id, cycle.cycle_path));
            err.with_context("mod", mod.id)
               .with_context("dependency", target_id)
               .with_context("cycle", cycle.format());
            return modkit_core::Err(std::move(err));
        }
        case VisitState::Done:
            break;
    }
    return modkit_core::Ok();
}

modkit_core::Result<void> ModDependencyResolver::check_version(const ModManifest& mod,
                                                               const DependencySpec& dep,
                                                               const ModManifest& found) const {
    if (!dep.has_constraint()) {
        return modkit_core::Ok();
    }

    auto found_version = found.semantic_version();
    if (found_version && dep.constraint.satisfies(*found_version)) {
        return modkit_core::Ok();
    }

    modkit_core::Error err(ResolveError::incompatible_version(
        mod.id, dep.id, dep.constraint.to_string(), found.version));
    err.with_context("mod", mod.id)
       .with_context("dependency", dep.id)
       .with_context("required", dep.constraint.to_string())
       .with_context("found", found.version);
    return modkit_core::Err(std::move(err));
}

std::string ModDependencyResolver::to_dot_graph(const std::vector<ModManifest>& manifests) {
    std::unordered_set<std::string> present;
    for (const auto& m : manifests) {
        present.insert(m.id);
    }

    std::ostringstream oss;
    oss << "digraph mods {\n";
    oss << "  rankdir=LR;\n";
    oss << "  node [shape=box];\n\n";

    for (const auto& m : manifests) {
        std::string id = dot_escape(m.id);
        oss << "  \"" << id << "\" [label=\"" << id << "\\n" << dot_escape(m.version)
            << "\\npriority " << m.priority << "\"];\n";
    }
    oss << "\n";

    for (const auto& m : manifests) {
        for (const auto& dep : m.dependencies) {
            oss << "  \"" << dot_escape(m.id) << "\" -> \"" << dot_escape(dep.id) << "\"";
            if (!present.count(dep.id)) {
                oss << " [color=red]";
            } else if (dep.has_constraint()) {
                oss << " [label=\"" << dot_escape(dep.constraint.to_string()) << "\"]";
            }
            oss << ";\n";
        }
        for (const auto& after : m.load_after) {
            if (present.count(after)) {
                oss << "  \"" << dot_escape(m.id) << "\" -> \"" << dot_escape(after) << "\" [style=dashed];\n";
            }
        }
    }

    oss << "}\n";
    return oss.str();
}

} // namespace modkit_mod
