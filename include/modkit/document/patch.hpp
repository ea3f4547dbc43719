#pragma once

/// @file patch.hpp
/// @brief Patch records (RFC 6902 operation lists) and patch file parsing
///
/// Patch file format:
/// @code
/// {
///   "target": "Templates/npc_guard.json",
///   "description": "Make guards tougher",
///   "operations": [
///     { "op": "replace", "path": "/stats/hp", "value": 200 },
///     { "op": "add", "path": "/tags/-", "value": "elite" },
///     { "op": "move", "from": "/old", "path": "/new" }
///   ]
/// }
/// @endcode

#include "fwd.hpp"
#include "document.hpp"
#include <modkit/core/error.hpp>

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace modkit_doc {

// =============================================================================
// PatchOperation
// =============================================================================

/// A single patch step
///
/// `op` is kept as written in the source so that unknown operation names
/// surface as shape errors when the operation is applied.
struct PatchOperation {
    std::string op;
    std::string path;
    std::optional<Document> value;
    std::optional<std::string> from;

    /// Check operation shape
    ///
    /// - op is one of add/remove/replace/move/copy/test (case-insensitive)
    /// - path starts with '/'
    /// - add/replace/test carry a value
    /// - move/copy carry a from that starts with '/'
    ///
    /// @return The parsed operation kind or PatchError::InvalidOperation
    [[nodiscard]] modkit_core::Result<PatchOp> validate() const;

    [[nodiscard]] static PatchOperation add(std::string path, Document value);
    [[nodiscard]] static PatchOperation remove(std::string path);
    [[nodiscard]] static PatchOperation replace(std::string path, Document value);
    [[nodiscard]] static PatchOperation move(std::string from, std::string path);
    [[nodiscard]] static PatchOperation copy(std::string from, std::string path);
    [[nodiscard]] static PatchOperation test(std::string path, Document value);
};

// =============================================================================
// ModPatch
// =============================================================================

/// An ordered list of operations against one content document
struct ModPatch {
    std::string target;       ///< Content key of the document to patch
    std::string description;
    std::vector<PatchOperation> operations;
    std::filesystem::path source_path;  ///< Patch file, if loaded from disk

    /// Validate every operation's shape
    [[nodiscard]] modkit_core::Result<void> validate() const;

    /// Build from parsed JSON
    [[nodiscard]] static modkit_core::Result<ModPatch> from_json(
        const nlohmann::ordered_json& json,
        const std::string& source_name = "<memory>");

    /// Parse patch file text
    [[nodiscard]] static modkit_core::Result<ModPatch> from_json_string(
        const std::string& json_str,
        const std::string& source_name = "<memory>");

    /// Read and parse a patch file
    [[nodiscard]] static modkit_core::Result<ModPatch> load(const std::filesystem::path& path);
};

} // namespace modkit_doc
