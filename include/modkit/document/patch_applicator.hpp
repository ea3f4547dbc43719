#pragma once

/// @file patch_applicator.hpp
/// @brief RFC 6902 patch execution against a Document

#include "fwd.hpp"
#include "document.hpp"
#include "json_pointer.hpp"
#include "patch.hpp"
#include <modkit/core/error.hpp>

#include <cstddef>

namespace modkit_doc {

/// Executes patch operations in order against a document
///
/// The document is mutated in place. Operations are not transactional:
/// when an operation fails, the operations before it stay applied and the
/// rest of the patch is skipped.
class PatchApplicator {
public:
    PatchApplicator() = default;

    /// Apply every operation of a patch
    ///
    /// Errors carry context keys `operation_index`, `op`, `path`, `target`
    /// and `operations_applied`.
    ///
    /// @return Number of operations applied
    [[nodiscard]] modkit_core::Result<std::size_t> apply(Document& document, const ModPatch& patch) const;

    /// Validate and apply a single operation
    [[nodiscard]] modkit_core::Result<void> apply_operation(Document& document,
                                                            const PatchOperation& operation) const;

private:
    [[nodiscard]] modkit_core::Result<void> apply_add(Document& document, const JsonPointer& path,
                                                      Document value) const;
    [[nodiscard]] modkit_core::Result<void> apply_remove(Document& document, const JsonPointer& path) const;
    [[nodiscard]] modkit_core::Result<void> apply_replace(Document& document, const JsonPointer& path,
                                                          Document value) const;
    [[nodiscard]] modkit_core::Result<void> apply_move(Document& document, const JsonPointer& from,
                                                       const JsonPointer& path) const;
    [[nodiscard]] modkit_core::Result<void> apply_copy(Document& document, const JsonPointer& from,
                                                       const JsonPointer& path) const;
    [[nodiscard]] modkit_core::Result<void> apply_test(const Document& document, const JsonPointer& path,
                                                       const Document& expected) const;
};

} // namespace modkit_doc
