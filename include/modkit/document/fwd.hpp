#pragma once

/// @file fwd.hpp
/// @brief Forward declarations for modkit_doc module

#include <cstdint>
#include <string>

namespace modkit_doc {

// =============================================================================
// Document Model
// =============================================================================

/// Which alternative a Document currently holds
enum class DocumentKind : std::uint8_t {
    Object,  ///< Ordered key -> value mapping
    Array,   ///< Ordered sequence
    Scalar   ///< Leaf value (null, bool, number, string)
};

/// Get kind name
[[nodiscard]] const char* document_kind_name(DocumentKind kind) noexcept;

struct Scalar;
class Object;
class Array;
class Document;

// =============================================================================
// Pointers
// =============================================================================

class JsonPointer;
struct ParentRef;

// =============================================================================
// Patches
// =============================================================================

/// RFC 6902 operation kinds
enum class PatchOp : std::uint8_t {
    Add,
    Remove,
    Replace,
    Move,
    Copy,
    Test
};

/// Get operation name ("add", "remove", ...)
[[nodiscard]] const char* patch_op_name(PatchOp op) noexcept;

/// Parse operation name (case-insensitive)
[[nodiscard]] bool patch_op_from_string(const std::string& str, PatchOp& out_op) noexcept;

struct PatchOperation;
struct ModPatch;
class PatchApplicator;

} // namespace modkit_doc
