#pragma once

/// @file json_pointer.hpp
/// @brief JSON Pointer (RFC 6901) parsing and document navigation
///
/// Pointer syntax:
/// - ""          -> the document root
/// - "/a/b"      -> key "b" of key "a"
/// - "/arr/0"    -> first element of array "arr"
/// - "/arr/-"    -> one past the last element (only meaningful to add)
/// - "/a~1b"     -> key "a/b"  (~1 decodes to '/')
/// - "/m~0n"     -> key "m~n"  (~0 decodes to '~')
///
/// Segments are unescaped by replacing "~1" first and "~0" second, so the
/// segment "~01" decodes to "~1".

#include "fwd.hpp"
#include "document.hpp"
#include <modkit/core/error.hpp>

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace modkit_doc {

// =============================================================================
// JsonPointer
// =============================================================================

/// Parsed JSON Pointer
class JsonPointer {
public:
    /// Root pointer
    JsonPointer() = default;

    /// Pointer from already-unescaped segments
    explicit JsonPointer(std::vector<std::string> segments)
        : m_segments(std::move(segments)) {}

    /// Parse pointer text
    ///
    /// @param text Pointer text; empty or starting with '/'
    /// @return Parsed pointer or PatchError::InvalidOperation
    [[nodiscard]] static modkit_core::Result<JsonPointer> parse(std::string_view text);

    /// Decode "~1" -> "/" then "~0" -> "~"
    [[nodiscard]] static std::string unescape(std::string_view segment);

    /// Encode "~" -> "~0" and "/" -> "~1"
    [[nodiscard]] static std::string escape(std::string_view segment);

    [[nodiscard]] bool is_root() const noexcept { return m_segments.empty(); }
    [[nodiscard]] std::size_t size() const noexcept { return m_segments.size(); }
    [[nodiscard]] const std::vector<std::string>& segments() const noexcept { return m_segments; }

    /// Last segment (pointer must not be root)
    [[nodiscard]] const std::string& back() const { return m_segments.back(); }

    /// Pointer to the containing location (root stays root)
    [[nodiscard]] JsonPointer parent() const;

    /// Pointer extended by one segment
    [[nodiscard]] JsonPointer child(std::string segment) const;

    /// Re-escaped pointer text
    [[nodiscard]] std::string to_string() const;

    bool operator==(const JsonPointer& other) const = default;

private:
    std::vector<std::string> m_segments;
};

// =============================================================================
// Navigation
// =============================================================================

/// Container and final key of a pointer target
struct ParentRef {
    Document* parent = nullptr;  ///< Object or array holding the target
    std::string key;             ///< Final segment (object key or array index text)
};

/// Parse an array index segment
///
/// Accepts decimal digits only, without leading zeros (except "0").
/// Returns nullopt for anything else, including "-".
[[nodiscard]] std::optional<std::size_t> parse_array_index(std::string_view segment) noexcept;

/// Locate the value a pointer addresses
///
/// Fails with PatchError::PathNotFound when a key is missing, an index is
/// invalid or out of bounds, or a segment would descend into a scalar.
[[nodiscard]] modkit_core::Result<const Document*> resolve(
    const Document& document, const JsonPointer& pointer);

[[nodiscard]] modkit_core::Result<Document*> resolve(
    Document& document, const JsonPointer& pointer);

/// Locate the container of a pointer's target
///
/// Every segment but the last must exist. The last segment is returned
/// unchecked so callers can create, replace or remove it.
/// The root pointer has no parent and fails with PatchError::InvalidOperation.
[[nodiscard]] modkit_core::Result<ParentRef> resolve_parent(
    Document& document, const JsonPointer& pointer);

} // namespace modkit_doc
