#pragma once

/// @file document.hpp
/// @brief In-memory content document tree
///
/// A Document is a closed tagged union of three alternatives:
/// - Object: ordered key -> Document mapping (insertion order preserved)
/// - Array: ordered sequence of Documents
/// - Scalar: null, bool, integer, floating point or string leaf
///
/// Documents convert to and from nlohmann::ordered_json. The compact
/// serialization produced by dump() is the canonical form used for
/// equality checks by the patch `test` operation.

#include "fwd.hpp"
#include <modkit/core/error.hpp>

#include <nlohmann/json.hpp>

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace modkit_doc {

// =============================================================================
// Scalar
// =============================================================================

/// Leaf value
struct Scalar {
    using Value = std::variant<
        std::nullptr_t,
        bool,
        std::int64_t,
        std::uint64_t,  ///< Only for values above INT64_MAX
        double,
        std::string
    >;

    Value value = nullptr;

    [[nodiscard]] bool is_null() const noexcept {
        return std::holds_alternative<std::nullptr_t>(value);
    }

    /// Name of the held type ("null", "bool", "integer", "number", "string")
    [[nodiscard]] const char* type_name() const noexcept;

    bool operator==(const Scalar& other) const = default;
};

// =============================================================================
// Object
// =============================================================================

/// Ordered key -> Document mapping
///
/// Keys keep insertion order; overwriting a key keeps its position.
class Object {
public:
    Object();
    ~Object();
    Object(const Object& other);
    Object(Object&& other) noexcept;
    Object& operator=(const Object& other);
    Object& operator=(Object&& other) noexcept;

    [[nodiscard]] std::size_t size() const noexcept { return m_keys.size(); }
    [[nodiscard]] bool empty() const noexcept { return m_keys.empty(); }

    /// Check whether a key is present
    [[nodiscard]] bool contains(std::string_view key) const;

    /// Find a value by key (nullptr if absent)
    [[nodiscard]] Document* find(std::string_view key);
    [[nodiscard]] const Document* find(std::string_view key) const;

    /// Insert a new key at the end, or overwrite an existing one in place
    void set(std::string key, Document value);

    /// Remove a key
    /// @return true if the key was present
    bool erase(std::string_view key);

    /// Keys in insertion order
    [[nodiscard]] const std::vector<std::string>& keys() const noexcept { return m_keys; }

    /// Value at insertion position (parallel to keys())
    [[nodiscard]] Document& value_at(std::size_t index);
    [[nodiscard]] const Document& value_at(std::size_t index) const;

    [[nodiscard]] bool operator==(const Object& other) const;

private:
    [[nodiscard]] std::size_t index_of(std::string_view key) const;

    std::vector<std::string> m_keys;
    std::vector<Document> m_values;
};

// =============================================================================
// Array
// =============================================================================

/// Ordered sequence of Documents
class Array {
public:
    Array();
    ~Array();
    Array(const Array& other);
    Array(Array&& other) noexcept;
    Array& operator=(const Array& other);
    Array& operator=(Array&& other) noexcept;

    [[nodiscard]] std::size_t size() const noexcept;
    [[nodiscard]] bool empty() const noexcept;

    /// Element access
    /// @throws std::out_of_range if index >= size()
    [[nodiscard]] Document& at(std::size_t index);
    [[nodiscard]] const Document& at(std::size_t index) const;

    /// Find an element by index (nullptr if out of range)
    [[nodiscard]] Document* find(std::size_t index);
    [[nodiscard]] const Document* find(std::size_t index) const;

    /// Append at the end
    void push_back(Document value);

    /// Insert before index, shifting later elements right (index <= size())
    void insert(std::size_t index, Document value);

    /// Remove element at index, shifting later elements left (index < size())
    void erase(std::size_t index);

    [[nodiscard]] bool operator==(const Array& other) const;

private:
    std::vector<Document> m_items;
};

// =============================================================================
// Document
// =============================================================================

/// A content document tree node
class Document {
public:
    using Storage = std::variant<Object, Array, Scalar>;

    // =========================================================================
    // Construction
    // =========================================================================

    /// Null scalar
    Document() : m_storage(Scalar{}) {}

    Document(Object object) : m_storage(std::move(object)) {}
    Document(Array array) : m_storage(std::move(array)) {}
    Document(Scalar scalar) : m_storage(std::move(scalar)) {}

    Document(std::nullptr_t) : m_storage(Scalar{}) {}
    Document(bool value) : m_storage(Scalar{value}) {}
    Document(int value) : m_storage(Scalar{static_cast<std::int64_t>(value)}) {}
    Document(std::int64_t value) : m_storage(Scalar{value}) {}
    Document(std::uint64_t value) : m_storage(Scalar{value}) {}
    Document(double value) : m_storage(Scalar{value}) {}
    Document(const char* value) : m_storage(Scalar{std::string(value)}) {}
    Document(std::string value) : m_storage(Scalar{std::move(value)}) {}

    /// Empty object
    [[nodiscard]] static Document object() { return Document(Object{}); }

    /// Empty array
    [[nodiscard]] static Document array() { return Document(Array{}); }

    // =========================================================================
    // Kind Queries
    // =========================================================================

    [[nodiscard]] DocumentKind kind() const noexcept {
        return static_cast<DocumentKind>(m_storage.index());
    }

    [[nodiscard]] bool is_object() const noexcept { return std::holds_alternative<Object>(m_storage); }
    [[nodiscard]] bool is_array() const noexcept { return std::holds_alternative<Array>(m_storage); }
    [[nodiscard]] bool is_scalar() const noexcept { return std::holds_alternative<Scalar>(m_storage); }
    [[nodiscard]] bool is_null() const noexcept {
        const auto* s = std::get_if<Scalar>(&m_storage);
        return s && s->is_null();
    }

    // =========================================================================
    // Typed Access (nullptr on kind mismatch)
    // =========================================================================

    [[nodiscard]] Object* as_object() noexcept { return std::get_if<Object>(&m_storage); }
    [[nodiscard]] const Object* as_object() const noexcept { return std::get_if<Object>(&m_storage); }
    [[nodiscard]] Array* as_array() noexcept { return std::get_if<Array>(&m_storage); }
    [[nodiscard]] const Array* as_array() const noexcept { return std::get_if<Array>(&m_storage); }
    [[nodiscard]] Scalar* as_scalar() noexcept { return std::get_if<Scalar>(&m_storage); }
    [[nodiscard]] const Scalar* as_scalar() const noexcept { return std::get_if<Scalar>(&m_storage); }

    /// Underlying variant, for exhaustive std::visit
    [[nodiscard]] Storage& storage() noexcept { return m_storage; }
    [[nodiscard]] const Storage& storage() const noexcept { return m_storage; }

    // =========================================================================
    // JSON Conversion
    // =========================================================================

    /// Build a document from parsed JSON
    [[nodiscard]] static Document from_json(const nlohmann::ordered_json& json);

    /// Parse JSON text into a document
    [[nodiscard]] static modkit_core::Result<Document> parse(std::string_view text);

    /// Convert to JSON (object keys in insertion order)
    [[nodiscard]] nlohmann::ordered_json to_json() const;

    /// Serialize; indent < 0 gives the compact canonical form
    [[nodiscard]] std::string dump(int indent = -1) const;

    [[nodiscard]] bool operator==(const Document& other) const;

private:
    Storage m_storage;
};

} // namespace modkit_doc
