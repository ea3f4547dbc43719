/// @file document.cpp
/// @brief Document model implementation

#include <modkit/document/document.hpp>

#include <limits>
#include <type_traits>

namespace modkit_doc {

const char* document_kind_name(DocumentKind kind) noexcept {
    switch (kind) {
        case DocumentKind::Object: return "object";
        case DocumentKind::Array: return "array";
        case DocumentKind::Scalar: return "scalar";
    }
    return "unknown";
}

// =============================================================================
// Scalar
// =============================================================================

const char* Scalar::type_name() const noexcept {
    return std::visit([](const auto& v) -> const char* {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::nullptr_t>) {
            return "null";
        } else if constexpr (std::is_same_v<T, bool>) {
            return "bool";
        } else if constexpr (std::is_same_v<T, std::int64_t> || std::is_same_v<T, std::uint64_t>) {
            return "integer";
        } else if constexpr (std::is_same_v<T, double>) {
            return "number";
        } else {
            static_assert(std::is_same_v<T, std::string>);
            return "string";
        }
    }, value);
}

// =============================================================================
// Object
// =============================================================================

Object::Object() = default;
Object::~Object() = default;
Object::Object(const Object& other) = default;
Object::Object(Object&& other) noexcept = default;
Object& Object::operator=(const Object& other) = default;
Object& Object::operator=(Object&& other) noexcept = default;

std::size_t Object::index_of(std::string_view key) const {
    for (std::size_t i = 0; i < m_keys.size(); ++i) {
        if (m_keys[i] == key) {
            return i;
        }
    }
    return m_keys.size();
}

bool Object::contains(std::string_view key) const {
    return index_of(key) < m_keys.size();
}

Document* Object::find(std::string_view key) {
    auto i = index_of(key);
    return i < m_keys.size() ? &m_values[i] : nullptr;
}

const Document* Object::find(std::string_view key) const {
    auto i = index_of(key);
    return i < m_keys.size() ? &m_values[i] : nullptr;
}

void Object::set(std::string key, Document value) {
    auto i = index_of(key);
    if (i < m_keys.size()) {
        m_values[i] = std::move(value);
        return;
    }
    m_keys.push_back(std::move(key));
    m_values.push_back(std::move(value));
}

bool Object::erase(std::string_view key) {
    auto i = index_of(key);
    if (i >= m_keys.size()) {
        return false;
    }
    m_keys.erase(m_keys.begin() + static_cast<std::ptrdiff_t>(i));
    m_values.erase(m_values.begin() + static_cast<std::ptrdiff_t>(i));
    return true;
}

Document& Object::value_at(std::size_t index) {
    return m_values[index];
}

const Document& Object::value_at(std::size_t index) const {
    return m_values[index];
}

bool Object::operator==(const Object& other) const {
    return m_keys == other.m_keys && m_values == other.m_values;
}

// =============================================================================
// Array
// =============================================================================

Array::Array() = default;
Array::~Array() = default;
Array::Array(const Array& other) = default;
Array::Array(Array&& other) noexcept = default;
Array& Array::operator=(const Array& other) = default;
Array& Array::operator=(Array&& other) noexcept = default;

std::size_t Array::size() const noexcept {
    return m_items.size();
}

bool Array::empty() const noexcept {
    return m_items.empty();
}

Document& Array::at(std::size_t index) {
    return m_items.at(index);
}

const Document& Array::at(std::size_t index) const {
    return m_items.at(index);
}

Document* Array::find(std::size_t index) {
    return index < m_items.size() ? &m_items[index] : nullptr;
}

const Document* Array::find(std::size_t index) const {
    return index < m_items.size() ? &m_items[index] : nullptr;
}

void Array::push_back(Document value) {
    m_items.push_back(std::move(value));
}

void Array::insert(std::size_t index, Document value) {
    m_items.insert(m_items.begin() + static_cast<std::ptrdiff_t>(index), std::move(value));
}

void Array::erase(std::size_t index) {
    m_items.erase(m_items.begin() + static_cast<std::ptrdiff_t>(index));
}

bool Array::operator==(const Array& other) const {
    return m_items == other.m_items;
}

// =============================================================================
// Document
// =============================================================================

Document Document::from_json(const nlohmann::ordered_json& json) {
    using value_t = nlohmann::ordered_json::value_t;

    switch (json.type()) {
        case value_t::object: {
            Object object;
            for (const auto& [key, value] : json.items()) {
                object.set(key, from_json(value));
            }
            return Document(std::move(object));
        }
        case value_t::array: {
            Array array;
            for (const auto& item : json) {
                array.push_back(from_json(item));
            }
            return Document(std::move(array));
        }
        case value_t::boolean:
            return Document(json.get<bool>());
        case value_t::number_integer:
            return Document(json.get<std::int64_t>());
        case value_t::number_unsigned: {
            auto value = json.get<std::uint64_t>();
            if (value <= static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())) {
                return Document(static_cast<std::int64_t>(value));
            }
            return Document(value);
        }
        case value_t::number_float:
            return Document(json.get<double>());
        case value_t::string:
            return Document(json.get<std::string>());
        case value_t::null:
        case value_t::binary:
        case value_t::discarded:
        default:
            return Document();
    }
}

modkit_core::Result<Document> Document::parse(std::string_view text) {
    nlohmann::ordered_json json;
    try {
        json = nlohmann::ordered_json::parse(text.begin(), text.end());
    } catch (const nlohmann::json::parse_error& e) {
        return modkit_core::Err<Document>(
            modkit_core::Error(modkit_core::ErrorCode::ParseError,
                std::string("JSON parse error: ") + e.what()));
    }
    return modkit_core::Ok(from_json(json));
}

nlohmann::ordered_json Document::to_json() const {
    return std::visit([](const auto& node) -> nlohmann::ordered_json {
        using T = std::decay_t<decltype(node)>;
        if constexpr (std::is_same_v<T, Object>) {
            nlohmann::ordered_json json = nlohmann::ordered_json::object();
            for (std::size_t i = 0; i < node.size(); ++i) {
                json[node.keys()[i]] = node.value_at(i).to_json();
            }
            return json;
        } else if constexpr (std::is_same_v<T, Array>) {
            nlohmann::ordered_json json = nlohmann::ordered_json::array();
            for (std::size_t i = 0; i < node.size(); ++i) {
                json.push_back(node.at(i).to_json());
            }
            return json;
        } else {
            static_assert(std::is_same_v<T, Scalar>);
            return std::visit([](const auto& v) -> nlohmann::ordered_json {
                return nlohmann::ordered_json(v);
            }, node.value);
        }
    }, m_storage);
}

std::string Document::dump(int indent) const {
    return to_json().dump(indent);
}

bool Document::operator==(const Document& other) const {
    return m_storage == other.m_storage;
}

} // namespace modkit_doc
