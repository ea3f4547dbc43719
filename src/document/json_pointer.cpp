/// @file json_pointer.cpp
/// @brief JSON Pointer implementation

#include <modkit/document/json_pointer.hpp>

#include <type_traits>

namespace modkit_doc {

namespace {

std::string replace_all(std::string_view input, std::string_view from, std::string_view to) {
    std::string result;
    result.reserve(input.size());

    std::size_t pos = 0;
    while (pos < input.size()) {
        auto found = input.find(from, pos);
        if (found == std::string_view::npos) {
            result.append(input.substr(pos));
            break;
        }
        result.append(input.substr(pos, found - pos));
        result.append(to);
        pos = found + from.size();
    }
    return result;
}

/// Take one step from `current` along `segment`
///
/// DocT is Document or const Document.
template<typename DocT>
modkit_core::Result<DocT*> step(DocT& current, const std::string& segment, const JsonPointer& pointer) {
    return std::visit([&](auto& node) -> modkit_core::Result<DocT*> {
        using T = std::decay_t<decltype(node)>;
        if constexpr (std::is_same_v<T, Object>) {
            DocT* child = node.find(segment);
            if (!child) {
                return modkit_core::Err<DocT*>(modkit_core::PatchError::path_not_found(pointer.to_string()));
            }
            return modkit_core::Ok<DocT*>(child);
        } else if constexpr (std::is_same_v<T, Array>) {
            auto index = parse_array_index(segment);
            DocT* child = index ? node.find(*index) : nullptr;
            if (!child) {
                return modkit_core::Err<DocT*>(modkit_core::PatchError::path_not_found(pointer.to_string()));
            }
            return modkit_core::Ok<DocT*>(child);
        } else {
            static_assert(std::is_same_v<T, Scalar>);
            return modkit_core::Err<DocT*>(modkit_core::PatchError::path_not_found(pointer.to_string()));
        }
    }, current.storage());
}

template<typename DocT>
modkit_core::Result<DocT*> walk(DocT& document, const JsonPointer& pointer, std::size_t count) {
    DocT* current = &document;
    for (std::size_t i = 0; i < count; ++i) {
        auto next = step(*current, pointer.segments()[i], pointer);
        if (!next) {
            return next;
        }
        current = *next;
    }
    return modkit_core::Ok<DocT*>(current);
}

} // anonymous namespace

// =============================================================================
// JsonPointer
// =============================================================================

modkit_core::Result<JsonPointer> JsonPointer::parse(std::string_view text) {
    if (text.empty()) {
        return modkit_core::Ok(JsonPointer{});
    }

    if (text.front() != '/') {
        return modkit_core::Err<JsonPointer>(
            modkit_core::PatchError::invalid_operation(
                "pointer must start with '/': " + std::string(text), std::string(text)));
    }

    std::vector<std::string> segments;
    std::size_t start = 1;
    while (true) {
        auto end = text.find('/', start);
        if (end == std::string_view::npos) {
            segments.push_back(unescape(text.substr(start)));
            break;
        }
        segments.push_back(unescape(text.substr(start, end - start)));
        start = end + 1;
    }

    return modkit_core::Ok(JsonPointer(std::move(segments)));
}

std::string JsonPointer::unescape(std::string_view segment) {
    if (segment.find('~') == std::string_view::npos) {
        return std::string(segment);
    }
    return replace_all(replace_all(segment, "~1", "/"), "~0", "~");
}

std::string JsonPointer::escape(std::string_view segment) {
    return replace_all(replace_all(segment, "~", "~0"), "/", "~1");
}

JsonPointer JsonPointer::parent() const {
    if (m_segments.empty()) {
        return *this;
    }
    return JsonPointer(std::vector<std::string>(m_segments.begin(), m_segments.end() - 1));
}

JsonPointer JsonPointer::child(std::string segment) const {
    auto segments = m_segments;
    segments.push_back(std::move(segment));
    return JsonPointer(std::move(segments));
}

std::string JsonPointer::to_string() const {
    std::string result;
    for (const auto& segment : m_segments) {
        result += '/';
        result += escape(segment);
    }
    return result;
}

// =============================================================================
// Navigation
// =============================================================================

std::optional<std::size_t> parse_array_index(std::string_view segment) noexcept {
    if (segment.empty() || segment.size() > 19) {
        return std::nullopt;
    }
    if (segment.size() > 1 && segment.front() == '0') {
        return std::nullopt;
    }

    std::size_t value = 0;
    for (char c : segment) {
        if (c < '0' || c > '9') {
            return std::nullopt;
        }
        value = value * 10 + static_cast<std::size_t>(c - '0');
    }
    return value;
}

modkit_core::Result<const Document*> resolve(const Document& document, const JsonPointer& pointer) {
    return walk(document, pointer, pointer.size());
}

modkit_core::Result<Document*> resolve(Document& document, const JsonPointer& pointer) {
    return walk(document, pointer, pointer.size());
}

modkit_core::Result<ParentRef> resolve_parent(Document& document, const JsonPointer& pointer) {
    if (pointer.is_root()) {
        return modkit_core::Err<ParentRef>(
            modkit_core::PatchError::invalid_operation("the document root has no parent"));
    }

    auto parent = walk(document, pointer, pointer.size() - 1);
    if (!parent) {
        return modkit_core::Err<ParentRef>(parent.error());
    }

    return modkit_core::Ok(ParentRef{*parent, pointer.back()});
}

} // namespace modkit_doc
