/// @file patch_applicator.cpp
/// @brief RFC 6902 patch execution implementation

#include <modkit/document/patch_applicator.hpp>
#include <modkit/core/log.hpp>

#include <type_traits>

namespace modkit_doc {

namespace {

using modkit_core::PatchError;
using VoidResult = modkit_core::Result<void>;

/// Array position for a segment, or an error naming why it is unusable
modkit_core::Result<std::size_t> array_index(const std::string& key, const JsonPointer& path) {
    auto index = parse_array_index(key);
    if (!index) {
        return modkit_core::Err<std::size_t>(
            PatchError::invalid_operation("invalid array index '" + key + "'", path.to_string()));
    }
    return modkit_core::Ok(*index);
}

} // anonymous namespace

// =============================================================================
// Patch
// =============================================================================

modkit_core::Result<std::size_t> PatchApplicator::apply(Document& document, const ModPatch& patch) const {
    std::size_t applied = 0;

    for (const auto& operation : patch.operations) {
        auto result = apply_operation(document, operation);
        if (!result) {
            auto err = result.error();
            err.with_context("operation_index", std::to_string(applied));
            err.with_context("op", operation.op);
            err.with_context("path", operation.path);
            err.with_context("target", patch.target);
            err.with_context("operations_applied", std::to_string(applied));
            modkit_core::debug::record_error(err);
            return modkit_core::Err<std::size_t>(std::move(err));
        }
        ++applied;
    }

    modkit_core::patch_logger()->trace("Applied {} operation(s) to '{}'", applied, patch.target);
    return modkit_core::Ok(applied);
}

modkit_core::Result<void> PatchApplicator::apply_operation(Document& document,
                                                           const PatchOperation& operation) const {
    auto kind = operation.validate();
    if (!kind) {
        return modkit_core::Err(kind.error());
    }

    auto path = JsonPointer::parse(operation.path);
    if (!path) {
        return modkit_core::Err(path.error());
    }

    switch (*kind) {
        case PatchOp::Add:
            return apply_add(document, *path, *operation.value);
        case PatchOp::Remove:
            return apply_remove(document, *path);
        case PatchOp::Replace:
            return apply_replace(document, *path, *operation.value);
        case PatchOp::Test:
            return apply_test(document, *path, *operation.value);
        case PatchOp::Move:
        case PatchOp::Copy: {
            auto from = JsonPointer::parse(*operation.from);
            if (!from) {
                return modkit_core::Err(from.error());
            }
            if (*kind == PatchOp::Move) {
                return apply_move(document, *from, *path);
            }
            return apply_copy(document, *from, *path);
        }
    }

    return modkit_core::Err(PatchError::invalid_operation("unknown op '" + operation.op + "'", operation.path));
}

// =============================================================================
// Operations
// =============================================================================

modkit_core::Result<void> PatchApplicator::apply_add(Document& document, const JsonPointer& path,
                                                     Document value) const {
    auto parent = resolve_parent(document, path);
    if (!parent) {
        return modkit_core::Err(parent.error());
    }
    const std::string& key = parent->key;

    return std::visit([&](auto& node) -> VoidResult {
        using T = std::decay_t<decltype(node)>;
        if constexpr (std::is_same_v<T, Object>) {
            node.set(key, std::move(value));
            return modkit_core::Ok();
        } else if constexpr (std::is_same_v<T, Array>) {
            if (key == "-") {
                node.push_back(std::move(value));
                return modkit_core::Ok();
            }
            auto index = array_index(key, path);
            if (!index) {
                return modkit_core::Err(index.error());
            }
            if (*index > node.size()) {
                return modkit_core::Err(PatchError::out_of_range(path.to_string(), key));
            }
            node.insert(*index, std::move(value));
            return modkit_core::Ok();
        } else {
            static_assert(std::is_same_v<T, Scalar>);
            return modkit_core::Err(PatchError::type_mismatch(path.to_string(),
                std::string("cannot add a member to a ") + node.type_name()));
        }
    }, parent->parent->storage());
}

modkit_core::Result<void> PatchApplicator::apply_remove(Document& document, const JsonPointer& path) const {
    auto parent = resolve_parent(document, path);
    if (!parent) {
        return modkit_core::Err(parent.error());
    }
    const std::string& key = parent->key;

    return std::visit([&](auto& node) -> VoidResult {
        using T = std::decay_t<decltype(node)>;
        if constexpr (std::is_same_v<T, Object>) {
            if (!node.erase(key)) {
                return modkit_core::Err(PatchError::path_not_found(path.to_string()));
            }
            return modkit_core::Ok();
        } else if constexpr (std::is_same_v<T, Array>) {
            auto index = array_index(key, path);
            if (!index) {
                return modkit_core::Err(index.error());
            }
            if (*index >= node.size()) {
                return modkit_core::Err(PatchError::out_of_range(path.to_string(), key));
            }
            node.erase(*index);
            return modkit_core::Ok();
        } else {
            static_assert(std::is_same_v<T, Scalar>);
            return modkit_core::Err(PatchError::type_mismatch(path.to_string(),
                std::string("cannot remove a member from a ") + node.type_name()));
        }
    }, parent->parent->storage());
}

modkit_core::Result<void> PatchApplicator::apply_replace(Document& document, const JsonPointer& path,
                                                         Document value) const {
    auto parent = resolve_parent(document, path);
    if (!parent) {
        return modkit_core::Err(parent.error());
    }
    const std::string& key = parent->key;

    return std::visit([&](auto& node) -> VoidResult {
        using T = std::decay_t<decltype(node)>;
        if constexpr (std::is_same_v<T, Object>) {
            Document* target = node.find(key);
            if (!target) {
                return modkit_core::Err(PatchError::path_not_found(path.to_string()));
            }
            *target = std::move(value);
            return modkit_core::Ok();
        } else if constexpr (std::is_same_v<T, Array>) {
            auto index = array_index(key, path);
            if (!index) {
                return modkit_core::Err(index.error());
            }
            if (*index >= node.size()) {
                return modkit_core::Err(PatchError::out_of_range(path.to_string(), key));
            }
            node.at(*index) = std::move(value);
            return modkit_core::Ok();
        } else {
            static_assert(std::is_same_v<T, Scalar>);
            return modkit_core::Err(PatchError::type_mismatch(path.to_string(),
                std::string("cannot replace a member of a ") + node.type_name()));
        }
    }, parent->parent->storage());
}

modkit_core::Result<void> PatchApplicator::apply_move(Document& document, const JsonPointer& from,
                                                      const JsonPointer& path) const {
    auto source = resolve(document, from);
    if (!source) {
        return modkit_core::Err(source.error());
    }

    // Remove before adding so indexes in a shared array shift first
    Document value = **source;
    auto removed = apply_remove(document, from);
    if (!removed) {
        return removed;
    }
    return apply_add(document, path, std::move(value));
}

modkit_core::Result<void> PatchApplicator::apply_copy(Document& document, const JsonPointer& from,
                                                      const JsonPointer& path) const {
    auto source = resolve(static_cast<const Document&>(document), from);
    if (!source) {
        return modkit_core::Err(source.error());
    }
    return apply_add(document, path, **source);
}

modkit_core::Result<void> PatchApplicator::apply_test(const Document& document, const JsonPointer& path,
                                                      const Document& expected) const {
    auto actual = resolve(document, path);
    if (!actual) {
        return modkit_core::Err(actual.error());
    }

    auto expected_json = expected.dump();
    auto actual_json = (*actual)->dump();
    if (expected_json != actual_json) {
        return modkit_core::Err(PatchError::test_failed(path.to_string(), expected_json, actual_json));
    }
    return modkit_core::Ok();
}

} // namespace modkit_doc
