/// @file patch.cpp
/// @brief Patch record and patch file parsing implementation

#include <modkit/document/patch.hpp>
#include <modkit/document/json_util.hpp>

namespace modkit_doc {

// =============================================================================
// PatchOp
// =============================================================================

const char* patch_op_name(PatchOp op) noexcept {
    switch (op) {
        case PatchOp::Add: return "add";
        case PatchOp::Remove: return "remove";
        case PatchOp::Replace: return "replace";
        case PatchOp::Move: return "move";
        case PatchOp::Copy: return "copy";
        case PatchOp::Test: return "test";
    }
    return "unknown";
}

bool patch_op_from_string(const std::string& str, PatchOp& out_op) noexcept {
    static constexpr PatchOp all_ops[] = {
        PatchOp::Add, PatchOp::Remove, PatchOp::Replace,
        PatchOp::Move, PatchOp::Copy, PatchOp::Test,
    };
    for (PatchOp op : all_ops) {
        if (iequals(str, patch_op_name(op))) {
            out_op = op;
            return true;
        }
    }
    return false;
}

// =============================================================================
// PatchOperation
// =============================================================================

modkit_core::Result<PatchOp> PatchOperation::validate() const {
    using modkit_core::PatchError;

    PatchOp kind;
    if (!patch_op_from_string(op, kind)) {
        return modkit_core::Err<PatchOp>(PatchError::invalid_operation("unknown op '" + op + "'", path));
    }

    if (path.empty() || path.front() != '/') {
        return modkit_core::Err<PatchOp>(
            PatchError::invalid_operation("path must start with '/' (got '" + path + "')", path));
    }

    switch (kind) {
        case PatchOp::Add:
        case PatchOp::Replace:
        case PatchOp::Test:
            if (!value) {
                return modkit_core::Err<PatchOp>(PatchError::invalid_operation(
                    std::string(patch_op_name(kind)) + " requires a value", path));
            }
            break;
        case PatchOp::Move:
        case PatchOp::Copy:
            if (!from) {
                return modkit_core::Err<PatchOp>(PatchError::invalid_operation(
                    std::string(patch_op_name(kind)) + " requires a from pointer", path));
            }
            if (from->empty() || from->front() != '/') {
                return modkit_core::Err<PatchOp>(PatchError::invalid_operation(
                    "from must start with '/' (got '" + *from + "')", path));
            }
            break;
        case PatchOp::Remove:
            break;
    }

    return modkit_core::Ok(kind);
}

PatchOperation PatchOperation::add(std::string path, Document value) {
    return PatchOperation{"add", std::move(path), std::move(value), std::nullopt};
}

PatchOperation PatchOperation::remove(std::string path) {
    return PatchOperation{"remove", std::move(path), std::nullopt, std::nullopt};
}

PatchOperation PatchOperation::replace(std::string path, Document value) {
    return PatchOperation{"replace", std::move(path), std::move(value), std::nullopt};
}

PatchOperation PatchOperation::move(std::string from, std::string path) {
    return PatchOperation{"move", std::move(path), std::nullopt, std::move(from)};
}

PatchOperation PatchOperation::copy(std::string from, std::string path) {
    return PatchOperation{"copy", std::move(path), std::nullopt, std::move(from)};
}

PatchOperation PatchOperation::test(std::string path, Document value) {
    return PatchOperation{"test", std::move(path), std::move(value), std::nullopt};
}

// =============================================================================
// Parsing Helpers
// =============================================================================

namespace {

modkit_core::Error patch_parse_error(const std::string& source_name, const std::string& reason) {
    return modkit_core::Error(modkit_core::ErrorCode::ParseError,
        "Invalid patch file " + source_name + ": " + reason);
}

modkit_core::Result<PatchOperation> parse_operation(
    const nlohmann::ordered_json& j, std::size_t index, const std::string& source_name) {

    const std::string where = "operations[" + std::to_string(index) + "]";
    if (!j.is_object()) {
        return modkit_core::Err<PatchOperation>(patch_parse_error(source_name, where + " must be an object"));
    }

    PatchOperation operation;

    const auto* op = find_member(j, "op");
    if (!op || !op->is_string()) {
        return modkit_core::Err<PatchOperation>(patch_parse_error(source_name, where + " is missing 'op'"));
    }
    operation.op = op->get<std::string>();

    const auto* path = find_member(j, "path");
    if (!path || !path->is_string()) {
        return modkit_core::Err<PatchOperation>(patch_parse_error(source_name, where + " is missing 'path'"));
    }
    operation.path = path->get<std::string>();

    // An explicit null value is still a value
    if (const auto* value = find_member(j, "value")) {
        operation.value = Document::from_json(*value);
    }

    if (const auto* from = find_member(j, "from")) {
        if (!from->is_string()) {
            return modkit_core::Err<PatchOperation>(
                patch_parse_error(source_name, where + " 'from' must be a string"));
        }
        operation.from = from->get<std::string>();
    }

    return modkit_core::Ok(std::move(operation));
}

} // anonymous namespace

// =============================================================================
// ModPatch
// =============================================================================

modkit_core::Result<void> ModPatch::validate() const {
    for (std::size_t i = 0; i < operations.size(); ++i) {
        auto result = operations[i].validate();
        if (!result) {
            auto err = result.error();
            err.with_context("operation_index", std::to_string(i));
            err.with_context("target", target);
            return modkit_core::Err(std::move(err));
        }
    }
    return modkit_core::Ok();
}

modkit_core::Result<ModPatch> ModPatch::from_json(const nlohmann::ordered_json& json,
                                                  const std::string& source_name) {
    if (!json.is_object()) {
        return modkit_core::Err<ModPatch>(patch_parse_error(source_name, "root must be an object"));
    }

    ModPatch patch;

    const auto* target = find_member(json, "target");
    if (!target || !target->is_string() || target->get<std::string>().empty()) {
        return modkit_core::Err<ModPatch>(patch_parse_error(source_name, "missing 'target'"));
    }
    patch.target = target->get<std::string>();

    if (const auto* description = find_member(json, "description")) {
        if (description->is_string()) {
            patch.description = description->get<std::string>();
        }
    }

    const auto* operations = find_member(json, "operations");
    if (operations) {
        if (!operations->is_array()) {
            return modkit_core::Err<ModPatch>(patch_parse_error(source_name, "'operations' must be an array"));
        }
        patch.operations.reserve(operations->size());
        for (std::size_t i = 0; i < operations->size(); ++i) {
            auto op = parse_operation((*operations)[i], i, source_name);
            if (!op) {
                return modkit_core::Err<ModPatch>(op.error());
            }
            patch.operations.push_back(std::move(*op));
        }
    }

    return modkit_core::Ok(std::move(patch));
}

modkit_core::Result<ModPatch> ModPatch::from_json_string(const std::string& json_str,
                                                         const std::string& source_name) {
    auto json = parse_json(json_str, source_name);
    if (!json) {
        return modkit_core::Err<ModPatch>(json.error());
    }
    return from_json(*json, source_name);
}

modkit_core::Result<ModPatch> ModPatch::load(const std::filesystem::path& path) {
    auto text = read_text_file(path);
    if (!text) {
        return modkit_core::Err<ModPatch>(text.error());
    }

    auto result = from_json_string(*text, path.string());
    if (!result) {
        return result;
    }

    result->source_path = path;
    return result;
}

} // namespace modkit_doc
