/// @file manifest.cpp
/// @brief Mod manifest implementation

#include <modkit/mod/manifest.hpp>
#include <modkit/document/json_util.hpp>

#include <limits>

namespace modkit_mod {

using modkit_core::ManifestError;

// =============================================================================
// JSON Parsing Helpers
// =============================================================================

namespace {

using Json = nlohmann::ordered_json;

/// Field lookup; explicit nulls count as absent
const Json* field(const Json& j, const char* name) {
    const Json* value = modkit_doc::find_member(j, name);
    if (value && value->is_null()) {
        return nullptr;
    }
    return value;
}

modkit_core::Result<void> read_string(const Json& j, const char* name, const std::string& source,
                                      std::string& out) {
    const Json* value = field(j, name);
    if (!value) {
        return modkit_core::Ok();
    }
    if (!value->is_string()) {
        return modkit_core::Err(ManifestError::invalid_field(source, name, "a string"));
    }
    out = value->get<std::string>();
    return modkit_core::Ok();
}

modkit_core::Result<void> read_string_array(const Json& j, const char* name, const std::string& source,
                                            std::vector<std::string>& out) {
    const Json* value = field(j, name);
    if (!value) {
        return modkit_core::Ok();
    }
    if (!value->is_array()) {
        return modkit_core::Err(ManifestError::invalid_field(source, name, "an array of strings"));
    }
    out.clear();
    out.reserve(value->size());
    for (const auto& item : *value) {
        if (!item.is_string()) {
            return modkit_core::Err(ManifestError::invalid_field(source, name, "an array of strings"));
        }
        out.push_back(item.get<std::string>());
    }
    return modkit_core::Ok();
}

modkit_core::Result<void> read_priority(const Json& j, const std::string& source, int& out) {
    const Json* value = field(j, "priority");
    if (!value) {
        return modkit_core::Ok();
    }
    if (value->is_number_unsigned()) {
        auto v = value->get<std::uint64_t>();
        if (v > static_cast<std::uint64_t>(std::numeric_limits<int>::max())) {
            return modkit_core::Err(ManifestError::invalid_field(source, "priority", "a 32-bit integer"));
        }
        out = static_cast<int>(v);
        return modkit_core::Ok();
    }
    if (value->is_number_integer()) {
        auto v = value->get<std::int64_t>();
        if (v < std::numeric_limits<int>::min() || v > std::numeric_limits<int>::max()) {
            return modkit_core::Err(ManifestError::invalid_field(source, "priority", "a 32-bit integer"));
        }
        out = static_cast<int>(v);
        return modkit_core::Ok();
    }
    return modkit_core::Err(ManifestError::invalid_field(source, "priority", "an integer"));
}

modkit_core::Result<void> read_content_folders(const Json& j, const std::string& source,
                                               std::map<std::string, std::string>& out) {
    const Json* value = field(j, "contentFolders");
    if (!value) {
        return modkit_core::Ok();
    }
    if (!value->is_object()) {
        return modkit_core::Err(ManifestError::invalid_field(
            source, "contentFolders", "an object of content type -> folder"));
    }
    for (auto it = value->begin(); it != value->end(); ++it) {
        if (!it.value().is_string()) {
            return modkit_core::Err(ManifestError::invalid_field(
                source, "contentFolders." + it.key(), "a string"));
        }
        out[it.key()] = it.value().get<std::string>();
    }
    return modkit_core::Ok();
}

} // anonymous namespace

// =============================================================================
// ModManifest Implementation
// =============================================================================

modkit_core::Result<ModManifest> ModManifest::load(const std::filesystem::path& path,
                                                   const std::filesystem::path& directory) {
    auto text = modkit_doc::read_text_file(path);
    if (!text) {
        return modkit_core::Err<ModManifest>(text.error());
    }
    return from_json_string(*text, directory, path.string());
}

modkit_core::Result<ModManifest> ModManifest::from_json_string(const std::string& json_str,
                                                               const std::filesystem::path& directory,
                                                               const std::string& source_name) {
    Json j;
    try {
        j = Json::parse(json_str);
    } catch (const nlohmann::json::parse_error& e) {
        return modkit_core::Err<ModManifest>(ManifestError::parse_failed(source_name, e.what()));
    }

    if (!j.is_object()) {
        return modkit_core::Err<ModManifest>(
            ManifestError::parse_failed(source_name, "root must be an object"));
    }

    ModManifest manifest;
    manifest.directory = directory;

    std::vector<std::string> dependency_strings;
    modkit_core::Result<void> steps[] = {
        read_string(j, "id", source_name, manifest.id),
        read_string(j, "name", source_name, manifest.name),
        read_string(j, "author", source_name, manifest.author),
        read_string(j, "version", source_name, manifest.version),
        read_string(j, "description", source_name, manifest.description),
        read_string_array(j, "dependencies", source_name, dependency_strings),
        read_string_array(j, "loadBefore", source_name, manifest.load_before),
        read_string_array(j, "loadAfter", source_name, manifest.load_after),
        read_priority(j, source_name, manifest.priority),
        read_string_array(j, "scripts", source_name, manifest.scripts),
        read_string_array(j, "permissions", source_name, manifest.permissions),
        read_string_array(j, "patches", source_name, manifest.patches),
        read_content_folders(j, source_name, manifest.content_folders),
    };
    for (auto& step : steps) {
        if (!step) {
            return modkit_core::Err<ModManifest>(step.error());
        }
    }

    for (const auto& entry : dependency_strings) {
        auto spec = DependencySpec::parse(entry);
        if (!spec) {
            return modkit_core::Err<ModManifest>(ManifestError::invalid_field(
                source_name, "dependencies", "'id' or 'id <op> version' (got '" + entry + "')"));
        }
        manifest.dependencies.push_back(std::move(*spec));
    }

    auto valid = manifest.validate(source_name);
    if (!valid) {
        return modkit_core::Err<ModManifest>(valid.error());
    }

    return modkit_core::Ok(std::move(manifest));
}

modkit_core::Result<void> ModManifest::validate(const std::string& source_name) const {
    if (id.empty()) {
        return modkit_core::Err(ManifestError::missing_field(source_name, "id"));
    }
    if (name.empty()) {
        return modkit_core::Err(ManifestError::missing_field(source_name, "name"));
    }
    if (version.empty()) {
        return modkit_core::Err(ManifestError::missing_field(source_name, "version"));
    }
    if (!has_version_prefix(version)) {
        return modkit_core::Err(ManifestError::invalid_version(source_name, version));
    }
    return modkit_core::Ok();
}

std::vector<std::string> ModManifest::dependency_ids() const {
    std::vector<std::string> ids;
    ids.reserve(dependencies.size());
    for (const auto& dep : dependencies) {
        ids.push_back(dep.id);
    }
    return ids;
}

std::string ModManifest::to_string() const {
    return name + " (" + id + ") v" + version;
}

} // namespace modkit_mod
