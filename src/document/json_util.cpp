/// @file json_util.cpp
/// @brief Shared JSON helpers implementation

#include <modkit/document/json_util.hpp>

#include <cctype>
#include <fstream>
#include <sstream>

namespace modkit_doc {

bool iequals(std::string_view a, std::string_view b) noexcept {
    if (a.size() != b.size()) {
        return false;
    }
    for (std::size_t i = 0; i < a.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(a[i])) !=
            std::tolower(static_cast<unsigned char>(b[i]))) {
            return false;
        }
    }
    return true;
}

const nlohmann::ordered_json* find_member(const nlohmann::ordered_json& json, std::string_view name) {
    if (!json.is_object()) {
        return nullptr;
    }

    auto exact = json.find(std::string(name));
    if (exact != json.end()) {
        return &*exact;
    }

    for (auto it = json.begin(); it != json.end(); ++it) {
        if (iequals(it.key(), name)) {
            return &*it;
        }
    }
    return nullptr;
}

modkit_core::Result<std::string> read_text_file(const std::filesystem::path& path) {
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        return modkit_core::Err<std::string>(
            modkit_core::Error(modkit_core::ErrorCode::NotFound,
                "File not found: " + path.string()));
    }

    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        return modkit_core::Err<std::string>(
            modkit_core::Error(modkit_core::ErrorCode::IOError,
                "Failed to open file: " + path.string()));
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    return modkit_core::Ok(buffer.str());
}

modkit_core::Result<nlohmann::ordered_json> parse_json(const std::string& text, const std::string& source_name) {
    try {
        return modkit_core::Ok(nlohmann::ordered_json::parse(text));
    } catch (const nlohmann::json::parse_error& e) {
        return modkit_core::Err<nlohmann::ordered_json>(
            modkit_core::Error(modkit_core::ErrorCode::ParseError,
                "JSON parse error in " + source_name + ": " + e.what()));
    }
}

} // namespace modkit_doc
