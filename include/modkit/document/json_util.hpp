#pragma once

/// @file json_util.hpp
/// @brief Shared helpers for reading JSON content files

#include <modkit/core/error.hpp>

#include <nlohmann/json.hpp>

#include <filesystem>
#include <string>
#include <string_view>

namespace modkit_doc {

/// Find an object member by name, ignoring ASCII case
///
/// An exact match wins over a case-insensitive one.
/// @return Member value or nullptr if absent (or json is not an object)
[[nodiscard]] const nlohmann::ordered_json* find_member(
    const nlohmann::ordered_json& json, std::string_view name);

/// Compare two strings ignoring ASCII case
[[nodiscard]] bool iequals(std::string_view a, std::string_view b) noexcept;

/// Read a whole file into a string
///
/// @return File contents, NotFound if the file does not exist, IOError otherwise
[[nodiscard]] modkit_core::Result<std::string> read_text_file(const std::filesystem::path& path);

/// Parse JSON text, converting parse exceptions to ParseError
[[nodiscard]] modkit_core::Result<nlohmann::ordered_json> parse_json(
    const std::string& text, const std::string& source_name);

} // namespace modkit_doc
