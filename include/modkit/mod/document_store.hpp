#pragma once

/// @file document_store.hpp
/// @brief Content document cache shared by the mod loader and its consumers
///
/// Documents are keyed by content key, `<contentType>/<relative path>` for
/// files loaded from content folders (e.g. "Templates/npcs/guard.json").
/// The store owns every document; callers borrow pointers that stay valid
/// until the key is replaced or removed.

#include "fwd.hpp"
#include <modkit/document/document.hpp>
#include <modkit/core/error.hpp>

#include <cstddef>
#include <filesystem>
#include <map>
#include <string>
#include <vector>

namespace modkit_mod {

class DocumentStore {
public:
    DocumentStore() = default;

    // Non-copyable, movable
    DocumentStore(const DocumentStore&) = delete;
    DocumentStore& operator=(const DocumentStore&) = delete;
    DocumentStore(DocumentStore&&) = default;
    DocumentStore& operator=(DocumentStore&&) = default;

    // =========================================================================
    // Access
    // =========================================================================

    /// Document for a key, or nullptr
    [[nodiscard]] modkit_doc::Document* get(const std::string& key);
    [[nodiscard]] const modkit_doc::Document* get(const std::string& key) const;

    [[nodiscard]] bool contains(const std::string& key) const;

    /// Sorted list of keys
    [[nodiscard]] std::vector<std::string> keys() const;

    [[nodiscard]] std::size_t size() const noexcept { return m_documents.size(); }
    [[nodiscard]] bool empty() const noexcept { return m_documents.empty(); }

    // =========================================================================
    // Mutation
    // =========================================================================

    /// Overwrite an existing document
    /// @return NotFound if the key is absent
    [[nodiscard]] modkit_core::Result<void> replace(const std::string& key, modkit_doc::Document document);

    /// Insert a new document
    /// @return AlreadyExists if the key is present
    [[nodiscard]] modkit_core::Result<void> add(const std::string& key, modkit_doc::Document document);

    /// Remove a document
    /// @return true if the key was present
    bool remove(const std::string& key);

    void clear() { m_documents.clear(); }

    // =========================================================================
    // Loading
    // =========================================================================

    /// Parse a JSON file and store it under key, replacing any existing document
    [[nodiscard]] modkit_core::Result<void> load_file(const std::string& key,
                                                      const std::filesystem::path& path);

    /// Load every *.json file below folder as `<key_prefix>/<relative path>`
    ///
    /// Files are visited in sorted path order. Relative paths use '/'
    /// separators. A file that fails to parse is logged and skipped.
    ///
    /// @return Number of documents stored
    [[nodiscard]] modkit_core::Result<std::size_t> load_folder(const std::filesystem::path& folder,
                                                               const std::string& key_prefix);

    /// Load base content laid out as `<root>/<contentType>/...`
    ///
    /// Each immediate subdirectory is loaded with load_folder() using its
    /// name as the key prefix.
    ///
    /// @return Number of documents stored
    [[nodiscard]] modkit_core::Result<std::size_t> load_content_root(const std::filesystem::path& root);

private:
    std::map<std::string, modkit_doc::Document> m_documents;
};

} // namespace modkit_mod
