/// @file document_store.cpp
/// @brief Content document cache implementation

#include <modkit/mod/document_store.hpp>
#include <modkit/document/json_util.hpp>
#include <modkit/core/log.hpp>

#include <algorithm>

namespace modkit_mod {

modkit_doc::Document* DocumentStore::get(const std::string& key) {
    auto it = m_documents.find(key);
    return it != m_documents.end() ? &it->second : nullptr;
}

const modkit_doc::Document* DocumentStore::get(const std::string& key) const {
    auto it = m_documents.find(key);
    return it != m_documents.end() ? &it->second : nullptr;
}

bool DocumentStore::contains(const std::string& key) const {
    return m_documents.count(key) > 0;
}

std::vector<std::string> DocumentStore::keys() const {
    std::vector<std::string> result;
    result.reserve(m_documents.size());
    for (const auto& [key, _] : m_documents) {
        result.push_back(key);
    }
    return result;
}

modkit_core::Result<void> DocumentStore::replace(const std::string& key, modkit_doc::Document document) {
    auto it = m_documents.find(key);
    if (it == m_documents.end()) {
        return modkit_core::Err(modkit_core::Error(modkit_core::ErrorCode::NotFound,
            "No document with key '" + key + "'"));
    }
    it->second = std::move(document);
    return modkit_core::Ok();
}

modkit_core::Result<void> DocumentStore::add(const std::string& key, modkit_doc::Document document) {
    auto [it, inserted] = m_documents.try_emplace(key, std::move(document));
    if (!inserted) {
        return modkit_core::Err(modkit_core::Error(modkit_core::ErrorCode::AlreadyExists,
            "Document '" + key + "' already exists"));
    }
    return modkit_core::Ok();
}

bool DocumentStore::remove(const std::string& key) {
    return m_documents.erase(key) > 0;
}

modkit_core::Result<void> DocumentStore::load_file(const std::string& key, const std::filesystem::path& path) {
    auto text = modkit_doc::read_text_file(path);
    if (!text) {
        return modkit_core::Err(text.error());
    }

    auto json = modkit_doc::parse_json(*text, path.string());
    if (!json) {
        return modkit_core::Err(json.error());
    }

    m_documents[key] = modkit_doc::Document::from_json(*json);
    return modkit_core::Ok();
}

modkit_core::Result<std::size_t> DocumentStore::load_folder(const std::filesystem::path& folder,
                                                            const std::string& key_prefix) {
    std::error_code ec;
    if (!std::filesystem::is_directory(folder, ec)) {
        return modkit_core::Err<std::size_t>(modkit_core::Error(modkit_core::ErrorCode::NotFound,
            "Content folder not found: " + folder.string()));
    }

    std::vector<std::filesystem::path> files;
    for (auto it = std::filesystem::recursive_directory_iterator(folder, ec);
         !ec && it != std::filesystem::recursive_directory_iterator(); it.increment(ec)) {
        if (it->is_regular_file(ec) && it->path().extension() == ".json") {
            files.push_back(it->path());
        }
    }
    if (ec) {
        return modkit_core::Err<std::size_t>(modkit_core::Error(modkit_core::ErrorCode::IOError,
            "Failed to scan " + folder.string() + ": " + ec.message()));
    }
    std::sort(files.begin(), files.end());

    auto log = modkit_core::content_logger();
    std::size_t loaded = 0;
    for (const auto& file : files) {
        std::string key = key_prefix + "/" + file.lexically_relative(folder).generic_string();
        bool existed = contains(key);

        auto result = load_file(key, file);
        if (!result) {
            log->error("Skipping content file {}: {}", file.string(), result.error().message());
            continue;
        }

        log->trace("{} content document '{}'", existed ? "Replaced" : "Added", key);
        ++loaded;
    }

    return modkit_core::Ok(loaded);
}

modkit_core::Result<std::size_t> DocumentStore::load_content_root(const std::filesystem::path& root) {
    std::error_code ec;
    std::vector<std::filesystem::path> folders;
    for (auto it = std::filesystem::directory_iterator(root, ec);
         !ec && it != std::filesystem::directory_iterator(); it.increment(ec)) {
        if (it->is_directory(ec)) {
            folders.push_back(it->path());
        }
    }
    if (ec) {
        return modkit_core::Err<std::size_t>(modkit_core::Error(modkit_core::ErrorCode::IOError,
            "Failed to scan content root " + root.string() + ": " + ec.message()));
    }
    std::sort(folders.begin(), folders.end());

    std::size_t total = 0;
    for (const auto& folder : folders) {
        auto loaded = load_folder(folder, folder.filename().string());
        if (!loaded) {
            return loaded;
        }
        total += *loaded;
    }

    modkit_core::content_logger()->info("Loaded {} base content document(s) from {}", total, root.string());
    return modkit_core::Ok(total);
}

} // namespace modkit_mod
