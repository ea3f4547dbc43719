/// @file error.cpp
/// @brief Error handling implementation for modkit_core
///
/// The error system is primarily template-based and header-only.
/// This file provides:
/// - Explicit template instantiations for the Result types loaders return
/// - Error formatting utilities
/// - Error statistics for diagnostics

#include <modkit/core/error.hpp>
#include <atomic>
#include <cstddef>
#include <sstream>
#include <vector>

namespace modkit_core {

// =============================================================================
// Error Message Formatting
// =============================================================================

namespace detail {

std::string format_manifest_error(const ManifestError& err) {
    std::ostringstream oss;
    oss << "[ManifestError] " << err.message;
    if (!err.field.empty()) {
        oss << " (field: " << err.field << ")";
    }
    return oss.str();
}

std::string format_resolve_error(const ResolveError& err) {
    std::ostringstream oss;
    oss << "[ResolveError] " << err.message;

    if (!err.mod_id.empty()) {
        oss << " (mod: " << err.mod_id << ")";
    }
    if (!err.dependency.empty()) {
        oss << " (dependency: " << err.dependency << ")";
    }

    return oss.str();
}

std::string format_patch_error(const PatchError& err) {
    std::ostringstream oss;
    oss << "[PatchError] " << err.message;
    if (!err.path.empty()) {
        oss << " (path: " << err.path << ")";
    }
    return oss.str();
}

} // namespace detail

// =============================================================================
// Error Chain Support
// =============================================================================

std::string build_error_chain(const Error& error) {
    std::ostringstream oss;

    oss << "[" << error_code_name(error.code()) << "] ";

    std::visit([&oss](const auto& err) {
        using T = std::decay_t<decltype(err)>;
        if constexpr (std::is_same_v<T, std::string>) {
            oss << err;
        } else if constexpr (std::is_same_v<T, ManifestError>) {
            oss << detail::format_manifest_error(err);
        } else if constexpr (std::is_same_v<T, ResolveError>) {
            oss << detail::format_resolve_error(err);
        } else if constexpr (std::is_same_v<T, PatchError>) {
            oss << detail::format_patch_error(err);
        }
    }, error.variant());

    for (const auto& [key, value] : error.context()) {
        oss << " " << key << "=" << value;
    }

    return oss.str();
}

// =============================================================================
// Explicit Template Instantiations
// =============================================================================

template class Result<void, Error>;
template class Result<std::size_t, Error>;
template class Result<std::string, Error>;

// =============================================================================
// Error Statistics (Debug/Development)
// =============================================================================

namespace debug {

struct ErrorStats {
    std::atomic<std::uint64_t> total_errors{0};
    std::atomic<std::uint64_t> manifest_errors{0};
    std::atomic<std::uint64_t> resolve_errors{0};
    std::atomic<std::uint64_t> patch_errors{0};
    std::atomic<std::uint64_t> generic_errors{0};
};

static ErrorStats s_error_stats;

void record_error(const Error& error) {
    s_error_stats.total_errors.fetch_add(1, std::memory_order_relaxed);

    if (error.is<ManifestError>()) {
        s_error_stats.manifest_errors.fetch_add(1, std::memory_order_relaxed);
    } else if (error.is<ResolveError>()) {
        s_error_stats.resolve_errors.fetch_add(1, std::memory_order_relaxed);
    } else if (error.is<PatchError>()) {
        s_error_stats.patch_errors.fetch_add(1, std::memory_order_relaxed);
    } else {
        s_error_stats.generic_errors.fetch_add(1, std::memory_order_relaxed);
    }
}

std::uint64_t total_error_count() {
    return s_error_stats.total_errors.load(std::memory_order_relaxed);
}

void reset_error_stats() {
    s_error_stats.total_errors.store(0, std::memory_order_relaxed);
    s_error_stats.manifest_errors.store(0, std::memory_order_relaxed);
    s_error_stats.resolve_errors.store(0, std::memory_order_relaxed);
    s_error_stats.patch_errors.store(0, std::memory_order_relaxed);
    s_error_stats.generic_errors.store(0, std::memory_order_relaxed);
}

std::string error_stats_summary() {
    std::ostringstream oss;
    oss << "Error Statistics:\n"
        << "  Total: " << s_error_stats.total_errors.load() << "\n"
        << "  Manifest: " << s_error_stats.manifest_errors.load() << "\n"
        << "  Resolve: " << s_error_stats.resolve_errors.load() << "\n"
        << "  Patch: " << s_error_stats.patch_errors.load() << "\n"
        << "  Generic: " << s_error_stats.generic_errors.load() << "\n";
    return oss.str();
}

} // namespace debug

} // namespace modkit_core
