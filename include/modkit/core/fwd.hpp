#pragma once

/// @file fwd.hpp
/// @brief Forward declarations for modkit_core module

#include <cstdint>

namespace modkit_core {

// =============================================================================
// Error Types
// =============================================================================

enum class ErrorCode : std::uint8_t;
struct ManifestError;
struct ResolveError;
struct PatchError;
class Error;

template<typename T, typename E = Error>
class Result;

// =============================================================================
// Logging
// =============================================================================

struct LogConfig;
class LogScope;

// =============================================================================
// Configuration
// =============================================================================

struct LoaderConfig;

} // namespace modkit_core
