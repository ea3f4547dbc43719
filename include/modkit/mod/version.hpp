#pragma once

/// @file version.hpp
/// @brief Mod versions and dependency version constraints
///
/// Mod versions must begin with "major.minor.patch"; anything after that
/// prefix is accepted ("1.2.3", "1.2.3-beta", "1.2.3+build7", "1.2.3b").
///
/// Dependency entries in a manifest are either a bare mod id or an id
/// followed by a constraint:
/// - "core"
/// - "core >= 1.2.0"
/// - "core ^1.0.0"
/// - "core 1.2.0"     (a bare version means ">=")
///
/// Constraint versions may omit minor and patch ("core >= 1.0", "core 2"),
/// which count as zero.

#include "fwd.hpp"
#include <modkit/core/error.hpp>

#include <compare>
#include <cstdint>
#include <string>
#include <string_view>
#include <utility>

namespace modkit_mod {

// =============================================================================
// SemanticVersion
// =============================================================================

/// major.minor.patch[-prerelease][+build]
///
/// Prerelease versions order below their release; build metadata is
/// ignored in comparisons.
struct SemanticVersion {
    std::uint32_t major = 0;
    std::uint32_t minor = 0;
    std::uint32_t patch = 0;
    std::string prerelease;
    std::string build_metadata;

    constexpr SemanticVersion() noexcept = default;

    constexpr SemanticVersion(std::uint32_t maj, std::uint32_t min, std::uint32_t pat) noexcept
        : major(maj), minor(min), patch(pat) {}

    /// Parse a version string
    ///
    /// The string must start with three dot-separated numbers. A '-' or '+'
    /// suffix is split into prerelease and build metadata; any other trailing
    /// text is ignored.
    [[nodiscard]] static modkit_core::Result<SemanticVersion> parse(std::string_view str);

    /// Parse "major[.minor[.patch]]" with the same suffix rules; missing
    /// components are zero
    [[nodiscard]] static modkit_core::Result<SemanticVersion> parse_partial(std::string_view str);

    [[nodiscard]] std::strong_ordering operator<=>(const SemanticVersion& other) const noexcept;
    [[nodiscard]] bool operator==(const SemanticVersion& other) const noexcept;

    [[nodiscard]] bool is_prerelease() const noexcept { return !prerelease.empty(); }

    [[nodiscard]] std::string to_string() const;
};

/// Check the manifest version rule (starts with \d+.\d+.\d+)
[[nodiscard]] bool has_version_prefix(std::string_view str) noexcept;

// =============================================================================
// VersionConstraint
// =============================================================================

/// A single comparison against a version
struct VersionConstraint {
    enum class Type : std::uint8_t {
        Any,           ///< No constraint
        Exact,         ///< ==1.2.3
        Greater,       ///< >1.2.3
        GreaterEqual,  ///< >=1.2.3
        Less,          ///< <1.2.3
        LessEqual,     ///< <=1.2.3
        Caret,         ///< ^1.2.3 (same major, or same minor for 0.x)
        Tilde          ///< ~1.2.3 (same major.minor)
    };

    Type type = Type::Any;
    SemanticVersion version;

    /// Parse a constraint ("*", ">=1.0.0", "^1.2.3", "== 2.0.0", ...)
    ///
    /// A version without an operator is an exact match.
    [[nodiscard]] static modkit_core::Result<VersionConstraint> parse(std::string_view str);

    [[nodiscard]] bool satisfies(const SemanticVersion& v) const noexcept;

    [[nodiscard]] std::string to_string() const;

    [[nodiscard]] static VersionConstraint any() { return VersionConstraint{}; }

    [[nodiscard]] static VersionConstraint greater_equal(SemanticVersion v) {
        VersionConstraint c;
        c.type = Type::GreaterEqual;
        c.version = std::move(v);
        return c;
    }
};

// =============================================================================
// DependencySpec
// =============================================================================

/// One parsed entry of a manifest's dependency list
struct DependencySpec {
    std::string id;
    VersionConstraint constraint;

    /// Parse "id" or "id <constraint>"
    [[nodiscard]] static modkit_core::Result<DependencySpec> parse(std::string_view str);

    [[nodiscard]] bool has_constraint() const noexcept {
        return constraint.type != VersionConstraint::Type::Any;
    }

    [[nodiscard]] std::string to_string() const;
};

} // namespace modkit_mod
