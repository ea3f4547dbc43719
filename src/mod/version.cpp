/// @file version.cpp
/// @brief Mod version and constraint implementation

#include <modkit/mod/version.hpp>

#include <algorithm>
#include <cctype>
#include <charconv>
#include <sstream>

namespace modkit_mod {

namespace {

std::string_view trim(std::string_view str) {
    while (!str.empty() && std::isspace(static_cast<unsigned char>(str.front()))) {
        str.remove_prefix(1);
    }
    while (!str.empty() && std::isspace(static_cast<unsigned char>(str.back()))) {
        str.remove_suffix(1);
    }
    return str;
}

bool is_digit(char c) {
    return std::isdigit(static_cast<unsigned char>(c)) != 0;
}

/// Leading run of up to three dot-separated numbers
struct NumericPrefix {
    std::size_t length = 0;
    int parts = 0;
};

NumericPrefix numeric_prefix(std::string_view str) {
    NumericPrefix prefix;
    std::size_t pos = 0;
    while (prefix.parts < 3) {
        std::size_t start = pos;
        if (prefix.parts > 0) {
            if (pos >= str.size() || str[pos] != '.') {
                break;
            }
            ++start;
        }
        std::size_t end = start;
        while (end < str.size() && is_digit(str[end])) {
            ++end;
        }
        if (end == start) {
            break;
        }
        pos = end;
        prefix.length = end;
        ++prefix.parts;
    }
    return prefix;
}

/// Length of the leading "\d+.\d+.\d+" run, or 0 if absent
std::size_t version_prefix_length(std::string_view str) {
    NumericPrefix prefix = numeric_prefix(str);
    return prefix.parts == 3 ? prefix.length : 0;
}

/// Parse a version with at least `min_parts` numeric components; missing
/// minor and patch are zero
modkit_core::Result<SemanticVersion> parse_version(std::string_view str, int min_parts) {
    NumericPrefix prefix = numeric_prefix(str);
    bool dangling_dot = prefix.parts > 0 && prefix.parts < 3 &&
                        prefix.length < str.size() && str[prefix.length] == '.';
    if (prefix.parts < min_parts || prefix.parts == 0 || dangling_dot) {
        return modkit_core::Err<SemanticVersion>(
            modkit_core::Error(modkit_core::ErrorCode::ParseError,
                "Invalid version '" + std::string(str) +
                (min_parts == 3 ? "' (expected major.minor.patch)" : "' (expected major[.minor[.patch]])")));
    }

    SemanticVersion result;
    std::uint32_t* parts[3] = {&result.major, &result.minor, &result.patch};
    std::size_t pos = 0;
    for (int i = 0; i < prefix.parts; ++i) {
        auto [ptr, ec] = std::from_chars(str.data() + pos, str.data() + prefix.length, *parts[i]);
        if (ec != std::errc{}) {
            return modkit_core::Err<SemanticVersion>(
                modkit_core::Error(modkit_core::ErrorCode::ParseError,
                    "Version component out of range: " + std::string(str)));
        }
        pos = static_cast<std::size_t>(ptr - str.data()) + 1;
    }

    std::string_view rest = str.substr(prefix.length);
    auto plus_pos = rest.find('+');
    if (!rest.empty() && rest.front() == '-') {
        result.prerelease = std::string(rest.substr(1, plus_pos == std::string_view::npos
            ? std::string_view::npos : plus_pos - 1));
    }
    if (plus_pos != std::string_view::npos) {
        result.build_metadata = std::string(rest.substr(plus_pos + 1));
    }

    return modkit_core::Ok(std::move(result));
}

std::strong_ordering compare_prerelease(std::string_view a, std::string_view b) noexcept {
    std::size_t a_start = 0;
    std::size_t b_start = 0;

    while (a_start < a.size() || b_start < b.size()) {
        if (a_start >= a.size()) return std::strong_ordering::less;
        if (b_start >= b.size()) return std::strong_ordering::greater;

        std::size_t a_end = std::min(a.find('.', a_start), a.size());
        std::size_t b_end = std::min(b.find('.', b_start), b.size());
        std::string_view a_id = a.substr(a_start, a_end - a_start);
        std::string_view b_id = b.substr(b_start, b_end - b_start);

        bool a_numeric = !a_id.empty() && std::all_of(a_id.begin(), a_id.end(), is_digit);
        bool b_numeric = !b_id.empty() && std::all_of(b_id.begin(), b_id.end(), is_digit);

        if (a_numeric && b_numeric) {
            std::uint64_t a_num = 0;
            std::uint64_t b_num = 0;
            std::from_chars(a_id.data(), a_id.data() + a_id.size(), a_num);
            std::from_chars(b_id.data(), b_id.data() + b_id.size(), b_num);
            if (auto cmp = a_num <=> b_num; cmp != 0) return cmp;
        } else if (a_numeric != b_numeric) {
            // Numeric identifiers order below alphanumeric ones
            return a_numeric ? std::strong_ordering::less : std::strong_ordering::greater;
        } else if (auto cmp = a_id.compare(b_id); cmp != 0) {
            return cmp < 0 ? std::strong_ordering::less : std::strong_ordering::greater;
        }

        a_start = a_end + 1;
        b_start = b_end + 1;
    }

    return std::strong_ordering::equal;
}

} // anonymous namespace

// =============================================================================
// SemanticVersion
// =============================================================================

bool has_version_prefix(std::string_view str) noexcept {
    return version_prefix_length(str) > 0;
}

modkit_core::Result<SemanticVersion> SemanticVersion::parse(std::string_view str) {
    return parse_version(trim(str), 3);
}

modkit_core::Result<SemanticVersion> SemanticVersion::parse_partial(std::string_view str) {
    return parse_version(trim(str), 1);
}

std::strong_ordering SemanticVersion::operator<=>(const SemanticVersion& other) const noexcept {
    if (auto cmp = major <=> other.major; cmp != 0) return cmp;
    if (auto cmp = minor <=> other.minor; cmp != 0) return cmp;
    if (auto cmp = patch <=> other.patch; cmp != 0) return cmp;

    if (prerelease.empty() != other.prerelease.empty()) {
        return prerelease.empty() ? std::strong_ordering::greater : std::strong_ordering::less;
    }
    return compare_prerelease(prerelease, other.prerelease);
}

bool SemanticVersion::operator==(const SemanticVersion& other) const noexcept {
    return major == other.major &&
           minor == other.minor &&
           patch == other.patch &&
           prerelease == other.prerelease;
}

std::string SemanticVersion::to_string() const {
    std::ostringstream oss;
    oss << major << '.' << minor << '.' << patch;
    if (!prerelease.empty()) {
        oss << '-' << prerelease;
    }
    if (!build_metadata.empty()) {
        oss << '+' << build_metadata;
    }
    return oss.str();
}

// =============================================================================
// VersionConstraint
// =============================================================================

modkit_core::Result<VersionConstraint> VersionConstraint::parse(std::string_view str) {
    str = trim(str);

    if (str.empty() || str == "*") {
        return modkit_core::Ok(VersionConstraint::any());
    }

    VersionConstraint result;
    if (str.starts_with(">=")) {
        result.type = Type::GreaterEqual;
        str.remove_prefix(2);
    } else if (str.starts_with(">")) {
        result.type = Type::Greater;
        str.remove_prefix(1);
    } else if (str.starts_with("<=")) {
        result.type = Type::LessEqual;
        str.remove_prefix(2);
    } else if (str.starts_with("<")) {
        result.type = Type::Less;
        str.remove_prefix(1);
    } else if (str.starts_with("^")) {
        result.type = Type::Caret;
        str.remove_prefix(1);
    } else if (str.starts_with("~")) {
        result.type = Type::Tilde;
        str.remove_prefix(1);
    } else if (str.starts_with("==") || str.starts_with("=")) {
        result.type = Type::Exact;
        str.remove_prefix(str.starts_with("==") ? 2 : 1);
    } else {
        result.type = Type::Exact;
    }

    auto version = SemanticVersion::parse_partial(str);
    if (!version) {
        return modkit_core::Err<VersionConstraint>(version.error());
    }
    result.version = std::move(*version);

    return modkit_core::Ok(std::move(result));
}

bool VersionConstraint::satisfies(const SemanticVersion& v) const noexcept {
    switch (type) {
        case Type::Any:
            return true;
        case Type::Exact:
            return v == version;
        case Type::Greater:
            return v > version;
        case Type::GreaterEqual:
            return v >= version;
        case Type::Less:
            return v < version;
        case Type::LessEqual:
            return v <= version;
        case Type::Caret: {
            if (v < version) return false;
            if (version.major > 0) return v.major == version.major;
            if (version.minor > 0) return v.major == 0 && v.minor == version.minor;
            return v.major == 0 && v.minor == 0 && v.patch == version.patch;
        }
        case Type::Tilde:
            return v >= version && v.major == version.major && v.minor == version.minor;
    }
    return false;
}

std::string VersionConstraint::to_string() const {
    switch (type) {
        case Type::Any: return "*";
        case Type::Exact: return "==" + version.to_string();
        case Type::Greater: return ">" + version.to_string();
        case Type::GreaterEqual: return ">=" + version.to_string();
        case Type::Less: return "<" + version.to_string();
        case Type::LessEqual: return "<=" + version.to_string();
        case Type::Caret: return "^" + version.to_string();
        case Type::Tilde: return "~" + version.to_string();
    }
    return "?";
}

// =============================================================================
// DependencySpec
// =============================================================================

modkit_core::Result<DependencySpec> DependencySpec::parse(std::string_view str) {
    str = trim(str);

    std::size_t id_end = 0;
    while (id_end < str.size()) {
        char c = str[id_end];
        if (std::isspace(static_cast<unsigned char>(c)) || c == '<' || c == '>' || c == '=' ||
            c == '^' || c == '~') {
            break;
        }
        ++id_end;
    }

    if (id_end == 0) {
        return modkit_core::Err<DependencySpec>(
            modkit_core::Error(modkit_core::ErrorCode::ParseError,
                "Dependency entry has no mod id: '" + std::string(str) + "'"));
    }

    DependencySpec spec;
    spec.id = std::string(str.substr(0, id_end));

    std::string_view rest = trim(str.substr(id_end));
    if (rest.empty()) {
        return modkit_core::Ok(std::move(spec));
    }

    if (is_digit(rest.front())) {
        auto version = SemanticVersion::parse_partial(rest);
        if (!version) {
            return modkit_core::Err<DependencySpec>(version.error());
        }
        spec.constraint = VersionConstraint::greater_equal(std::move(*version));
        return modkit_core::Ok(std::move(spec));
    }

    auto constraint = VersionConstraint::parse(rest);
    if (!constraint) {
        return modkit_core::Err<DependencySpec>(constraint.error());
    }
    spec.constraint = std::move(*constraint);

    return modkit_core::Ok(std::move(spec));
}

std::string DependencySpec::to_string() const {
    if (!has_constraint()) {
        return id;
    }
    return id + " " + constraint.to_string();
}

} // namespace modkit_mod
