// modkit_mod version, constraint and dependency parsing tests

#include <catch2/catch_test_macros.hpp>
#include <modkit/mod/version.hpp>

using namespace modkit_mod;

TEST_CASE("SemanticVersion parsing", "[mod][version]") {
    SECTION("plain") {
        auto v = SemanticVersion::parse("1.2.3");
        REQUIRE(v);
        REQUIRE(v->major == 1);
        REQUIRE(v->minor == 2);
        REQUIRE(v->patch == 3);
        REQUIRE_FALSE(v->is_prerelease());
    }

    SECTION("prerelease and build metadata") {
        auto v = SemanticVersion::parse("2.0.0-beta.2+build7");
        REQUIRE(v);
        REQUIRE(v->prerelease == "beta.2");
        REQUIRE(v->build_metadata == "build7");
        REQUIRE(v->to_string() == "2.0.0-beta.2+build7");
    }

    SECTION("invalid") {
        REQUIRE(SemanticVersion::parse("1.2").is_err());
        REQUIRE(SemanticVersion::parse("v1.2.3").is_err());
        REQUIRE(SemanticVersion::parse("").is_err());
    }

    SECTION("version prefix") {
        REQUIRE(has_version_prefix("1.0.0"));
        REQUIRE(has_version_prefix("1.0.0-alpha"));
        REQUIRE_FALSE(has_version_prefix("1.0"));
        REQUIRE_FALSE(has_version_prefix("latest"));
    }
}

TEST_CASE("SemanticVersion ordering", "[mod][version]") {
    auto v = [](const char* text) { return SemanticVersion::parse(text).value(); };

    REQUIRE(v("1.0.0") < v("1.0.1"));
    REQUIRE(v("1.9.0") < v("1.10.0"));
    REQUIRE(v("1.0.0-alpha") < v("1.0.0"));
    REQUIRE(v("1.0.0-alpha") < v("1.0.0-alpha.1"));
    REQUIRE(v("1.0.0-alpha.2") < v("1.0.0-alpha.10"));
    REQUIRE(v("1.0.0-1") < v("1.0.0-alpha"));
    REQUIRE(v("1.0.0+a") == v("1.0.0+b"));
}

TEST_CASE("VersionConstraint", "[mod][version]") {
    auto v = [](const char* text) { return SemanticVersion::parse(text).value(); };
    auto c = [](const char* text) { return VersionConstraint::parse(text).value(); };

    SECTION("any") {
        REQUIRE(c("*").type == VersionConstraint::Type::Any);
        REQUIRE(c("").satisfies(v("0.0.1")));
    }

    SECTION("comparisons") {
        REQUIRE(c(">=1.2.0").satisfies(v("1.2.0")));
        REQUIRE_FALSE(c(">1.2.0").satisfies(v("1.2.0")));
        REQUIRE(c("<2.0.0").satisfies(v("1.99.0")));
        REQUIRE(c("<=2.0.0").satisfies(v("2.0.0")));
        REQUIRE(c("1.2.3").satisfies(v("1.2.3")));
        REQUIRE_FALSE(c("==1.2.3").satisfies(v("1.2.4")));
    }

    SECTION("caret and tilde") {
        REQUIRE(c("^1.2.0").satisfies(v("1.9.0")));
        REQUIRE_FALSE(c("^1.2.0").satisfies(v("2.0.0")));
        REQUIRE_FALSE(c("^0.2.0").satisfies(v("0.3.0")));
        REQUIRE(c("~1.2.0").satisfies(v("1.2.9")));
        REQUIRE_FALSE(c("~1.2.0").satisfies(v("1.3.0")));
    }

    SECTION("to_string") {
        REQUIRE(c("1.2.3").to_string() == "==1.2.3");
        REQUIRE(c(">= 1.0.0").to_string() == ">=1.0.0");
    }

    SECTION("short versions pad with zero") {
        REQUIRE(c(">=1.0").version == SemanticVersion(1, 0, 0));
        REQUIRE(c("^2").version == SemanticVersion(2, 0, 0));
        REQUIRE(c("~1.4").to_string() == "~1.4.0");
        REQUIRE(c("<2-rc.1").version.prerelease == "rc.1");
    }

    SECTION("invalid") {
        REQUIRE(VersionConstraint::parse(">=banana").is_err());
        REQUIRE(VersionConstraint::parse(">=1.").is_err());
        REQUIRE(VersionConstraint::parse("1.x").is_err());
    }
}

TEST_CASE("Short versions stay invalid for mods", "[mod][version]") {
    REQUIRE(SemanticVersion::parse("1").is_err());
    REQUIRE(SemanticVersion::parse("1.0").is_err());
    REQUIRE(SemanticVersion::parse_partial("1.0").is_ok());
}

TEST_CASE("DependencySpec parsing", "[mod][version]") {
    SECTION("bare id") {
        auto spec = DependencySpec::parse("core_lib");
        REQUIRE(spec);
        REQUIRE(spec->id == "core_lib");
        REQUIRE_FALSE(spec->has_constraint());
        REQUIRE(spec->to_string() == "core_lib");
    }

    SECTION("operator constraint") {
        auto spec = DependencySpec::parse("core_lib>=1.2.0");
        REQUIRE(spec);
        REQUIRE(spec->id == "core_lib");
        REQUIRE(spec->constraint.type == VersionConstraint::Type::GreaterEqual);
    }

    SECTION("space separated bare version means minimum") {
        auto spec = DependencySpec::parse("core_lib 1.2.0");
        REQUIRE(spec);
        REQUIRE(spec->constraint.type == VersionConstraint::Type::GreaterEqual);
        REQUIRE(spec->constraint.satisfies(SemanticVersion(1, 3, 0)));
        REQUIRE_FALSE(spec->constraint.satisfies(SemanticVersion(1, 1, 0)));
    }

    SECTION("minimum with two components") {
        auto spec = DependencySpec::parse("core >= 1.0");
        REQUIRE(spec);
        REQUIRE(spec->id == "core");
        REQUIRE(spec->constraint.type == VersionConstraint::Type::GreaterEqual);
        REQUIRE(spec->constraint.version == SemanticVersion(1, 0, 0));
        REQUIRE(spec->constraint.satisfies(SemanticVersion(1, 0, 0)));
    }

    SECTION("bare major version") {
        auto spec = DependencySpec::parse("core 1");
        REQUIRE(spec);
        REQUIRE(spec->constraint.type == VersionConstraint::Type::GreaterEqual);
        REQUIRE(spec->to_string() == "core >=1.0.0");
        REQUIRE_FALSE(spec->constraint.satisfies(SemanticVersion(0, 9, 0)));
    }

    SECTION("exact major version") {
        auto spec = DependencySpec::parse("core == 2");
        REQUIRE(spec);
        REQUIRE(spec->constraint.type == VersionConstraint::Type::Exact);
        REQUIRE(spec->constraint.satisfies(SemanticVersion(2, 0, 0)));
        REQUIRE_FALSE(spec->constraint.satisfies(SemanticVersion(2, 0, 1)));
    }

    SECTION("caret with whitespace") {
        auto spec = DependencySpec::parse("  ui_kit ^2.0.0 ");
        REQUIRE(spec);
        REQUIRE(spec->id == "ui_kit");
        REQUIRE(spec->to_string() == "ui_kit ^2.0.0");
    }

    SECTION("invalid") {
        REQUIRE(DependencySpec::parse(">=1.0.0").is_err());
        REQUIRE(DependencySpec::parse("core_lib >=one").is_err());
        REQUIRE(DependencySpec::parse("core_lib 1.").is_err());
    }
}
