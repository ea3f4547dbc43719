// modkit_core Error and Result tests

#include <catch2/catch_test_macros.hpp>
#include <modkit/core/error.hpp>
#include <cstddef>
#include <string>
#include <vector>

using namespace modkit_core;

// =============================================================================
// Error Tests
// =============================================================================

TEST_CASE("Error construction", "[core][error]") {
    SECTION("from string") {
        Error err("Test error");
        REQUIRE(err.message() == "Test error");
        REQUIRE(err.code() == ErrorCode::Unknown);
        REQUIRE(err.is<std::string>());
    }

    SECTION("from code and message") {
        Error err(ErrorCode::InvalidArgument, "Bad argument");
        REQUIRE(err.code() == ErrorCode::InvalidArgument);
        REQUIRE(err.message() == "Bad argument");
    }

    SECTION("with context") {
        Error err = Error("Base error").with_context("key", "value");
        auto* ctx = err.get_context("key");
        REQUIRE(ctx != nullptr);
        REQUIRE(*ctx == "value");
        REQUIRE(err.get_context("missing") == nullptr);
    }

    SECTION("context overwrites") {
        Error err("Base error");
        err.with_context("key", "first").with_context("key", "second");
        REQUIRE(err.context().size() == 1);
        REQUIRE(*err.get_context("key") == "second");
    }
}

TEST_CASE("Error factory methods", "[core][error]") {
    SECTION("ManifestError::missing_field") {
        Error err = ManifestError::missing_field("Mods/a/mod.json", "id");
        REQUIRE(err.code() == ErrorCode::ValidationError);
        REQUIRE(err.is<ManifestError>());
        REQUIRE(err.as<ManifestError>()->field == "id");
        REQUIRE(err.message().find("Mods/a/mod.json") != std::string::npos);
    }

    SECTION("ManifestError::parse_failed") {
        Error err = ManifestError::parse_failed("mod.json", "unexpected end of input");
        REQUIRE(err.code() == ErrorCode::ParseError);
    }

    SECTION("ManifestError::invalid_version") {
        Error err = ManifestError::invalid_version("mod.json", "banana");
        REQUIRE(err.code() == ErrorCode::ValidationError);
        REQUIRE(err.as<ManifestError>()->field == "version");
    }

    SECTION("ResolveError::missing_dependency names both mods") {
        Error err = ResolveError::missing_dependency("alpha", "beta");
        REQUIRE(err.code() == ErrorCode::DependencyMissing);
        REQUIRE(err.message().find("alpha") != std::string::npos);
        REQUIRE(err.message().find("beta") != std::string::npos);
    }

    SECTION("ResolveError::circular_dependency carries the cycle") {
        Error err = ResolveError::circular_dependency("a", "b", {"a", "b", "a"});
        REQUIRE(err.code() == ErrorCode::DependencyCycle);
        REQUIRE(err.as<ResolveError>()->cycle.size() == 3);
        REQUIRE(err.message().find("a -> b -> a") != std::string::npos);
    }

    SECTION("ResolveError::incompatible_version") {
        Error err = ResolveError::incompatible_version("a", "b", ">=2.0.0", "1.0.0");
        REQUIRE(err.code() == ErrorCode::IncompatibleVersion);
    }

    SECTION("PatchError kinds map to codes") {
        REQUIRE(Error(PatchError::invalid_operation("bad op")).code() == ErrorCode::InvalidArgument);
        REQUIRE(Error(PatchError::path_not_found("/a")).code() == ErrorCode::NotFound);
        REQUIRE(Error(PatchError::type_mismatch("/a", "scalar")).code() == ErrorCode::TypeMismatch);
        REQUIRE(Error(PatchError::out_of_range("/a/9", "9")).code() == ErrorCode::OutOfRange);
        REQUIRE(Error(PatchError::test_failed("/a", "1", "2")).code() == ErrorCode::TestFailed);
    }

    SECTION("PatchError::test_failed keeps both sides") {
        Error err = PatchError::test_failed("/hp", "100", "50");
        const auto* patch = err.as<PatchError>();
        REQUIRE(patch != nullptr);
        REQUIRE(patch->expected == "100");
        REQUIRE(patch->actual == "50");
    }
}

TEST_CASE("build_error_chain", "[core][error]") {
    Error err = PatchError::path_not_found("/stats/hp");
    err.with_context("mod", "better_guards");

    std::string chain = build_error_chain(err);
    REQUIRE(chain.find("[NotFound]") != std::string::npos);
    REQUIRE(chain.find("[PatchError]") != std::string::npos);
    REQUIRE(chain.find("/stats/hp") != std::string::npos);
    REQUIRE(chain.find("mod=better_guards") != std::string::npos);
}

TEST_CASE("Error statistics", "[core][error]") {
    debug::reset_error_stats();
    REQUIRE(debug::total_error_count() == 0);

    debug::record_error(ManifestError::missing_field("mod.json", "id"));
    debug::record_error(Error("generic"));
    REQUIRE(debug::total_error_count() == 2);

    std::string summary = debug::error_stats_summary();
    REQUIRE(summary.find("Manifest: 1") != std::string::npos);
    REQUIRE(summary.find("Generic: 1") != std::string::npos);

    debug::reset_error_stats();
    REQUIRE(debug::total_error_count() == 0);
}

// =============================================================================
// Result<T> Tests
// =============================================================================

TEST_CASE("Result construction", "[core][result]") {
    SECTION("Ok with value") {
        Result<int> r = Ok(42);
        REQUIRE(r.is_ok());
        REQUIRE_FALSE(r.is_err());
        REQUIRE(r.value() == 42);
    }

    SECTION("Ok void") {
        Result<void> r = Ok();
        REQUIRE(r.is_ok());
        REQUIRE_FALSE(r.is_err());
    }

    SECTION("Err with message") {
        Result<int> r = Err<int>(Error("Something failed"));
        REQUIRE(r.is_err());
        REQUIRE(r.error().message() == "Something failed");
    }

    SECTION("count result") {
        Result<std::size_t> r = Ok(std::size_t{3});
        REQUIRE(r.value() == 3u);
        Result<std::size_t> failed = Err<std::size_t>(Error(ErrorCode::IOError, "scan failed"));
        REQUIRE(failed.value_or(0) == 0u);
    }

    SECTION("Err void with Error object") {
        Result<void> r = Err(Error(ErrorCode::NotFound, "Not found"));
        REQUIRE(r.is_err());
        REQUIRE(r.error().code() == ErrorCode::NotFound);
    }
}

TEST_CASE("Result value access", "[core][result]") {
    SECTION("value_or on Ok") {
        Result<int> r = Ok(42);
        REQUIRE(r.value_or(0) == 42);
    }

    SECTION("value_or on Err") {
        Result<int> r = Err<int>(Error("error"));
        REQUIRE(r.value_or(0) == 0);
    }

    SECTION("dereference") {
        Result<std::string> r = Ok(std::string("hello"));
        REQUIRE(*r == "hello");
        REQUIRE(r->size() == 5);
    }

    SECTION("move value out") {
        Result<std::vector<int>> r = Ok(std::vector<int>{1, 2, 3});
        std::vector<int> v = std::move(r).value();
        REQUIRE(v.size() == 3);
    }
}

TEST_CASE("Result map operations", "[core][result]") {
    SECTION("map on Ok") {
        Result<int> r = Ok(21);
        auto r2 = r.map([](int x) { return x * 2; });
        REQUIRE(r2.is_ok());
        REQUIRE(r2.value() == 42);
    }

    SECTION("map on Err keeps the error") {
        Result<int> r = Err<int>(Error(ErrorCode::OutOfRange, "error"));
        auto r2 = r.map([](int x) { return x * 2; });
        REQUIRE(r2.is_err());
        REQUIRE(r2.error().code() == ErrorCode::OutOfRange);
    }

    SECTION("and_then on Ok") {
        Result<int> r = Ok(42);
        auto r2 = r.and_then([](int x) -> Result<std::string> {
            return Ok(std::to_string(x));
        });
        REQUIRE(r2.is_ok());
        REQUIRE(r2.value() == "42");
    }
}

TEST_CASE("Result boolean conversion", "[core][result]") {
    Result<int> ok = Ok(42);
    Result<int> err = Err<int>(Error("error"));

    REQUIRE(static_cast<bool>(ok));
    REQUIRE_FALSE(static_cast<bool>(err));
}
