#include <catch2/catch_test_macros.hpp>
#include "core/result.hpp"
#include "core/error_codes.hpp"

using namespace tally;

TEST_CASE("Result::ok creates a success result", "[result]") {
    auto result = Result<int>::ok(42);

    REQUIRE(result.is_ok());
    REQUIRE_FALSE(result.is_err());
    REQUIRE(result.unwrap() == 42);
}

TEST_CASE("Result::err creates an error result", "[result]") {
    auto result = Result<int>::err(Error{"something went wrong", codes::DB});

    REQUIRE_FALSE(result.is_ok());
    REQUIRE(result.is_err());
    REQUIRE(result.unwrap_err().message == "something went wrong");
    REQUIRE(result.unwrap_err().code == codes::DB);
}

TEST_CASE("Result::unwrap throws on error", "[result]") {
    auto result = Result<int>::err(Error{"error"});

    REQUIRE_THROWS_AS(result.unwrap(), std::runtime_error);
}

TEST_CASE("Result::value_or returns default on error", "[result]") {
    auto ok_result = Result<int>::ok(42);
    auto err_result = Result<int>::err(Error{"error"});

    REQUIRE(ok_result.value_or(0) == 42);
    REQUIRE(err_result.value_or(0) == 0);
}

TEST_CASE("Result::map transforms success value", "[result]") {
    auto result = Result<int>::ok(21);
    auto mapped = result.map([](int x) { return x * 2; });

    REQUIRE(mapped.is_ok());
    REQUIRE(mapped.unwrap() == 42);
}

TEST_CASE("Result::map propagates error", "[result]") {
    auto result = Result<int>::err(Error{"error"});
    auto mapped = result.map([](int x) { return x * 2; });

    REQUIRE(mapped.is_err());
    REQUIRE(mapped.unwrap_err().message == "error");
}

TEST_CASE("Result::and_then chains operations", "[result]") {
    auto divide = [](int x) -> Result<int> {
        if (x == 0) return Result<int>::err(Error{"division by zero"});
        return Result<int>::ok(100 / x);
    };

    auto result = Result<int>::ok(5).and_then(divide);
    REQUIRE(result.is_ok());
    REQUIRE(result.unwrap() == 20);

    auto failed = Result<int>::ok(0).and_then(divide);
    REQUIRE(failed.is_err());
    REQUIRE(failed.unwrap_err().message == "division by zero");
}

TEST_CASE("Result::and_then short-circuits on error", "[result]") {
    bool called = false;
    auto divide = [&](int x) -> Result<int> {
        called = true;
        return Result<int>::ok(100 / x);
    };

    auto result = Result<int>::err(Error{"initial error"}).and_then(divide);

    REQUIRE(result.is_err());
    REQUIRE(result.unwrap_err().message == "initial error");
    REQUIRE_FALSE(called);
}

TEST_CASE("Result::map_err attaches a domain code", "[result]") {
    auto result = Result<int>::err(Error{"disk full", codes::IO});
    auto mapped = std::move(result).map_err([](Error e) {
        return Error{"backup failed: " + e.message, codes::SYNC_BACKUP};
    });

    REQUIRE(mapped.is_err());
    REQUIRE(mapped.unwrap_err().message == "backup failed: disk full");
    REQUIRE(mapped.unwrap_err().code == codes::SYNC_BACKUP);
}

TEST_CASE("Result accepts a non-Error error type", "[result]") {
    auto result = Result<std::string, int>::err(404);

    REQUIRE(result.is_err());
    REQUIRE(result.unwrap_err() == 404);
    REQUIRE_THROWS_AS(result.unwrap(), std::runtime_error);
}

TEST_CASE("Result<void> works correctly", "[result]") {
    auto ok_result = Result<void>::ok();
    auto err_result = Result<void>::err(Error{"error"});

    REQUIRE(ok_result.is_ok());
    REQUIRE(err_result.is_err());

    REQUIRE_NOTHROW(ok_result.unwrap());
    REQUIRE_THROWS(err_result.unwrap());
}

TEST_CASE("TALLY_TRY returns the first failure", "[result]") {
    int steps = 0;
    auto step = [&](bool fail) -> Result<void> {
        ++steps;
        if (fail) return Result<void>::err(Error{"step failed", codes::IO});
        return Result<void>::ok();
    };
    auto run = [&]() -> Result<int> {
        TALLY_TRY(Result<int>, step(false));
        TALLY_TRY(Result<int>, step(true));
        TALLY_TRY(Result<int>, step(false));
        return Result<int>::ok(1);
    };

    auto result = run();
    REQUIRE(result.is_err());
    REQUIRE(result.unwrap_err().code == codes::IO);
    REQUIRE(steps == 2);
}

TEST_CASE("Error::to_string prefixes the code", "[result]") {
    REQUIRE(Error{"Access denied", codes::SYNC_AUTH}.to_string() == "SYNC_AUTH: Access denied");
    REQUIRE(Error{"plain"}.to_string() == "plain");
}

TEST_CASE("Result chaining works with different types", "[result]") {
    auto result = Result<int>::ok(5)
        .map([](int x) { return std::to_string(x); })
        .map([](const std::string& s) { return s + " items"; });

    REQUIRE(result.is_ok());
    REQUIRE(result.unwrap() == "5 items");
}
