#include <catch2/catch_test_macros.hpp>

#include <stdexcept>

#include "tgwire/core/error.hpp"

TEST_CASE("Error creation and accessors", "[error]") {
    SECTION("basic error") {
        tgwire::Error err(tgwire::ErrorCode::InvalidEndpoint, "bad address");
        CHECK(err.code() == tgwire::ErrorCode::InvalidEndpoint);
        CHECK(err.message() == "bad address");
        CHECK(err.detail() == "");
        CHECK(err.subject() == "");
        CHECK(err.what() == "bad address");
    }

    SECTION("error with detail") {
        tgwire::Error err(tgwire::ErrorCode::SerializationError,
                          "decode failed", "missing key");
        CHECK(err.detail() == "missing key");
        CHECK(err.what() == "decode failed: missing key");
    }

    SECTION("error with subject") {
        tgwire::Error err(tgwire::ErrorCode::KindNotRecognized,
                          "Unrecognized ChatId value", "true", "ChatId");
        CHECK(err.subject() == "ChatId");
        CHECK(err.what() == "Unrecognized ChatId value: true");
    }
}

TEST_CASE("make_error helpers", "[error]") {
    SECTION("two-argument form") {
        auto err = tgwire::make_error(tgwire::ErrorCode::InvalidConfig, "no host");
        CHECK(err.code() == tgwire::ErrorCode::InvalidConfig);
        CHECK(err.message() == "no host");
        CHECK(err.detail() == "");
    }

    SECTION("three-argument form") {
        auto err = tgwire::make_error(tgwire::ErrorCode::InvalidArgument,
                                      "bad value", "not an object");
        CHECK(err.what() == "bad value: not an object");
    }
}

TEST_CASE("Result type success and error", "[error]") {
    SECTION("success") {
        tgwire::Result<int> result = 42;
        REQUIRE(result.has_value());
        CHECK(*result == 42);
    }

    SECTION("error") {
        tgwire::Result<int> result = std::unexpected(
            tgwire::make_error(tgwire::ErrorCode::InvalidArgument, "bad value"));
        REQUIRE_FALSE(result.has_value());
        CHECK(result.error().code() == tgwire::ErrorCode::InvalidArgument);
    }
}

TEST_CASE("error_code_to_string is stable", "[error]") {
    CHECK(tgwire::error_code_to_string(tgwire::ErrorCode::KindNotRecognized) == "KIND_NOT_RECOGNIZED");
    CHECK(tgwire::error_code_to_string(tgwire::ErrorCode::InvalidEndpoint) == "INVALID_ENDPOINT");
    CHECK(tgwire::error_code_to_string(tgwire::ErrorCode::SerializationError) == "SERIALIZATION_ERROR");
}

TEST_CASE("DecodeError wraps an Error", "[error]") {
    tgwire::DecodeError ex(tgwire::make_error(tgwire::ErrorCode::SerializationError,
                                              "Expected string", "got number"));
    CHECK(ex.error().code() == tgwire::ErrorCode::SerializationError);
    CHECK(std::string(ex.what()) == "Expected string: got number");

    const std::runtime_error& base = ex;
    CHECK(std::string(base.what()) == ex.error().what());
}
