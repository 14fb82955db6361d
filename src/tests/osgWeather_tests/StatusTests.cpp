/* osgWeather
 * Copyright 2025 Pelican Mapping
 * MIT License
 */
#include <catch2/catch.hpp>
#include <osgWeather/Status>

using namespace osgWeather;

TEST_CASE("Status") {

    SECTION("OK") {
        REQUIRE(STATUS_OK.isOK());
        REQUIRE(Status().isOK());
        REQUIRE(Status::OK() == STATUS_OK);
        REQUIRE(STATUS_OK.toString() == "No error");
    }

    SECTION("Errors") {
        Status s(Status::ConfigurationError, "end before start");
        REQUIRE(s.isError());
        REQUIRE(s.code() == Status::ConfigurationError);
        REQUIRE(s.message() == "end before start");
        REQUIRE(s.toString() == "Configuration error: end before start");
        REQUIRE(s != Status(Status::ConfigurationError));

        REQUIRE(Status::Error("oops").code() == Status::GeneralError);
        REQUIRE(Status(Status::ServiceUnavailable).codeText() == "Service unavailable");
    }

    SECTION("Result") {
        Result<int> good(42);
        REQUIRE(good.ok());
        REQUIRE(*good == 42);

        Result<int> bad(Status(Status::AssertionFailure, "empty"));
        REQUIRE_FALSE(bad.ok());
        REQUIRE(bad.status().code() == Status::AssertionFailure);
    }
}
