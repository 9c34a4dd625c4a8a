#include <catch2/catch.hpp>
#include "status.hpp"

#include <stdexcept>

using namespace stderrx;

TEST_CASE("Default status is ok", "[status]") {
    Status status;
    CHECK(status.is_ok());
    CHECK(static_cast<bool>(status));
    CHECK(status.to_string() == "ok");
    CHECK_THROWS_AS(status.error(), std::logic_error);
}

TEST_CASE("Failure carries kind and message", "[status]") {
    Status status = Status::failure(ErrorKind::Layout, "no room");
    CHECK_FALSE(status.is_ok());
    CHECK(status.kind() == ErrorKind::Layout);
    CHECK(status.message() == "no room");
    CHECK(status.to_string() == "layout: no room");
}

TEST_CASE("Result holds a value or an error", "[status]") {
    Result<int> good = 7;
    REQUIRE(good.is_ok());
    CHECK(good.value() == 7);
    CHECK(good.status().is_ok());

    auto bad = Result<int>::failure(ErrorKind::Input, "eof");
    REQUIRE_FALSE(bad.is_ok());
    CHECK(bad.error().kind == ErrorKind::Input);
    CHECK(bad.status().to_string() == "input: eof");
    CHECK_THROWS_AS(bad.value(), std::logic_error);
}

TEST_CASE("Error kinds have readable names", "[status]") {
    CHECK(std::string(to_string(ErrorKind::Io)) == "io");
    CHECK(std::string(to_string(ErrorKind::HandleMisuse)) == "handle misuse");
}
