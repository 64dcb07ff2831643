#include <string>
#include <system_error>

#include <catch2/catch.hpp>

#include "../src/esq/ErrorCategory.hpp"

using esq::ErrorCodeEnum;

TEST_CASE("Error codes", "[ErrorCategory]") {
    std::error_code const error = ErrorCodeEnum::ServerFailure;
    REQUIRE(std::string{error.category().name()} == "esq");
    REQUIRE(error.message() == "Elasticsearch error");
    REQUIRE(ErrorCodeEnum::ServerFailure == error);
    REQUIRE(make_error_code(ErrorCodeEnum::ConfigFailure).message() == "Configuration error");
}

TEST_CASE("Transient errors", "[ErrorCategory]") {
    REQUIRE(esq::is_transient_error(ErrorCodeEnum::NetworkFailure));
    REQUIRE(esq::is_transient_error(ErrorCodeEnum::ServiceUnavailable));
    REQUIRE_FALSE(esq::is_transient_error(ErrorCodeEnum::ServerFailure));
    REQUIRE_FALSE(esq::is_transient_error(ErrorCodeEnum::Interrupted));
    REQUIRE_FALSE(esq::is_transient_error(std::make_error_code(std::errc::timed_out)));
}
