#include <exprune/error.hpp>
#include <catch2/catch_test_macros.hpp>

TEST_CASE("error codes stable subset", "[errors]") {
  using exprune::core::error_code;
  REQUIRE(static_cast<unsigned>(error_code::ok) == 0u);
  REQUIRE(static_cast<unsigned>(error_code::io_failed) == 1001u);
  REQUIRE(static_cast<unsigned>(error_code::config_invalid) == 2001u);
  REQUIRE(static_cast<unsigned>(error_code::not_found) == 6001u);
  REQUIRE(static_cast<unsigned>(error_code::not_a_directory) == 6002u);
  REQUIRE(static_cast<unsigned>(error_code::empty_result) == 6003u);
  REQUIRE(static_cast<unsigned>(error_code::internal) == 9001u);
}

TEST_CASE("not-found kind groups missing paths and empty scopes", "[errors]") {
  using exprune::core::error_code;
  using exprune::core::is_not_found_kind;
  REQUIRE(is_not_found_kind(error_code::not_found));
  REQUIRE(is_not_found_kind(error_code::empty_result));
  REQUIRE_FALSE(is_not_found_kind(error_code::not_a_directory));
  REQUIRE_FALSE(is_not_found_kind(error_code::io_failed));
}
