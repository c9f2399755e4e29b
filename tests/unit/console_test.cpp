#include <catch2/catch_test_macros.hpp>
#include <exprune/core/console.hpp>

#include <sstream>

using exprune::core::Console;
using exprune::core::normalize_answer;

TEST_CASE("normalize_answer trims and lowercases", "[core][console]") {
  REQUIRE(normalize_answer("yes") == "yes");
  REQUIRE(normalize_answer("  YES\r") == "yes");
  REQUIRE(normalize_answer("\tYeS \n") == "yes");
  REQUIRE(normalize_answer("   ").empty());
  REQUIRE(normalize_answer("y es") == "y es");
}

TEST_CASE("report stream is silenced in quiet mode, error stream is not", "[core][console]") {
  std::ostringstream out, err; std::istringstream in;
  Console console(out, err, in, /*quiet=*/true);
  console.report() << "progress";
  console.error() << "boom";
  REQUIRE(out.str().empty());
  REQUIRE(err.str() == "boom");

  console.set_quiet(false);
  console.report() << "visible";
  REQUIRE(out.str() == "visible");
}

TEST_CASE("confirm accepts only yes and blocks on one line", "[core][console]") {
  std::ostringstream out, err;
  std::istringstream in("yes\nno\nYES\n");
  Console console(out, err, in);
  REQUIRE(console.confirm("proceed?"));
  REQUIRE_FALSE(console.confirm("proceed?"));
  REQUIRE(console.confirm("proceed?"));
  REQUIRE_FALSE(console.confirm("proceed?"));  // end of input
  REQUIRE(out.str().find("proceed?") != std::string::npos);
}

TEST_CASE("confirm shows the question even when quiet", "[core][console]") {
  std::ostringstream out, err;
  std::istringstream in("no\n");
  Console console(out, err, in, /*quiet=*/true);
  REQUIRE_FALSE(console.confirm("really?"));
  REQUIRE(out.str() == "really?\n");
}

TEST_CASE("debug lines are tagged and off unless enabled", "[core][console]") {
  std::ostringstream out, err; std::istringstream in;
  Console console(out, err, in);
  console.set_debug(false);
  console.debug("group", "hidden");
  REQUIRE(err.str().empty());
  console.set_debug(true);
  console.debug("group", "shown");
  REQUIRE(err.str() == "[exprune][group] shown\n");
}
