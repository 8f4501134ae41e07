#include "catch2/catch.hpp"

#include <string>
#include <vector>

#include "include/utils.hpp"

TEST_CASE("split_list") {

  SECTION("trims and drops empties") {
    auto items = split_list(" eastus, ,westeurope ,,japaneast ");
    REQUIRE(items == std::vector<std::string>{"eastus", "westeurope", "japaneast"});
  }

  SECTION("single item") { REQUIRE(split_list("uksouth") == std::vector<std::string>{"uksouth"}); }

  SECTION("empty") { REQUIRE(split_list("").empty()); }

  SECTION("other separator") {
    REQUIRE(split_list("a;b", ';') == std::vector<std::string>{"a", "b"});
  }
}

TEST_CASE("parse_number") {
  REQUIRE(parse_number<int>("42").value() == 42);
  REQUIRE(parse_number<double>(" 2.5 ").value() == 2.5);
  REQUIRE_FALSE(parse_number<int>("4x"));
  REQUIRE_FALSE(parse_number<double>(""));
  REQUIRE_FALSE(parse_number<double>("nan"));
}

TEST_CASE("format_elapsed") {
  REQUIRE(format_elapsed(12.4) == "12 sec");
  REQUIRE(format_elapsed(125.0) == "2 min 5 sec");
  REQUIRE(format_elapsed(-1.0) == "0 sec");
}
