#include "catch2/catch.hpp"

#include <chrono>
#include <expected>
#include <string>
#include <vector>

#include "include/retry.hpp"

using namespace std::chrono;

TEST_CASE("exponential_backoff") {
  auto backoff = exponential_backoff(milliseconds(100), milliseconds(1000));
  REQUIRE(backoff(1) == milliseconds(100));
  REQUIRE(backoff(2) == milliseconds(200));
  REQUIRE(backoff(3) == milliseconds(400));
  REQUIRE(backoff(4) == milliseconds(800));
  REQUIRE(backoff(5) == milliseconds(1000));
  REQUIRE(backoff(30) == milliseconds(1000));
}

TEST_CASE("retry") {

  std::vector<milliseconds> slept;
  SleepFn sleep = [&](milliseconds d) { slept.push_back(d); };
  RetryPolicy policy{4, exponential_backoff(milliseconds(10), milliseconds(1000))};

  SECTION("first attempt succeeds") {
    int calls = 0;
    auto r = retry([&]() -> std::expected<int, std::string> { ++calls; return 7; }, policy,
                   sleep);
    REQUIRE(r);
    REQUIRE(*r == 7);
    REQUIRE(calls == 1);
    REQUIRE(slept.empty());
  }

  SECTION("succeeds after failures") {
    int calls = 0;
    auto r = retry(
        [&]() -> std::expected<int, std::string> {
          if (++calls < 3) return std::unexpected("boom");
          return calls;
        },
        policy, sleep);
    REQUIRE(r);
    REQUIRE(*r == 3);
    REQUIRE(slept == std::vector<milliseconds>{milliseconds(10), milliseconds(20)});
  }

  SECTION("exhausted") {
    int calls = 0;
    auto r = retry(
        [&]() -> std::expected<int, std::string> {
          ++calls;
          return std::unexpected("attempt " + std::to_string(calls));
        },
        policy, sleep);
    REQUIRE_FALSE(r);
    REQUIRE(r.error().attempts == 4);
    REQUIRE(r.error().last_error == "attempt 4");
    REQUIRE(calls == 4);
    REQUIRE(slept.size() == 3);
  }

  SECTION("zero attempts still runs once") {
    int calls = 0;
    RetryPolicy none{0, {}};
    auto r = retry([&]() -> std::expected<int, std::string> { ++calls; return std::unexpected("x"); },
                   none, sleep);
    REQUIRE_FALSE(r);
    REQUIRE(calls == 1);
    REQUIRE(r.error().attempts == 1);
  }
}
