#include "catch2/catch.hpp"

#include <algorithm>
#include <cmath>
#include <chrono>
#include <stop_token>
#include <vector>

#include "include/latency_collector.hpp"
#include "include/results.hpp"
#include "test/fakes.hpp"

using namespace std::chrono;

namespace {

CollectionSettings settings_for(double interval_s, double duration_s) {
  CollectionSettings s;
  s.interval = duration<double>(interval_s);
  s.duration = duration<double>(duration_s);
  s.warmup_rounds = 2;
  return s;
}

} // namespace

TEST_CASE("collector warm-up") {

  FakeClock clock;
  std::vector<Endpoint> endpoints{make_endpoint("a"), make_endpoint("b")};

  // The first four calls are the two warm-up rounds over two endpoints.
  FakeSampler sampler(clock, 50.0, [](const Endpoint &, int call) {
    return call < 4 ? 999.0 : 50.0;
  });

  LatencyCollector collector(sampler, clock.hooks());
  auto result = collector.collect(endpoints, settings_for(5.0, 60.0));

  REQUIRE(result.warmup_rounds == 2);
  REQUIRE(result.timed_rounds > 0);
  REQUIRE(sampler.calls == static_cast<int>(4 + 2 * result.timed_rounds));

  for (const auto &series : result.series) {
    REQUIRE(series.latencies_ms.size() == result.timed_rounds);
    REQUIRE(std::ranges::count(series.latencies_ms, 999.0) == 0);
  }
}

TEST_CASE("collector timing") {

  FakeClock clock;
  std::vector<Endpoint> endpoints{make_endpoint("a"), make_endpoint("b")};
  FakeSampler sampler(clock, 50.0, [](const Endpoint &, int) { return 50.0; });
  LatencyCollector collector(sampler, clock.hooks());

  SECTION("run length within one round of the duration") {
    auto result = collector.collect(endpoints, settings_for(5.0, 60.0));
    const double round_seconds = 0.1; // two samples at 50 ms
    REQUIRE(result.timed_rounds == 12);
    REQUIRE(std::abs(result.elapsed.count() - 60.0) <= round_seconds);
  }

  SECTION("sleeps the remainder of the interval") {
    auto result = collector.collect(endpoints, settings_for(5.0, 12.0));
    REQUIRE(result.timed_rounds == 3);
    REQUIRE_FALSE(clock.sleeps.empty());
    REQUIRE(clock.sleeps.front() == duration_cast<FakeClock::Clock::duration>(milliseconds(4900)));
  }

  SECTION("no sleep when a round overruns the interval") {
    auto result = collector.collect(endpoints, settings_for(0.05, 1.0));
    REQUIRE(result.timed_rounds == 10);
    REQUIRE(clock.sleeps.empty());
  }

  SECTION("zero duration runs no timed rounds") {
    auto result = collector.collect(endpoints, settings_for(5.0, 0.0));
    REQUIRE(result.warmup_rounds == 2);
    REQUIRE(result.timed_rounds == 0);
    REQUIRE(sampler.calls == 4);

    auto report = build_report(result);
    REQUIRE(report.rows.size() == 2);
    for (const auto &row : report.rows) {
      REQUIRE_FALSE(row.stats.has_value());
    }
  }
}

TEST_CASE("collector failures") {

  FakeClock clock;
  std::vector<Endpoint> endpoints{make_endpoint("good"), make_endpoint("bad")};
  FakeSampler sampler(clock, 50.0, [](const Endpoint &ep, int) {
    return ep.name == "good" ? 50.0 : LatencySampler::kFailed;
  });
  LatencyCollector collector(sampler, clock.hooks());

  auto result = collector.collect(endpoints, settings_for(1.0, 10.0));

  const auto &good = result.series[0];
  const auto &bad = result.series[1];
  REQUIRE(good.latencies_ms.size() == result.timed_rounds);
  REQUIRE(good.failures == 0);
  REQUIRE(bad.latencies_ms.empty());
  REQUIRE(bad.failures == result.timed_rounds);

  SECTION("sentinel never stored") {
    for (const auto &series : result.series) {
      REQUIRE(std::ranges::count(series.latencies_ms, LatencySampler::kFailed) == 0);
    }
  }

  SECTION("end to end report") {
    auto report = build_report(result);
    REQUIRE(report.rows.size() == 2);

    // sorted by name within the group: "bad" before "good"
    REQUIRE(report.rows[0].region == "bad");
    REQUIRE_FALSE(report.rows[0].stats.has_value());

    REQUIRE(report.rows[1].region == "good");
    REQUIRE(report.rows[1].stats.has_value());
    REQUIRE(report.rows[1].stats->minimum == 50.0);
    REQUIRE(report.rows[1].stats->maximum == 50.0);
    REQUIRE(report.rows[1].stats->average == 50.0);
    REQUIRE(report.rows[1].stats->jitter == 0.0);
  }
}

TEST_CASE("collector cancellation") {

  FakeClock clock;
  std::vector<Endpoint> endpoints{make_endpoint("a"), make_endpoint("b")};
  std::stop_source source;

  // Stop once the third timed round has started.
  FakeSampler sampler(clock, 10.0, [&](const Endpoint &, int call) {
    if (call == 4 + 2 * 2) source.request_stop();
    return 20.0;
  });
  LatencyCollector collector(sampler, clock.hooks());

  auto result = collector.collect(endpoints, settings_for(1.0, 60.0), {}, source.get_token());

  REQUIRE(result.interrupted);
  REQUIRE(result.timed_rounds == 2);
  REQUIRE(result.series[0].latencies_ms.size() == 3);
  REQUIRE(result.series[1].latencies_ms.size() == 2);

  auto report = build_report(result);
  REQUIRE(report.interrupted);
  REQUIRE(report.rows[0].stats.has_value());
}

TEST_CASE("collector aborted sample is not a failure") {

  FakeClock clock;
  std::vector<Endpoint> endpoints{make_endpoint("a"), make_endpoint("b")};
  std::stop_source source;

  // The stop lands while "b" is in flight in the second timed round.
  FakeSampler sampler(clock, 10.0, [&](const Endpoint &, int call) {
    if (call == 4 + 3) {
      source.request_stop();
      return LatencySampler::kFailed;
    }
    return 20.0;
  });
  LatencyCollector collector(sampler, clock.hooks());

  auto result = collector.collect(endpoints, settings_for(1.0, 60.0), {}, source.get_token());

  REQUIRE(result.interrupted);
  REQUIRE(result.timed_rounds == 1);
  REQUIRE(result.series[0].latencies_ms.size() == 2);
  REQUIRE(result.series[1].latencies_ms.size() == 1);
  REQUIRE(result.series[0].failures == 0);
  REQUIRE(result.series[1].failures == 0);
}

TEST_CASE("collector huge settings") {

  FakeClock clock;
  std::vector<Endpoint> endpoints{make_endpoint("a")};

  SECTION("huge interval waits out the window instead of spinning") {
    FakeSampler sampler(clock, 100.0, [](const Endpoint &, int) { return 100.0; });
    LatencyCollector collector(sampler, clock.hooks());

    auto result = collector.collect(endpoints, settings_for(1e12, 10.0));

    REQUIRE(result.timed_rounds == 1);
    REQUIRE(clock.sleeps.size() == 1);
    REQUIRE(clock.sleeps.front() == milliseconds(9900));
  }

  SECTION("huge duration still runs timed rounds") {
    std::stop_source source;
    FakeSampler sampler(clock, 100.0, [&](const Endpoint &, int call) {
      if (call == 2 + 3) source.request_stop();
      return 100.0;
    });
    LatencyCollector collector(sampler, clock.hooks());

    auto result = collector.collect(endpoints, settings_for(1.0, 1e15), {}, source.get_token());

    REQUIRE(result.interrupted);
    REQUIRE(result.timed_rounds == 4);
    REQUIRE(result.series[0].latencies_ms.size() == 4);
  }
}

TEST_CASE("collector progress") {

  FakeClock clock;
  std::vector<Endpoint> endpoints{make_endpoint("a")};
  FakeSampler sampler(clock, 100.0, [](const Endpoint &, int) { return 100.0; });
  LatencyCollector collector(sampler, clock.hooks());

  std::vector<CollectionProgress> seen;
  auto result = collector.collect(endpoints, settings_for(2.0, 10.0),
                                  [&](const CollectionProgress &p) { seen.push_back(p); });

  REQUIRE(seen.size() == result.timed_rounds);
  REQUIRE(seen.front().rounds == 1);
  REQUIRE(seen.front().percent() == 1);
  REQUIRE(seen.back().percent() <= 100);
  REQUIRE(seen.back().remaining_seconds() < seen.front().remaining_seconds());
}
