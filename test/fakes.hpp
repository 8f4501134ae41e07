#pragma once

#include <chrono>
#include <expected>
#include <functional>
#include <stop_token>
#include <string>
#include <vector>

#include "include/http_client.hpp"
#include "include/latency_collector.hpp"
#include "include/latency_sampler.hpp"

// Manual clock: time only moves when a sample or a sleep advances it.
struct FakeClock {
  using Clock = std::chrono::steady_clock;

  Clock::time_point t{};
  std::vector<Clock::duration> sleeps;

  void advance(std::chrono::duration<double, std::milli> d) {
    t += std::chrono::duration_cast<Clock::duration>(d);
  }

  CollectorHooks hooks() {
    CollectorHooks h;
    h.now = [this] { return t; };
    h.sleep = [this](Clock::duration d, std::stop_token) {
      sleeps.push_back(d);
      t += d;
    };
    return h;
  }
};

// Returns whatever the callback says and advances the clock by `cost_ms` per call.
class FakeSampler : public LatencySampler {
public:
  using Fn = std::function<double(const Endpoint &, int call)>;

  FakeSampler(FakeClock &clock, double cost_ms, Fn fn)
      : clock_(clock), cost_ms_(cost_ms), fn_(std::move(fn)) {}

  double sample(const Endpoint &endpoint) override {
    int call = calls++;
    clock_.advance(std::chrono::duration<double, std::milli>(cost_ms_));
    return fn_(endpoint, call);
  }

  int calls = 0;

private:
  FakeClock &clock_;
  double cost_ms_;
  Fn fn_;
};

class FakeTransport : public HttpTransport {
public:
  using Fn = std::function<std::expected<ProbeTiming, ProbeError>(const std::string &url,
                                                                  TlsVersion version)>;

  explicit FakeTransport(Fn fn) : fn_(std::move(fn)) {}

  std::expected<ProbeTiming, ProbeError> probe(const std::string &url) override {
    urls.push_back(url);
    return fn_(url, version_);
  }
  void set_tls_version(TlsVersion version) override { version_ = version; }
  TlsVersion tls_version() const override { return version_; }

  std::vector<std::string> urls;

private:
  Fn fn_;
  TlsVersion version_ = TlsVersion::Default;
};

inline Endpoint make_endpoint(const std::string &name, const std::string &group = "Europe",
                              bool enabled = true) {
  return Endpoint{name, group, "https://" + name + ".example.test/blob", enabled};
}
