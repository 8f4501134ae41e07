/*
 * Copyright (c) 2025 Alfie Ardinata
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
#include "include/latency_collector.hpp"

#include <algorithm>
#include <cmath>
#include <thread>

#include "include/config.hpp"
#include "include/interrupts.hpp"

using namespace std::chrono;

int CollectionProgress::percent() const noexcept {
    if (total.count() <= 0.0) return 100;
    double ratio = elapsed.count() / total.count();
    return static_cast<int>(std::clamp(ratio, 0.0, 1.0) * 100.0);
}

double CollectionProgress::remaining_seconds() const noexcept {
    return std::max(0.0, total.count() - elapsed.count());
}

CollectorHooks CollectorHooks::system() {
    CollectorHooks hooks;
    hooks.now = [] { return Clock::now(); };
    hooks.sleep = [](Clock::duration wait, std::stop_token stop) {
        const auto slice = milliseconds(Config::SLEEP_SLICE_MS);
        auto until = Clock::now() + wait;
        while (!stop_requested(stop)) {
            auto left = until - Clock::now();
            if (left <= Clock::duration::zero()) break;
            std::this_thread::sleep_for(std::min<Clock::duration>(left, slice));
        }
    };
    return hooks;
}

LatencyCollector::LatencyCollector(LatencySampler& sampler, CollectorHooks hooks)
    : sampler_(sampler), hooks_(std::move(hooks)) {
    if (!hooks_.now) hooks_.now = [] { return CollectorHooks::Clock::now(); };
    if (!hooks_.sleep) hooks_.sleep = CollectorHooks::system().sleep;
}

CollectionResult LatencyCollector::collect(const std::vector<Endpoint>& endpoints,
                                           const CollectionSettings& settings,
                                           const CollectionProgressCallback& progress_cb,
                                           std::stop_token stop) {
    using Clock = CollectorHooks::Clock;

    CollectionResult result;
    result.series.reserve(endpoints.size());
    for (const auto& endpoint : endpoints) {
        result.series.push_back(SampleSeries{endpoint, {}, 0});
    }

    // Warm-up rounds absorb connection setup; their samples are dropped.
    for (int round = 0; round < settings.warmup_rounds; ++round) {
        if (stop_requested(stop)) break;
        for (const auto& endpoint : endpoints) {
            if (stop_requested(stop)) break;
            (void)sampler_.sample(endpoint);
        }
        ++result.warmup_rounds;
    }

    // Keep start + total representable in the clock's integer ticks.
    const duration<double> longest = duration<double>(Clock::duration::max()) / 4;
    const auto total = duration_cast<Clock::duration>(
        std::clamp(settings.duration, duration<double>::zero(), longest));
    const auto interval = duration_cast<Clock::duration>(
        std::clamp(settings.interval, duration<double>::zero(), longest));

    const Clock::time_point start = hooks_.now();
    const Clock::time_point deadline = start + total;

    while (hooks_.now() < deadline) {
        if (stop_requested(stop)) {
            result.interrupted = true;
            break;
        }

        const Clock::time_point round_start = hooks_.now();

        for (auto& series : result.series) {
            if (stop_requested(stop)) {
                result.interrupted = true;
                break;
            }

            double latency = sampler_.sample(series.endpoint);
            if (latency >= 0.0 && std::isfinite(latency)) {
                series.latencies_ms.push_back(latency);
            } else if (stop_requested(stop)) {
                // The transfer was aborted by the stop, not by the endpoint.
                result.interrupted = true;
                break;
            } else {
                ++series.failures;
            }
        }
        if (result.interrupted) break;

        ++result.timed_rounds;

        const Clock::time_point round_end = hooks_.now();
        if (progress_cb) {
            CollectionProgress progress;
            progress.elapsed = std::min<Clock::duration>(round_end - start, total);
            progress.total = total;
            progress.rounds = result.timed_rounds;
            progress_cb(progress);
        }

        auto wait = std::min<Clock::duration>(interval - (round_end - round_start),
                                              deadline - round_end);
        if (wait > Clock::duration::zero()) {
            hooks_.sleep(wait, stop);
        }
    }

    if (!result.interrupted && stop_requested(stop)) {
        result.interrupted = true;
    }

    result.elapsed = hooks_.now() - start;
    return result;
}
