/*
 * Copyright (c) 2025 Alfie Ardinata
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
#pragma once

#include <chrono>
#include <functional>
#include <stop_token>
#include <vector>

#include "endpoint_registry.hpp"
#include "latency_sampler.hpp"
#include "results.hpp"

struct CollectionSettings {
    std::chrono::duration<double> interval{5.0};
    std::chrono::duration<double> duration{300.0};
    int warmup_rounds = 2;
};

struct CollectionProgress {
    std::chrono::duration<double> elapsed{0.0};
    std::chrono::duration<double> total{0.0};
    std::size_t rounds = 0;

    int percent() const noexcept;
    double remaining_seconds() const noexcept;
};

using CollectionProgressCallback = std::function<void(const CollectionProgress&)>;

struct CollectorHooks {
    using Clock = std::chrono::steady_clock;

    std::function<Clock::time_point()> now;
    std::function<void(Clock::duration, std::stop_token)> sleep;

    // steady_clock plus a sleep that wakes early on stop or signal.
    static CollectorHooks system();
};

class LatencyCollector {
    LatencySampler& sampler_;
    CollectorHooks hooks_;

   public:
    explicit LatencyCollector(LatencySampler& sampler, CollectorHooks hooks = CollectorHooks::system());

    // Samples every endpoint once per round for settings.duration after the
    // warm-up rounds. Stopping returns whatever was collected so far.
    CollectionResult collect(const std::vector<Endpoint>& endpoints,
                             const CollectionSettings& settings,
                             const CollectionProgressCallback& progress_cb = {},
                             std::stop_token stop = {});
};
