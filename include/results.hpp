// This Source Code Form is subject to the terms of the Mozilla Public License, v. 2.0.
// If a copy of the MPL was not distributed with this file, You can obtain one at https://mozilla.org/MPL/2.0/.
// Copyright (c) 2025 Alfie Ardinata.

#pragma once

#include <chrono>
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include "endpoint_registry.hpp"
#include "latency_stats.hpp"

struct SampleSeries {
    Endpoint endpoint;
    std::vector<double> latencies_ms;  // append-only, successful samples only
    std::size_t failures = 0;
};

struct CollectionResult {
    std::vector<SampleSeries> series;
    std::size_t warmup_rounds = 0;
    std::size_t timed_rounds = 0;
    std::chrono::duration<double> elapsed{0.0};
    bool interrupted = false;
};

struct ReportRow {
    std::string region;
    std::string global_region;
    std::size_t samples = 0;
    std::size_t failures = 0;
    std::optional<LatencyStatistics> stats;  // nullopt: no data
};

struct LatencyReport {
    std::vector<ReportRow> rows;
    std::size_t timed_rounds = 0;
    bool interrupted = false;
};

// Reduces every series and orders rows by global region, then region name.
LatencyReport build_report(const CollectionResult& collection);
