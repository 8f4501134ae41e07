// This Source Code Form is subject to the terms of the Mozilla Public License, v. 2.0.
// If a copy of the MPL was not distributed with this file, You can obtain one at https://mozilla.org/MPL/2.0/.
// Copyright (c) 2025 Alfie Ardinata.

#include "include/results.hpp"

#include <algorithm>
#include <tuple>

LatencyReport build_report(const CollectionResult& collection) {
    LatencyReport report;
    report.timed_rounds = collection.timed_rounds;
    report.interrupted = collection.interrupted;
    report.rows.reserve(collection.series.size());

    for (const auto& series : collection.series) {
        ReportRow row;
        row.region = series.endpoint.name;
        row.global_region = series.endpoint.global_region;
        row.samples = series.latencies_ms.size();
        row.failures = series.failures;
        row.stats = summarize(series.latencies_ms);
        report.rows.push_back(std::move(row));
    }

    std::ranges::sort(report.rows, [](const ReportRow& a, const ReportRow& b) {
        return std::tie(a.global_region, a.region) < std::tie(b.global_region, b.region);
    });

    return report;
}
