/*
 * Copyright (c) 2025 Alfie Ardinata
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
#include "include/latency_stats.hpp"

#include <algorithm>
#include <cmath>

double jitter(std::span<const double> series) noexcept {
    if (series.size() < 2) {
        return 0.0;
    }

    double total = 0.0;
    for (std::size_t i = 1; i < series.size(); ++i) {
        total += std::abs(series[i] - series[i - 1]);
    }
    return total / static_cast<double>(series.size() - 1);
}

std::optional<LatencyStatistics> summarize(std::span<const double> series) noexcept {
    if (series.empty()) {
        return std::nullopt;
    }

    auto [min_it, max_it] = std::ranges::minmax_element(series);

    double sum = 0.0;
    for (double v : series) sum += v;

    LatencyStatistics stats;
    stats.samples = series.size();
    stats.minimum = *min_it;
    stats.maximum = *max_it;
    // Clamp against rounding so min <= avg <= max always holds.
    stats.average = std::clamp(sum / static_cast<double>(series.size()), stats.minimum, stats.maximum);
    stats.jitter = jitter(series);
    return stats;
}
