/*
 * Copyright (c) 2025 Alfie Ardinata
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
#pragma once

#include <cstddef>
#include <optional>
#include <span>

struct LatencyStatistics {
    std::size_t samples = 0;
    double minimum = 0.0;
    double maximum = 0.0;
    double average = 0.0;
    double jitter = 0.0;
};

// Mean absolute difference between consecutive samples; 0 below two samples.
[[nodiscard]] double jitter(std::span<const double> series) noexcept;

// std::nullopt means the series had no successful samples.
[[nodiscard]] std::optional<LatencyStatistics> summarize(std::span<const double> series) noexcept;
