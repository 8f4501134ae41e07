/*
 * Copyright (c) 2025 Alfie Ardinata
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
#pragma once

#include "endpoint_registry.hpp"
#include "latency_collector.hpp"
#include "results.hpp"
#include <cstdio>
#include <string>
#include <vector>

namespace CliRenderer {
std::string format_latency_table(const LatencyReport& report, bool color = true);
std::string format_latency_json(const LatencyReport& report);
void render_latency_report(const LatencyReport& report);

void render_region_list(const std::vector<Endpoint>& endpoints);

std::string create_progress_bar(int percent);
std::string format_progress_line(const CollectionProgress& progress);
CollectionProgressCallback make_progress_callback(std::FILE* out);
}  // namespace CliRenderer
