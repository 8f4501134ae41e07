/*
 * Copyright (c) 2025 Alfie Ardinata
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
#pragma once

#include <expected>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

struct Endpoint {
    std::string name;
    std::string global_region;
    std::string url;
    bool enabled = true;
};

namespace EndpointRegistry {

// Azure regions, each pointing at a small static blob in that region.
const std::vector<Endpoint>& builtin_endpoints();

// nullptr when no endpoint has that name.
const Endpoint* find_endpoint(const std::vector<Endpoint>& endpoints, std::string_view name);
Endpoint* find_endpoint(std::vector<Endpoint>& endpoints, std::string_view name);

std::vector<Endpoint> enabled_only(const std::vector<Endpoint>& endpoints);

std::expected<std::vector<Endpoint>, std::string> parse_endpoints_json(std::string_view text);
std::expected<std::vector<Endpoint>, std::string> load_endpoints_file(
    const std::filesystem::path& path);

}  // namespace EndpointRegistry
