/*
 * Copyright (c) 2025 Alfie Ardinata
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
#include "include/endpoint_registry.hpp"

#include <algorithm>
#include <format>
#include <fstream>
#include <iterator>
#include <sstream>
#include <unordered_set>

#include <nlohmann/json.hpp>

#include "include/utils.hpp"

using json = nlohmann::json;

namespace EndpointRegistry {

namespace {

std::string blob_url(std::string_view account) {
    return std::format("https://{}.blob.core.windows.net/public/latency-test.json", account);
}

Endpoint make(std::string_view name, std::string_view group, std::string_view account,
              bool enabled) {
    return Endpoint{std::string(name), std::string(group), blob_url(account), enabled};
}

bool is_http_url(std::string_view url) {
    return url.starts_with("https://") || url.starts_with("http://");
}

}

const std::vector<Endpoint>& builtin_endpoints() {
    // Only the European group is probed unless other regions are selected.
    static const std::vector<Endpoint> endpoints = {
        make("eastus", "Americas", "azspeedeastus", false),
        make("eastus2", "Americas", "azspeedeastus2", false),
        make("centralus", "Americas", "azspeedcentralus", false),
        make("westus2", "Americas", "azspeedwestus2", false),
        make("canadacentral", "Americas", "azspeedcanadacentral", false),
        make("brazilsouth", "Americas", "azspeedbrazilsouth", false),

        make("westeurope", "Europe", "azspeedwesteurope", true),
        make("northeurope", "Europe", "azspeednortheurope", true),
        make("uksouth", "Europe", "azspeeduksouth", true),
        make("francecentral", "Europe", "azspeedfrancecentral", true),
        make("germanywestcentral", "Europe", "azspeedgermanywc", true),
        make("switzerlandnorth", "Europe", "azspeedswitzerlandn", true),
        make("swedencentral", "Europe", "azspeedswedencentral", true),
        make("norwayeast", "Europe", "azspeednorwayeast", true),

        make("eastasia", "Asia Pacific", "azspeedeastasia", false),
        make("southeastasia", "Asia Pacific", "azspeedsoutheastasia", false),
        make("japaneast", "Asia Pacific", "azspeedjapaneast", false),
        make("australiaeast", "Asia Pacific", "azspeedaustraliaeast", false),
        make("centralindia", "Asia Pacific", "azspeedcentralindia", false),

        make("uaenorth", "Middle East & Africa", "azspeeduaenorth", false),
        make("southafricanorth", "Middle East & Africa", "azspeedsouthafrican", false),
    };
    return endpoints;
}

const Endpoint* find_endpoint(const std::vector<Endpoint>& endpoints, std::string_view name) {
    auto it = std::ranges::find(endpoints, name, &Endpoint::name);
    return it == endpoints.end() ? nullptr : &*it;
}

Endpoint* find_endpoint(std::vector<Endpoint>& endpoints, std::string_view name) {
    auto it = std::ranges::find(endpoints, name, &Endpoint::name);
    return it == endpoints.end() ? nullptr : &*it;
}

std::vector<Endpoint> enabled_only(const std::vector<Endpoint>& endpoints) {
    std::vector<Endpoint> out;
    std::ranges::copy_if(endpoints, std::back_inserter(out), &Endpoint::enabled);
    return out;
}

std::expected<std::vector<Endpoint>, std::string> parse_endpoints_json(std::string_view text) {
    json doc;
    try {
        doc = json::parse(text);
    } catch (const json::parse_error& e) {
        return std::unexpected(std::format("Invalid endpoints JSON: {}", e.what()));
    }

    if (!doc.is_array()) {
        return std::unexpected("Endpoints JSON must be an array of objects");
    }

    std::vector<Endpoint> endpoints;
    std::unordered_set<std::string> seen;
    std::size_t index = 0;

    for (const auto& item : doc) {
        if (!item.is_object()) {
            return std::unexpected(std::format("Endpoint #{} is not an object", index));
        }
        if (!item.contains("name") || !item["name"].is_string() || !item.contains("url") ||
            !item["url"].is_string()) {
            return std::unexpected(
                std::format("Endpoint #{} needs string fields 'name' and 'url'", index));
        }

        Endpoint ep;
        ep.name = trim(item["name"].get<std::string>());
        ep.url = trim(item["url"].get<std::string>());
        try {
            ep.global_region = item.value("global_region", std::string("Custom"));
            ep.enabled = item.value("enabled", true);
        } catch (const json::type_error&) {
            return std::unexpected(std::format(
                "Endpoint '{}' has a mistyped 'global_region' or 'enabled' field", ep.name));
        }

        if (ep.name.empty()) {
            return std::unexpected(std::format("Endpoint #{} has an empty name", index));
        }
        if (!is_http_url(ep.url)) {
            return std::unexpected(
                std::format("Endpoint '{}' has unsupported URL '{}'", ep.name, ep.url));
        }
        if (!seen.insert(ep.name).second) {
            return std::unexpected(std::format("Duplicate endpoint name '{}'", ep.name));
        }

        endpoints.push_back(std::move(ep));
        ++index;
    }

    if (endpoints.empty()) {
        return std::unexpected("Endpoints JSON contains no endpoints");
    }
    return endpoints;
}

std::expected<std::vector<Endpoint>, std::string> load_endpoints_file(
    const std::filesystem::path& path) {
    std::ifstream in(path);
    if (!in) {
        return std::unexpected(std::format("Cannot open endpoints file '{}'", path.string()));
    }

    std::stringstream buffer;
    buffer << in.rdbuf();
    if (in.bad()) {
        return std::unexpected(std::format("Failed to read endpoints file '{}'", path.string()));
    }

    return parse_endpoints_json(buffer.str());
}

}  // namespace EndpointRegistry
