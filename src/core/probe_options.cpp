/*
 * Copyright (c) 2025 Alfie Ardinata
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
#include "include/probe_options.hpp"

#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <format>

#include "include/utils.hpp"

namespace {

std::expected<double, std::string> parse_seconds_like(std::string_view text,
                                                      std::string_view source) {
    auto value = parse_number<double>(text);
    if (!value) {
        return std::unexpected(std::format("Invalid number '{}' for {}", text, source));
    }
    return *value;
}

template <typename T>
std::expected<T, std::string> parse_positive(std::string_view text, std::string_view source) {
    auto value = parse_number<T>(text);
    if (!value || *value <= 0) {
        return std::unexpected(
            std::format("{} expects a positive integer, got '{}'", source, text));
    }
    return *value;
}

class ArgCursor {
    const std::vector<std::string>& args_;
    std::size_t index_ = 0;

public:
    explicit ArgCursor(const std::vector<std::string>& args) : args_(args) {}

    bool done() const { return index_ >= args_.size(); }
    const std::string& next() { return args_[index_++]; }

    std::expected<std::string, std::string> value_for(std::string_view flag,
                                                      std::optional<std::string> inline_value) {
        if (inline_value) return *inline_value;
        if (done()) {
            return std::unexpected(std::format("Option '{}' requires a value", flag));
        }
        return next();
    }
};

std::expected<void, std::string> set_enabled(std::vector<Endpoint>& endpoints,
                                             const std::vector<std::string>& names,
                                             bool enabled) {
    for (const auto& name : names) {
        Endpoint* endpoint = EndpointRegistry::find_endpoint(endpoints, name);
        if (!endpoint) {
            return std::unexpected(std::format(
                "Unknown region '{}' (use --list-regions to see available regions)", name));
        }
        endpoint->enabled = enabled;
    }
    return {};
}

}

EnvLookup process_environment() {
    return [](std::string_view name) -> std::optional<std::string> {
        const char* value = std::getenv(std::string(name).c_str());
        if (!value) return std::nullopt;
        return std::string(value);
    };
}

std::expected<ParsedCommand, std::string> parse_options(const std::vector<std::string>& args,
                                                        const EnvLookup& env) {
    ParsedCommand cmd;
    ProbeOptions& opts = cmd.options;

    if (env) {
        if (auto v = env(Config::ENV_INTERVAL_SEC)) {
            auto parsed = parse_seconds_like(*v, Config::ENV_INTERVAL_SEC);
            if (!parsed) return std::unexpected(parsed.error());
            opts.interval_seconds = *parsed;
        }
        if (auto v = env(Config::ENV_DURATION_MIN)) {
            auto parsed = parse_seconds_like(*v, Config::ENV_DURATION_MIN);
            if (!parsed) return std::unexpected(parsed.error());
            opts.duration_minutes = *parsed;
        }
    }

    bool all_regions = false;
    std::optional<std::vector<std::string>> only_regions;
    std::vector<std::string> excluded_regions;

    ArgCursor cursor(args);
    while (!cursor.done()) {
        std::string arg = cursor.next();

        std::optional<std::string> inline_value;
        if (arg.starts_with("--")) {
            if (auto eq = arg.find('='); eq != std::string::npos) {
                inline_value = arg.substr(eq + 1);
                arg.resize(eq);
            }
        }

        if (arg == "-h" || arg == "--help") {
            cmd.action = CommandAction::Help;
            return cmd;
        } else if (arg == "-v" || arg == "--version") {
            cmd.action = CommandAction::Version;
            return cmd;
        } else if (arg == "--list-regions") {
            cmd.action = CommandAction::ListRegions;
        } else if (arg == "--all-regions") {
            all_regions = true;
        } else if (arg == "--allow-legacy-tls") {
            opts.allow_legacy_tls = true;
        } else if (arg == "--verbose") {
            opts.verbose = true;
        } else if (arg == "--interval-seconds" || arg == "--duration-minutes") {
            auto value = cursor.value_for(arg, inline_value);
            if (!value) return std::unexpected(value.error());
            auto parsed = parse_seconds_like(*value, arg);
            if (!parsed) return std::unexpected(parsed.error());
            (arg == "--interval-seconds" ? opts.interval_seconds : opts.duration_minutes) = *parsed;
        } else if (arg == "--timeout-seconds" || arg == "--connect-timeout-seconds") {
            auto value = cursor.value_for(arg, inline_value);
            if (!value) return std::unexpected(value.error());
            auto parsed = parse_positive<long>(*value, arg);
            if (!parsed) return std::unexpected(parsed.error());
            (arg == "--timeout-seconds" ? opts.http_timeout_sec : opts.connect_timeout_sec) = *parsed;
        } else if (arg == "--connect-attempts") {
            auto value = cursor.value_for(arg, inline_value);
            if (!value) return std::unexpected(value.error());
            auto parsed = parse_positive<int>(*value, arg);
            if (!parsed) return std::unexpected(parsed.error());
            opts.connect_attempts = *parsed;
        } else if (arg == "--regions") {
            auto value = cursor.value_for(arg, inline_value);
            if (!value) return std::unexpected(value.error());
            only_regions = split_list(*value);
        } else if (arg == "--exclude-regions") {
            auto value = cursor.value_for(arg, inline_value);
            if (!value) return std::unexpected(value.error());
            auto names = split_list(*value);
            excluded_regions.insert(excluded_regions.end(), names.begin(), names.end());
        } else if (arg == "--endpoints-file") {
            auto value = cursor.value_for(arg, inline_value);
            if (!value) return std::unexpected(value.error());
            opts.endpoints_file = *value;
        } else if (arg == "--format") {
            auto value = cursor.value_for(arg, inline_value);
            if (!value) return std::unexpected(value.error());
            if (*value == "table") {
                opts.format = OutputFormat::Table;
            } else if (*value == "json") {
                opts.format = OutputFormat::Json;
            } else {
                return std::unexpected(
                    std::format("Unknown format '{}' (expected 'table' or 'json')", *value));
            }
        } else {
            return std::unexpected(std::format("Unknown option '{}'", arg));
        }
    }

    if (!std::isfinite(opts.interval_seconds) || opts.interval_seconds <= 0.0) {
        return std::unexpected("Interval must be a positive number of seconds");
    }
    if (!std::isfinite(opts.duration_minutes) || opts.duration_minutes < 0.0) {
        return std::unexpected("Duration must be zero or a positive number of minutes");
    }
    if (opts.interval_seconds > Config::MAX_INTERVAL_SEC) {
        return std::unexpected(
            std::format("Interval must be at most {} seconds", Config::MAX_INTERVAL_SEC));
    }
    if (opts.duration_minutes > Config::MAX_DURATION_MIN) {
        return std::unexpected(
            std::format("Duration must be at most {} minutes", Config::MAX_DURATION_MIN));
    }

    if (!opts.endpoints_file.empty()) {
        auto loaded = EndpointRegistry::load_endpoints_file(opts.endpoints_file);
        if (!loaded) return std::unexpected(loaded.error());
        opts.endpoints = std::move(*loaded);
    } else {
        opts.endpoints = EndpointRegistry::builtin_endpoints();
    }

    if (all_regions) {
        for (auto& ep : opts.endpoints) ep.enabled = true;
    }
    if (only_regions) {
        if (only_regions->empty()) {
            return std::unexpected("--regions needs at least one region name");
        }
        for (auto& ep : opts.endpoints) ep.enabled = false;
        if (auto res = set_enabled(opts.endpoints, *only_regions, true); !res) {
            return std::unexpected(res.error());
        }
    }
    if (auto res = set_enabled(opts.endpoints, excluded_regions, false); !res) {
        return std::unexpected(res.error());
    }

    if (cmd.action == CommandAction::Run &&
        std::ranges::none_of(opts.endpoints, &Endpoint::enabled)) {
        return std::unexpected("No regions are enabled");
    }

    return cmd;
}
