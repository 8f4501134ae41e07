/*
 * Copyright (c) 2025 Alfie Ardinata
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
#pragma once

#include <expected>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "config.hpp"
#include "endpoint_registry.hpp"

enum class OutputFormat { Table, Json };

struct ProbeOptions {
    std::vector<Endpoint> endpoints;
    double interval_seconds = Config::DEFAULT_INTERVAL_SEC;
    double duration_minutes = Config::DEFAULT_DURATION_MIN;
    long http_timeout_sec = Config::HTTP_TIMEOUT_SEC;
    long connect_timeout_sec = Config::HTTP_CONNECT_TIMEOUT_SEC;
    int connect_attempts = Config::CONNECT_ATTEMPTS;
    bool allow_legacy_tls = false;
    bool verbose = false;
    OutputFormat format = OutputFormat::Table;
    std::string endpoints_file;
};

enum class CommandAction { Run, Help, Version, ListRegions };

struct ParsedCommand {
    CommandAction action = CommandAction::Run;
    ProbeOptions options;
};

using EnvLookup = std::function<std::optional<std::string>(std::string_view)>;

EnvLookup process_environment();

// Defaults, then environment, then flags. args excludes the program name.
std::expected<ParsedCommand, std::string> parse_options(const std::vector<std::string>& args,
                                                        const EnvLookup& env = {});
