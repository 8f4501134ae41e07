/*
 * Copyright (c) 2025 Alfie Ardinata
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
#pragma once

#include <expected>
#include <string>
#include <vector>

#include "endpoint_registry.hpp"
#include "http_client.hpp"
#include "retry.hpp"

class LatencySampler {
   public:
    static constexpr double kFailed = -1.0;

    virtual ~LatencySampler() = default;

    // Elapsed milliseconds of one request, or kFailed. Never throws.
    virtual double sample(const Endpoint& endpoint) = 0;
};

class HttpLatencySampler : public LatencySampler {
    HttpTransport& http_;
    bool verbose_ = false;

   public:
    explicit HttpLatencySampler(HttpTransport& http, bool verbose = false)
        : http_(http), verbose_(verbose) {}

    double sample(const Endpoint& endpoint) override;
};

struct ConnectivityOptions {
    int max_attempts = 3;
    std::size_t max_candidates = 3;
    bool allow_legacy_tls = false;
    BackoffFn backoff;
};

struct ConnectivityResult {
    std::string endpoint;
    TlsVersion tls_version = TlsVersion::Default;
    double latency_ms = 0.0;
};

// Probes enabled endpoints in order until one answers. An error here means no
// endpoint was reachable at all.
std::expected<ConnectivityResult, std::string> check_connectivity(
    HttpTransport& http,
    const std::vector<Endpoint>& endpoints,
    const ConnectivityOptions& options,
    const SleepFn& sleep);
