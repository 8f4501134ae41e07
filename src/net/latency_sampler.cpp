/*
 * Copyright (c) 2025 Alfie Ardinata
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
#include "include/latency_sampler.hpp"

#include <array>
#include <exception>
#include <format>
#include <print>

#include "include/color.hpp"
#include "include/interrupts.hpp"

namespace {

constexpr std::array kLegacyLadder = {TlsVersion::Tls1_2, TlsVersion::Tls1_1, TlsVersion::Tls1_0};

std::expected<ProbeTiming, ProbeError> probe_with_fallback(HttpTransport& http,
                                                           const std::string& url,
                                                           bool allow_legacy_tls) {
    auto result = http.probe(url);
    if (result || result.error().kind != ProbeErrorKind::Tls || !allow_legacy_tls ||
        http.tls_version() != TlsVersion::Default) {
        return result;
    }

    for (TlsVersion version : kLegacyLadder) {
        http.set_tls_version(version);
        result = http.probe(url);
        if (result) {
            std::println(stderr,
                         "{}Warning: TLS negotiation only succeeded with {}; "
                         "using it for the rest of the run{}",
                         Color::YELLOW, tls_version_name(version), Color::RESET);
            return result;
        }
        if (result.error().kind != ProbeErrorKind::Tls) break;
    }

    http.set_tls_version(TlsVersion::Default);
    return result;
}

}

double HttpLatencySampler::sample(const Endpoint& endpoint) {
    try {
        auto result = http_.probe(endpoint.url);
        if (result) {
            return result->elapsed_ms;
        }
        if (verbose_ && result.error().kind != ProbeErrorKind::Interrupted) {
            std::println(stderr, "{}[{}] sample discarded: {}{}",
                         Color::YELLOW, endpoint.name, result.error().message, Color::RESET);
        }
    } catch (const std::exception& e) {
        if (verbose_) {
            std::println(stderr, "{}[{}] sample discarded: {}{}",
                         Color::YELLOW, endpoint.name, e.what(), Color::RESET);
        }
    }
    return kFailed;
}

std::expected<ConnectivityResult, std::string> check_connectivity(
    HttpTransport& http,
    const std::vector<Endpoint>& endpoints,
    const ConnectivityOptions& options,
    const SleepFn& sleep) {
    RetryPolicy policy{options.max_attempts, options.backoff};

    std::string last_error = "no endpoints configured";
    bool saw_tls_error = false;
    std::size_t tried = 0;

    for (const auto& endpoint : endpoints) {
        if (!endpoint.enabled) continue;
        if (tried++ >= options.max_candidates) break;
        if (g_interrupted) return std::unexpected("Interrupted by user");

        auto result = retry(
            [&] { return probe_with_fallback(http, endpoint.url, options.allow_legacy_tls); },
            policy, sleep);

        if (result) {
            return ConnectivityResult{endpoint.name, http.tls_version(), result->elapsed_ms};
        }

        const auto& failure = result.error();
        if (failure.last_error.kind == ProbeErrorKind::Tls) saw_tls_error = true;
        last_error = std::format("{} after {} attempt(s): {}",
                                 endpoint.name, failure.attempts, failure.last_error.message);
    }

    std::string message = std::format("No endpoint is reachable ({})", last_error);
    if (saw_tls_error && !options.allow_legacy_tls) {
        message += "; TLS negotiation failed, --allow-legacy-tls permits older protocol versions";
    }
    return std::unexpected(message);
}
