/*
 * Copyright (c) 2025 Alfie Ardinata
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
#include "include/application.hpp"

#include <chrono>
#include <cstdio>
#include <filesystem>
#include <format>
#include <print>
#include <string>
#include <vector>

#include "include/cli_renderer.hpp"
#include "include/color.hpp"
#include "include/config.hpp"
#include "include/endpoint_registry.hpp"
#include "include/http_client.hpp"
#include "include/http_context.hpp"
#include "include/interrupts.hpp"
#include "include/latency_collector.hpp"
#include "include/latency_sampler.hpp"
#include "include/results.hpp"
#include "include/retry.hpp"
#include "include/utils.hpp"

namespace fs = std::filesystem;
using namespace std::chrono;

void Application::show_help(const std::string& app_name) const {
    std::println("Usage: {} [options]", app_name);
    std::println("");
    std::println("Measures HTTP latency to cloud regions and reports min/max/average/jitter.");
    std::println("");
    std::println("Options:");
    std::println("  -h, --help                     Show this help message");
    std::println("  -v, --version                  Show version information");
    std::println("  --interval-seconds N           Seconds between rounds (default {}, env {})",
                 Config::DEFAULT_INTERVAL_SEC, Config::ENV_INTERVAL_SEC);
    std::println("  --duration-minutes N           Length of the timed window (default {}, env {})",
                 Config::DEFAULT_DURATION_MIN, Config::ENV_DURATION_MIN);
    std::println("  --timeout-seconds N            Per-request timeout (default {})",
                 Config::HTTP_TIMEOUT_SEC);
    std::println("  --connect-timeout-seconds N    Connect timeout (default {})",
                 Config::HTTP_CONNECT_TIMEOUT_SEC);
    std::println("  --connect-attempts N           Attempts per endpoint in the initial check (default {})",
                 Config::CONNECT_ATTEMPTS);
    std::println("  --regions a,b,...              Probe exactly these regions");
    std::println("  --all-regions                  Probe every known region");
    std::println("  --exclude-regions a,b,...      Skip these regions");
    std::println("  --endpoints-file PATH          Load endpoints from a JSON file");
    std::println("  --list-regions                 List regions and whether they are enabled");
    std::println("  --allow-legacy-tls             Fall back to TLS 1.2/1.1/1.0 if negotiation fails");
    std::println("  --format table|json            Report format (default table)");
    std::println("  --verbose                      Log every discarded sample");
    std::println("");
    std::println("Examples:");
    std::println("  {} --duration-minutes 2 --interval-seconds 3", app_name);
    std::println("  {} --regions westeurope,eastus --format json", app_name);
}

void Application::show_version() const {
    std::println("{} v{}", Config::APP_NAME, Config::APP_VERSION);
    std::println("Copyright (c) 2025 Alfie Ardinata");
    std::println("Licensed under the Mozilla Public License 2.0");
}

void Application::show_banner(const ProbeOptions& options, const std::string& app_name) const {
    print_centered_header(std::format("RegionPing - Cloud Region Latency Probe (v{})", Config::APP_VERSION));
    std::println(" {:<{}} : ./{}", "Usage", Config::APP_INFO_LABEL_WIDTH, app_name);
    print_line();

    auto enabled = EndpointRegistry::enabled_only(options.endpoints);
    std::println(" {:<{}} : {}",
                 "Regions",
                 Config::APP_INFO_LABEL_WIDTH,
                 Color::colorize(std::format("{} enabled", enabled.size()), Color::CYAN));
    std::println(" {:<{}} : {}",
                 "Interval",
                 Config::APP_INFO_LABEL_WIDTH,
                 Color::colorize(std::format("{} sec", options.interval_seconds), Color::YELLOW));
    std::println(" {:<{}} : {}",
                 "Duration",
                 Config::APP_INFO_LABEL_WIDTH,
                 Color::colorize(std::format("{} min", options.duration_minutes), Color::YELLOW));
    std::println(" {:<{}} : {}",
                 "Warm-up Rounds",
                 Config::APP_INFO_LABEL_WIDTH,
                 Color::colorize(std::format("{}", Config::WARMUP_ROUNDS), Color::YELLOW));
    std::println(" {:<{}} : {}",
                 "Legacy TLS",
                 Config::APP_INFO_LABEL_WIDTH,
                 options.allow_legacy_tls ? Color::colorize("\u2713 Allowed", Color::YELLOW)
                                          : Color::colorize("\u2717 Disabled", Color::GREEN));
    print_line();
}

int Application::run_probe(const ProbeOptions& options, const std::string& app_name) {
    const bool json_output = options.format == OutputFormat::Json;
    std::FILE* status_out = json_output ? stderr : stdout;

    if (auto runtime = HttpContext::verify_runtime(); !runtime) {
        std::println(stderr, "{}Error: {}{}", Color::RED, runtime.error(), Color::RESET);
        return 1;
    }

    HttpClient http(HttpTimeouts{options.http_timeout_sec, options.connect_timeout_sec});
    auto start_time = steady_clock::now();

    if (!json_output) {
        show_banner(options, app_name);
    }

    auto endpoints = EndpointRegistry::enabled_only(options.endpoints);

    auto sleep_ms = [](milliseconds wait) {
        CollectorHooks::system().sleep(wait, {});
    };

    ConnectivityOptions connectivity;
    connectivity.max_attempts = options.connect_attempts;
    connectivity.max_candidates = Config::CONNECTIVITY_CANDIDATES;
    connectivity.allow_legacy_tls = options.allow_legacy_tls;
    connectivity.backoff = exponential_backoff(
        milliseconds(Config::RETRY_BASE_DELAY_MS), milliseconds(Config::RETRY_MAX_DELAY_MS));

    std::println(status_out, " Checking connectivity...");
    auto reachable = check_connectivity(http, endpoints, connectivity, sleep_ms);
    if (!reachable) {
        std::println(stderr, "{}Error: {}{}", Color::RED, reachable.error(), Color::RESET);
        return 1;
    }
    std::println(status_out, " {:<{}} : {} ({:.1f} ms, TLS: {})",
                 "Reachable",
                 Config::APP_INFO_LABEL_WIDTH,
                 Color::colorize(reachable->endpoint, Color::GREEN),
                 reachable->latency_ms,
                 tls_version_name(reachable->tls_version));

    CollectionSettings settings;
    settings.interval = duration<double>(options.interval_seconds);
    settings.duration = duration<double>(options.duration_minutes * Config::SECONDS_PER_MINUTE);
    settings.warmup_rounds = Config::WARMUP_ROUNDS;

    HttpLatencySampler sampler(http, options.verbose);
    LatencyCollector collector(sampler);

    std::println(status_out, " Warming up ({} rounds)...", settings.warmup_rounds);
    auto collection = collector.collect(endpoints, settings,
                                        CliRenderer::make_progress_callback(status_out));
    std::print(status_out, "\r\x1b[2K");
    std::fflush(status_out);

    if (collection.interrupted) {
        std::println(stderr, "{}Interrupted: reporting the samples collected so far{}",
                     Color::YELLOW, Color::RESET);
    }

    auto report = build_report(collection);

    if (json_output) {
        std::println("{}", CliRenderer::format_latency_json(report));
        return 0;
    }

    CliRenderer::render_latency_report(report);
    print_line();
    double elapsed_sec = duration<double>(steady_clock::now() - start_time).count();
    std::println(" {:<{}} : {}", "Finished in", Config::APP_INFO_LABEL_WIDTH, format_elapsed(elapsed_sec));
    return 0;
}

int Application::run(int argc, char* argv[]) {
    try {
        SignalGuard signal_guard;

        std::string app_name{Config::APP_NAME};
        if (argc > 0) {
            app_name = fs::path(argv[0]).filename().string();
            if (app_name.empty())
                app_name = Config::APP_NAME;
        }

        std::vector<std::string> args;
        for (int i = 1; i < argc; ++i) {
            args.emplace_back(argv[i]);
        }

        auto parsed = parse_options(args, process_environment());
        if (!parsed) {
            std::println(
                stderr, "{}Error: {}{}", Color::RED, parsed.error(), Color::RESET);
            std::println(stderr, "Run '{} --help' for usage.", app_name);
            return 1;
        }

        switch (parsed->action) {
            case CommandAction::Help:
                show_help(app_name);
                return 0;
            case CommandAction::Version:
                show_version();
                return 0;
            case CommandAction::ListRegions:
                CliRenderer::render_region_list(parsed->options.endpoints);
                return 0;
            case CommandAction::Run:
                break;
        }

        HttpContext http_context;
        return run_probe(parsed->options, app_name);

    } catch (const std::exception& e) {
        std::println(stderr, "\n{}Fatal Error: {}{}", Color::RED, e.what(), Color::RESET);
        return 1;
    }
}
