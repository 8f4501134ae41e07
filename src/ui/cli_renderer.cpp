#include "include/cli_renderer.hpp"

#include <algorithm>
#include <format>
#include <print>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

#include "include/color.hpp"
#include "include/config.hpp"

using json = nlohmann::json;

namespace CliRenderer {

namespace {

std::string latency_cell(double value) {
    return std::format("{:>{}.2f}", value, Config::LATENCY_COLUMN_WIDTH);
}

json nullable(const std::optional<LatencyStatistics>& stats,
              double LatencyStatistics::*field) {
    if (!stats) return nullptr;
    return (*stats).*field;
}

}

std::string format_latency_table(const LatencyReport& report, bool color) {
    std::string out;
    out += std::format("{:<{}}{:>{}}{:>{}}{:>{}}{:>{}}\n",
                       " Region", Config::REGION_COLUMN_WIDTH,
                       "Minimum (ms)", Config::LATENCY_COLUMN_WIDTH,
                       "Maximum (ms)", Config::LATENCY_COLUMN_WIDTH,
                       "Average (ms)", Config::LATENCY_COLUMN_WIDTH,
                       "Jitter (ms)", Config::LATENCY_COLUMN_WIDTH);

    const std::string* current_group = nullptr;
    for (const auto& row : report.rows) {
        if (!current_group || *current_group != row.global_region) {
            current_group = &row.global_region;
            out += std::format(" -> {}\n", Color::colorize_if(color, row.global_region, Color::BOLD));
        }

        std::string region = std::format("{:<{}}", " " + row.region, Config::REGION_COLUMN_WIDTH);
        out += Color::colorize_if(color, region, Color::YELLOW);

        if (!row.stats) {
            std::string missing = std::format("{:>{}}", "no data", Config::LATENCY_COLUMN_WIDTH);
            out += Color::colorize_if(color, missing, Color::RED);
            if (row.failures > 0) {
                out += Color::colorize_if(
                    color, std::format("  ({} failed samples)", row.failures), Color::GRAY);
            }
            out += "\n";
            continue;
        }

        const auto& s = *row.stats;
        out += Color::colorize_if(color, latency_cell(s.minimum), Color::GREEN);
        out += Color::colorize_if(color, latency_cell(s.maximum), Color::RED);
        out += Color::colorize_if(color, latency_cell(s.average), Color::CYAN);
        out += Color::colorize_if(color, latency_cell(s.jitter), Color::YELLOW);
        out += "\n";
    }

    return out;
}

std::string format_latency_json(const LatencyReport& report) {
    using Stats = LatencyStatistics;

    json rows = json::array();
    for (const auto& row : report.rows) {
        json item = {
            {"Region", row.region},
            {"GlobalRegion", row.global_region},
            {"MinimumLatencyMilliseconds", nullable(row.stats, &Stats::minimum)},
            {"MaximumLatencyMilliseconds", nullable(row.stats, &Stats::maximum)},
            {"AverageLatencyMilliseconds", nullable(row.stats, &Stats::average)},
            {"JitterMilliseconds", nullable(row.stats, &Stats::jitter)},
            {"Samples", row.samples},
            {"Failures", row.failures},
        };
        rows.push_back(std::move(item));
    }
    return rows.dump(2);
}

void render_latency_report(const LatencyReport& report) {
    std::print("{}", format_latency_table(report));
    std::println(" {:<{}} : {}", "Timed rounds", Config::APP_INFO_LABEL_WIDTH, report.timed_rounds);
    if (report.interrupted) {
        std::println("{}", Color::colorize(" Partial results: collection was interrupted", Color::YELLOW));
    }
}

void render_region_list(const std::vector<Endpoint>& endpoints) {
    std::println("{:<{}}{:<22}{}", " Region", Config::REGION_COLUMN_WIDTH, "Group", "Enabled");
    for (const auto& ep : endpoints) {
        std::println("{:<{}}{:<22}{}",
                     " " + ep.name, Config::REGION_COLUMN_WIDTH, ep.global_region,
                     ep.enabled ? Color::colorize("\u2713 yes", Color::GREEN)
                                : Color::colorize("\u2717 no", Color::RED));
    }
}

std::string create_progress_bar(int percent) {
    percent = std::clamp(percent, 0, 100);
    int filled = (percent * Config::PROGRESS_BAR_WIDTH) / 100;
    return std::format("[{}{}]",
                       std::string(static_cast<std::size_t>(filled), '#'),
                       std::string(static_cast<std::size_t>(Config::PROGRESS_BAR_WIDTH - filled), ' '));
}

std::string format_progress_line(const CollectionProgress& progress) {
    return std::format(" Collecting {} {:3}%  ~{:.0f} s remaining  (round {})",
                       create_progress_bar(progress.percent()),
                       progress.percent(),
                       progress.remaining_seconds(),
                       progress.rounds);
}

CollectionProgressCallback make_progress_callback(std::FILE* out) {
    return [out](const CollectionProgress& progress) {
        std::print(out, "\r\x1b[2K{}", format_progress_line(progress));
        std::fflush(out);
    };
}

}  // namespace CliRenderer
