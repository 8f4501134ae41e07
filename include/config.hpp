#pragma once

#include <cstddef>
#include <string_view>

namespace Config {
    constexpr std::string_view APP_NAME = "regionping";
    constexpr std::string_view APP_VERSION = "1.0.0";

    constexpr double DEFAULT_INTERVAL_SEC = 5.0;
    constexpr double DEFAULT_DURATION_MIN = 5.0;
    constexpr int WARMUP_ROUNDS = 2;
    constexpr double MAX_INTERVAL_SEC = 86400.0;
    constexpr double MAX_DURATION_MIN = 10080.0;

    constexpr long HTTP_TIMEOUT_SEC = 10;
    constexpr long HTTP_CONNECT_TIMEOUT_SEC = 10;

    constexpr int CONNECT_ATTEMPTS = 3;
    constexpr std::size_t CONNECTIVITY_CANDIDATES = 3;
    constexpr long RETRY_BASE_DELAY_MS = 500;
    constexpr long RETRY_MAX_DELAY_MS = 8000;

    constexpr long SLEEP_SLICE_MS = 100;

    constexpr std::string_view ENV_INTERVAL_SEC = "REGIONPING_INTERVAL_SECONDS";
    constexpr std::string_view ENV_DURATION_MIN = "REGIONPING_DURATION_MINUTES";

    constexpr std::size_t TERM_WIDTH = 78;
    constexpr int APP_INFO_LABEL_WIDTH = 20;
    constexpr int REGION_COLUMN_WIDTH = 24;
    constexpr int LATENCY_COLUMN_WIDTH = 13;
    constexpr int PROGRESS_BAR_WIDTH = 30;

    constexpr double SECONDS_PER_MINUTE = 60.0;
    constexpr double TIME_MINUTES_THRESHOLD = 60.0;
}
