/*
 * Copyright (c) 2025 Alfie Ardinata
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
#pragma once

#include <algorithm>
#include <chrono>
#include <expected>
#include <functional>
#include <type_traits>
#include <utility>

#include "interrupts.hpp"

using BackoffFn = std::function<std::chrono::milliseconds(int attempt)>;
using SleepFn = std::function<void(std::chrono::milliseconds)>;

struct RetryPolicy {
    int max_attempts = 1;
    BackoffFn backoff;
};

template <typename E>
struct RetryExhausted {
    int attempts = 0;
    E last_error;
};

// Delay before attempt `attempt + 1`: base * 2^(attempt - 1), capped.
inline BackoffFn exponential_backoff(std::chrono::milliseconds base,
                                     std::chrono::milliseconds cap) {
    return [base, cap](int attempt) {
        auto delay = base;
        for (int i = 1; i < attempt && delay < cap; ++i) {
            delay *= 2;
        }
        return std::min(delay, cap);
    };
}

// Runs op until it succeeds or max_attempts is reached. op returns std::expected<T, E>.
template <typename Op>
auto retry(Op&& op, const RetryPolicy& policy, const SleepFn& sleep)
    -> std::expected<typename std::invoke_result_t<Op&>::value_type,
                     RetryExhausted<typename std::invoke_result_t<Op&>::error_type>> {
    using Result = std::invoke_result_t<Op&>;
    using E = typename Result::error_type;

    const int max_attempts = std::max(1, policy.max_attempts);
    int attempt = 0;

    while (true) {
        ++attempt;
        Result result = op();
        if (result) {
            return std::move(*result);
        }

        if (attempt >= max_attempts || g_interrupted) {
            return std::unexpected(RetryExhausted<E>{attempt, std::move(result.error())});
        }

        if (policy.backoff && sleep) {
            sleep(policy.backoff(attempt));
        }
    }
}
