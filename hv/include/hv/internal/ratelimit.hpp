/*
 * Part of the HeaderVerify (HV) project.
 *
 * SPDX-FileCopyrightText: 2025 HeaderVerify contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of HeaderVerify (HV). See LICENSE for details.
 */

#pragma once
#include <unordered_map>
#include <string>
#include <chrono>
#include <cstddef>
#include <mutex>

namespace hv::internal {

// Token-bucket map keyed by peer IP.
class TokenBucketMap {
public:
    using Clock = std::chrono::steady_clock;

    TokenBucketMap() = default;

    // Returns true if request is allowed under (rate, burst).
    // rate <= 0 or burst <= 0 disables limiting.
    bool allow(const std::string& key, double rate, double burst);
    bool allow_at(const std::string& key, double rate, double burst, Clock::time_point now);

    // Drop buckets untouched for longer than max_idle. Returns number removed.
    std::size_t prune(std::chrono::seconds max_idle);
    std::size_t prune_at(std::chrono::seconds max_idle, Clock::time_point now);

    std::size_t size() const;

    // Seconds after which an untouched bucket is full again:
    // floor(burst / rate) + 1, at least 1s and clamped to kMaxIdleSec.
    static std::chrono::seconds refill_window(double rate, double burst);
    static constexpr long long kMaxIdleSec = 1000000000LL;

private:
    struct Bucket {
        double tokens = 0.0;
        Clock::time_point last{};
    };

    mutable std::mutex _mtx;
    std::unordered_map<std::string, Bucket> _buckets;
};

} // namespace hv::internal
