/*
 * Part of the HeaderVerify (HV) project.
 *
 * SPDX-FileCopyrightText: 2025 HeaderVerify contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of HeaderVerify (HV). See LICENSE for details.
 */

#include "hv/internal/ratelimit.hpp"
#include <algorithm>
#include <cmath>

namespace hv::internal {

bool TokenBucketMap::allow(const std::string& key, double rate, double burst) {
    return allow_at(key, rate, burst, Clock::now());
}

bool TokenBucketMap::allow_at(const std::string& key, double rate, double burst,
                              Clock::time_point now) {
    if (rate <= 0.0 || burst <= 0.0) return true;
    std::lock_guard<std::mutex> lk(_mtx);
    auto ins = _buckets.try_emplace(key);
    Bucket& b = ins.first->second;
    if (ins.second) {
        b.tokens = burst;
        b.last   = now;
    }
    if (now > b.last) {
        const double elapsed = std::chrono::duration<double>(now - b.last).count();
        b.tokens = std::min(burst, b.tokens + elapsed * rate);
        b.last   = now;
    }
    if (b.tokens >= 1.0) {
        b.tokens -= 1.0;
        return true;
    }
    return false;
}

std::size_t TokenBucketMap::prune(std::chrono::seconds max_idle) {
    return prune_at(max_idle, Clock::now());
}

std::size_t TokenBucketMap::prune_at(std::chrono::seconds max_idle, Clock::time_point now) {
    std::lock_guard<std::mutex> lk(_mtx);
    std::size_t removed = 0;
    for (auto it = _buckets.begin(); it != _buckets.end(); ) {
        if (now - it->second.last > max_idle) {
            it = _buckets.erase(it);
            ++removed;
        } else {
            ++it;
        }
    }
    return removed;
}

std::chrono::seconds TokenBucketMap::refill_window(double rate, double burst) {
    if (!(rate > 0.0) || !(burst > 0.0)) return std::chrono::seconds(1);
    const double secs = std::floor(burst / rate) + 1.0;
    if (!(secs < static_cast<double>(kMaxIdleSec))) return std::chrono::seconds(kMaxIdleSec);
    return std::chrono::seconds(std::max(1LL, static_cast<long long>(secs)));
}

std::size_t TokenBucketMap::size() const {
    std::lock_guard<std::mutex> lk(_mtx);
    return _buckets.size();
}

} // namespace hv::internal
