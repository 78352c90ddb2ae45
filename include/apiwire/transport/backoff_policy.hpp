#ifndef APIWIRE_TRANSPORT_BACKOFF_POLICY_HPP
#define APIWIRE_TRANSPORT_BACKOFF_POLICY_HPP

#include <algorithm>
#include <chrono>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <random>

namespace apiwire {

// ─────────────────────────────────────────────────────────────────────────────
// IBackoffPolicy
// ─────────────────────────────────────────────────────────────────────────────
// How long the executor sleeps before a retry. One policy instance is shared
// by every call through an engine, so implementations must be thread-safe.

struct IBackoffPolicy {
    virtual ~IBackoffPolicy() = default;

    // retry: 0-indexed retry number (0 = delay before the second attempt)
    virtual std::chrono::milliseconds next_delay(std::size_t retry) = 0;
};

// ─────────────────────────────────────────────────────────────────────────────
// ExponentialBackoff
// ─────────────────────────────────────────────────────────────────────────────
// delay = base * multiplier^retry + uniform(0, max_jitter)
//
// With the defaults (1s, 2.0, 1000ms) the sleeps before attempts 2, 3, 4 ...
// are 1s, 2s, 4s ... each plus up to one second of jitter. The jitter is
// additive and bounded, so the base schedule is never shortened.

class ExponentialBackoff final : public IBackoffPolicy {
public:
    ExponentialBackoff()
        : ExponentialBackoff(std::chrono::milliseconds{1'000}, 2.0, std::chrono::milliseconds{1'000})
    {}

    ExponentialBackoff(
        std::chrono::milliseconds base,
        double multiplier,
        std::chrono::milliseconds max_jitter
    )
        : base_(base)
        , multiplier_(multiplier)
        , max_jitter_(max_jitter)
        , rng_(std::random_device{}())
    {}

    std::chrono::milliseconds next_delay(std::size_t retry) override {
        return base_delay(retry) + jitter();
    }

    // Growth saturates here so large retry numbers never overflow the cast
    static constexpr std::chrono::milliseconds kMaxBaseDelay{std::chrono::hours{24}};

    /// Delay without jitter.
    [[nodiscard]] std::chrono::milliseconds base_delay(std::size_t retry) const {
        const double base_ms = static_cast<double>(base_.count());
        const double delay_ms = base_ms * std::pow(multiplier_, static_cast<double>(retry));
        const double ceiling_ms = static_cast<double>(kMaxBaseDelay.count());
        return std::chrono::milliseconds{static_cast<std::int64_t>(std::clamp(delay_ms, 0.0, ceiling_ms))};
    }

    [[nodiscard]] std::chrono::milliseconds max_jitter() const noexcept {
        return max_jitter_;
    }

private:
    std::chrono::milliseconds jitter() {
        if (max_jitter_.count() <= 0) {
            return std::chrono::milliseconds{0};
        }
        std::uniform_int_distribution<std::int64_t> dist(0, max_jitter_.count());
        std::lock_guard<std::mutex> lock(mutex_);
        return std::chrono::milliseconds{dist(rng_)};
    }

    std::chrono::milliseconds base_;
    double multiplier_;
    std::chrono::milliseconds max_jitter_;
    std::mutex mutex_;
    std::mt19937_64 rng_;
};

// ─────────────────────────────────────────────────────────────────────────────
// NoBackoff - zero delay, for tests
// ─────────────────────────────────────────────────────────────────────────────

class NoBackoff final : public IBackoffPolicy {
public:
    std::chrono::milliseconds next_delay(std::size_t /*retry*/) override {
        return std::chrono::milliseconds{0};
    }
};

// ─────────────────────────────────────────────────────────────────────────────
// ConstantBackoff
// ─────────────────────────────────────────────────────────────────────────────

class ConstantBackoff final : public IBackoffPolicy {
public:
    explicit ConstantBackoff(std::chrono::milliseconds delay)
        : delay_(delay) {}

    std::chrono::milliseconds next_delay(std::size_t /*retry*/) override {
        return delay_;
    }

private:
    std::chrono::milliseconds delay_;
};

}  // namespace apiwire

#endif  // APIWIRE_TRANSPORT_BACKOFF_POLICY_HPP
