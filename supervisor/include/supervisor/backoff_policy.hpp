#pragma once
#include <chrono>
#include <cstdint>
#include <functional>

namespace presence::supervisor {

// Uniform factor in [0.75, 1.25]
using JitterSource = std::function<double()>;

JitterSource MakeDefaultJitter();

class BackoffPolicy {
public:
    struct Config {
        std::chrono::milliseconds base{1000};
        std::uint32_t cap_exponent{10};
        std::chrono::milliseconds max_delay{5 * 60 * 1000};
    };

    BackoffPolicy(Config cfg, JitterSource jitter);
    explicit BackoffPolicy(Config cfg) : BackoffPolicy(cfg, MakeDefaultJitter()) {}

    // base * 2^min(attempt, cap_exponent), clamped to max_delay, then jittered.
    std::chrono::milliseconds ComputeDelay(std::uint32_t attempt) const;
    std::chrono::milliseconds Unjittered(std::uint32_t attempt) const noexcept;

    const Config& GetConfig() const noexcept { return cfg_; }

private:
    Config cfg_;
    JitterSource jitter_;
};

// Used for authentication failures
class FixedCooldown {
public:
    explicit FixedCooldown(std::chrono::milliseconds cooldown) : cooldown_(cooldown) {}
    std::chrono::milliseconds ComputeDelay(std::uint32_t /*attempt*/) const noexcept { return cooldown_; }

private:
    std::chrono::milliseconds cooldown_;
};

} // namespace presence::supervisor
