#include <supervisor/backoff_policy.hpp>
#include <algorithm>
#include <cmath>
#include <memory>
#include <random>

namespace presence::supervisor {

JitterSource MakeDefaultJitter() {
    auto rng = std::make_shared<std::mt19937>(std::random_device{}());
    return [rng]() {
        std::uniform_real_distribution<double> dist(0.75, 1.25);
        return dist(*rng);
    };
}

BackoffPolicy::BackoffPolicy(Config cfg, JitterSource jitter)
    : cfg_(cfg), jitter_(std::move(jitter)) {
    if (!jitter_) jitter_ = MakeDefaultJitter();
}

std::chrono::milliseconds BackoffPolicy::Unjittered(std::uint32_t attempt) const noexcept {
    const std::uint32_t exp = std::min(attempt, cfg_.cap_exponent);
    // double keeps large cap exponents from overflowing before the clamp
    const double raw = static_cast<double>(cfg_.base.count()) * std::ldexp(1.0, static_cast<int>(exp));
    const double capped = std::min(raw, static_cast<double>(cfg_.max_delay.count()));
    return std::chrono::milliseconds(static_cast<std::int64_t>(capped));
}

std::chrono::milliseconds BackoffPolicy::ComputeDelay(std::uint32_t attempt) const {
    double factor = jitter_();
    factor = std::clamp(factor, 0.75, 1.25);
    const double delay = static_cast<double>(Unjittered(attempt).count()) * factor;
    return std::chrono::milliseconds(static_cast<std::int64_t>(std::llround(delay)));
}

} // namespace presence::supervisor
