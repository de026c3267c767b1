#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include <presence/core/scheduler.hpp>

namespace presence::com {

// RFC 4648 base32, case-insensitive, padding and spaces ignored.
std::optional<std::vector<std::uint8_t>> DecodeBase32(const std::string& text);

// RFC 6238 code (HMAC-SHA1, 30 s step). nullopt when the secret is not base32.
std::optional<std::string> GenerateTotp(const std::string& base32_secret,
                                        core::WallClock::time_point now,
                                        int digits = 6);

} // namespace presence::com
