#include <presence/com/totp.hpp>
#include <openssl/evp.h>
#include <openssl/hmac.h>
#include <array>
#include <cctype>
#include <cstdio>

namespace presence::com {

std::optional<std::vector<std::uint8_t>> DecodeBase32(const std::string& text) {
    std::vector<std::uint8_t> out;
    std::uint32_t buffer = 0;
    int bits = 0;
    for (char raw : text) {
        if (raw == '=' || raw == ' ' || raw == '-') continue;
        const char c = static_cast<char>(std::toupper(static_cast<unsigned char>(raw)));
        int v;
        if (c >= 'A' && c <= 'Z')      v = c - 'A';
        else if (c >= '2' && c <= '7') v = c - '2' + 26;
        else return std::nullopt;

        buffer = (buffer << 5) | static_cast<std::uint32_t>(v);
        bits += 5;
        if (bits >= 8) {
            bits -= 8;
            out.push_back(static_cast<std::uint8_t>((buffer >> bits) & 0xFF));
        }
    }
    if (out.empty()) return std::nullopt;
    return out;
}

std::optional<std::string> GenerateTotp(const std::string& base32_secret,
                                        core::WallClock::time_point now, int digits) {
    auto key = DecodeBase32(base32_secret);
    if (!key || digits < 6 || digits > 8) return std::nullopt;

    const auto secs = std::chrono::duration_cast<std::chrono::seconds>(now.time_since_epoch()).count();
    std::uint64_t counter = static_cast<std::uint64_t>(secs) / 30;

    std::array<unsigned char, 8> msg{};
    for (int i = 7; i >= 0; --i) {
        msg[i] = static_cast<unsigned char>(counter & 0xFF);
        counter >>= 8;
    }

    unsigned char mac[EVP_MAX_MD_SIZE];
    unsigned int mac_len = 0;
    if (HMAC(EVP_sha1(), key->data(), static_cast<int>(key->size()),
             msg.data(), msg.size(), mac, &mac_len) == nullptr || mac_len < 20) {
        return std::nullopt;
    }

    // dynamic truncation
    const int offset = mac[mac_len - 1] & 0x0F;
    const std::uint32_t bin = (static_cast<std::uint32_t>(mac[offset] & 0x7F) << 24)
                            | (static_cast<std::uint32_t>(mac[offset + 1]) << 16)
                            | (static_cast<std::uint32_t>(mac[offset + 2]) << 8)
                            |  static_cast<std::uint32_t>(mac[offset + 3]);

    std::uint32_t mod = 1;
    for (int i = 0; i < digits; ++i) mod *= 10;

    char buf[16];
    std::snprintf(buf, sizeof(buf), "%0*u", digits, bin % mod);
    return std::string(buf);
}

} // namespace presence::com
