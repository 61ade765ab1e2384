#include <chremote/core/uuid.h>

#include <array>
#include <cstdint>
#include <random>

namespace chremote {
namespace {

bool IsLowerHex(char c) {
    return (c >= '0' && c <= '9') || (c >= 'a' && c <= 'f');
}

std::mt19937_64& Generator() {
    thread_local std::mt19937_64 gen([] {
        std::random_device rd;
        return (static_cast<std::uint64_t>(rd()) << 32) ^ rd();
    }());
    return gen;
}

} // namespace

std::string NewUuid() {
    std::array<std::uint8_t, 16> bytes{};
    std::uniform_int_distribution<std::uint32_t> dist(0, 255);
    auto& gen = Generator();
    for (auto& b : bytes) {
        b = static_cast<std::uint8_t>(dist(gen));
    }
    bytes[6] = static_cast<std::uint8_t>((bytes[6] & 0x0F) | 0x40); // version 4
    bytes[8] = static_cast<std::uint8_t>((bytes[8] & 0x3F) | 0x80); // variant 10xx

    static const char* kHex = "0123456789abcdef";
    std::string out;
    out.reserve(36);
    for (std::size_t i = 0; i < bytes.size(); ++i) {
        if (i == 4 || i == 6 || i == 8 || i == 10) {
            out.push_back('-');
        }
        out.push_back(kHex[(bytes[i] >> 4) & 0xF]);
        out.push_back(kHex[(bytes[i] >> 0) & 0xF]);
    }
    return out;
}

bool IsUuid(std::string_view s) {
    if (s.size() != 36) {
        return false;
    }
    for (std::size_t i = 0; i < s.size(); ++i) {
        if (i == 8 || i == 13 || i == 18 || i == 23) {
            if (s[i] != '-') {
                return false;
            }
        } else if (!IsLowerHex(s[i])) {
            return false;
        }
    }
    return s[14] == '4';
}

} // namespace chremote
