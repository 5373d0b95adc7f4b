#include "shoal/core/uuid.hpp"

#include <array>
#include <cctype>
#include <cstdint>
#include <random>

#include <unistd.h>

namespace shoal::uuid {

namespace {

constexpr std::string_view HEX_DIGITS = "0123456789abcdef";
constexpr std::string_view NIL_UUID = "00000000-0000-0000-0000-000000000000";
constexpr std::string_view MAX_UUID = "ffffffff-ffff-ffff-ffff-ffffffffffff";

bool is_dash_position(size_t i) noexcept {
    return i == 8 || i == 13 || i == 18 || i == 23;
}

bool iequals(std::string_view a, std::string_view b) noexcept {
    if (a.size() != b.size()) {
        return false;
    }
    for (size_t i = 0; i < a.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(a[i])) !=
            std::tolower(static_cast<unsigned char>(b[i]))) {
            return false;
        }
    }
    return true;
}

std::mt19937_64& process_engine() {
    static std::mt19937_64 engine;
    static pid_t seeded_for = -1;
    pid_t self = ::getpid();
    if (seeded_for != self) {
        std::random_device rd;
        std::seed_seq seq{rd(), rd(), rd(), rd(), static_cast<unsigned>(self)};
        engine.seed(seq);
        seeded_for = self;
    }
    return engine;
}

} // namespace

std::string generate_v4() {
    auto& engine = process_engine();
    std::array<uint8_t, 16> bytes{};
    for (size_t i = 0; i < bytes.size(); i += 8) {
        uint64_t chunk = engine();
        for (size_t j = 0; j < 8; ++j) {
            bytes[i + j] = static_cast<uint8_t>(chunk >> (j * 8));
        }
    }
    bytes[6] = static_cast<uint8_t>((bytes[6] & 0x0F) | 0x40);
    bytes[8] = static_cast<uint8_t>((bytes[8] & 0x3F) | 0x80);

    std::string out;
    out.reserve(36);
    for (size_t i = 0; i < bytes.size(); ++i) {
        if (i == 4 || i == 6 || i == 8 || i == 10) {
            out.push_back('-');
        }
        out.push_back(HEX_DIGITS[bytes[i] >> 4]);
        out.push_back(HEX_DIGITS[bytes[i] & 0x0F]);
    }
    return out;
}

bool is_valid(std::string_view id) noexcept {
    if (id.size() != 36) {
        return false;
    }
    if (iequals(id, NIL_UUID) || iequals(id, MAX_UUID)) {
        return true;
    }
    for (size_t i = 0; i < id.size(); ++i) {
        if (is_dash_position(i)) {
            if (id[i] != '-') {
                return false;
            }
        } else if (!std::isxdigit(static_cast<unsigned char>(id[i]))) {
            return false;
        }
    }

    char version = id[14];
    if (version < '1' || version > '8') {
        return false;
    }
    char variant = static_cast<char>(std::tolower(static_cast<unsigned char>(id[19])));
    return variant == '8' || variant == '9' || variant == 'a' || variant == 'b';
}

} // namespace shoal::uuid
