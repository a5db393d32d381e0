#pragma once

// Random identifiers for sessions, changes, conflicts and versions.
//
// Internal header — not installed.

#include <cstdint>
#include <mutex>
#include <random>
#include <string>

namespace bimcollab::detail {

// A random RFC 4122 version 4 UUID in canonical text form.
inline auto make_uuid() -> std::string {
    static auto mutex = std::mutex{};
    static auto gen = std::mt19937_64{std::random_device{}()};
    static auto dis = std::uniform_int_distribution<std::uint64_t>{};

    auto high = std::uint64_t{0};
    auto low = std::uint64_t{0};
    {
        auto lock = std::scoped_lock{mutex};
        high = dis(gen);
        low = dis(gen);
    }

    // version nibble 4, variant bits 10
    high = (high & 0xFFFFFFFFFFFF0FFFULL) | 0x0000000000004000ULL;
    low = (low & 0x3FFFFFFFFFFFFFFFULL) | 0x8000000000000000ULL;

    static constexpr char hex_chars[] = "0123456789abcdef";
    auto result = std::string{};
    result.reserve(36);
    auto append = [&](std::uint64_t word, int from_nibble, int to_nibble) {
        for (int i = from_nibble; i < to_nibble; ++i) {
            result.push_back(hex_chars[(word >> (60 - 4 * i)) & 0x0F]);
        }
    };
    append(high, 0, 8);
    result.push_back('-');
    append(high, 8, 12);
    result.push_back('-');
    append(high, 12, 16);
    result.push_back('-');
    append(low, 0, 4);
    result.push_back('-');
    append(low, 4, 16);
    return result;
}

}  // namespace bimcollab::detail
