// src/util/key_hash.hpp
#pragma once
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <string>
#include <string_view>

#include <fmt/format.h>

namespace ddattr {

// MurmurHash64A (Austin Appleby, public domain).
inline std::uint64_t murmur64a(const void* key, std::size_t len, std::uint64_t seed) {
    constexpr std::uint64_t m = 0xc6a4a7935bd1e995ULL;
    constexpr int r = 47;

    std::uint64_t h = seed ^ (static_cast<std::uint64_t>(len) * m);
    const auto* data = static_cast<const unsigned char*>(key);
    const std::size_t nblocks = len / 8;

    for (std::size_t i = 0; i < nblocks; ++i) {
        std::uint64_t k;
        std::memcpy(&k, data + i * 8, sizeof(k));
        k *= m;
        k ^= k >> r;
        k *= m;
        h ^= k;
        h *= m;
    }

    const unsigned char* tail = data + nblocks * 8;
    switch (len & 7) {
        case 7: h ^= static_cast<std::uint64_t>(tail[6]) << 48; [[fallthrough]];
        case 6: h ^= static_cast<std::uint64_t>(tail[5]) << 40; [[fallthrough]];
        case 5: h ^= static_cast<std::uint64_t>(tail[4]) << 32; [[fallthrough]];
        case 4: h ^= static_cast<std::uint64_t>(tail[3]) << 24; [[fallthrough]];
        case 3: h ^= static_cast<std::uint64_t>(tail[2]) << 16; [[fallthrough]];
        case 2: h ^= static_cast<std::uint64_t>(tail[1]) << 8;  [[fallthrough]];
        case 1: h ^= static_cast<std::uint64_t>(tail[0]);
                h *= m;
    }

    h ^= h >> r;
    h *= m;
    h ^= h >> r;
    return h;
}

constexpr std::uint64_t key_hash_seed = 0x6464617474720001ULL;

// Fingerprint of a partition key: 16 lowercase hex digits.
inline std::string key_hash(std::string_view key) {
    return fmt::format("{:016x}", murmur64a(key.data(), key.size(), key_hash_seed));
}

}
