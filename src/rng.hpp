#pragma once
#include <cstdint>
#include <cstddef>
#include <limits>

// Compile-time tag hashing (FNV-1a) for readable domain separation.
// Used to derive independent RNG streams from one run seed.
//
// Example:
//   RNG tagRng(hashCombine(seed, "ROOMTAGS"_tag));
constexpr uint32_t fnv1a32(const char* data, std::size_t len) {
    uint32_t h = 2166136261u; // FNV offset basis
    for (std::size_t i = 0; i < len; ++i) {
        h ^= static_cast<uint8_t>(static_cast<unsigned char>(data[i]));
        h *= 16777619u; // FNV prime
    }
    return h;
}

constexpr uint32_t operator"" _tag(const char* str, std::size_t len) {
    return fnv1a32(str, len);
}

// Simple, fast RNG with deterministic cross-platform behavior.
// Not cryptographically secure. Every generation run owns its own instance.
struct RNG {
    uint32_t state;

    explicit RNG(uint32_t seed = 0x12345678u) : state(seed ? seed : 0x12345678u) {}

    uint32_t nextU32() {
        // xorshift32
        uint32_t x = state;
        x ^= x << 13;
        x ^= x >> 17;
        x ^= x << 5;
        state = x;
        return x;
    }

    int range(int lo, int hiInclusive) {
        if (hiInclusive <= lo) return lo;
        uint32_t span = static_cast<uint32_t>(hiInclusive - lo + 1);
        return lo + static_cast<int>(nextU32() % span);
    }

    // [lo, hiExclusive). Returns lo for an empty interval.
    int below(int lo, int hiExclusive) {
        return range(lo, hiExclusive - 1);
    }

    // [0,1) with 53 bits drawn from two outputs, so Bernoulli trials with
    // small probabilities (0.01) are not quantized by float precision.
    double nextDouble() {
        const uint64_t hi = nextU32() >> 5;  // 27 bits
        const uint64_t lo = nextU32() >> 6;  // 26 bits
        return static_cast<double>((hi << 26) | lo) / 9007199254740992.0;
    }

    bool chance(double p) {
        return nextDouble() < p;
    }

    // Percent roll in [0,100), matching "chance out of 100" config values.
    bool percent(int pct) {
        return range(0, 99) < pct;
    }
};

// A tiny integer hash for stable variation.
inline uint32_t hash32(uint32_t x) {
    // Thomas Wang-ish mix
    x ^= x >> 16;
    x *= 0x7feb352du;
    x ^= x >> 15;
    x *= 0x846ca68bu;
    x ^= x >> 16;
    return x;
}

inline uint32_t hashCombine(uint32_t a, uint32_t b) {
    return hash32(a ^ (b + 0x9e3779b9u + (a << 6) + (a >> 2)));
}

// 64-bit FNV-1a accumulator for artifact fingerprints.
struct Fnv1a64 {
    uint64_t h = 14695981039346656037ull;

    void addByte(uint8_t b) {
        h ^= b;
        h *= 1099511628211ull;
    }

    void addU32(uint32_t v) {
        for (int i = 0; i < 4; ++i) addByte(static_cast<uint8_t>((v >> (i * 8)) & 0xFFu));
    }

    void addI32(int32_t v) {
        addU32(static_cast<uint32_t>(v));
    }
};
