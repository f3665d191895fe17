#pragma once
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <string>

// Integer grid coordinate. y is the vertical (level) axis; flat dungeons keep
// every cell on y = 0 and use (x, z) as the horizontal plane.
struct Vec3i {
    int x = 0;
    int y = 0;
    int z = 0;
};

inline bool operator==(const Vec3i& a, const Vec3i& b) {
    return a.x == b.x && a.y == b.y && a.z == b.z;
}

inline bool operator!=(const Vec3i& a, const Vec3i& b) {
    return !(a == b);
}

// Lexicographic (x, y, z). Used for ordered maps in the output artifact.
inline bool operator<(const Vec3i& a, const Vec3i& b) {
    if (a.x != b.x) return a.x < b.x;
    if (a.y != b.y) return a.y < b.y;
    return a.z < b.z;
}

inline Vec3i operator+(const Vec3i& a, const Vec3i& b) {
    return {a.x + b.x, a.y + b.y, a.z + b.z};
}

inline Vec3i operator-(const Vec3i& a, const Vec3i& b) {
    return {a.x - b.x, a.y - b.y, a.z - b.z};
}

inline Vec3i operator*(const Vec3i& a, int s) {
    return {a.x * s, a.y * s, a.z * s};
}

struct Vec3f {
    float x = 0.0f;
    float y = 0.0f;
    float z = 0.0f;
};

inline Vec3f toVec3f(const Vec3i& v) {
    return {static_cast<float>(v.x), static_cast<float>(v.y), static_cast<float>(v.z)};
}

inline float length(const Vec3f& v) {
    return std::sqrt(v.x * v.x + v.y * v.y + v.z * v.z);
}

inline float distance(const Vec3f& a, const Vec3f& b) {
    return length({a.x - b.x, a.y - b.y, a.z - b.z});
}

inline float distance(const Vec3i& a, const Vec3i& b) {
    return distance(toVec3f(a), toVec3f(b));
}

// Returns the zero vector for zero-length input.
inline Vec3f normalized(const Vec3f& v) {
    const float len = length(v);
    if (len <= 0.0f) return {};
    return {v.x / len, v.y / len, v.z / len};
}

inline float dot(const Vec3f& a, const Vec3f& b) {
    return a.x * b.x + a.y * b.y + a.z * b.z;
}

struct Color {
    uint8_t r = 255;
    uint8_t g = 255;
    uint8_t b = 255;
    uint8_t a = 255;
};

inline int sign(int v) {
    return (v > 0) - (v < 0);
}

inline int clampi(int v, int lo, int hi) {
    if (v < lo) return lo;
    if (v > hi) return hi;
    return v;
}

inline std::string toString(const Vec3i& p) {
    return "[" + std::to_string(p.x) + "," + std::to_string(p.y) + "," + std::to_string(p.z) + "]";
}
