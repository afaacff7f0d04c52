// Minimal 2D vector for positions, velocities and impulses.
#pragma once

#include <cmath>

namespace Surge {

struct Vec2 {
    float x{0.0f};
    float y{0.0f};

    Vec2() = default;
    Vec2(float xIn, float yIn) : x(xIn), y(yIn) {}

    Vec2& operator+=(const Vec2& rhs) {
        x += rhs.x;
        y += rhs.y;
        return *this;
    }

    float length() const { return std::sqrt(x * x + y * y); }
};

inline Vec2 operator*(const Vec2& v, float scalar) { return Vec2{v.x * scalar, v.y * scalar}; }
inline Vec2 operator+(const Vec2& a, const Vec2& b) { return Vec2{a.x + b.x, a.y + b.y}; }
inline Vec2 operator-(const Vec2& a, const Vec2& b) { return Vec2{a.x - b.x, a.y - b.y}; }

inline float distance(const Vec2& a, const Vec2& b) { return (b - a).length(); }

// Angle in radians of the ray from `from` towards `to`.
inline float angleBetween(const Vec2& from, const Vec2& to) { return std::atan2(to.y - from.y, to.x - from.x); }

inline Vec2 fromAngle(float radians, float magnitude) {
    return Vec2{std::cos(radians) * magnitude, std::sin(radians) * magnitude};
}

// Mirrors `v` about a unit surface normal.
inline Vec2 reflect(const Vec2& v, const Vec2& normal) {
    const float d = 2.0f * (v.x * normal.x + v.y * normal.y);
    return Vec2{v.x - d * normal.x, v.y - d * normal.y};
}

}  // namespace Surge
