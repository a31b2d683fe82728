#pragma once

#include "core/types.hpp"

#include <cmath>

namespace rsim::sim {

struct Vector3 {
    f32 x = 0, y = 0, z = 0;

    Vector3& operator+=(const Vector3& o) { x += o.x; y += o.y; z += o.z; return *this; }
    Vector3& operator-=(const Vector3& o) { x -= o.x; y -= o.y; z -= o.z; return *this; }
    Vector3& operator*=(f32 s) { x *= s; y *= s; z *= s; return *this; }

    f32 length_squared() const { return x * x + y * y + z * z; }
    f32 length() const { return std::sqrt(length_squared()); }
};

inline Vector3 operator+(Vector3 a, const Vector3& b) { return a += b; }
inline Vector3 operator-(Vector3 a, const Vector3& b) { return a -= b; }
inline Vector3 operator-(const Vector3& a) { return {-a.x, -a.y, -a.z}; }
inline Vector3 operator*(Vector3 a, f32 s) { return a *= s; }
inline Vector3 operator*(f32 s, Vector3 a) { return a *= s; }
inline Vector3 operator/(const Vector3& a, f32 s) { return {a.x / s, a.y / s, a.z / s}; }

inline bool operator==(const Vector3& a, const Vector3& b) {
    return a.x == b.x && a.y == b.y && a.z == b.z;
}

inline f32 dot(const Vector3& a, const Vector3& b) {
    return a.x * b.x + a.y * b.y + a.z * b.z;
}

inline Vector3 cross(const Vector3& a, const Vector3& b) {
    return {a.y * b.z - a.z * b.y, a.z * b.x - a.x * b.z,
            a.x * b.y - a.y * b.x};
}

/// Direction used whenever a normalisation has nothing to work with.
constexpr Vector3 FORWARD_AXIS{0, 0, -1};
constexpr Vector3 UP_AXIS{0, 1, 0};

constexpr f32 NORMALIZE_EPSILON = 1e-6f;

/// Unit vector along v, or `fallback` when |v| is (near) zero.
inline Vector3 normalize_or(const Vector3& v, const Vector3& fallback) {
    f32 len = v.length();
    if (len < NORMALIZE_EPSILON) return fallback;
    return v / len;
}

struct Quaternion {
    f32 x = 0, y = 0, z = 0, w = 1;

    static Quaternion rotation_x(f32 radians) {
        return {std::sin(radians * 0.5f), 0, 0, std::cos(radians * 0.5f)};
    }

    static Quaternion rotation_y(f32 radians) {
        return {0, std::sin(radians * 0.5f), 0, std::cos(radians * 0.5f)};
    }

    /// Orientation whose -Z axis points along `direction` with +Y kept as
    /// close to `up` as possible.
    static Quaternion look_to(const Vector3& direction, const Vector3& up = UP_AXIS);

    Quaternion normalized() const {
        f32 len = std::sqrt(x * x + y * y + z * z + w * w);
        if (len < NORMALIZE_EPSILON) return {};
        return {x / len, y / len, z / len, w / len};
    }

    Vector3 rotate(const Vector3& v) const {
        // v' = v + 2w(q x v) + 2(q x (q x v))
        Vector3 q{x, y, z};
        Vector3 t = cross(q, v) * 2.0f;
        return v + t * w + cross(q, t);
    }
};

inline Quaternion operator*(const Quaternion& a, const Quaternion& b) {
    return {
        a.w * b.x + a.x * b.w + a.y * b.z - a.z * b.y,
        a.w * b.y - a.x * b.z + a.y * b.w + a.z * b.x,
        a.w * b.z + a.x * b.y - a.y * b.x + a.z * b.w,
        a.w * b.w - a.x * b.x - a.y * b.y - a.z * b.z,
    };
}

inline Quaternion Quaternion::look_to(const Vector3& direction,
                                      const Vector3& up) {
    Vector3 back = -normalize_or(direction, FORWARD_AXIS);
    Vector3 right = cross(up, back);
    if (right.length_squared() < NORMALIZE_EPSILON) {
        // Looking straight up/down: pick any perpendicular
        right = cross(Vector3{1, 0, 0}, back);
        if (right.length_squared() < NORMALIZE_EPSILON)
            right = cross(Vector3{0, 0, 1}, back);
    }
    right = normalize_or(right, Vector3{1, 0, 0});
    Vector3 new_up = cross(back, right);

    // Rotation matrix columns: right, new_up, back
    f32 m00 = right.x, m01 = new_up.x, m02 = back.x;
    f32 m10 = right.y, m11 = new_up.y, m12 = back.y;
    f32 m20 = right.z, m21 = new_up.z, m22 = back.z;

    Quaternion q;
    f32 trace = m00 + m11 + m22;
    if (trace > 0) {
        f32 s = std::sqrt(trace + 1.0f) * 2.0f;
        q.w = 0.25f * s;
        q.x = (m21 - m12) / s;
        q.y = (m02 - m20) / s;
        q.z = (m10 - m01) / s;
    } else if (m00 > m11 && m00 > m22) {
        f32 s = std::sqrt(1.0f + m00 - m11 - m22) * 2.0f;
        q.w = (m21 - m12) / s;
        q.x = 0.25f * s;
        q.y = (m01 + m10) / s;
        q.z = (m02 + m20) / s;
    } else if (m11 > m22) {
        f32 s = std::sqrt(1.0f + m11 - m00 - m22) * 2.0f;
        q.w = (m02 - m20) / s;
        q.x = (m01 + m10) / s;
        q.y = 0.25f * s;
        q.z = (m12 + m21) / s;
    } else {
        f32 s = std::sqrt(1.0f + m22 - m00 - m11) * 2.0f;
        q.w = (m10 - m01) / s;
        q.x = (m02 + m20) / s;
        q.y = (m12 + m21) / s;
        q.z = 0.25f * s;
    }
    return q.normalized();
}

constexpr f32 PI = 3.14159265358979323846f;

inline f32 deg_to_rad(f32 deg) { return deg * (PI / 180.0f); }
inline f32 rad_to_deg(f32 rad) { return rad * (180.0f / PI); }

} // namespace rsim::sim
