#include "core/math.h"

#include <algorithm>
#include <cmath>

namespace pitchsync::core {

Vec3 operator+(const Vec3& lhs, const Vec3& rhs) {
    return Vec3{.x = lhs.x + rhs.x, .y = lhs.y + rhs.y, .z = lhs.z + rhs.z};
}

Vec3 operator-(const Vec3& lhs, const Vec3& rhs) {
    return Vec3{.x = lhs.x - rhs.x, .y = lhs.y - rhs.y, .z = lhs.z - rhs.z};
}

Vec3 operator-(const Vec3& value) {
    return Vec3{.x = -value.x, .y = -value.y, .z = -value.z};
}

Vec3 operator*(const Vec3& value, float scale) {
    return Vec3{.x = value.x * scale, .y = value.y * scale, .z = value.z * scale};
}

Vec3 operator*(float scale, const Vec3& value) {
    return value * scale;
}

Vec3& operator+=(Vec3& lhs, const Vec3& rhs) {
    lhs = lhs + rhs;
    return lhs;
}

Vec3& operator-=(Vec3& lhs, const Vec3& rhs) {
    lhs = lhs - rhs;
    return lhs;
}

bool operator==(const Vec3& lhs, const Vec3& rhs) {
    return lhs.x == rhs.x && lhs.y == rhs.y && lhs.z == rhs.z;
}

float Dot(const Vec3& lhs, const Vec3& rhs) {
    return lhs.x * rhs.x + lhs.y * rhs.y + lhs.z * rhs.z;
}

Vec3 Cross(const Vec3& lhs, const Vec3& rhs) {
    return Vec3{
        .x = lhs.y * rhs.z - lhs.z * rhs.y,
        .y = lhs.z * rhs.x - lhs.x * rhs.z,
        .z = lhs.x * rhs.y - lhs.y * rhs.x,
    };
}

float Length(const Vec3& value) {
    return std::sqrt(Dot(value, value));
}

float Distance(const Vec3& lhs, const Vec3& rhs) {
    return Length(lhs - rhs);
}

Vec3 Normalize(const Vec3& value) {
    const float length = Length(value);
    if (length <= 1e-6F) {
        return Vec3{};
    }
    return value * (1.0F / length);
}

Vec3 Lerp(const Vec3& from, const Vec3& to, float t) {
    return from + (to - from) * t;
}

Vec3 ClampLength(const Vec3& value, float max_length) {
    const float length = Length(value);
    if (length <= max_length || length <= 1e-6F) {
        return value;
    }
    return value * (max_length / length);
}

Vec3 Hermite(const Vec3& p0, const Vec3& m0, const Vec3& p1, const Vec3& m1, float t) {
    const float t2 = t * t;
    const float t3 = t2 * t;
    const float h00 = 2.0F * t3 - 3.0F * t2 + 1.0F;
    const float h10 = t3 - 2.0F * t2 + t;
    const float h01 = -2.0F * t3 + 3.0F * t2;
    const float h11 = t3 - t2;
    return p0 * h00 + m0 * h10 + p1 * h01 + m1 * h11;
}

Quat operator*(const Quat& lhs, const Quat& rhs) {
    return Quat{
        .w = lhs.w * rhs.w - lhs.x * rhs.x - lhs.y * rhs.y - lhs.z * rhs.z,
        .x = lhs.w * rhs.x + lhs.x * rhs.w + lhs.y * rhs.z - lhs.z * rhs.y,
        .y = lhs.w * rhs.y - lhs.x * rhs.z + lhs.y * rhs.w + lhs.z * rhs.x,
        .z = lhs.w * rhs.z + lhs.x * rhs.y - lhs.y * rhs.x + lhs.z * rhs.w,
    };
}

bool operator==(const Quat& lhs, const Quat& rhs) {
    return lhs.w == rhs.w && lhs.x == rhs.x && lhs.y == rhs.y && lhs.z == rhs.z;
}

Quat Conjugate(const Quat& value) {
    return Quat{.w = value.w, .x = -value.x, .y = -value.y, .z = -value.z};
}

float Dot(const Quat& lhs, const Quat& rhs) {
    return lhs.w * rhs.w + lhs.x * rhs.x + lhs.y * rhs.y + lhs.z * rhs.z;
}

Quat Normalize(const Quat& value) {
    const float length = std::sqrt(Dot(value, value));
    if (length <= 1e-6F) {
        return Quat{};
    }
    const float inverse = 1.0F / length;
    return Quat{
        .w = value.w * inverse,
        .x = value.x * inverse,
        .y = value.y * inverse,
        .z = value.z * inverse,
    };
}

Quat FromAxisAngle(const Vec3& axis, float angle_radians) {
    const Vec3 unit_axis = Normalize(axis);
    const float half_angle = angle_radians * 0.5F;
    const float sine = std::sin(half_angle);
    return Quat{
        .w = std::cos(half_angle),
        .x = unit_axis.x * sine,
        .y = unit_axis.y * sine,
        .z = unit_axis.z * sine,
    };
}

Vec3 Rotate(const Quat& rotation, const Vec3& value) {
    const Vec3 axis{.x = rotation.x, .y = rotation.y, .z = rotation.z};
    const Vec3 t = Cross(axis, value) * 2.0F;
    return value + t * rotation.w + Cross(axis, t);
}

Quat Slerp(const Quat& from, const Quat& to, float t) {
    Quat target = to;
    float cosine = Dot(from, to);
    if (cosine < 0.0F) {
        cosine = -cosine;
        target = Quat{.w = -to.w, .x = -to.x, .y = -to.y, .z = -to.z};
    }

    float from_weight = 1.0F - t;
    float to_weight = t;
    if (cosine < 0.9995F) {
        const float angle = std::acos(std::clamp(cosine, -1.0F, 1.0F));
        const float sine = std::sin(angle);
        from_weight = std::sin((1.0F - t) * angle) / sine;
        to_weight = std::sin(t * angle) / sine;
    }

    return Normalize(Quat{
        .w = from.w * from_weight + target.w * to_weight,
        .x = from.x * from_weight + target.x * to_weight,
        .y = from.y * from_weight + target.y * to_weight,
        .z = from.z * from_weight + target.z * to_weight,
    });
}

float AngleDegrees(const Quat& from, const Quat& to) {
    const float cosine = std::min(std::fabs(Dot(Normalize(from), Normalize(to))), 1.0F);
    return 2.0F * std::acos(cosine) * kRadiansToDegrees;
}

Quat IntegrateAngularVelocity(const Quat& rotation, const Vec3& angular_velocity, float delta_seconds) {
    const float angular_speed = Length(angular_velocity);
    if (angular_speed <= 1e-6F) {
        return rotation;
    }
    const Quat delta = FromAxisAngle(angular_velocity, angular_speed * delta_seconds);
    return Normalize(delta * rotation);
}

float Clamp01(float value) {
    return std::clamp(value, 0.0F, 1.0F);
}

}  // namespace pitchsync::core
