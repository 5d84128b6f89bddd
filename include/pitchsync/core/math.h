#pragma once

namespace pitchsync::core {

inline constexpr float kPi = 3.14159265358979323846F;
inline constexpr float kRadiansToDegrees = 180.0F / kPi;
inline constexpr float kDegreesToRadians = kPi / 180.0F;

struct Vec3 final {
    float x = 0.0F;
    float y = 0.0F;
    float z = 0.0F;
};

// Hamilton convention, w is the real part.
struct Quat final {
    float w = 1.0F;
    float x = 0.0F;
    float y = 0.0F;
    float z = 0.0F;
};

Vec3 operator+(const Vec3& lhs, const Vec3& rhs);
Vec3 operator-(const Vec3& lhs, const Vec3& rhs);
Vec3 operator-(const Vec3& value);
Vec3 operator*(const Vec3& value, float scale);
Vec3 operator*(float scale, const Vec3& value);
Vec3& operator+=(Vec3& lhs, const Vec3& rhs);
Vec3& operator-=(Vec3& lhs, const Vec3& rhs);
bool operator==(const Vec3& lhs, const Vec3& rhs);

float Dot(const Vec3& lhs, const Vec3& rhs);
Vec3 Cross(const Vec3& lhs, const Vec3& rhs);
float Length(const Vec3& value);
float Distance(const Vec3& lhs, const Vec3& rhs);
Vec3 Normalize(const Vec3& value);
Vec3 Lerp(const Vec3& from, const Vec3& to, float t);
Vec3 ClampLength(const Vec3& value, float max_length);

// Cubic Hermite spline between p0 and p1 with tangents m0 and m1, t in [0, 1].
Vec3 Hermite(const Vec3& p0, const Vec3& m0, const Vec3& p1, const Vec3& m1, float t);

Quat operator*(const Quat& lhs, const Quat& rhs);
bool operator==(const Quat& lhs, const Quat& rhs);

Quat Conjugate(const Quat& value);
float Dot(const Quat& lhs, const Quat& rhs);
Quat Normalize(const Quat& value);
Quat FromAxisAngle(const Vec3& axis, float angle_radians);
Vec3 Rotate(const Quat& rotation, const Vec3& value);
Quat Slerp(const Quat& from, const Quat& to, float t);

// Smallest angle in degrees that rotates `from` onto `to`.
float AngleDegrees(const Quat& from, const Quat& to);

// Advances an orientation by a world-space angular velocity over delta_seconds.
Quat IntegrateAngularVelocity(const Quat& rotation, const Vec3& angular_velocity, float delta_seconds);

float Clamp01(float value);

}  // namespace pitchsync::core
