#pragma once
#include <algorithm>
#include <cmath>
#include <numbers>
#include <optional>

namespace kartsim {

// Constant naming convention (kCamelCase)
inline constexpr double kPI       = std::numbers::pi_v<double>;
inline constexpr double kTAU      = 2.0 * kPI;
inline constexpr double kHalfPI   = 0.5 * kPI;
inline constexpr double kDegToRad = kPI / 180.0;
inline constexpr double kRadToDeg = 180.0 / kPI;

// Below this squared length a vector is treated as zero and never normalized.
inline constexpr double kZeroLengthSq = 1e-12;

// Trigonometry for the simulation path. libm implementations differ between
// platforms in the last bits, so these are evaluated with a fixed sequence of
// + - * / and sqrt only (sqrt is correctly rounded under IEEE 754).
namespace detmath {

// Taylor series on [-pi/2, pi/2], abs error < 1e-13.
inline double sin(double x) {
  const double k = std::floor(x / kTAU + 0.5);
  double r = x - k * kTAU;                  // [-pi, pi]
  if (r > kHalfPI)  r = kPI - r;
  if (r < -kHalfPI) r = -kPI - r;
  const double r2 = r * r;
  // Horner form of r - r^3/3! + ... - r^19/19!
  double p = -1.0 / 121645100408832000.0;   // -1/19!
  p = p * r2 + 1.0 / 355687428096000.0;     // 1/17!
  p = p * r2 - 1.0 / 1307674368000.0;       // -1/15!
  p = p * r2 + 1.0 / 6227020800.0;          // 1/13!
  p = p * r2 - 1.0 / 39916800.0;            // -1/11!
  p = p * r2 + 1.0 / 362880.0;              // 1/9!
  p = p * r2 - 1.0 / 5040.0;                // -1/7!
  p = p * r2 + 1.0 / 120.0;                 // 1/5!
  p = p * r2 - 1.0 / 6.0;                   // -1/3!
  p = p * r2 + 1.0;
  return r * p;
}

inline double cos(double x) { return sin(x + kHalfPI); }

// Series for asin on [-0.5, 0.5]; fixed 26 terms.
inline double asin_small_(double x) {
  const double x2 = x * x;
  double term = x;
  double sum = x;
  for (int n = 0; n < 26; ++n) {
    const double a = 2.0 * n + 1.0;
    term *= x2 * (a * a) / ((a + 1.0) * (a + 2.0));
    sum += term;
  }
  return sum;
}

inline double asin(double x) {
  x = std::clamp(x, -1.0, 1.0);
  if (x > 0.5)  return kHalfPI - 2.0 * asin_small_(std::sqrt((1.0 - x) * 0.5));
  if (x < -0.5) return -kHalfPI + 2.0 * asin_small_(std::sqrt((1.0 + x) * 0.5));
  return asin_small_(x);
}

inline double acos(double x) { return kHalfPI - asin(x); }

} // namespace detmath

inline double clamp01(double x) {
  return x < 0.0 ? 0.0 : (x > 1.0 ? 1.0 : x);
}

inline double lerp(double a, double b, double t) { return a + (b - a) * t; }

// -1, 0 or +1
inline double sign(double x) {
  return x > 0.0 ? 1.0 : (x < 0.0 ? -1.0 : 0.0);
}

struct Vec3 {
  double x{};
  double y{};
  double z{};

  Vec3& operator+=(const Vec3& o) { x += o.x; y += o.y; z += o.z; return *this; }
  Vec3& operator-=(const Vec3& o) { x -= o.x; y -= o.y; z -= o.z; return *this; }
  Vec3& operator*=(double s)      { x *= s; y *= s; z *= s; return *this; }

  bool operator==(const Vec3&) const = default;
};

inline Vec3 operator+(Vec3 a, const Vec3& b) { return a += b; }
inline Vec3 operator-(Vec3 a, const Vec3& b) { return a -= b; }
inline Vec3 operator-(const Vec3& a)         { return Vec3{-a.x, -a.y, -a.z}; }
inline Vec3 operator*(Vec3 a, double s)      { return a *= s; }
inline Vec3 operator*(double s, Vec3 a)      { return a *= s; }
inline Vec3 operator/(const Vec3& a, double s) { return Vec3{a.x / s, a.y / s, a.z / s}; }

inline double dot(const Vec3& a, const Vec3& b) { return a.x * b.x + a.y * b.y + a.z * b.z; }

inline Vec3 cross(const Vec3& a, const Vec3& b) {
  return Vec3{a.y * b.z - a.z * b.y,
              a.z * b.x - a.x * b.z,
              a.x * b.y - a.y * b.x};
}

inline double length_sq(const Vec3& v) { return dot(v, v); }
inline double length(const Vec3& v)    { return std::sqrt(dot(v, v)); }

// Zero vector stays zero.
inline Vec3 normalized(const Vec3& v) {
  const double l2 = length_sq(v);
  if (l2 <= kZeroLengthSq) return Vec3{};
  return v / std::sqrt(l2);
}

inline Vec3 lerp(const Vec3& a, const Vec3& b, double t) { return a + (b - a) * t; }

inline Vec3 clamp_magnitude(const Vec3& v, double max_len) {
  const double l2 = length_sq(v);
  if (l2 <= max_len * max_len) return v;
  return v * (max_len / std::sqrt(l2));
}

// Moves `from` toward `to` by at most `max_delta` (units of length).
inline Vec3 move_towards(const Vec3& from, const Vec3& to, double max_delta) {
  const Vec3 d = to - from;
  const double l2 = length_sq(d);
  if (l2 <= max_delta * max_delta || l2 <= kZeroLengthSq) return to;
  return from + d * (max_delta / std::sqrt(l2));
}

// y is up, x is right, z is forward.
inline constexpr Vec3 kWorldUp{0.0, 1.0, 0.0};
inline constexpr Vec3 kWorldDown{0.0, -1.0, 0.0};
inline constexpr Vec3 kWorldRight{1.0, 0.0, 0.0};
inline constexpr Vec3 kWorldForward{0.0, 0.0, 1.0};

struct Quat {
  double w{1.0};
  double x{};
  double y{};
  double z{};

  static Quat identity() { return Quat{}; }

  // Positive angle about +y turns +z toward +x.
  static Quat from_axis_angle(const Vec3& axis, double angle_rad) {
    const Vec3 n = normalized(axis);
    const double half = angle_rad * 0.5;
    const double s = detmath::sin(half);
    return Quat{detmath::cos(half), n.x * s, n.y * s, n.z * s};
  }

  Quat operator*(const Quat& q) const {
    return Quat{
      w*q.w - x*q.x - y*q.y - z*q.z,
      w*q.x + x*q.w + y*q.z - z*q.y,
      w*q.y - x*q.z + y*q.w + z*q.x,
      w*q.z + x*q.y - y*q.x + z*q.w
    };
  }

  Vec3 rotate(const Vec3& v) const {
    const Vec3 u{x, y, z};
    return u * (2.0 * dot(u, v))
         + v * (w*w - dot(u, u))
         + cross(u, v) * (2.0 * w);
  }

  Vec3 forward() const { return rotate(kWorldForward); }
  Vec3 right() const   { return rotate(kWorldRight); }
  Vec3 up() const      { return rotate(kWorldUp); }

  bool operator==(const Quat&) const = default;
};

inline double dot(const Quat& a, const Quat& b) {
  return a.w*b.w + a.x*b.x + a.y*b.y + a.z*b.z;
}

inline Quat normalized(const Quat& q) {
  const double l2 = dot(q, q);
  if (l2 <= kZeroLengthSq) return Quat::identity();
  const double inv = 1.0 / std::sqrt(l2);
  return Quat{q.w * inv, q.x * inv, q.y * inv, q.z * inv};
}

// Rotation whose forward axis is `forward` and whose up axis is as close to
// `up` as possible. nullopt when the two are (nearly) parallel or zero.
inline std::optional<Quat> look_rotation(const Vec3& forward, const Vec3& up) {
  const Vec3 f = normalized(forward);
  const Vec3 r = normalized(cross(up, f));
  if (length_sq(f) <= kZeroLengthSq || length_sq(r) <= kZeroLengthSq) return std::nullopt;
  const Vec3 u = cross(f, r);

  // Columns of the rotation matrix are r, u, f.
  const double trace = r.x + u.y + f.z;
  Quat q;
  if (trace > 0.0) {
    const double s = std::sqrt(trace + 1.0) * 2.0;
    q = Quat{0.25 * s, (u.z - f.y) / s, (f.x - r.z) / s, (r.y - u.x) / s};
  } else if (r.x > u.y && r.x > f.z) {
    const double s = std::sqrt(1.0 + r.x - u.y - f.z) * 2.0;
    q = Quat{(u.z - f.y) / s, 0.25 * s, (u.x + r.y) / s, (f.x + r.z) / s};
  } else if (u.y > f.z) {
    const double s = std::sqrt(1.0 + u.y - r.x - f.z) * 2.0;
    q = Quat{(f.x - r.z) / s, (u.x + r.y) / s, 0.25 * s, (f.y + u.z) / s};
  } else {
    const double s = std::sqrt(1.0 + f.z - r.x - u.y) * 2.0;
    q = Quat{(r.y - u.x) / s, (f.x + r.z) / s, (f.y + u.z) / s, 0.25 * s};
  }
  return normalized(q);
}

// Smallest angle (radians) rotating a onto b.
inline double angle_between(const Quat& a, const Quat& b) {
  const double d = std::min(std::abs(dot(a, b)), 1.0);
  return 2.0 * detmath::acos(d);
}

inline Quat slerp(const Quat& a, const Quat& b, double t) {
  double cos_half = dot(a, b);
  Quat end = b;
  if (cos_half < 0.0) {
    end = Quat{-b.w, -b.x, -b.y, -b.z};
    cos_half = -cos_half;
  }
  if (cos_half >= 1.0) return a;

  const double sin_half = std::sqrt(1.0 - cos_half * cos_half);
  if (sin_half < 1e-6) {
    return normalized(Quat{lerp(a.w, end.w, t), lerp(a.x, end.x, t),
                           lerp(a.y, end.y, t), lerp(a.z, end.z, t)});
  }
  const double half = detmath::acos(cos_half);
  const double ra = detmath::sin((1.0 - t) * half) / sin_half;
  const double rb = detmath::sin(t * half) / sin_half;
  return normalized(Quat{a.w * ra + end.w * rb, a.x * ra + end.x * rb,
                         a.y * ra + end.y * rb, a.z * ra + end.z * rb});
}

// Heading about world up; 0 faces +z, positive turns toward +x.
inline Quat yaw_rotation(double heading_rad) {
  return Quat::from_axis_angle(kWorldUp, heading_rad);
}

} // namespace kartsim
