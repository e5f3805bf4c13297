#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <cmath>

#include <kartsim/math.hpp>

using Catch::Approx;
using namespace kartsim;

TEST_CASE("detmath trig matches libm closely") {
  for (int i = -200; i <= 200; ++i) {
    const double x = i * 0.05;
    REQUIRE(detmath::sin(x) == Approx(std::sin(x)).margin(1e-12));
    REQUIRE(detmath::cos(x) == Approx(std::cos(x)).margin(1e-12));
  }
  for (int i = -100; i <= 100; ++i) {
    const double x = i * 0.01;
    REQUIRE(detmath::asin(x) == Approx(std::asin(x)).margin(1e-12));
    REQUIRE(detmath::acos(x) == Approx(std::acos(x)).margin(1e-12));
  }
}

TEST_CASE("detmath acos clamps out-of-range input") {
  REQUIRE(detmath::acos(1.0000001) == Approx(0.0).margin(1e-12));
  REQUIRE(detmath::acos(-1.0000001) == Approx(kPI).margin(1e-12));
}

TEST_CASE("Vec3 helpers") {
  SECTION("normalizing zero stays zero") {
    REQUIRE(normalized(Vec3{}) == Vec3{});
    REQUIRE(length(normalized(Vec3{3.0, 0.0, 4.0})) == Approx(1.0));
  }
  SECTION("cross follows the right/up/forward frame") {
    const Vec3 f = cross(kWorldRight, kWorldUp);
    REQUIRE(f == kWorldForward);
  }
  SECTION("clamp_magnitude") {
    const Vec3 v = clamp_magnitude(Vec3{0.0, 0.0, 40.0}, 30.0);
    REQUIRE(v.z == Approx(30.0));
    REQUIRE(clamp_magnitude(Vec3{1.0, 2.0, 2.0}, 30.0) == Vec3{1.0, 2.0, 2.0});
  }
  SECTION("move_towards is bounded by the step") {
    const Vec3 v = move_towards(Vec3{0.0, 0.0, 40.0}, Vec3{0.0, 0.0, 30.0}, 0.25);
    REQUIRE(v.z == Approx(39.75));
    REQUIRE(move_towards(Vec3{0.0, 0.0, 30.1}, Vec3{0.0, 0.0, 30.0}, 0.25) == Vec3{0.0, 0.0, 30.0});
  }
}

TEST_CASE("Quat yaw turns forward toward +x") {
  const Quat q = yaw_rotation(kHalfPI);
  const Vec3 f = q.forward();
  const Vec3 r = q.right();
  REQUIRE(f.x == Approx(1.0));
  REQUIRE(f.z == Approx(0.0).margin(1e-12));
  REQUIRE(r.z == Approx(-1.0));
  REQUIRE(q.up().y == Approx(1.0));
}

TEST_CASE("look_rotation") {
  SECTION("reproduces a yaw") {
    auto q = look_rotation(Vec3{1.0, 0.0, 0.0}, kWorldUp);
    REQUIRE(q.has_value());
    REQUIRE(angle_between(*q, yaw_rotation(kHalfPI)) == Approx(0.0).margin(1e-6));
  }
  SECTION("parallel forward and up has no answer") {
    REQUIRE_FALSE(look_rotation(kWorldUp, kWorldUp).has_value());
    REQUIRE_FALSE(look_rotation(Vec3{}, kWorldUp).has_value());
  }
}

TEST_CASE("angle_between and slerp") {
  const Quat a = Quat::identity();
  const Quat b = yaw_rotation(1.0);
  REQUIRE(angle_between(a, b) == Approx(1.0).margin(1e-9));

  const Quat mid = slerp(a, b, 0.5);
  REQUIRE(angle_between(mid, yaw_rotation(0.5)) == Approx(0.0).margin(1e-6));

  REQUIRE(angle_between(slerp(a, b, 0.0), a) == Approx(0.0).margin(1e-6));
  REQUIRE(angle_between(slerp(a, b, 1.0), b) == Approx(0.0).margin(1e-6));
  REQUIRE(angle_between(slerp(b, b, 0.3), b) == Approx(0.0).margin(1e-6));
}
