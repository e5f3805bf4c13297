#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>

#include <kartsim/surface.hpp>
#include <kartsim/vehicle.hpp>

using Catch::Approx;
using namespace kartsim;

namespace {

const SurfaceDefinition kAsphalt{"asphalt", 1.0, 1.0, 1.0, false};
const SurfaceDefinition kGrass{"grass", 0.6, 0.6, 0.8, true};
const SurfaceDefinition kIce{"ice", 0.15, 1.0, 0.6, false};

WheelContact contact(const SurfaceDefinition& s, const Vec3& point) {
  WheelContact w;
  w.grounded = true;
  w.point = point;
  w.normal = kWorldUp;
  w.compression = 0.2;
  w.surface = &s;
  return w;
}

WheelContacts all_on(const SurfaceDefinition& s) {
  return {contact(s, Vec3{-0.6, 0.0, 0.8}), contact(s, Vec3{0.6, 0.0, 0.8}),
          contact(s, Vec3{-0.6, 0.0, -0.8}), contact(s, Vec3{0.6, 0.0, -0.8})};
}

} // namespace

TEST_CASE("aggregate_surface uses grounded+1 and full wheel count denominators") {
  const Vec3 pos{0.0, 0.5, 0.0};
  const SurfaceSample s = aggregate_surface(all_on(kAsphalt), pos);

  REQUIRE(s.grounded_wheels == 4);
  REQUIRE(s.offroad_wheels == 0);
  REQUIRE(s.normal.y == Approx(4.0 / 5.0));
  REQUIRE(s.speed == Approx(4.0 / 5.0));
  REQUIRE(s.handling == Approx(4.0 / 5.0));
  REQUIRE(s.friction == Approx(1.0));
  // Mean offset (-0.5 per wheel) over five
  REQUIRE(s.point.y == Approx(0.5 - 4.0 * 0.5 / 5.0));
  REQUIRE(s.point.x == Approx(0.0).margin(1e-12));
}

TEST_CASE("aggregate_surface with partial contact") {
  WheelContacts w{};
  w[0] = contact(kIce, Vec3{-0.6, 0.0, 0.8});
  w[3] = contact(kIce, Vec3{0.6, 0.0, -0.8});

  const SurfaceSample s = aggregate_surface(w, Vec3{0.0, 0.5, 0.0});
  REQUIRE(s.grounded_wheels == 2);
  REQUIRE(s.friction == Approx(2.0 * 0.15 / 4.0));
  REQUIRE(s.speed == Approx(2.0 * 1.0 / 3.0));
  REQUIRE(s.handling == Approx(2.0 * 0.6 / 3.0));
  REQUIRE(s.normal.y == Approx(2.0 / 3.0));
}

TEST_CASE("aggregate_surface with no contact is all zero") {
  const Vec3 pos{3.0, 7.0, -2.0};
  const SurfaceSample s = aggregate_surface(WheelContacts{}, pos);
  REQUIRE(s.grounded_wheels == 0);
  REQUIRE(s.normal == Vec3{});
  REQUIRE(s.point == pos);
  REQUIRE(s.friction == 0.0);
  REQUIRE(s.speed == 0.0);
  REQUIRE(s.handling == 0.0);
}

TEST_CASE("Grounded needs more than one wheel") {
  for (int n = 0; n <= 4; ++n) {
    WheelContacts w{};
    for (int i = 0; i < n; ++i) w[i] = contact(kAsphalt, Vec3{});
    VehicleState v;
    apply_surface(v, aggregate_surface(w, Vec3{}), 1.0 / 60.0);
    REQUIRE(v.grounded_wheels == n);
    REQUIRE(v.grounded() == (n > 1));
  }
}

TEST_CASE("Offroad needs all four wheels offroad") {
  for (int n = 0; n <= 4; ++n) {
    WheelContacts w = all_on(kAsphalt);
    for (int i = 0; i < n; ++i) w[i].surface = &kGrass;
    VehicleState v;
    apply_surface(v, aggregate_surface(w, Vec3{}), 1.0 / 60.0);
    REQUIRE(v.offroad_wheels == n);
    REQUIRE(v.offroad() == (n == 4));
  }
}

TEST_CASE("Air time accumulates at one wheel or fewer and resets on landing") {
  const double dt = 1.0 / 60.0;
  VehicleState v;

  WheelContacts one{};
  one[1] = contact(kAsphalt, Vec3{});
  apply_surface(v, aggregate_surface(one, Vec3{}), dt);
  apply_surface(v, aggregate_surface(WheelContacts{}, Vec3{}), dt);
  REQUIRE(v.air_time == Approx(2.0 * dt));

  apply_surface(v, aggregate_surface(all_on(kAsphalt), Vec3{}), dt);
  REQUIRE(v.air_time == 0.0);
  REQUIRE(v.speed_multiplier == Approx(0.8));
  REQUIRE(v.friction_multiplier == Approx(1.0));
}
