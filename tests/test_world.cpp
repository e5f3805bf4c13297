#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <cmath>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <vector>

#include <kartsim/config.hpp>
#include <kartsim/script.hpp>
#include <kartsim/world.hpp>

using Catch::Approx;
using namespace kartsim;

namespace {

std::shared_ptr<const Arena> preset(ArenaPreset p) {
  return std::make_shared<const Arena>(Arena::make_preset(p));
}

// One big asphalt sheet, no obstacles.
std::shared_ptr<const Arena> open_lot() {
  auto a = std::make_shared<Arena>();
  a->add_ground_rect(-500.0, -500.0, 500.0, 500.0, 0.0, *a->surface_id("asphalt"));
  return a;
}

InputMap scripted(const KartWorld& w) {
  InputMap m;
  for (std::size_t i = 0; i < w.kart_count(); ++i) {
    const KartId id = w.kart_by_index(i)->id;
    m[id] = scripted_input(id, w.tick());
  }
  return m;
}

KartInput throttle(double t, double steering = 0.0, bool drift = false) {
  KartInput in;
  in.throttle = t;
  in.steering = steering;
  in.drift_pressed = drift;
  in.drift_held = drift;
  return in;
}

} // namespace

TEST_CASE("World construction is validated") {
  REQUIRE_THROWS_AS(KartWorld(nullptr), std::invalid_argument);
  REQUIRE_THROWS_AS(KartWorld(preset(ArenaPreset::Flat), 0.0), std::invalid_argument);

  KartWorld w(preset(ArenaPreset::Flat));
  REQUIRE(w.dt() == Approx(1.0 / 60.0));
  REQUIRE(w.tick() == 0);
  REQUIRE(w.kart_count() == 0);
}

TEST_CASE("Invalid stats are rejected and logged") {
  std::ostringstream os;
  KartWorld w(preset(ArenaPreset::Flat), kDefaultTickDt,
              std::make_shared<OstreamLogSink>(os, LogLevel::Debug));

  KartStats bad = default_kart_stats();
  bad.max_speed = 0.0;
  REQUIRE_THROWS_AS(w.add_kart(bad), std::invalid_argument);
  REQUIRE(w.kart_count() == 0);
  REQUIRE(os.str().find("[error]") != std::string::npos);
  REQUIRE(os.str().find("max_speed") != std::string::npos);

  w.add_kart(default_kart_stats());
  REQUIRE(os.str().find("[info ] kart 0 spawned") != std::string::npos);
}

TEST_CASE("Kart ids are stable across removal") {
  KartWorld w(preset(ArenaPreset::Flat));
  REQUIRE(w.add_kart(default_kart_stats()) == 0);
  REQUIRE(w.add_kart(default_kart_stats()) == 1);
  REQUIRE(w.add_kart(default_kart_stats()) == 2);

  REQUIRE(w.remove_kart(1));
  REQUIRE_FALSE(w.remove_kart(1));
  REQUIRE(w.kart_by_id(1) == nullptr);
  REQUIRE(w.add_kart(default_kart_stats()) == 3);

  REQUIRE(w.kart_count() == 3);
  REQUIRE(w.kart_by_index(0)->id == 0);
  REQUIRE(w.kart_by_index(1)->id == 2);
  REQUIRE(w.kart_by_index(2)->id == 3);
  REQUIRE(w.kart_by_index(3) == nullptr);

  REQUIRE_FALSE(w.start_boost(1, *boost_by_key("mini")));
  REQUIRE_FALSE(w.interrupt_boost(1));
  REQUIRE_FALSE(w.respawn(1));
}

TEST_CASE("Karts take arena spawn slots in order") {
  const auto arena = preset(ArenaPreset::TestTrack);
  KartWorld w(arena);
  const auto& spawns = arena->spawns();
  for (std::size_t i = 0; i <= spawns.size(); ++i) w.add_kart(default_kart_stats());

  REQUIRE(w.kart_by_index(1)->vehicle.position == spawns[1].position);
  // Wraps around once the slots run out
  REQUIRE(w.kart_by_index(spawns.size())->vehicle.position == spawns[0].position);

  KartWorld bare(std::make_shared<const Arena>());
  bare.add_kart(default_kart_stats());
  REQUIRE(bare.kart_by_index(0)->vehicle.position == Vec3{});
}

TEST_CASE("Same inputs give the same world") {
  KartWorld a(preset(ArenaPreset::TestTrack));
  KartWorld b(preset(ArenaPreset::TestTrack));
  for (int i = 0; i < 4; ++i) {
    a.add_kart(default_kart_stats());
    b.add_kart(default_kart_stats());
  }
  REQUIRE(a.checksum() == b.checksum());

  for (int t = 0; t < 600; ++t) {
    a.step(scripted(a));
    b.step(scripted(b));
    REQUIRE(a.checksum() == b.checksum());
  }
  REQUIRE(a.tick() == 600);
  REQUIRE(a.sim_time() == Approx(10.0));

  InputMap other = scripted(b);
  other[0].steering = -other[0].steering + 0.5;
  a.step(scripted(a));
  b.step(other);
  REQUIRE(a.checksum() != b.checksum());
}

TEST_CASE("A missing input is a neutral input") {
  KartWorld a(preset(ArenaPreset::Flat));
  a.add_kart(default_kart_stats());
  KartWorld b = a;

  for (int t = 0; t < 30; ++t) {
    a.step();
    b.step(InputMap{{0, KartInput{}}});
  }
  REQUIRE(a.checksum() == b.checksum());
}

TEST_CASE("A dropped kart settles on the ground") {
  KartWorld w(preset(ArenaPreset::Flat));
  const KartId id = w.add_kart(default_kart_stats(), SpawnPoint{Vec3{0.0, 1.0, 0.0}, 0.0});

  for (int t = 0; t < 120; ++t) w.step();
  const Kart& k = *w.kart_by_id(id);
  REQUIRE(k.vehicle.grounded());
  REQUIRE(k.vehicle.grounded_wheels == 4);
  REQUIRE(k.vehicle.air_time == 0.0);
  REQUIRE(k.vehicle.position.y == Approx(0.5625).margin(1e-3));
  REQUIRE(k.vehicle.rotation.up().y == Approx(1.0).margin(1e-6));
}

TEST_CASE("Throttle drives the kart along its heading") {
  KartWorld w(preset(ArenaPreset::Flat));
  const KartId id = w.add_kart(default_kart_stats(), SpawnPoint{Vec3{0.0, 0.5625, 0.0}, 0.0});

  for (int t = 0; t < 60; ++t) w.step(InputMap{{id, throttle(1.0)}});
  const VehicleState& v = w.kart_by_id(id)->vehicle;
  REQUIRE(v.velocity.z > 5.0);
  REQUIRE(v.position.z > 2.0);
  REQUIRE(v.position.x == Approx(0.0).margin(1e-9));

  SECTION("respawn puts it back at rest") {
    REQUIRE(w.respawn(id));
    const VehicleState& r = w.kart_by_id(id)->vehicle;
    REQUIRE(r.position == Vec3{0.0, 0.5625, 0.0});
    REQUIRE(r.velocity == Vec3{});
  }
  SECTION("respawn request skips the tick's physics") {
    KartInput in = throttle(1.0);
    in.respawn_requested = true;
    w.step(InputMap{{id, in}});
    const VehicleState& r = w.kart_by_id(id)->vehicle;
    REQUIRE(r.position == Vec3{0.0, 0.5625, 0.0});
    REQUIRE(r.velocity == Vec3{});
    REQUIRE(w.tick() == 61);
  }
}

TEST_CASE("External boosts report once") {
  KartWorld w(preset(ArenaPreset::Flat));
  const KartId id = w.add_kart(default_kart_stats());

  REQUIRE(w.start_boost(id, *boost_by_key("pad")));
  REQUIRE(w.events().size() == 1);
  REQUIRE(w.events()[0].type == KartEventType::BoostStarted);
  REQUIRE(w.kart_by_id(id)->boost.is_active());

  w.step();
  REQUIRE(w.events().empty());
  REQUIRE(w.kart_by_id(id)->boost.is_active());

  REQUIRE(w.interrupt_boost(id));
  REQUIRE_FALSE(w.kart_by_id(id)->boost.is_active());
}

TEST_CASE("A held drift pays out a boost on release") {
  KartWorld w(open_lot());
  const KartId id = w.add_kart(default_kart_stats(), SpawnPoint{Vec3{0.0, 0.5625, 0.0}, 0.0});
  std::vector<KartEvent> seen;

  for (int t = 0; t < 180; ++t) w.step(InputMap{{id, throttle(1.0)}});
  REQUIRE(length(w.kart_by_id(id)->vehicle.velocity) > 8.0);

  w.step(InputMap{{id, throttle(1.0, 0.6, true)}});
  REQUIRE(w.kart_by_id(id)->drift.direction == 1);

  KartInput hold = throttle(1.0, 0.6);
  hold.drift_held = true;
  for (int t = 0; t < 150; ++t) {
    w.step(InputMap{{id, hold}});
    seen.insert(seen.end(), w.events().begin(), w.events().end());
    REQUIRE(w.kart_by_id(id)->drift.drifting());
  }
  REQUIRE(w.kart_by_id(id)->drift_boost.level == 1);

  w.step(InputMap{{id, throttle(1.0, 0.6, true)}});
  seen.insert(seen.end(), w.events().begin(), w.events().end());

  const Kart& k = *w.kart_by_id(id);
  REQUIRE_FALSE(k.drift.drifting());
  REQUIRE(k.boost.is_active());
  REQUIRE(k.boost.active->key == "mini");

  REQUIRE(seen.size() == 3);
  REQUIRE(seen[0].type == KartEventType::DriftBoostCharged);
  REQUIRE(seen[0].level == 1);
  REQUIRE(seen[1].type == KartEventType::BoostStarted);
  REQUIRE(seen[2].type == KartEventType::DriftBoostApplied);
  REQUIRE(seen[2].level == 1);
}

TEST_CASE("Overlapping karts push each other apart") {
  KartWorld w(preset(ArenaPreset::Flat));
  const KartId a = w.add_kart(default_kart_stats(), SpawnPoint{Vec3{-0.5, 0.5625, 0.0}, 0.0});
  const KartId b = w.add_kart(default_kart_stats(), SpawnPoint{Vec3{0.5, 0.5625, 0.0}, 0.0});

  w.step();
  // Two 0.9 spheres one apart overlap by 0.8
  REQUIRE(w.kart_by_id(a)->vehicle.compensation.x == Approx(-0.8));
  REQUIRE(w.kart_by_id(b)->vehicle.compensation.x == Approx(0.8));

  w.step();
  REQUIRE(w.kart_by_id(a)->vehicle.position.x < -1.0);
  REQUIRE(w.kart_by_id(b)->vehicle.position.x > 1.0);
}

TEST_CASE("Powerup presses are forwarded for one tick") {
  KartWorld w(preset(ArenaPreset::Flat));
  w.add_kart(default_kart_stats());
  w.add_kart(default_kart_stats());
  w.add_kart(default_kart_stats());

  KartInput fire;
  fire.powerup_pressed = true;
  w.step(InputMap{{2, fire}, {0, fire}});
  const std::vector<KartId> expected{0, 2};
  REQUIRE(w.powerup_requests() == expected);

  w.step();
  REQUIRE(w.powerup_requests().empty());
}
