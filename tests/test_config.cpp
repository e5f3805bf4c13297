#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <sstream>
#include <string>

#include <kartsim/config.hpp>

using Catch::Approx;
using namespace kartsim;

TEST_CASE("Built-in catalogs are present and valid") {
  REQUIRE(surface_catalog().size() == 4);
  REQUIRE(boost_catalog().size() == 4);
  for (const auto& s : surface_catalog()) REQUIRE_FALSE(validate_surface(s).has_value());
  for (const auto& b : boost_catalog())   REQUIRE_FALSE(validate_boost(b).has_value());
  REQUIRE_FALSE(validate_stats(default_kart_stats()).has_value());

  auto grass = surface_by_key("grass");
  REQUIRE(grass.has_value());
  REQUIRE(grass->offroad);
  REQUIRE_FALSE(surface_by_key("lava").has_value());

  auto ultra = boost_by_key("ultra");
  REQUIRE(ultra.has_value());
  REQUIRE(ultra->duration_s > boost_by_key("mini")->duration_s);
}

static std::string surfaces_csv = R"( key , friction , speed , handling , offroad
# comment lines are ignored
asphalt, 1.0, 1.0, 1.0, 0
sand , 0.5 , 0.7 , 0.8 , true
bad_flag, 1.0, 1.0, 1.0, maybe
negative, -1.0, 1.0, 1.0, 0
, , , ,
mud, 0.4, 0.5, 0.5, 1
)";

TEST_CASE("surfaces_from_csv_stream keeps valid rows only") {
  std::istringstream ss(surfaces_csv);
  auto cat = surfaces_from_csv_stream(ss);
  REQUIRE(cat.size() == 3);

  auto sand = surface_by_key_in(cat, "sand");
  REQUIRE(sand.has_value());
  REQUIRE(sand->friction == Approx(0.5));
  REQUIRE(sand->speed == Approx(0.7));
  REQUIRE(sand->handling == Approx(0.8));
  REQUIRE(sand->offroad);

  REQUIRE_FALSE(surface_by_key_in(cat, "bad_flag").has_value());
  REQUIRE_FALSE(surface_by_key_in(cat, "negative").has_value());
  REQUIRE(surface_by_key_in(cat, "mud")->offroad);
}

TEST_CASE("boosts_from_csv_stream parses rows and rejects zero duration") {
  std::istringstream ss("key,duration_s,accel_bonus,max_speed_bonus\n"
                        "rocket,2.0,25,12\n"
                        "dud,0,5,5\n"
                        "short,0.3,4\n");
  auto cat = boosts_from_csv_stream(ss);
  REQUIRE(cat.size() == 1);
  REQUIRE(cat[0].key == "rocket");
  REQUIRE(cat[0].duration_s == Approx(2.0));
  REQUIRE(cat[0].accel_bonus == Approx(25.0));
  REQUIRE(cat[0].max_speed_bonus == Approx(12.0));
}

TEST_CASE("Filesystem loaders report unreadable paths") {
  REQUIRE_FALSE(load_surfaces_csv("/nonexistent/kartsim/surfaces.csv").has_value());
  REQUIRE_FALSE(load_boosts_csv("/nonexistent/kartsim/boosts.csv").has_value());

  std::string err;
  REQUIRE_FALSE(load_kart_stats("/nonexistent/kartsim/kart.csv", boost_catalog(), &err).has_value());
  REQUIRE(err.find("cannot open") != std::string::npos);
}

TEST_CASE("kart_stats_from_stream applies overrides over a base") {
  std::istringstream ss(R"(name,value
key, heavy
max_speed, 26.5
acceleration, 0:14 1:3
wheel_fl, -0.7 -0.25 0.9
drift_boost_1, super
drift_min_speed, 6
)");
  std::string err;
  auto s = kart_stats_from_stream(ss, boost_catalog(), default_kart_stats(), &err);
  REQUIRE(s.has_value());
  REQUIRE(err.empty());
  REQUIRE(s->key == "heavy");
  REQUIRE(s->max_speed == Approx(26.5));
  REQUIRE(s->acceleration.keys().size() == 2);
  REQUIRE(s->acceleration.evaluate(0.5) == Approx(8.5));
  REQUIRE(s->wheel_offsets[0].x == Approx(-0.7));
  REQUIRE(s->wheel_offsets[0].z == Approx(0.9));
  REQUIRE(s->drift_boost.boosts[0].key == "super");
  REQUIRE(s->drift.min_speed == Approx(6.0));
  // Untouched fields come from the base
  REQUIRE(s->gravity == Approx(default_kart_stats().gravity));
}

TEST_CASE("kart_stats_from_stream skips either header spelling") {
  for (const char* header : {"key,value", "name,value", "Key , Value"}) {
    std::istringstream ss(std::string(header) + "\nmax_speed,31\n");
    std::string err;
    auto s = kart_stats_from_stream(ss, boost_catalog(), default_kart_stats(), &err);
    REQUIRE(s.has_value());
    REQUIRE(s->key == "standard");
    REQUIRE(s->max_speed == Approx(31.0));
  }

  // A key row that is not a header still renames the stats
  std::istringstream ss("key,light\n");
  auto s = kart_stats_from_stream(ss, boost_catalog(), default_kart_stats());
  REQUIRE(s.has_value());
  REQUIRE(s->key == "light");
}

TEST_CASE("kart_stats_from_stream is strict") {
  std::string err;

  SECTION("unknown field") {
    std::istringstream ss("max_sped,20\n");
    REQUIRE_FALSE(kart_stats_from_stream(ss, boost_catalog(), default_kart_stats(), &err).has_value());
    REQUIRE(err.find("unknown field") != std::string::npos);
    REQUIRE(err.find("line 1") != std::string::npos);
  }
  SECTION("malformed number") {
    std::istringstream ss("# tuning\ndrag,0.3x\n");
    REQUIRE_FALSE(kart_stats_from_stream(ss, boost_catalog(), default_kart_stats(), &err).has_value());
    REQUIRE(err.find("line 2") != std::string::npos);
  }
  SECTION("malformed curve") {
    std::istringstream ss("turning,0:60 0.5\n");
    REQUIRE_FALSE(kart_stats_from_stream(ss, boost_catalog(), default_kart_stats(), &err).has_value());
  }
  SECTION("unknown boost reference") {
    std::istringstream ss("drift_boost_3,warp\n");
    REQUIRE_FALSE(kart_stats_from_stream(ss, boost_catalog(), default_kart_stats(), &err).has_value());
    REQUIRE(err.find("warp") != std::string::npos);
  }
  SECTION("result that fails validation") {
    std::istringstream ss("drift_threshold_2,0.1\n");
    REQUIRE_FALSE(kart_stats_from_stream(ss, boost_catalog(), default_kart_stats(), &err).has_value());
    REQUIRE(err.find("ascending") != std::string::npos);
  }
}

TEST_CASE("validate_stats catches bad tuning") {
  KartStats s = default_kart_stats();
  REQUIRE_FALSE(validate_stats(s).has_value());

  s.max_speed = 0.0;
  REQUIRE(validate_stats(s).has_value());

  s = default_kart_stats();
  s.friction = ResponseCurve{};
  REQUIRE(validate_stats(s).has_value());

  s = default_kart_stats();
  s.max_tilt_angle = 120.0;
  REQUIRE(validate_stats(s).has_value());

  s = default_kart_stats();
  s.drift.forward_factor = 1.5;
  REQUIRE(validate_stats(s).has_value());
}
