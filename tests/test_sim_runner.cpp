#include <catch2/catch_test_macros.hpp>
#include <chrono>
#include <cstdint>
#include <memory>
#include <sstream>
#include <string>
#include <thread>

#include <kartsim/config.hpp>
#include <kartsim/sim_runner.hpp>

using namespace kartsim;

TEST_CASE("Runner rejects invalid kart stats before starting") {
  std::ostringstream os;
  SimRunner sim;
  sim.set_log_sink(std::make_shared<OstreamLogSink>(os, LogLevel::Debug));

  KartStats bad = default_kart_stats();
  bad.key = "broken";
  bad.collision_radius = 0.0;
  REQUIRE_FALSE(sim.set_kart_stats(bad));
  REQUIRE(sim.kart_stats().key == "standard");
  REQUIRE(os.str().find("[error]") != std::string::npos);

  KartStats light = default_kart_stats();
  light.key = "light";
  light.max_speed = 26.0;
  REQUIRE(sim.set_kart_stats(light));
  REQUIRE(sim.kart_stats().key == "light");
}

TEST_CASE("Runner keeps stepping after a rejected stats update") {
  SimRunner sim;
  KartStats bad = default_kart_stats();
  bad.max_speed = -1.0;
  REQUIRE_FALSE(sim.set_kart_stats(bad));
  sim.set_kart_count(2);
  sim.request_arena_preset(ArenaPreset::Flat);
  sim.start();
  REQUIRE(sim.running());

  SimSnapshot snap;
  std::uint64_t cursor = 0;
  bool got = false;
  const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
  while (std::chrono::steady_clock::now() < deadline) {
    if (sim.mailbox().try_consume_latest(cursor, snap) && snap.tick > 0) {
      got = true;
      break;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(5));
  }
  sim.stop();

  REQUIRE(got);
  REQUIRE_FALSE(sim.running());
  REQUIRE(snap.karts.size() == 2);
}
