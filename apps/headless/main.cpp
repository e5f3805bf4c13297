#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <memory>
#include <string>

#include <kartsim/arena.hpp>
#include <kartsim/config.hpp>
#include <kartsim/history.hpp>
#include <kartsim/logging.hpp>
#include <kartsim/script.hpp>
#include <kartsim/world.hpp>

using namespace kartsim;

// Runs the scripted field on two independent worlds and checks that they
// stay bit-identical, then rolls one back and replays the tail.
//   kartsim_headless [ticks=1800] [karts=4] [stats.csv]
static InputMap scripted_inputs(const KartWorld& w) {
  InputMap inputs;
  for (std::size_t i = 0; i < w.kart_count(); ++i) {
    const KartId id = w.kart_by_index(i)->id;
    inputs[id] = scripted_input(id, w.tick());
  }
  return inputs;
}

static std::string hex(std::uint64_t v) {
  char buf[24];
  std::snprintf(buf, sizeof(buf), "%016llx", (unsigned long long)v);
  return buf;
}

int main(int argc, char** argv) {
  auto log_sink = make_console_log_sink(LogLevel::Info);

  const long ticks_arg = argc > 1 ? std::strtol(argv[1], nullptr, 10) : 1800;
  const long karts_arg = argc > 2 ? std::strtol(argv[2], nullptr, 10) : 4;
  if (ticks_arg <= 0 || karts_arg <= 0) {
    log(log_sink, LogLevel::Error, "usage: kartsim_headless [ticks>0] [karts>0] [stats.csv]");
    return 2;
  }
  const auto ticks = static_cast<std::uint64_t>(ticks_arg);
  const auto karts = static_cast<std::size_t>(karts_arg);

  KartStats stats = default_kart_stats();
  if (argc > 3) {
    std::string err;
    auto loaded = load_kart_stats(argv[3], boost_catalog(), &err);
    if (!loaded) {
      log(log_sink, LogLevel::Error, "stats: " + err);
      return 2;
    }
    stats = *loaded;
  }

  auto arena = std::make_shared<const Arena>(Arena::make_preset(ArenaPreset::TestTrack));
  KartWorld a(arena, kDefaultTickDt, log_sink);
  KartWorld b(arena, kDefaultTickDt);
  for (std::size_t i = 0; i < karts; ++i) {
    a.add_kart(stats);
    b.add_kart(stats);
  }

  const std::uint64_t replay_ticks = ticks < 120 ? ticks : 120;
  StateHistory history(replay_ticks + 1);

  std::size_t events = 0;
  for (std::uint64_t t = 0; t < ticks; ++t) {
    history.push(a);
    const InputMap inputs = scripted_inputs(a);
    a.step(inputs);
    b.step(inputs);
    events += a.events().size();

    if (a.checksum() != b.checksum()) {
      log(log_sink, LogLevel::Error, "desync at tick " + std::to_string(a.tick()) + ": " +
          hex(a.checksum()) + " vs " + hex(b.checksum()));
      return 1;
    }
    if (a.tick() % 60 == 0) {
      log(log_sink, LogLevel::Info, "tick " + std::to_string(a.tick()) + " crc " + hex(a.checksum()));
    }
  }

  const std::uint64_t final_crc = a.checksum();
  const std::uint64_t from = a.tick() - replay_ticks;
  KartWorld replay = a;
  if (!history.restore(from, replay)) {
    log(log_sink, LogLevel::Error, "rollback: tick " + std::to_string(from) + " not in history");
    return 1;
  }
  while (replay.tick() < a.tick()) replay.step(scripted_inputs(replay));
  if (replay.checksum() != final_crc) {
    log(log_sink, LogLevel::Error, "replay diverged: " + hex(replay.checksum()) + " vs " + hex(final_crc));
    return 1;
  }

  log(log_sink, LogLevel::Info, "ok: " + std::to_string(ticks) + " ticks, " + std::to_string(karts) +
      " karts, " + std::to_string(events) + " events, replayed " + std::to_string(replay_ticks) +
      " ticks, crc " + hex(final_crc));
  return 0;
}
