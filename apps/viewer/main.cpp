#include <kartsim/logging.hpp>
#include <kartsim/sim_runner.hpp>
#include <kartsim/viewer/app.hpp>

using namespace kartsim;

int main() {
  SimRunner sim;
  sim.set_log_sink(make_console_log_sink(LogLevel::Info));
  sim.set_kart_count(8);
  sim.start();

  ViewerApp app(sim);
  const int code = app.run();

  sim.stop();
  return code;
}
