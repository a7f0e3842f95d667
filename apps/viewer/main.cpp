#include <raylib.h>
#include <cstdint>
#include <cstdlib>
#include <ctime>
#include <string>
#include <utility>
#include <vector>

#include <tdw/sim_runner.hpp>
#include <tdw/viewer/app.hpp>
#include <tdw/world_config.hpp>

using namespace tdw;

// Usage: tdworld_viewer [config.ini] [seed]
int main(int argc, char** argv) {
  WorldConfig cfg = default_world_config();
  if (argc > 1) {
    std::vector<std::string> rejected;
    if (auto loaded = load_world_config(argv[1], &rejected)) {
      cfg = std::move(*loaded);
      TraceLog(LOG_INFO, "TDW: loaded config %s", argv[1]);
      for (const auto& line : rejected) TraceLog(LOG_WARNING, "TDW: ignored config line '%s'", line.c_str());
    } else {
      TraceLog(LOG_ERROR, "TDW: cannot open config %s", argv[1]);
      return 1;
    }
  }

  std::uint32_t seed = static_cast<std::uint32_t>(std::time(nullptr));
  if (argc > 2) seed = static_cast<std::uint32_t>(std::strtoul(argv[2], nullptr, 10));

  SimRunner runner(cfg);
  if (!runner.reset(seed)) {
    TraceLog(LOG_ERROR, "TDW: could not place agents for seed=%u", seed);
    return 1;
  }

  ViewerApp app(runner);
  return app.run();
}
