#include <cassert>
#include <cstdlib>
#include "mcpeasy/settings.hpp"

static void set_env(const char* name, const char* value) {
  setenv(name, value, 1);
}

int main() {
  using namespace mcpeasy;

  // Env parse (set locally)
  set_env("HOME", "/home/tester");
  set_env("MCPEASY_LOG_LEVEL", "warn");
  unsetenv("MCPEASY_CONFIG_DIR");
  unsetenv("MCPEASY_LOGS_DIR");
  auto e = Settings::from_env();
  assert(e.log_level == "WARN"); // uppercased
  assert(e.config_dir == "/home/tester/.config/mcpeasy");
  assert(e.logs_dir == "/home/tester/.local/share/mcpeasy/logs");

  set_env("MCPEASY_CONFIG_DIR", "/tmp/mcpeasy-cfg");
  set_env("MCPEASY_LOGS_DIR", "/tmp/mcpeasy-logs");
  auto overridden = Settings::from_env();
  assert(overridden.config_dir == "/tmp/mcpeasy-cfg");
  assert(overridden.logs_dir == "/tmp/mcpeasy-logs");

  // JSON parse falls back to the environment for missing keys
  auto s = Settings::from_json(Json{{"log_level", "DEBUG"}, {"config_dir", "/srv/cfg"}});
  assert(s.log_level == "DEBUG");
  assert(s.config_dir == "/srv/cfg");
  assert(s.logs_dir == "/tmp/mcpeasy-logs");

  unsetenv("MCPEASY_LOG_LEVEL");
  assert(Settings::from_env().log_level == "INFO");
  return 0;
}
