#include <cstdio>
#include <string>
#include <stratus/config.hpp>
#include <stratus/error.hpp>
#include <stratus/log.hpp>
#include <stratus/session.hpp>
#include <stratus/viewer/app.hpp>

using namespace stratus;

int main(int argc, char** argv) {
  AppConfig cfg;
  if (argc > 1) {
    auto loaded = load_config_file(argv[1]);
    if (!loaded) {
      std::fprintf(stderr, "cannot open config %s\n", argv[1]);
      return 2;
    }
    cfg = *loaded;
  }
  apply_env_overrides(cfg);
  set_log_level(cfg.log_level);

  try {
    AtcSession session(cfg);
    session.start();

    ViewerApp app(session);
    const int code = app.run();

    session.stop();
    return code;
  } catch (const Error& e) {
    STRATUS_LOG_ERROR("main", "%s", e.what());
    return 1;
  }
}
