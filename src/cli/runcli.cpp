#include <cstdio>
#include <exception>

#include "../config.hpp"
#include "../log.hpp"
#include "cli.hpp"

int run_cli(int argc, char** argv) {
  CLI::App app { "Explain a malformed DATABASE_URL and open .env", "envfix" };
  // every argument is accepted and ignored, --help included
  app.allow_extras();
  app.set_help_flag();

  if (gConfig == nullptr) {
    gConfig = std::make_unique<Config>();
    gConfig->set_defaults();
  }

  RunResult result;
  load_command_fixenv(app, result);

  try {
    app.parse(argc, argv);
  } catch (const CLI::ParseError &e) {
    return app.exit(e);
  } catch (const std::exception& ex) {
    __print(stderr, "{}", ex.what());
    return 1;
  }
  return result.exitCode;
}
