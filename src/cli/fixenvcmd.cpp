#include "../config.hpp"
#include "../launcher.hpp"
#include "../notice.hpp"
#include "cli.hpp"

void load_command_fixenv(CLI::App& app, RunResult& result) {
  app.callback([&result]() {
    print_notice(stdout);
    result.exitCode = open_in_default_editor(*gConfig);
  });
}
