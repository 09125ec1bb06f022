#ifndef CLI_CLI_HPP
#define CLI_CLI_HPP

#include <CLI/CLI.hpp>

struct RunResult {
  int exitCode = 0;
};

void load_command_fixenv(CLI::App& app, RunResult& result);

int run_cli(int argc, char** argv);

#endif /* CLI_CLI_HPP */
