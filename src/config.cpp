#include "config.hpp"

#include "log.hpp"

std::unique_ptr<Config> gConfig;

void Config::set_defaults() {
  env_file = ENV_FILE;
#ifdef _WIN32
  opener = DEFAULT_VERB;
#else
  opener = DEFAULT_OPENER;
#endif
  DbgLog("Target file: {}, opener: {}", env_file, opener);
}
