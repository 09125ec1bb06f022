#ifndef CONFIG_HPP
#define CONFIG_HPP

#include <filesystem>
#include <memory>
#include <string>

#define ENV_FILE ".env"

#if defined(_WIN32)
// ShellExecute verb, not a program
#define DEFAULT_VERB "open"
#elif defined(__APPLE__)
#define DEFAULT_OPENER "open"
#else
#define DEFAULT_OPENER "xdg-open"
#endif

class Config {
 public:
  // Relative to the working directory, never resolved.
  std::filesystem::path env_file;
  // Program used to reach the default editor, or the ShellExecute verb
  // on Windows.
  std::string opener;

  void set_defaults();
};

extern std::unique_ptr<Config> gConfig;

#endif /* CONFIG_HPP */
