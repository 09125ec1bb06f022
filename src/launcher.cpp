#include "launcher.hpp"

#include <cstdio>
#include <stdexcept>
#include <string>

#ifdef _WIN32
#include <Windows.h>
#include <shellapi.h>
#else
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include <csignal>
#include <cerrno>
#endif

#include "log.hpp"
#include "util.hpp"

#ifdef _WIN32
int open_in_default_editor(const Config& config) {
  auto stlEnvPath = config.env_file.string();
  auto chEnvPath = stlEnvPath.c_str();
  DbgLog("ShellExecuteA({}, \"{}\")", config.opener, chEnvPath);

  auto hr = reinterpret_cast<INT_PTR>(ShellExecuteA(
      nullptr, config.opener.c_str(), chEnvPath, nullptr, nullptr,
      SW_SHOWDEFAULT));
  // Values above 32 mean success
  if (hr > 32) return 0;
  __print(stderr, "{}: {}", chEnvPath,
          util::get_last_error(static_cast<int>(hr)));
  return 1;
}
#else
int open_in_default_editor(const Config& config) {
  if (config.opener.empty())
    throw std::invalid_argument(
        "open_in_default_editor(): no opener configured");

  auto stlEnvPath = config.env_file.string();
  DbgLog("Launching {} \"{}\"", config.opener, stlEnvPath);

  // an inherited SIG_IGN would make the kernel reap the child before waitpid
  struct sigaction dfl {}, old {};
  dfl.sa_handler = SIG_DFL;
  sigemptyset(&dfl.sa_mask);
  sigaction(SIGCHLD, &dfl, &old);

  pid_t pid = fork();
  if (pid < 0) {
    auto err = util::get_last_error();
    sigaction(SIGCHLD, &old, nullptr);
    throw std::runtime_error("open_in_default_editor(): fork() failed\n  " +
                             err);
  }

  if (pid == 0) {
    char* argv[] = {const_cast<char*>(config.opener.c_str()),
                    const_cast<char*>(stlEnvPath.c_str()), nullptr};
    execvp(argv[0], argv);
    // only reached when exec failed, report it like a shell would
    auto err = util::get_last_error();
    fprintf(stderr, "%s: %s\n", argv[0], err.c_str());
    _exit(127);
  }

  int status = 0;
  while (waitpid(pid, &status, 0) < 0) {
    if (errno != EINTR) {
      auto err = util::get_last_error();
      sigaction(SIGCHLD, &old, nullptr);
      throw std::runtime_error(
          "open_in_default_editor(): waitpid() failed\n  " + err);
    }
  }
  sigaction(SIGCHLD, &old, nullptr);

  if (WIFEXITED(status)) {
    DbgLog("{} exited with {}", config.opener, WEXITSTATUS(status));
    return WEXITSTATUS(status);
  }
  if (WIFSIGNALED(status)) return 128 + WTERMSIG(status);
  return 1;
}
#endif
