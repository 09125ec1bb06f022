#include "util.hpp"

#include <cstdio>

#ifdef _WIN32
#include <Windows.h>
#else
#include <cerrno>
#include <cstring>
#endif

std::string util::to_hex(int num) {
  char buf[11];
  snprintf(buf, sizeof(buf), "0x%08x", static_cast<unsigned int>(num));
  std::string str = buf;
  return str;
}

#ifdef _WIN32
std::string util::get_last_error(int error) {
  char* buf;
  auto size = FormatMessageA(
    FORMAT_MESSAGE_ALLOCATE_BUFFER | FORMAT_MESSAGE_FROM_SYSTEM | FORMAT_MESSAGE_IGNORE_INSERTS,
    nullptr,
    error,
    MAKELANGID(LANG_NEUTRAL, SUBLANG_DEFAULT),
    reinterpret_cast<char*>(&buf),
    0,
    nullptr);
  std::string msg(buf, size);
  LocalFree(buf);
  return "Error " + to_hex(error) + ":\n  " + msg;
}
std::string util::get_last_error() {
  return get_last_error(GetLastError());
}
#else
std::string util::get_last_error(int error) {
  std::string msg = std::strerror(error);
  return "Error " + to_hex(error) + ": " + msg;
}
std::string util::get_last_error() {
  return get_last_error(errno);
}
#endif
