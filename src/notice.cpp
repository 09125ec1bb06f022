#include "notice.hpp"

#include "log.hpp"

const std::vector<std::string_view>& notice_lines() {
  static const std::vector<std::string_view> lines {
    "============================================================",
    " DATABASE_URL is malformed",
    "============================================================",
    "",
    "The DATABASE_URL value in your .env file could not be parsed.",
    "It must be a complete connection URL, for example:",
    "",
    "  DATABASE_URL=" EXAMPLE_POSTGRES_URL,
    "",
    "or, for a local SQLite database:",
    "",
    "  DATABASE_URL=" EXAMPLE_SQLITE_URL,
    "",
    "Opening .env in your default editor.",
    "Fix the value, save the file and restart the backend.",
  };
  return lines;
}

void print_notice(FILE* const stream) {
  for (const auto& line : notice_lines()) __print(stream, "{}", line);
  fflush(stream);
}
