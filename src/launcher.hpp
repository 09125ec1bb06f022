#ifndef LAUNCHER_HPP
#define LAUNCHER_HPP

#include "config.hpp"

// Opens config.env_file with config.opener and waits for the opener to
// return. The result is the opener's exit status: 127 when it could not
// be executed, 128 + signal when it was killed. Throws std::invalid_argument
// when no opener is set and std::runtime_error if no process could be
// created or waited for.
int open_in_default_editor(const Config& config);

#endif /* LAUNCHER_HPP */
