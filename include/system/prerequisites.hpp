#pragma once

#include "util/config_parser.hpp"
#include "util/result.hpp"

#include <string>

namespace imgbuild {

// Resolves `name` the way execvp would: names containing '/' are used as
// given, others are searched in $PATH. On success `out` is the path found.
Result ResolveExecutable(const std::string& name, std::string& out);

// Environment the solve needs before anything else is set up: the solver and
// the runtime helper are executable, and the state directory exists.
Result CheckRuntimePrerequisites(const config::BuilderConfig& cfg);

} // namespace imgbuild
