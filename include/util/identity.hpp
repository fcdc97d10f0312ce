#pragma once

#include "util/result.hpp"

#include <string>

namespace imgbuild {

// Random identifier for solves and sessions: 128 bits from the OpenSSL CSPRNG
// rendered as 25 lowercase base-36 characters.
Result NewId(std::string& out);

} // namespace imgbuild
