#pragma once

#include "util/result.hpp"

#include <string>
#include <string_view>

namespace imgbuild {

enum class JoinPolicy {
    // Archive entry names: climbing above `root` is an error.
    Reject,
    // User-supplied names: climbing above `root` stops at `root`, and an
    // absolute name is taken relative to `root`.
    Clamp,
};

// Joins `unsafe` onto `root` so that the result names a location inside
// `root`, resolving symlinks already present below `root` as if `root` were
// the filesystem root. ".." segments are resolved against what has been
// resolved so far, so "a/../b" is simply "b".
//
// Under JoinPolicy::Reject these fail:
// - absolute names ("/etc/passwd")
// - a ".." that would climb above `root`, literal or through a symlink
// Symlink chains longer than 255 hops fail under either policy.
//
// Components that do not exist yet are appended lexically.
Result SecureJoin(const std::string& root,
                  std::string_view unsafe,
                  std::string& out,
                  JoinPolicy policy = JoinPolicy::Reject);

} // namespace imgbuild
