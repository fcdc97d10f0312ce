#pragma once

#include <expected>
#include <string>
#include <string_view>

namespace imgbuild {

inline constexpr char kDefaultDomain[] = "docker.io";
inline constexpr char kOfficialRepoPrefix[] = "library/";
inline constexpr char kDefaultTag[] = "latest";

// A parsed image reference: [domain/]path[:tag][@digest].
struct ImageReference {
    std::string domain;
    std::string path;
    std::string tag;
    std::string digest;

    std::string Name() const { return domain + "/" + path; }
    std::string String() const;
};

// Parses a user-supplied reference and fills in the default registry and the
// official-image namespace ("myapp" -> "docker.io/library/myapp").
std::expected<ImageReference, std::string> ParseNormalizedNamed(std::string_view s);

// Adds the default tag when the reference carries neither tag nor digest.
ImageReference TagNameOnly(ImageReference ref);

// ParseNormalizedNamed + TagNameOnly, rendered back to a string.
std::expected<std::string, std::string> NormalizeImageTag(std::string_view s);

} // namespace imgbuild
