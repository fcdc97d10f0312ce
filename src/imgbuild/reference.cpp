#include "imgbuild/reference.hpp"

#include <algorithm>
#include <cctype>
#include <regex>

namespace imgbuild {

namespace {

constexpr size_t kNameTotalLengthMax = 255;

const std::regex& PathComponentRe() {
    static const std::regex re("[a-z0-9]+(?:(?:[._]|__|[-]*)[a-z0-9]+)*");
    return re;
}

const std::regex& DomainRe() {
    static const std::regex re(
        "(?:[a-zA-Z0-9]|[a-zA-Z0-9][a-zA-Z0-9-]*[a-zA-Z0-9])"
        "(?:\\.(?:[a-zA-Z0-9]|[a-zA-Z0-9][a-zA-Z0-9-]*[a-zA-Z0-9]))*"
        "(?::[0-9]+)?");
    return re;
}

const std::regex& TagRe() {
    static const std::regex re("[\\w][\\w.-]{0,127}");
    return re;
}

const std::regex& DigestRe() {
    static const std::regex re(
        "[A-Za-z][A-Za-z0-9]*(?:[-_+.][A-Za-z][A-Za-z0-9]*)*:[0-9a-fA-F]{32,}");
    return re;
}

const std::regex& HexIdRe() {
    static const std::regex re("[a-f0-9]{64}");
    return re;
}

bool IsLower(std::string_view s) {
    return std::none_of(s.begin(), s.end(), [](unsigned char c) { return std::isupper(c); });
}

// Mirrors the registry rules: the first component is a domain only if it
// looks like one (has '.' or ':', or is "localhost") and is lowercase.
void SplitDomain(std::string_view name, std::string& domain, std::string& remainder) {
    const auto slash = name.find('/');
    const std::string_view first = name.substr(0, slash);
    const bool looks_like_domain = first.find_first_of(".:") != std::string_view::npos ||
                                   first == "localhost" || !IsLower(first);
    if (slash == std::string_view::npos || !looks_like_domain) {
        domain = kDefaultDomain;
        remainder = std::string(name);
    } else {
        domain = std::string(first);
        remainder = std::string(name.substr(slash + 1));
    }
    if (domain == "index.docker.io") domain = kDefaultDomain;
    if (domain == kDefaultDomain && remainder.find('/') == std::string::npos) {
        remainder = kOfficialRepoPrefix + remainder;
    }
}

} // namespace

std::string ImageReference::String() const {
    std::string out = Name();
    if (!tag.empty()) out += ":" + tag;
    if (!digest.empty()) out += "@" + digest;
    return out;
}

std::expected<ImageReference, std::string> ParseNormalizedNamed(std::string_view s) {
    if (s.empty()) return std::unexpected("invalid reference format: empty reference");

    if (std::regex_match(s.begin(), s.end(), HexIdRe())) {
        return std::unexpected("invalid repository name (" + std::string(s) +
                               "), cannot specify 64-byte hexadecimal strings");
    }

    ImageReference ref;
    std::string_view rest = s;

    if (const auto at = rest.find('@'); at != std::string_view::npos) {
        ref.digest = std::string(rest.substr(at + 1));
        rest = rest.substr(0, at);
        if (!std::regex_match(ref.digest, DigestRe())) {
            return std::unexpected("invalid reference format: invalid digest");
        }
    }

    const auto last_slash = rest.rfind('/');
    const auto colon = rest.rfind(':');
    if (colon != std::string_view::npos &&
        (last_slash == std::string_view::npos || colon > last_slash)) {
        ref.tag = std::string(rest.substr(colon + 1));
        rest = rest.substr(0, colon);
        if (!std::regex_match(ref.tag, TagRe())) {
            return std::unexpected("invalid reference format: invalid tag");
        }
    }

    std::string remainder;
    SplitDomain(rest, ref.domain, remainder);
    if (!IsLower(remainder)) {
        return std::unexpected("invalid reference format: repository name must be lowercase");
    }
    if (!std::regex_match(ref.domain, DomainRe())) {
        return std::unexpected("invalid reference format: invalid domain");
    }

    std::string_view path = remainder;
    while (true) {
        const auto pos = path.find('/');
        const std::string_view comp = path.substr(0, pos);
        if (comp.empty() || !std::regex_match(comp.begin(), comp.end(), PathComponentRe())) {
            return std::unexpected("invalid reference format");
        }
        if (pos == std::string_view::npos) break;
        path.remove_prefix(pos + 1);
    }
    ref.path = std::move(remainder);

    if (ref.Name().size() > kNameTotalLengthMax) {
        return std::unexpected("repository name must not be longer than " +
                               std::to_string(kNameTotalLengthMax) + " characters");
    }
    return ref;
}

ImageReference TagNameOnly(ImageReference ref) {
    if (ref.tag.empty() && ref.digest.empty()) ref.tag = kDefaultTag;
    return ref;
}

std::expected<std::string, std::string> NormalizeImageTag(std::string_view s) {
    auto parsed = ParseNormalizedNamed(s);
    if (!parsed) return std::unexpected(parsed.error());
    return TagNameOnly(std::move(*parsed)).String();
}

} // namespace imgbuild
