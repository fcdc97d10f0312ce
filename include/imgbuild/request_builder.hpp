#pragma once

#include "imgbuild/build_request.hpp"
#include "util/result.hpp"

#include <expected>
#include <string>
#include <string_view>
#include <utility>

namespace imgbuild {

// Turns user options into a normalized request, the frontend attribute map
// and the image export descriptor.
class RequestBuilder {
public:
    RequestBuilder();
    explicit RequestBuilder(std::string host_platform);

    Result Build(const BuildOptions& opt, SolvePlan& out) const;

    // Splits "key=value" on the first '='. `what` names the option in errors.
    static std::expected<std::pair<std::string, std::string>, std::string>
    ParseKeyValue(std::string_view entry, std::string_view what);

private:
    std::string host_platform_;
};

} // namespace imgbuild
