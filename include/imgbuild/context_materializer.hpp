#pragma once

#include "io/file_reader.hpp"
#include "io/io.hpp"
#include "util/result.hpp"
#include "util/temp_path.hpp"

#include <string>

namespace imgbuild {

inline constexpr char kDefaultRecipeName[] = "Dockerfile";

// Turns stdin-sourced input into files on local storage.
class ContextMaterializer {
public:
    explicit ContextMaterializer(std::string temp_base = {});

    // Reads `stream` as either a (possibly compressed) tar of the whole build
    // context, or a lone recipe. An archive is extracted into a new temporary
    // directory. Anything else is written verbatim to
    // <dir>/<declared_recipe_name or "Dockerfile">, unless the recipe itself
    // is declared to come from the same stream, which is an error. The
    // declared name is clamped under <dir>: "/home/u/Dockerfile" lands in
    // <dir>/home/u/Dockerfile.
    //
    // `written_recipe`, when given, receives the path of the recipe written
    // for a non-archive stream and is cleared for an archive.
    //
    // `out_context` owns the directory as soon as it is created, including on
    // failure, so dropping it always removes what was written.
    Result ContextFromStream(const std::string& declared_recipe_name,
                             IReader& stream,
                             TempDirectory& out_context,
                             std::string* written_recipe = nullptr) const;

    // Copies `stream` to a new temporary file.
    Result RecipeFromStream(IReader& stream, TempFile& out_recipe) const;

private:
    std::string temp_base_;
};

} // namespace imgbuild
