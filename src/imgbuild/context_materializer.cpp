#include "imgbuild/context_materializer.hpp"

#include "imgbuild/archive_classifier.hpp"
#include "imgbuild/secure_join.hpp"
#include "imgbuild/tar_extractor.hpp"
#include "io/file_writer.hpp"
#include "io/peek_reader.hpp"
#include "util/logger.hpp"
#include "util/path_utils.hpp"

#include <filesystem>

namespace imgbuild {

namespace {

constexpr char kContextPrefix[] = "imgbuild-context-";
constexpr char kRecipePrefix[] = "imgbuild-recipe-";

Result CopyToNewFile(IReader& stream, const std::string& path, std::uint64_t& copied) {
    FileWriter writer;
    auto cr = FileWriter::Create(path, 0644, writer);
    if (!cr.is_ok()) return cr;

    auto copy = CopyAll(stream, writer, &copied);
    auto close = writer.Close();
    if (!copy.is_ok()) return copy;
    return close;
}

} // namespace

ContextMaterializer::ContextMaterializer(std::string temp_base)
    : temp_base_(TempBaseDir(temp_base)) {}

Result ContextMaterializer::ContextFromStream(const std::string& declared_recipe_name,
                                              IReader& stream,
                                              TempDirectory& out_context,
                                              std::string* written_recipe) const {
    if (written_recipe) written_recipe->clear();
    const std::string recipe_name =
        declared_recipe_name.empty() ? std::string(kDefaultRecipeName) : declared_recipe_name;

    auto td = TempDirectory::Create(temp_base_, kContextPrefix, out_context);
    if (!td.is_ok()) return td.Wrap("unable to create temporary context directory");
    const std::string& dir = out_context.Path();

    PeekReader peek(stream);
    std::span<const std::uint8_t> head;
    auto pr = peek.Peek(kArchiveHeaderSize, head);
    if (!pr.is_ok()) return pr.Wrap("failed to peek context header");

    if (IsArchive(head)) {
        LogInfo("Context is an archive, extracting into %s", dir.c_str());
        TarExtractor extractor;
        ExtractStats stats{};
        auto er = extractor.Extract(peek, dir, &stats);
        if (!er.is_ok()) return er.Wrap("extracting context archive");
        LogInfo("Extracted %llu files, %llu directories (%llu bytes)",
                (unsigned long long)stats.files,
                (unsigned long long)stats.directories,
                (unsigned long long)stats.bytes);
        return Result::Ok();
    }

    if (recipe_name == kStdinPath) {
        return Result::Fail(-1,
                            "build context is not an archive (the recipe cannot also be read "
                            "from the same stdin)");
    }

    std::string recipe_path;
    auto jr = SecureJoin(dir, recipe_name, recipe_path, JoinPolicy::Clamp);
    if (!jr.is_ok()) return jr.Wrap("resolving recipe name");

    const std::string parent = PathDir(recipe_path);
    if (parent != dir) {
        std::error_code ec;
        std::filesystem::create_directories(parent, ec);
        if (ec) {
            return Result::Fail(ec.value(), "creating " + parent + ": " + ec.message());
        }
    }

    std::uint64_t copied = 0;
    auto wr = CopyToNewFile(peek, recipe_path, copied);
    if (!wr.is_ok()) return wr.Wrap("writing recipe to " + recipe_path);

    LogInfo("Context is a single recipe (%llu bytes) written to %s",
            (unsigned long long)copied, recipe_path.c_str());
    if (written_recipe) *written_recipe = recipe_path;
    return Result::Ok();
}

Result ContextMaterializer::RecipeFromStream(IReader& stream, TempFile& out_recipe) const {
    auto tf = TempFile::Create(temp_base_, kRecipePrefix, out_recipe);
    if (!tf.is_ok()) return tf.Wrap("unable to create temporary file for recipe");

    // Reopened through FileWriter so the recipe gets ordinary 0644 bits.
    auto cl = out_recipe.Close();
    if (!cl.is_ok()) return cl;

    std::uint64_t copied = 0;
    auto wr = CopyToNewFile(stream, out_recipe.Path(), copied);
    if (!wr.is_ok()) return wr.Wrap("writing to temporary file for recipe failed");

    LogDebug("recipe from stdin: %llu bytes in %s", (unsigned long long)copied,
             out_recipe.Path().c_str());
    return Result::Ok();
}

} // namespace imgbuild
