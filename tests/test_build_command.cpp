#include "imgbuild/build_command.hpp"
#include "imgbuild/context_materializer.hpp"
#include "testing.hpp"

#include <cstdio>
#include <filesystem>
#include <gtest/gtest.h>
#include <string>

namespace imgbuild {
namespace {

namespace fs = std::filesystem;

class BuildCommandTest : public ::testing::Test {
  protected:
    void SetUp() override {
        cfg.solver = "/bin/sh";
        cfg.runtime_helper = "sh";
        cfg.state_dir = tmp.Join("state");
        cfg.temp_dir = tmp.Join("work");
        fs::create_directories(cfg.temp_dir);
        testutil::WriteFile(tmp.Join("ctx/Dockerfile"), "FROM scratch\n");
        testutil::WriteFile(tmp.Join("ctx/hello.txt"), "hello");

        out = std::tmpfile();
        ASSERT_NE(out, nullptr);
    }

    void TearDown() override {
        if (out)
            std::fclose(out);
    }

    std::string Output() {
        std::fflush(out);
        std::rewind(out);
        std::string s;
        char buf[512];
        size_t n;
        while ((n = std::fread(buf, 1, sizeof(buf), out)) > 0)
            s.append(buf, n);
        return s;
    }

    bool WorkDirEmpty() { return fs::is_empty(cfg.temp_dir); }

    BuildOptions Options() {
        BuildOptions o;
        o.context_dir = tmp.Join("ctx");
        o.tags = {"app"};
        return o;
    }

    // Engine whose solve records what the local directories hold at solve time.
    testutil::FakeEngine MakeEngine(Result result = Result::Ok()) {
        return testutil::FakeEngine([this, result](const SolveRequest& req, StatusChannel&, std::stop_token) {
            ++solves;
            const auto& dirs = engine_dirs();
            seen_recipe = testutil::ReadFile(dirs.at(kLocalDirRecipe) + "/" + req.frontend_attrs.at("filename"));
            seen_hello = testutil::ReadFile(dirs.at(kLocalDirContext) + "/hello.txt");
            return result;
        });
    }

    std::function<const LocalDirs&()> engine_dirs;

    testutil::TemporaryDirectory tmp;
    config::BuilderConfig cfg;
    testutil::RecordingDisplay display;
    std::FILE* out = nullptr;
    int solves = 0;
    std::string seen_recipe;
    std::string seen_hello;
};

TEST_F(BuildCommandTest, LocalContextBuilds) {
    auto engine = MakeEngine();
    engine_dirs = [&engine]() -> const LocalDirs& { return engine.Dirs(); };
    testutil::MemoryReader stdin_reader(std::string{});
    BuildCommand cmd(cfg, engine, display, stdin_reader, out);

    Result r = cmd.Run({}, Options());
    ASSERT_TRUE(r.is_ok()) << r.msg;
    EXPECT_EQ(cmd.LastState(), SolveState::Succeeded);
    EXPECT_EQ(solves, 1);
    EXPECT_EQ(seen_recipe, "FROM scratch\n");
    EXPECT_EQ(seen_hello, "hello");

    const std::string text = Output();
    EXPECT_NE(text.find("Building docker.io/library/app:latest\n"), std::string::npos) << text;
    EXPECT_NE(text.find("Successfully built docker.io/library/app:latest\n"), std::string::npos) << text;
}

TEST_F(BuildCommandTest, RecipeFromStdinIsRemovedAfterwards) {
    auto engine = MakeEngine();
    engine_dirs = [&engine]() -> const LocalDirs& { return engine.Dirs(); };
    testutil::MemoryReader stdin_reader(std::string("FROM busybox\n"));
    BuildCommand cmd(cfg, engine, display, stdin_reader, out);

    auto o = Options();
    o.recipe_path = kStdinPath;
    Result r = cmd.Run({}, o);
    ASSERT_TRUE(r.is_ok()) << r.msg;
    EXPECT_EQ(seen_recipe, "FROM busybox\n");
    EXPECT_EQ(seen_hello, "hello");
    EXPECT_EQ(engine.Dirs().at(kLocalDirRecipe), cfg.temp_dir);
    EXPECT_TRUE(WorkDirEmpty());
}

TEST_F(BuildCommandTest, ArchiveContextFromStdin) {
    auto engine = MakeEngine();
    engine_dirs = [&engine]() -> const LocalDirs& { return engine.Dirs(); };
    testutil::MemoryReader stdin_reader(testutil::BuildTar(
        {{"Dockerfile", "FROM alpine\n"}, {"hello.txt", "from tar"}}, testutil::TarFilter::Gzip));
    BuildCommand cmd(cfg, engine, display, stdin_reader, out);

    auto o = Options();
    o.context_dir = kStdinPath;
    Result r = cmd.Run({}, o);
    ASSERT_TRUE(r.is_ok()) << r.msg;
    EXPECT_EQ(seen_recipe, "FROM alpine\n");
    EXPECT_EQ(seen_hello, "from tar");
    EXPECT_TRUE(WorkDirEmpty());
}

TEST_F(BuildCommandTest, NamedRecipeInsideStreamedContext) {
    auto engine = MakeEngine();
    engine_dirs = [&engine]() -> const LocalDirs& { return engine.Dirs(); };
    testutil::MemoryReader stdin_reader(testutil::BuildTar(
        {{"docker/api.Dockerfile", "FROM debian\n"}, {"hello.txt", "x"}}));
    BuildCommand cmd(cfg, engine, display, stdin_reader, out);

    auto o = Options();
    o.context_dir = kStdinPath;
    o.recipe_path = "docker/api.Dockerfile";
    Result r = cmd.Run({}, o);
    ASSERT_TRUE(r.is_ok()) << r.msg;
    EXPECT_EQ(seen_recipe, "FROM debian\n");
}

TEST_F(BuildCommandTest, HostRecipeWithArchiveContextIsUsedAsGiven) {
    auto engine = MakeEngine();
    engine_dirs = [&engine]() -> const LocalDirs& { return engine.Dirs(); };
    testutil::WriteFile(tmp.Join("host/Build.Dockerfile"), "FROM host\n");
    testutil::MemoryReader stdin_reader(testutil::BuildTar(
        {{"Dockerfile", "FROM archived\n"}, {"Build.Dockerfile", "FROM archived-named\n"}, {"hello.txt", "t"}}));
    BuildCommand cmd(cfg, engine, display, stdin_reader, out);

    auto o = Options();
    o.context_dir = kStdinPath;
    o.recipe_path = tmp.Join("host/Build.Dockerfile");
    Result r = cmd.Run({}, o);
    ASSERT_TRUE(r.is_ok()) << r.msg;
    EXPECT_EQ(seen_recipe, "FROM host\n");
    EXPECT_EQ(seen_hello, "t");
    EXPECT_EQ(engine.Dirs().at(kLocalDirRecipe), tmp.Join("host"));
}

TEST_F(BuildCommandTest, AbsoluteRecipeNameWithPlainStdinLandsInContext) {
    auto engine = MakeEngine();
    engine_dirs = [&engine]() -> const LocalDirs& { return engine.Dirs(); };
    testutil::MemoryReader stdin_reader(std::string("FROM streamed\n"));
    BuildCommand cmd(cfg, engine, display, stdin_reader, out);

    auto o = Options();
    o.context_dir = kStdinPath;
    o.recipe_path = "/home/u/Dockerfile";
    Result r = cmd.Run({}, o);
    ASSERT_TRUE(r.is_ok()) << r.msg;
    EXPECT_EQ(seen_recipe, "FROM streamed\n");
    const std::string recipe_dir = engine.Dirs().at(kLocalDirRecipe);
    EXPECT_EQ(recipe_dir, engine.Dirs().at(kLocalDirContext) + "/home/u");
    EXPECT_TRUE(WorkDirEmpty());
}

TEST_F(BuildCommandTest, BothFromStdinIsRejected) {
    auto engine = MakeEngine();
    engine_dirs = [&engine]() -> const LocalDirs& { return engine.Dirs(); };
    testutil::MemoryReader stdin_reader(std::string("FROM alpine\n"));
    BuildCommand cmd(cfg, engine, display, stdin_reader, out);

    auto o = Options();
    o.context_dir = kStdinPath;
    o.recipe_path = kStdinPath;
    EXPECT_FALSE(cmd.Run({}, o).is_ok());
    EXPECT_EQ(solves, 0);
    EXPECT_TRUE(WorkDirEmpty());
}

TEST_F(BuildCommandTest, ValidationErrors) {
    auto engine = MakeEngine();
    engine_dirs = [&engine]() -> const LocalDirs& { return engine.Dirs(); };
    testutil::MemoryReader stdin_reader(std::string{});
    BuildCommand cmd(cfg, engine, display, stdin_reader, out);

    auto no_tag = Options();
    no_tag.tags.clear();
    EXPECT_FALSE(cmd.Run({}, no_tag).is_ok());

    auto no_ctx = Options();
    no_ctx.context_dir.clear();
    auto r = cmd.Run({}, no_ctx);
    ASSERT_FALSE(r.is_ok());
    EXPECT_NE(r.msg.find("build context"), std::string::npos);

    EXPECT_EQ(solves, 0);
}

TEST_F(BuildCommandTest, MalformedBuildArgCleansUpStreamedContext) {
    auto engine = MakeEngine();
    engine_dirs = [&engine]() -> const LocalDirs& { return engine.Dirs(); };
    testutil::MemoryReader stdin_reader(testutil::BuildTar({{"Dockerfile", "FROM alpine\n"}}));
    BuildCommand cmd(cfg, engine, display, stdin_reader, out);

    auto o = Options();
    o.context_dir = kStdinPath;
    o.build_args = {"BROKEN"};
    auto r = cmd.Run({}, o);
    ASSERT_FALSE(r.is_ok());
    EXPECT_NE(r.msg.find("BROKEN"), std::string::npos);
    EXPECT_EQ(solves, 0);
    EXPECT_TRUE(WorkDirEmpty());
}

TEST_F(BuildCommandTest, PrerequisiteFailureStopsEarly) {
    cfg.runtime_helper = "no-such-runtime-helper-42";
    auto engine = MakeEngine();
    engine_dirs = [&engine]() -> const LocalDirs& { return engine.Dirs(); };
    testutil::MemoryReader stdin_reader(std::string("FROM alpine\n"));
    BuildCommand cmd(cfg, engine, display, stdin_reader, out);

    auto o = Options();
    o.context_dir = kStdinPath;
    auto r = cmd.Run({}, o);
    ASSERT_FALSE(r.is_ok());
    EXPECT_NE(r.msg.find("prerequisites"), std::string::npos);
    EXPECT_EQ(solves, 0);
    EXPECT_TRUE(WorkDirEmpty());
}

TEST_F(BuildCommandTest, SolveFailureCleansUpAndSkipsSuccessLine) {
    auto engine = MakeEngine(Result::Fail(EIO, "RUN make: exit code 2"));
    engine_dirs = [&engine]() -> const LocalDirs& { return engine.Dirs(); };
    testutil::MemoryReader stdin_reader(std::string("FROM alpine\n"));
    BuildCommand cmd(cfg, engine, display, stdin_reader, out);

    auto o = Options();
    o.context_dir = kStdinPath;
    auto r = cmd.Run({}, o);
    ASSERT_FALSE(r.is_ok());
    EXPECT_EQ(cmd.LastState(), SolveState::Failed);
    EXPECT_TRUE(WorkDirEmpty());
    EXPECT_EQ(Output().find("Successfully built"), std::string::npos);
}

} // namespace
} // namespace imgbuild
