#include "imgbuild/build_command.hpp"
#include "imgbuild/exec_solve_engine.hpp"
#include "imgbuild/status_display.hpp"
#include "io/file_reader.hpp"
#include "system/signals.hpp"
#include "util/config_parser.hpp"
#include "util/logger.hpp"

#include <chrono>
#include <cstdio>
#include <cstring>
#include <getopt.h>
#include <string>
#include <thread>
#include <vector>

namespace {

enum LongOnly {
    kOptConfig = 1000,
    kOptDebug,
    kOptTarget,
    kOptPlatform,
    kOptBuildArg,
    kOptLabel,
    kOptNoCache,
};

void PrintUsage(const char *argv) {
    std::fprintf(stderr,
        "Usage:\n"
        "   %s [--config <file>] [--debug] build [OPTIONS] PATH|-\n"
        "\n"
        "Global options:\n"
        "      --config FILE      Configuration file (default /etc/imgbuild/imgbuild.conf)\n"
        "      --debug            Enable debug logging\n"
        "\n"
        "Build options:\n"
        "  -f, --file FILE        Recipe file, '-' reads it from stdin (default PATH/Dockerfile)\n"
        "  -t, --tag NAME         Image name and optional tag (repeatable)\n"
        "      --target STAGE     Build stage to stop at\n"
        "      --platform LIST    Target platform(s), comma separated (repeatable)\n"
        "      --build-arg K=V    Build-time variable (repeatable)\n"
        "      --label K=V        Image label (repeatable)\n"
        "      --no-cache         Do not use cache when building the image\n"
        "  -h, --help             Show this help\n"
        "\n"
        "PATH of '-' reads the build context (a tar archive or a lone recipe) from stdin.\n",
        argv);
}

void SplitCommaList(const char *s, std::vector<std::string> &out) {
    std::string item;
    for (const char *p = s; ; ++p) {
        if (*p == ',' || *p == '\0') {
            if (!item.empty())
                out.push_back(item);
            item.clear();
            if (*p == '\0')
                break;
        } else {
            item.push_back(*p);
        }
    }
}

// Returns -1 when parsing succeeded, otherwise the exit code.
int ParseBuildArgs(int argc, char **argv, const char *prog, imgbuild::BuildOptions &opt) {
    static option long_opts[] = {
        {"file", required_argument, nullptr, 'f'},
        {"tag", required_argument, nullptr, 't'},
        {"target", required_argument, nullptr, kOptTarget},
        {"platform", required_argument, nullptr, kOptPlatform},
        {"build-arg", required_argument, nullptr, kOptBuildArg},
        {"label", required_argument, nullptr, kOptLabel},
        {"no-cache", no_argument, nullptr, kOptNoCache},
        {"help", no_argument, nullptr, 'h'},
        {nullptr, 0, nullptr, 0},
    };

    optind = 0;
    int idx = 0;
    int c;
    while ((c = getopt_long(argc, argv, "hf:t:", long_opts, &idx)) != -1) {
        switch (c) {
            case 'h':
                PrintUsage(prog);
                return 0;

            case 'f':
                opt.recipe_path = optarg;
                break;

            case 't':
                opt.tags.emplace_back(optarg);
                break;

            case kOptTarget:
                opt.target = optarg;
                break;

            case kOptPlatform:
                SplitCommaList(optarg, opt.platforms);
                break;

            case kOptBuildArg:
                opt.build_args.emplace_back(optarg);
                break;

            case kOptLabel:
                opt.labels.emplace_back(optarg);
                break;

            case kOptNoCache:
                opt.no_cache = true;
                break;

            default:
                PrintUsage(prog);
                return 2;
        }
    }

    if (optind != argc - 1) {
        std::fprintf(stderr, "ERROR: \"build\" requires exactly 1 argument (the build context)\n");
        PrintUsage(prog);
        return 2;
    }
    opt.context_dir = argv[optind];
    return -1;
}

} // namespace

int main(int argc, char **argv) {
    imgbuild::InstallSignalHandlers();

    std::string config_path;
    bool debug = false;

    static option global_opts[] = {
        {"config", required_argument, nullptr, kOptConfig},
        {"debug", no_argument, nullptr, kOptDebug},
        {"help", no_argument, nullptr, 'h'},
        {nullptr, 0, nullptr, 0},
    };

    int idx = 0;
    int c;
    // '+' stops at the subcommand.
    while ((c = getopt_long(argc, argv, "+h", global_opts, &idx)) != -1) {
        switch (c) {
            case 'h':
                PrintUsage(argv[0]);
                return 0;

            case kOptConfig:
                config_path = optarg;
                break;

            case kOptDebug:
                debug = true;
                break;

            default:
                PrintUsage(argv[0]);
                return 2;
        }
    }

    if (optind >= argc || std::strcmp(argv[optind], "build") != 0) {
        if (optind < argc)
            std::fprintf(stderr, "ERROR: unknown command \"%s\"\n", argv[optind]);
        PrintUsage(argv[0]);
        return 2;
    }

    imgbuild::BuildOptions opt;
    if (int rc = ParseBuildArgs(argc - optind, argv + optind, argv[0], opt); rc >= 0) {
        return rc;
    }

    imgbuild::config::BuilderConfig cfg;
    if (auto r = cfg.Load(config_path); !r.ok) {
        std::fprintf(stderr, "ERROR: %s\n", r.msg.c_str());
        return 1;
    }
    if (cfg.log_level)
        imgbuild::Logger::Instance().SetLevel(*cfg.log_level);
    if (debug)
        imgbuild::Logger::Instance().SetLevel(imgbuild::LogLevel::Debug);
    LogDebug("log level %s, solver %s, state dir %s",
             imgbuild::LogLevelName(imgbuild::Logger::Instance().Level()),
             cfg.solver.c_str(), cfg.state_dir.c_str());

    imgbuild::FileOrStdinReader stdin_reader;
    if (auto r = imgbuild::FileOrStdinReader::Open(imgbuild::kStdinPath, stdin_reader); !r.ok) {
        std::fprintf(stderr, "ERROR: %s\n", r.msg.c_str());
        return 1;
    }

    imgbuild::ExecSolveEngine engine({
        .solver = cfg.solver,
        .solver_args = cfg.solver_args,
        .state_dir = cfg.state_dir,
        .backend = cfg.backend,
    });
    imgbuild::PlainStatusDisplay display;
    imgbuild::BuildCommand cmd(cfg, engine, display, stdin_reader);

    // Turns SIGINT/SIGTERM into a stop request for the running build.
    std::stop_source cancel;
    std::jthread watcher([&cancel](std::stop_token st) {
        while (!st.stop_requested()) {
            if (imgbuild::g_cancel.load()) {
                cancel.request_stop();
                return;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
        }
    });

    auto res = cmd.Run(cancel.get_token(), opt);
    watcher.request_stop();

    if (!res.ok) {
        std::fprintf(stderr, "ERROR: %s\n", res.msg.c_str());
        return 1;
    }
    return 0;
}
