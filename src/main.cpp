#define _FILE_OFFSET_BITS 64

#include "join/image_joiner.hpp"
#include "util/config_parser.hpp"
#include "util/logger.hpp"

#include <cstdio>
#include <getopt.h>
#include <string>

namespace {

void PrintUsage(std::FILE* stream, const char* argv0) {
    std::fprintf(stream,
        "Usage: %s [options] /path/to/<stem>_parts/<stem>.manifest.txt [output.img]\n"
        "\n"
        "Reassembles a split image from its parts and verifies SHA-256 checksums.\n"
        "\n"
        "Options:\n"
        "  -c, --config <file>    JSON settings (DefaultOutput, BufferSize, FsyncOutput, LogLevel)\n"
        "  -v, --verbose          Debug logging\n"
        "  -q, --quiet            Only print errors\n"
        "  -h, --help             Show this help\n",
        argv0);
}

} // namespace

int main(int argc, char** argv) {
    const char* config_path = nullptr;
    bool verbose = false;
    bool quiet = false;

    static option long_opts[] = {
        {"config", required_argument, nullptr, 'c'},
        {"verbose", no_argument, nullptr, 'v'},
        {"quiet", no_argument, nullptr, 'q'},
        {"help", no_argument, nullptr, 'h'},
        {nullptr, 0, nullptr, 0},
    };

    int idx = 0;
    int c;
    while ((c = getopt_long(argc, argv, "hc:vq", long_opts, &idx)) != -1) {
        switch (c) {
            case 'h':
                PrintUsage(stdout, argv[0]);
                return 0;

            case 'c':
                config_path = optarg;
                break;

            case 'v':
                verbose = true;
                break;

            case 'q':
                quiet = true;
                break;

            default:
                PrintUsage(stderr, argv[0]);
                return 1;
        }
    }

    const int positional = argc - optind;
    if (positional < 1 || positional > 2) {
        PrintUsage(stderr, argv[0]);
        return 1;
    }

    auto& logger = imgjoin::Logger::Instance();
    imgjoin::ReassemblyOptions opt{};
    std::string out = imgjoin::kDefaultOutputPath;

    if (config_path) {
        imgjoin::config::JoinerConfigFromFile cfg;
        if (auto r = cfg.LoadFile(config_path); !r.ok) {
            std::fprintf(stderr, "ERROR: %s\n", r.msg.c_str());
            return 1;
        }
        if (cfg.default_output) out = *cfg.default_output;
        if (cfg.buffer_size) opt.buffer_size = static_cast<std::size_t>(*cfg.buffer_size);
        if (cfg.fsync_output) opt.fsync_output = *cfg.fsync_output;
        if (cfg.log_level) logger.SetLevel(*cfg.log_level);
    }

    if (verbose) logger.SetLevel(imgjoin::LogLevel::Debug);
    if (quiet) logger.SetLevel(imgjoin::LogLevel::Error);

    const std::string manifest = argv[optind];
    if (positional == 2) {
        out = argv[optind + 1];
    }

    imgjoin::ImageJoiner joiner(opt);
    auto res = joiner.Run(manifest, out);
    if (!res.ok) {
        LogDebug("run failed at %s check", imgjoin::ToString(res.kind()));
        std::fprintf(stderr, "ERROR: %s\n", res.msg.c_str());
        return 1;
    }

    return 0;
}
