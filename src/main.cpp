#define _FILE_OFFSET_BITS 64

#include "pack/pack_runner.hpp"
#include "system/signals.hpp"
#include "util/config_parser.hpp"
#include "util/logger.hpp"
#include "util/pack_options.hpp"

#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <getopt.h>
#include <optional>
#include <string>
#include <system_error>
#include <vector>

namespace {

enum LongOnly {
    kOptBoard = 1000,
    kOptFactory,
    kOptRelease,
    kOptFirmware,
    kOptHwid,
    kOptComplete,
    kOptSubfolder,
    kOptUsbimg,
    kOptInstallShim,
    kOptDiskimg,
    kOptPreserve,
    kOptNoPreserve,
    kOptSectors,
    kOptDetect,
    kOptNoDetect,
    kOptConfig,
    kOptOmahaDir,
    kOptScratchDir,
    kOptShimBuilder,
};

void PrintUsage(const char *argv) {
    std::fprintf(stderr,
        "Prepares factory resources (mini-omaha server, usb/disk images)\n"
        "\n"
        "Usage:\n"
        "   %s --release <image> --factory <image> [options]\n"
        "   %s --config <file.json>\n"
        "\n"
        "Options:\n"
        "  --board <name>             Board for which the image was built (mini-omaha mode)\n"
        "  --release <image>          Release image: /path/chromiumos_image.bin\n"
        "  --factory <image>          Factory image: /path/chromiumos_test_image.bin\n"
        "  --firmware_updater <file>  Firmware updater, empty for the one in the release image,\n"
        "                             or 'none'\n"
        "  --hwid_updater <file>      HWID component list updater, or 'none'\n"
        "  --complete_script <file>   Script for the last step of factory install\n"
        "  --subfolder <name>         Put the payloads in static/<name> and append to the config\n"
        "  --usbimg <file>            Output a USB installation disk image\n"
        "  --install_shim <image>     Factory install shim for --usbimg\n"
        "  --diskimg <file|device>    Output a disk image\n"
        "  --[no]preserve             Reuse the disk image file if its size matches (default off)\n"
        "  --sectors <n>              Size of the disk image in sectors (default 31277232)\n"
        "  --[no]detect_release_image Detect and convert usb/recovery release images (default on)\n"
        "  --config <file.json>       Read one or more jobs from a JSON file\n"
        "  --omaha_dir <dir>          Mini-omaha directory (default: program directory)\n"
        "  --scratch_dir <dir>        Directory for temporary files (default: $TMPDIR or /tmp)\n"
        "  --shim_builder <file>      make_universal_factory_shim.sh (default: program directory)\n"
        "  -v, --verbose              Debug logging\n"
        "  -q, --quiet                Warnings and errors only\n"
        "  -h, --help                 Show this help\n",
        argv, argv);
}

std::string ProgramDir(const char *argv0) {
    std::error_code ec;
    auto exe = std::filesystem::read_symlink("/proc/self/exe", ec);
    if (ec) exe = std::filesystem::absolute(argv0, ec);
    return exe.parent_path().string();
}

bool ParseSectors(const char *text, std::uint64_t &out) {
    char *end = nullptr;
    unsigned long long v = std::strtoull(text, &end, 10);
    if (!end || *end != '\0' || end == text) return false;
    out = static_cast<std::uint64_t>(v);
    return true;
}

int RunJobs(std::vector<fpack::PackOptions> jobs, const std::string &program_dir) {
    auto tools = fpack::CheckRequiredTools();
    if (!tools.ok) {
        LogError("%s", tools.msg.c_str());
        return 1;
    }

    fpack::PackRunner runner(fpack::DefaultServices());
    for (size_t i = 0; i < jobs.size(); ++i) {
        auto &job = jobs[i];
        std::optional<fpack::ScopedLogTag> tag;
        if (jobs.size() > 1) {
            tag.emplace("job " + std::to_string(i + 1) + "/" + std::to_string(jobs.size()));
        }

        fpack::ApplyDefaultLocations(job, program_dir);
        if (auto r = fpack::ValidateOptions(job); !r.ok) {
            LogError("%s", r.msg.c_str());
            return 2;
        }
        if (auto r = runner.Run(job); !r.ok) {
            LogError("%s", r.msg.c_str());
            return 1;
        }
    }
    return 0;
}

} // namespace

int main(int argc, char **argv) {
    fpack::InstallSignalHandlers();

    fpack::PackOptions opt;
    std::string config_path;
    bool job_flags = false;

    static option long_opts[] = {
        {"board", required_argument, nullptr, kOptBoard},
        {"factory", required_argument, nullptr, kOptFactory},
        {"release", required_argument, nullptr, kOptRelease},
        {"firmware_updater", required_argument, nullptr, kOptFirmware},
        {"hwid_updater", required_argument, nullptr, kOptHwid},
        {"complete_script", required_argument, nullptr, kOptComplete},
        {"subfolder", required_argument, nullptr, kOptSubfolder},
        {"usbimg", required_argument, nullptr, kOptUsbimg},
        {"install_shim", required_argument, nullptr, kOptInstallShim},
        {"diskimg", required_argument, nullptr, kOptDiskimg},
        {"preserve", no_argument, nullptr, kOptPreserve},
        {"nopreserve", no_argument, nullptr, kOptNoPreserve},
        {"sectors", required_argument, nullptr, kOptSectors},
        {"detect_release_image", no_argument, nullptr, kOptDetect},
        {"nodetect_release_image", no_argument, nullptr, kOptNoDetect},
        {"config", required_argument, nullptr, kOptConfig},
        {"omaha_dir", required_argument, nullptr, kOptOmahaDir},
        {"scratch_dir", required_argument, nullptr, kOptScratchDir},
        {"shim_builder", required_argument, nullptr, kOptShimBuilder},
        {"verbose", no_argument, nullptr, 'v'},
        {"quiet", no_argument, nullptr, 'q'},
        {"help", no_argument, nullptr, 'h'},
        {nullptr, 0, nullptr, 0},
    };

    int idx = 0;
    int c;
    while ((c = getopt_long(argc, argv, "hvq", long_opts, &idx)) != -1) {
        switch (c) {
            case 'h':
                PrintUsage(argv[0]);
                return 0;
            case 'v':
                fpack::Logger::Instance().SetLevel(fpack::LogLevel::Debug);
                break;
            case 'q':
                fpack::Logger::Instance().SetLevel(fpack::LogLevel::Warn);
                break;

            case kOptBoard: opt.board = optarg; job_flags = true; break;
            case kOptFactory: opt.factory = optarg; job_flags = true; break;
            case kOptRelease: opt.release = optarg; job_flags = true; break;
            case kOptFirmware: opt.firmware_updater = optarg; job_flags = true; break;
            case kOptHwid: opt.hwid_updater = optarg; job_flags = true; break;
            case kOptComplete: opt.complete_script = optarg; job_flags = true; break;
            case kOptSubfolder: opt.subfolder = optarg; job_flags = true; break;
            case kOptUsbimg: opt.usbimg = optarg; job_flags = true; break;
            case kOptInstallShim: opt.install_shim = optarg; job_flags = true; break;
            case kOptDiskimg: opt.diskimg = optarg; job_flags = true; break;
            case kOptPreserve: opt.preserve = true; break;
            case kOptNoPreserve: opt.preserve = false; break;
            case kOptDetect: opt.detect_release_image = true; break;
            case kOptNoDetect: opt.detect_release_image = false; break;
            case kOptOmahaDir: opt.omaha_dir = optarg; break;
            case kOptScratchDir: opt.scratch_dir = optarg; break;
            case kOptShimBuilder: opt.shim_builder = optarg; break;
            case kOptConfig: config_path = optarg; break;

            case kOptSectors:
                if (!ParseSectors(optarg, opt.sectors)) {
                    std::fprintf(stderr, "Invalid --sectors: %s\n", optarg);
                    return 2;
                }
                break;

            default:
                PrintUsage(argv[0]);
                return 2;
        }
    }

    if (optind < argc) {
        std::fprintf(stderr, "Unexpected argument: %s\n", argv[optind]);
        PrintUsage(argv[0]);
        return 2;
    }

    const std::string program_dir = ProgramDir(argv[0]);

    if (config_path.empty()) {
        return RunJobs({opt}, program_dir);
    }

    if (job_flags) {
        std::fprintf(stderr, "ERROR: image and output parameters are not supported when using --config\n");
        return 2;
    }

    fpack::config::PackConfigFile cfg;
    if (auto r = cfg.LoadFile(config_path); !r.ok) {
        std::fprintf(stderr, "ERROR: %s\n", r.msg.c_str());
        return 2;
    }

    // Locations given on the command line apply to every job that leaves them unset.
    std::vector<fpack::PackOptions> jobs = cfg.Jobs();
    for (auto &job : jobs) {
        if (job.omaha_dir.empty()) job.omaha_dir = opt.omaha_dir;
        if (job.scratch_dir.empty()) job.scratch_dir = opt.scratch_dir;
        if (job.shim_builder.empty()) job.shim_builder = opt.shim_builder;
    }
    return RunJobs(std::move(jobs), program_dir);
}
