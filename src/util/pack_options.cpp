// pack_options.cpp - Per-mode parameter validation.

#include "util/pack_options.hpp"

#include "util/path_utils.hpp"

#include <cerrno>
#include <filesystem>
#include <system_error>

namespace fpack {

namespace {

namespace fs = std::filesystem;

Result MakeAbsolute(std::string& path) {
    if (path.empty() || path == kNoneValue) return Result::Ok();
    std::error_code ec;
    const fs::path abs = fs::absolute(path, ec);
    if (ec) return Result::Fail(ec.value(), "Cannot resolve path " + path + ": " + ec.message());
    path = abs.lexically_normal().string();
    return Result::Ok();
}

Result RequireFile(const char* name, const std::string& value, const char* context) {
    if (value.empty()) {
        return Result::Fail(EINVAL, std::string("You must assign a file for --") + name + context);
    }
    std::error_code ec;
    if (!fs::is_regular_file(value, ec)) {
        return Result::Fail(ENOENT, "Cannot find file: " + value);
    }
    return Result::Ok();
}

Result RequireFileOrNone(const char* name, const std::string& value, const char* context) {
    if (value == kNoneValue) return Result::Ok();
    if (value.empty()) {
        return Result::Fail(EINVAL, std::string("You must assign either a file or '") + kNoneValue +
                                        "' for --" + name + context);
    }
    return RequireFile(name, value, context);
}

Result RequireOptionalFile(const std::string& value) {
    if (value.empty()) return Result::Ok();
    std::error_code ec;
    if (!fs::is_regular_file(value, ec)) return Result::Fail(ENOENT, "Cannot find file: " + value);
    return Result::Ok();
}

Result RequireEmpty(const char* name, const std::string& value, const char* context) {
    if (!value.empty()) {
        return Result::Fail(EINVAL, std::string("Parameter --") + name + " is not supported" + context);
    }
    return Result::Ok();
}

} // namespace

const char* PackModeName(PackMode mode) {
    switch (mode) {
        case PackMode::Server:    return "mini-omaha";
        case PackMode::DiskImage: return "diskimg";
        case PackMode::UsbImage:  return "usbimg";
    }
    return "unknown";
}

PackMode PackOptions::Mode() const {
    if (!usbimg.empty()) return PackMode::UsbImage;
    if (!diskimg.empty()) return PackMode::DiskImage;
    return PackMode::Server;
}

FirmwareSource PackOptions::Firmware() const {
    if (firmware_updater == kNoneValue) return FirmwareSource::Disabled;
    if (firmware_updater.empty()) {
        return Mode() == PackMode::DiskImage ? FirmwareSource::Disabled : FirmwareSource::FromRelease;
    }
    return FirmwareSource::File;
}

Result ValidateOptions(PackOptions& opt) {
    if (!opt.usbimg.empty() && !opt.diskimg.empty()) {
        return Result::Fail(EINVAL, "--usbimg and --diskimg cannot be used at the same time.");
    }

    for (std::string* path : {&opt.release, &opt.factory, &opt.firmware_updater, &opt.hwid_updater,
                              &opt.complete_script, &opt.usbimg, &opt.install_shim, &opt.diskimg,
                              &opt.omaha_dir, &opt.scratch_dir, &opt.shim_builder}) {
        if (auto r = MakeAbsolute(*path); !r.is_ok()) return r;
    }

    if (auto r = RequireFile("release", opt.release, ""); !r.is_ok()) return r;
    if (auto r = RequireFile("factory", opt.factory, ""); !r.is_ok()) return r;

    // Only an explicit file is checked; empty and "none" select a source.
    if (opt.Firmware() == FirmwareSource::File) {
        if (auto r = RequireFile("firmware_updater", opt.firmware_updater, ""); !r.is_ok()) return r;
    }

    switch (opt.Mode()) {
        case PackMode::UsbImage: {
            const char* ctx = " in --usbimg mode";
            if (auto r = RequireFileOrNone("hwid_updater", opt.hwid_updater, ctx); !r.is_ok()) return r;
            if (auto r = RequireEmpty("complete_script", opt.complete_script, ctx); !r.is_ok()) return r;
            if (auto r = RequireFile("install_shim", opt.install_shim, ctx); !r.is_ok()) return r;
            break;
        }
        case PackMode::DiskImage: {
            const char* ctx = " in --diskimg mode";
            if (auto r = RequireEmpty("firmware_updater", opt.firmware_updater, ctx); !r.is_ok()) return r;
            if (auto r = RequireFileOrNone("hwid_updater", opt.hwid_updater, ctx); !r.is_ok()) return r;
            if (auto r = RequireEmpty("complete_script", opt.complete_script, ctx); !r.is_ok()) return r;
            if (auto r = RequireEmpty("install_shim", opt.install_shim, ctx); !r.is_ok()) return r;
            if (opt.sectors == 0) return Result::Fail(EINVAL, "--sectors must be positive");
            break;
        }
        case PackMode::Server: {
            const char* ctx = " in mini-omaha mode";
            if (auto r = RequireFileOrNone("hwid_updater", opt.hwid_updater, ctx); !r.is_ok()) return r;
            if (auto r = RequireOptionalFile(opt.complete_script); !r.is_ok()) return r;
            if (auto r = RequireEmpty("install_shim", opt.install_shim, ctx); !r.is_ok()) return r;
            if (opt.board.empty()) {
                return Result::Fail(EINVAL, "Need --board parameter for mini-omaha server.");
            }
            if (opt.omaha_dir.empty()) return Result::Fail(EINVAL, "No mini-omaha directory set");
            break;
        }
    }

    if (opt.subfolder.find('/') != std::string::npos || opt.subfolder == "." || opt.subfolder == "..") {
        return Result::Fail(EINVAL, "--subfolder must be a single directory name: " + opt.subfolder);
    }
    return Result::Ok();
}

void ApplyDefaultLocations(PackOptions& opt, const std::string& program_dir) {
    if (opt.omaha_dir.empty()) opt.omaha_dir = program_dir;
    if (opt.shim_builder.empty()) {
        opt.shim_builder = JoinPath(program_dir, "make_universal_factory_shim.sh");
    }
}

} // namespace fpack
