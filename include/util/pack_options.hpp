#pragma once

#include "image/layout.hpp"
#include "util/result.hpp"

#include <cstdint>
#include <string>

namespace fpack {

// Value that turns an optional updater off.
inline constexpr const char* kNoneValue = "none";

enum class PackMode {
    Server,
    DiskImage,
    UsbImage,
};

const char* PackModeName(PackMode mode);

enum class FirmwareSource {
    Disabled,
    // Copied out of the release rootfs.
    FromRelease,
    File,
};

// Parameters of one run. Filled from flags or from one job of a config file.
struct PackOptions {
    std::string release;
    std::string factory;
    std::string board;
    // A file, "none", or empty for the updater inside the release image.
    std::string firmware_updater;
    // A file or "none".
    std::string hwid_updater;
    std::string complete_script;
    std::string subfolder;
    std::string usbimg;
    std::string install_shim;
    std::string diskimg;
    bool preserve = false;
    std::uint64_t sectors = layout::kDefaultDiskSectors;
    bool detect_release_image = true;

    // Where miniomaha.conf and static/ live. Defaults to the program directory.
    std::string omaha_dir;
    // Parent of scratch files and mount points. Defaults to $TMPDIR or /tmp.
    std::string scratch_dir;
    // make_universal_factory_shim.sh. Defaults to the program directory.
    std::string shim_builder;

    PackMode Mode() const;
    FirmwareSource Firmware() const;
    bool HasHwidUpdater() const { return !hwid_updater.empty() && hwid_updater != kNoneValue; }
};

// Checks the parameters of the selected mode and rewrites every path as an
// absolute one. Fails with EINVAL (bad combination) or ENOENT (missing file).
Result ValidateOptions(PackOptions& opt);

// Fills omaha_dir and shim_builder when unset, relative to `program_dir`.
void ApplyDefaultLocations(PackOptions& opt, const std::string& program_dir);

} // namespace fpack
