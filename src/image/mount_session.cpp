#include "image/mount_session.hpp"

#include "io/fd.hpp"
#include "util/logger.hpp"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <filesystem>
#include <linux/loop.h>
#include <memory>
#include <sys/ioctl.h>
#include <sys/mount.h>
#include <unistd.h>
#include <vector>

namespace fs = std::filesystem;

namespace fpack {

namespace {

constexpr const char* kMountPrefix = "fpack-mnt-";
constexpr int kLoopBindAttempts = 5;

std::string ErrText(int e) { return std::string(std::strerror(e)); }

class PosixMountOps final : public IMountOps {
  public:
    Result CreateMountPoint(std::string_view mount_base_dir,
                            std::string_view mount_prefix,
                            std::string& out_dir) const override {
        const fs::path base = mount_base_dir.empty() ? fs::temp_directory_path()
                                                     : fs::path(mount_base_dir);
        std::error_code ec;
        fs::create_directories(base, ec);

        std::string tmpl = (base / (std::string(mount_prefix) + "XXXXXX")).string();
        std::vector<char> buf(tmpl.begin(), tmpl.end());
        buf.push_back('\0');

        char* created = ::mkdtemp(buf.data());
        if (!created) {
            return Result::Fail(errno, "mkdtemp failed: " + ErrText(errno));
        }

        out_dir = created;
        return Result::Ok();
    }

    Result AttachLoop(std::string_view image,
                      std::uint64_t offset,
                      std::uint64_t size,
                      bool read_only,
                      std::string& out_device) const override {
        const int open_mode = (read_only ? O_RDONLY : O_RDWR) | O_CLOEXEC;
        Fd image_fd(::open(std::string(image).c_str(), open_mode));
        if (!image_fd.Valid()) {
            const int e = errno;
            return Result::Fail(e, "Cannot open " + std::string(image) + ": " + ErrText(e));
        }
        Fd control(::open("/dev/loop-control", O_RDWR | O_CLOEXEC));
        if (!control.Valid()) {
            const int e = errno;
            return Result::Fail(e, "Cannot open /dev/loop-control: " + ErrText(e));
        }

        // Another process can grab the free device between GET_FREE and SET_FD.
        for (int attempt = 0; attempt < kLoopBindAttempts; ++attempt) {
            const int index = ::ioctl(control.Get(), LOOP_CTL_GET_FREE);
            if (index < 0) {
                const int e = errno;
                return Result::Fail(e, "LOOP_CTL_GET_FREE failed: " + ErrText(e));
            }
            const std::string device = "/dev/loop" + std::to_string(index);
            Fd loop_fd(::open(device.c_str(), open_mode));
            if (!loop_fd.Valid()) {
                const int e = errno;
                return Result::Fail(e, "Cannot open " + device + ": " + ErrText(e));
            }
            if (::ioctl(loop_fd.Get(), LOOP_SET_FD, image_fd.Get()) != 0) {
                if (errno == EBUSY) continue;
                const int e = errno;
                return Result::Fail(e, "LOOP_SET_FD failed on " + device + ": " + ErrText(e));
            }

            struct loop_info64 info{};
            info.lo_offset = offset;
            info.lo_sizelimit = size;
            info.lo_flags = LO_FLAGS_AUTOCLEAR | (read_only ? LO_FLAGS_READ_ONLY : 0);
            std::strncpy(reinterpret_cast<char*>(info.lo_file_name), std::string(image).c_str(),
                         LO_NAME_SIZE - 1);
            if (::ioctl(loop_fd.Get(), LOOP_SET_STATUS64, &info) != 0) {
                const int e = errno;
                (void)::ioctl(loop_fd.Get(), LOOP_CLR_FD, 0);
                return Result::Fail(e, "LOOP_SET_STATUS64 failed on " + device + ": " + ErrText(e));
            }
            out_device = device;
            return Result::Ok();
        }
        return Result::Fail(EBUSY, "No free loop device for " + std::string(image));
    }

    Result DetachLoop(std::string_view device) const override {
        Fd loop_fd(::open(std::string(device).c_str(), O_RDONLY | O_CLOEXEC));
        if (!loop_fd.Valid()) {
            const int e = errno;
            return Result::Fail(e, "Cannot open " + std::string(device) + ": " + ErrText(e));
        }
        if (::ioctl(loop_fd.Get(), LOOP_CLR_FD, 0) != 0 && errno != ENXIO) {
            const int e = errno;
            return Result::Fail(e, "LOOP_CLR_FD failed on " + std::string(device) + ": " + ErrText(e));
        }
        return Result::Ok();
    }

    Result Mount(std::string_view device,
                 std::string_view target_dir,
                 std::string_view fs_type,
                 unsigned long mount_flags) const override {
        if (::mount(std::string(device).c_str(),
                    std::string(target_dir).c_str(),
                    std::string(fs_type).c_str(),
                    mount_flags,
                    nullptr) != 0) {
            const int err = errno;
            return Result::Fail(err, "mount " + std::string(device) + " failed: " + ErrText(err));
        }
        return Result::Ok();
    }

    Result Unmount(std::string_view target_dir) const override {
        if (::umount2(std::string(target_dir).c_str(), 0) != 0) {
            return Result::Fail(errno, "umount failed: " + ErrText(errno));
        }
        return Result::Ok();
    }

    void RemoveDirectory(std::string_view dir) const override {
        std::error_code ec;
        fs::remove(fs::path(dir), ec);
    }
};

} // namespace

std::shared_ptr<const IMountOps> DefaultMountOps() {
    static const std::shared_ptr<const IMountOps> kDefault = std::make_shared<PosixMountOps>();
    return kDefault;
}

LoopDevice::LoopDevice() : ops_(DefaultMountOps()) {}

LoopDevice::LoopDevice(std::shared_ptr<const IMountOps> ops)
    : ops_(ops ? std::move(ops) : DefaultMountOps()) {}

LoopDevice::LoopDevice(LoopDevice&& other) noexcept
    : ops_(other.ops_), device_(std::move(other.device_)) {
    other.device_.clear();
}

LoopDevice& LoopDevice::operator=(LoopDevice&& other) noexcept {
    if (this == &other)
        return *this;
    (void)Detach();
    ops_ = other.ops_;
    device_ = std::move(other.device_);
    other.device_.clear();
    return *this;
}

LoopDevice::~LoopDevice() {
    auto r = Detach();
    if (!r.is_ok()) {
        LogWarn("Loop device %s left attached: %s", device_.c_str(), r.msg.c_str());
    }
}

Result LoopDevice::Attach(std::string_view image,
                          const PartitionExtent& extent,
                          bool read_only,
                          LoopDevice& out) {
    if (auto r = out.Detach(); !r.is_ok()) return r;
    auto r = out.ops_->AttachLoop(image, extent.OffsetBytes(), extent.SizeBytes(), read_only,
                                  out.device_);
    if (!r.is_ok()) {
        out.device_.clear();
        return r;
    }
    LogDebug("Attached %s to %s #%d", out.device_.c_str(), std::string(image).c_str(),
             extent.number);
    return Result::Ok();
}

Result LoopDevice::Detach() {
    if (device_.empty())
        return Result::Ok();
    auto r = ops_->DetachLoop(device_);
    if (!r.is_ok())
        return r;
    device_.clear();
    return Result::Ok();
}

MountSession::MountSession() : ops_(DefaultMountOps()), loop_(ops_) {}

MountSession::MountSession(std::shared_ptr<const IMountOps> ops)
    : ops_(ops ? std::move(ops) : DefaultMountOps()), loop_(ops_) {}

MountSession::MountSession(MountSession&& other) noexcept
    : ops_(other.ops_), loop_(std::move(other.loop_)), dir_(std::move(other.dir_)),
      mounted_(other.mounted_) {
    other.mounted_ = false;
    other.dir_.clear();
}

MountSession& MountSession::operator=(MountSession&& other) noexcept {
    if (this == &other)
        return *this;
    Cleanup();
    ops_ = other.ops_;
    loop_ = std::move(other.loop_);
    dir_ = std::move(other.dir_);
    mounted_ = other.mounted_;
    other.mounted_ = false;
    other.dir_.clear();
    return *this;
}

MountSession::~MountSession() { Cleanup(); }

Result MountSession::MountPartition(std::string_view image,
                                    const PartitionExtent& extent,
                                    std::string_view fs_type,
                                    unsigned long mount_flags,
                                    std::string_view mount_base_dir,
                                    MountSession& out) {
    out.Cleanup();

    const bool read_only = (mount_flags & MS_RDONLY) != 0;
    LoopDevice loop(out.ops_);
    if (auto r = LoopDevice::Attach(image, extent, read_only, loop); !r.is_ok()) {
        return r.Wrap("Cannot map partition #" + std::to_string(extent.number) + " of " +
                      std::string(image));
    }

    auto create_result = out.ops_->CreateMountPoint(mount_base_dir, kMountPrefix, out.dir_);
    if (!create_result.is_ok()) {
        out.dir_.clear();
        return create_result;
    }

    auto mount_result = out.ops_->Mount(loop.Device(), out.dir_, fs_type, mount_flags);
    if (!mount_result.is_ok()) {
        out.Cleanup();
        return mount_result.Wrap("Cannot mount partition #" + std::to_string(extent.number) +
                                 " of " + std::string(image));
    }

    out.loop_ = std::move(loop);
    out.mounted_ = true;
    LogDebug("Mounted %s #%d at %s (%s)", std::string(image).c_str(), extent.number,
             out.dir_.c_str(), read_only ? "ro" : "rw");
    return Result::Ok();
}

Result MountSession::Unmount() {
    if (!mounted_ || dir_.empty())
        return Result::Ok();

    auto unmount_result = ops_->Unmount(dir_);
    if (!unmount_result.is_ok())
        return unmount_result;

    mounted_ = false;
    ops_->RemoveDirectory(dir_);
    dir_.clear();
    return loop_.Detach();
}

void MountSession::Cleanup() {
    if (mounted_ && !dir_.empty()) {
        auto r = ops_->Unmount(dir_);
        if (!r.is_ok()) LogWarn("Cannot unmount %s: %s", dir_.c_str(), r.msg.c_str());
    }
    mounted_ = false;
    if (!dir_.empty()) {
        ops_->RemoveDirectory(dir_);
        dir_.clear();
    }
    if (auto r = loop_.Detach(); !r.is_ok()) {
        LogWarn("Cannot detach %s: %s", loop_.Device().c_str(), r.msg.c_str());
    }
}

} // namespace fpack
