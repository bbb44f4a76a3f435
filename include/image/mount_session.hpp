#pragma once

#include "image/partition_table.hpp"
#include "util/result.hpp"

#include <memory>
#include <string>
#include <string_view>

namespace fpack {

// System calls behind partition mounts. Tests substitute a fake.
class IMountOps {
  public:
    virtual ~IMountOps() = default;
    virtual Result CreateMountPoint(std::string_view mount_base_dir,
                                    std::string_view mount_prefix,
                                    std::string& out_dir) const = 0;
    // Binds a free loop device to `size` bytes of `image` starting at `offset`.
    virtual Result AttachLoop(std::string_view image,
                              std::uint64_t offset,
                              std::uint64_t size,
                              bool read_only,
                              std::string& out_device) const = 0;
    virtual Result DetachLoop(std::string_view device) const = 0;
    virtual Result Mount(std::string_view device,
                         std::string_view target_dir,
                         std::string_view fs_type,
                         unsigned long mount_flags) const = 0;
    virtual Result Unmount(std::string_view target_dir) const = 0;
    virtual void RemoveDirectory(std::string_view dir) const = 0;
};

std::shared_ptr<const IMountOps> DefaultMountOps();

// A loop device over one partition of an image, detached on destruction.
class LoopDevice {
  public:
    LoopDevice();
    explicit LoopDevice(std::shared_ptr<const IMountOps> ops);
    LoopDevice(const LoopDevice&) = delete;
    LoopDevice& operator=(const LoopDevice&) = delete;
    LoopDevice(LoopDevice&& other) noexcept;
    LoopDevice& operator=(LoopDevice&& other) noexcept;
    ~LoopDevice();

    static Result Attach(std::string_view image,
                         const PartitionExtent& extent,
                         bool read_only,
                         LoopDevice& out);

    Result Detach();
    const std::string& Device() const { return device_; }

  private:
    std::shared_ptr<const IMountOps> ops_;
    std::string device_;
};

// A partition of an image mounted at a scratch directory. Unmounted, detached
// and the directory removed on destruction.
class MountSession {
  public:
    MountSession();
    explicit MountSession(std::shared_ptr<const IMountOps> ops);
    MountSession(const MountSession&) = delete;
    MountSession& operator=(const MountSession&) = delete;
    MountSession(MountSession&& other) noexcept;
    MountSession& operator=(MountSession&& other) noexcept;
    ~MountSession();

    static Result MountPartition(std::string_view image,
                                 const PartitionExtent& extent,
                                 std::string_view fs_type,
                                 unsigned long mount_flags,
                                 std::string_view mount_base_dir,
                                 MountSession& out);

    Result Unmount();
    const std::string& Dir() const { return dir_; }

  private:
    void Cleanup();

    std::shared_ptr<const IMountOps> ops_;
    LoopDevice loop_;
    std::string dir_;
    bool mounted_ = false;
};

} // namespace fpack
