#pragma once

#include <cstdint>

namespace fpack::layout {

// Partition numbers of a Chromium OS style image. Roles are a numbering
// convention only; nothing in the table records them.
inline constexpr int kStateful = 1;
inline constexpr int kKernelA = 2;
inline constexpr int kRootfsA = 3;
inline constexpr int kKernelB = 4;
inline constexpr int kRootfsB = 5;
inline constexpr int kKernelC = 6;
inline constexpr int kRootfsC = 7;
inline constexpr int kOem = 8;
inline constexpr int kReserved9 = 9;
inline constexpr int kReserved10 = 10;
inline constexpr int kFirmware = 11;
inline constexpr int kEfi = 12;

// Where the kernel of a recovery image really lives.
inline constexpr int kRecoveryKernel = kKernelB;

// Composite disk image: factory install slot A, release slot B.
inline constexpr int kDiskFactoryKernel = kKernelA;
inline constexpr int kDiskFactoryRootfs = kRootfsA;
inline constexpr int kDiskReleaseKernel = kKernelB;
inline constexpr int kDiskReleaseRootfs = kRootfsB;

// Filesystem types used to mount partitions. The rootfs is mounted as ext2 so
// that the kernel never replays or touches an ext4 journal.
inline constexpr const char* kStatefulFsType = "ext4";
inline constexpr const char* kRootfsFsType = "ext2";
inline constexpr const char* kEfiFsType = "vfat";

inline constexpr std::uint64_t kDefaultDiskSectors = 31277232;

// Default GPT geometry, in 512-byte sectors.
inline constexpr std::uint64_t kFirstUsableSector = 64;
inline constexpr std::uint64_t kGptReservedSectors = 33;  // entries + header at either end
inline constexpr std::uint64_t kKernelSectors = 32768;    // 16 MiB
inline constexpr std::uint64_t kRootfsSectors = 4194304;  // 2 GiB
inline constexpr std::uint64_t kOemSectors = 32768;       // 16 MiB
inline constexpr std::uint64_t kEfiSectors = 32768;       // 16 MiB
inline constexpr std::uint64_t kMinStatefulSectors = 2048;

} // namespace fpack::layout
