#pragma once

#include "image/partition_transfer.hpp"
#include "io/io.hpp"
#include "system/scratch.hpp"
#include "util/result.hpp"

#include <cstdint>
#include <expected>
#include <span>
#include <string>
#include <string_view>

namespace fpack {

// Boot variant of a kernel partition.
//   Ssd:      partition 2 boots as-is.
//   Usb:      partition 2 needs the stateful boot block patched in.
//   Recovery: like Usb, but the real kernel is partition 4.
enum class KernelVariant {
    Ssd,
    Usb,
    Recovery,
};

const char* KernelVariantName(KernelVariant variant);

// Verified-boot key block header fields used for classification.
namespace keyblock {
inline constexpr std::string_view kMagic = "CHROMEOS";
inline constexpr size_t kFlagsOffset = 72;  // magic:8 version:4+4 size:8 signature:24 checksum:24
inline constexpr std::uint64_t kFlagDeveloper0 = 0x1;
inline constexpr std::uint64_t kFlagDeveloper1 = 0x2;
inline constexpr std::uint64_t kFlagRecovery0 = 0x4;
inline constexpr std::uint64_t kFlagRecovery1 = 0x8;
} // namespace keyblock

// Collects printable runs that look like a kernel command line ("root=...").
class KernelConfigScanner {
  public:
    void Feed(std::span<const std::uint8_t> chunk);
    void Finish();

    const std::string& Config() const { return config_; }
    bool HasWord(std::string_view word) const;

  private:
    void EndRun();

    std::string run_;
    std::string config_;
};

// Classifies a kernel blob read from `reader`. The error names the detected
// type ("invalid", "factory_install", "other") when it is not usable.
std::expected<KernelVariant, std::string> ClassifyKernel(IReader& reader);

struct ClassifiedKernel {
    KernelVariant variant = KernelVariant::Ssd;
    // Scratch copy of partition 2, owned by the run's ScratchSet.
    std::string extracted_path;
};

class ImageClassifier {
  public:
    ImageClassifier(const PartitionTransferEngine& engine, ScratchSet& scratch);

    // Extracts partition 2 of `image` to a scratch file and classifies it.
    Result Classify(const std::string& image, ClassifiedKernel& out) const;

  private:
    const PartitionTransferEngine& engine_;
    ScratchSet& scratch_;
};

} // namespace fpack
