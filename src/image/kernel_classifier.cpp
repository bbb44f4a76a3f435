// kernel_classifier.cpp - Kernel partition boot type detection.

#include "image/kernel_classifier.hpp"

#include "image/layout.hpp"
#include "io/file_reader.hpp"
#include "io/file_writer.hpp"
#include "util/logger.hpp"

#include <array>
#include <cerrno>
#include <cstring>
#include <vector>

namespace fpack {

namespace {

constexpr size_t kMinRunLength = 4;
constexpr size_t kMaxRunLength = 64 * 1024;

bool IsPrintable(std::uint8_t c) { return (c >= 0x20 && c <= 0x7e) || c == '\t'; }

bool IsWordChar(char c) {
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') || c == '_';
}

// Reads until `out` is full or the reader is exhausted.
ssize_t ReadFully(IReader& reader, std::span<std::uint8_t> out) {
    size_t done = 0;
    while (done < out.size()) {
        const ssize_t n = reader.Read(out.subspan(done));
        if (n < 0) return -1;
        if (n == 0) break;
        done += static_cast<size_t>(n);
    }
    return static_cast<ssize_t>(done);
}

std::uint64_t LoadLe64(const std::uint8_t* p) {
    std::uint64_t v = 0;
    for (int i = 7; i >= 0; --i) v = (v << 8) | p[i];
    return v;
}

} // namespace

const char* KernelVariantName(KernelVariant variant) {
    switch (variant) {
        case KernelVariant::Ssd:      return "ssd";
        case KernelVariant::Usb:      return "usb";
        case KernelVariant::Recovery: return "recovery";
    }
    return "unknown";
}

void KernelConfigScanner::Feed(std::span<const std::uint8_t> chunk) {
    for (std::uint8_t c : chunk) {
        if (IsPrintable(c)) {
            if (run_.size() < kMaxRunLength) run_.push_back(static_cast<char>(c));
        } else {
            EndRun();
        }
    }
}

void KernelConfigScanner::Finish() { EndRun(); }

void KernelConfigScanner::EndRun() {
    if (run_.size() >= kMinRunLength && run_.find("root=") != std::string::npos) {
        if (!config_.empty()) config_.push_back('\n');
        config_ += run_;
    }
    run_.clear();
}

bool KernelConfigScanner::HasWord(std::string_view word) const {
    size_t pos = 0;
    while ((pos = config_.find(word, pos)) != std::string::npos) {
        const bool left_ok = pos == 0 || !IsWordChar(config_[pos - 1]);
        const size_t end = pos + word.size();
        const bool right_ok = end >= config_.size() || !IsWordChar(config_[end]);
        if (left_ok && right_ok) return true;
        pos = end;
    }
    return false;
}

std::expected<KernelVariant, std::string> ClassifyKernel(IReader& reader) {
    std::array<std::uint8_t, keyblock::kFlagsOffset + 8> header{};
    const ssize_t got = ReadFully(reader, header);
    if (got < 0) return std::unexpected("read error");
    if (static_cast<size_t>(got) < header.size() ||
        std::memcmp(header.data(), keyblock::kMagic.data(), keyblock::kMagic.size()) != 0) {
        return std::unexpected("invalid");
    }

    const std::uint64_t flags = LoadLe64(header.data() + keyblock::kFlagsOffset);
    if (flags & keyblock::kFlagRecovery0) {
        return KernelVariant::Ssd;
    }
    if (!(flags & keyblock::kFlagRecovery1)) {
        return std::unexpected("other");
    }
    if (!(flags & keyblock::kFlagDeveloper0)) {
        return std::unexpected("factory_install");
    }

    // Recovery-mode key block: recovery and USB kernels differ only in the
    // command line.
    KernelConfigScanner scanner;
    scanner.Feed(header);
    std::vector<std::uint8_t> buf(256 * 1024);
    while (true) {
        const ssize_t n = reader.Read(buf);
        if (n < 0) return std::unexpected("read error");
        if (n == 0) break;
        scanner.Feed(std::span<const std::uint8_t>(buf.data(), static_cast<size_t>(n)));
    }
    scanner.Finish();

    if (scanner.HasWord("cros_recovery") && scanner.HasWord("kern_b_hash")) {
        return KernelVariant::Recovery;
    }
    return KernelVariant::Usb;
}

ImageClassifier::ImageClassifier(const PartitionTransferEngine& engine, ScratchSet& scratch)
    : engine_(engine), scratch_(scratch) {}

Result ImageClassifier::Classify(const std::string& image, ClassifiedKernel& out) const {
    std::string kernel_path;
    if (auto r = scratch_.CreateFile("fpack-kernel-", kernel_path); !r.is_ok()) return r;

    {
        FileWriter writer;
        if (auto r = FileWriter::Open(kernel_path, writer); !r.is_ok()) return r;
        if (auto r = engine_.Dump(image, layout::kKernelA, writer); !r.is_ok()) {
            return r.Wrap("Cannot extract kernel partition from image " + image);
        }
        if (auto r = writer.Close(); !r.is_ok()) return r;
    }

    FileReader reader;
    if (auto r = FileReader::Open(kernel_path, reader); !r.is_ok()) return r;

    auto variant = ClassifyKernel(reader);
    if (!variant) {
        return Result::Fail(EINVAL, "Unexpected image type [" + variant.error() + "]: " + image);
    }

    out.variant = *variant;
    out.extracted_path = kernel_path;
    LogInfo("Image type is [%s]: %s", KernelVariantName(out.variant), image.c_str());
    return Result::Ok();
}

} // namespace fpack
