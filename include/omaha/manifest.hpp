#pragma once

#include "util/result.hpp"

#include <expected>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace fpack {

// File names of the update server payloads.
namespace artifact {
inline constexpr const char* kReleaseRootfs = "rootfs-release.gz";
inline constexpr const char* kFactoryRootfs = "rootfs-test.gz";
inline constexpr const char* kOem = "oem.gz";
inline constexpr const char* kEfi = "efi.gz";
inline constexpr const char* kState = "state.gz";
inline constexpr const char* kFirmware = "firmware.gz";
inline constexpr const char* kHwid = "hwid.gz";
inline constexpr const char* kComplete = "complete.gz";
// Written by older tools; only ever removed.
inline constexpr const char* kLegacyUpdate = "update.gz";
} // namespace artifact

// One value of a manifest group: a quoted string, a set of strings, or a
// bare token kept verbatim (e.g. True, 42) from a hand-edited file.
struct ManifestValue {
    enum class Kind {
        String,
        Set,
        Raw,
    };

    Kind kind = Kind::String;
    std::string text;
    std::vector<std::string> items;

    static ManifestValue Str(std::string s) { return {.kind = Kind::String, .text = std::move(s)}; }
    static ManifestValue SetOf(std::vector<std::string> v) {
        return {.kind = Kind::Set, .items = std::move(v)};
    }

    bool operator==(const ManifestValue&) const = default;
};

// Ordered key/value record for one qualification id.
struct ManifestGroup {
    std::vector<std::pair<std::string, ManifestValue>> entries;

    void Set(std::string key, ManifestValue value);
    const ManifestValue* Find(std::string_view key) const;
    bool Has(std::string_view key) const { return Find(key) != nullptr; }

    bool operator==(const ManifestGroup&) const = default;
};

// The served-update configuration: `config = [ {group}, ... ]`.
struct ManifestDocument {
    std::vector<ManifestGroup> groups;

    // Whitespace-only input is an empty document. A missing closing ']' is
    // tolerated; an unterminated group is not.
    static std::expected<ManifestDocument, std::string> Parse(std::string_view text);
    std::string Serialize() const;
};

// Digests of one server-mode run. Optional payloads are left unset when the
// corresponding input was not given.
struct ManifestRecord {
    std::string board;
    std::string subfolder;
    std::string factory_checksum;
    std::string release_checksum;
    std::string oem_checksum;
    std::string efi_checksum;
    std::string state_checksum;
    std::optional<std::string> firmware_checksum;
    std::optional<std::string> hwid_checksum;
    std::optional<std::string> complete_checksum;
};

ManifestGroup BuildGroup(const ManifestRecord& record);

class ManifestAggregator {
  public:
    // Writes `group` to the manifest at `path`. With `append`, groups already
    // in an existing manifest are kept in front of it; a manifest that does
    // not parse is an error rather than being replaced.
    Result Record(const std::string& path, const ManifestGroup& group, bool append) const;
};

} // namespace fpack
