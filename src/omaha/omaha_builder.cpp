// omaha_builder.cpp - Mini-omaha server data set generation.

#include "omaha/omaha_builder.hpp"

#include "image/layout.hpp"
#include "util/logger.hpp"
#include "util/path_utils.hpp"

#include <filesystem>
#include <system_error>

namespace fpack {

namespace fs = std::filesystem;

OmahaBuilder::OmahaBuilder(const CompressHashPipeline& pipeline, const ManifestAggregator& aggregator)
    : pipeline_(pipeline), aggregator_(aggregator) {}

std::string OmahaBuilder::DataDir(const std::string& omaha_dir, const std::string& subfolder) {
    std::string dir = JoinPath(omaha_dir, kOmahaStaticDir) + "/";
    if (!subfolder.empty()) dir = JoinPath(dir, subfolder) + "/";
    return dir;
}

std::string OmahaBuilder::ConfigPath(const std::string& omaha_dir) {
    return JoinPath(omaha_dir, kOmahaConfigName);
}

Result OmahaBuilder::PrepareDataDir(const std::string& dir) {
    const char* const stale[] = {
        artifact::kFactoryRootfs, artifact::kReleaseRootfs, artifact::kLegacyUpdate,
        artifact::kEfi,           artifact::kOem,           artifact::kState,
        artifact::kHwid,          artifact::kFirmware,      artifact::kComplete,
    };
    std::error_code ec;
    for (const char* name : stale) {
        const std::string path = JoinPath(dir, name);
        fs::remove(path, ec);
        if (ec) return Result::Fail(ec.value(), "Cannot remove stale " + path + ": " + ec.message());
    }
    fs::create_directories(dir, ec);
    if (ec) return Result::Fail(ec.value(), "Cannot create " + dir + ": " + ec.message());
    return Result::Ok();
}

Result OmahaBuilder::CompressOptional(const std::optional<std::string>& input, const std::string& out_path,
                                      const char* name, std::optional<std::string>& out_digest) const {
    out_digest.reset();
    if (!input) return Result::Ok();
    Artifact a;
    if (auto r = pipeline_.CompressFile(*input, out_path, a); !r.is_ok()) return r;
    LogInfo("%s: %s", name, a.digest.c_str());
    out_digest = a.digest;
    return Result::Ok();
}

Result OmahaBuilder::Build(const ServerJob& job, ManifestRecord& out) const {
    using namespace layout;

    const std::string data_dir = DataDir(job.omaha_dir, job.subfolder);
    const std::string conf = ConfigPath(job.omaha_dir);
    if (auto r = PrepareDataDir(data_dir); !r.is_ok()) return r;

    LogInfo("Generating omaha release image from %s", job.release.c_str());
    LogInfo("Generating omaha factory image from %s", job.factory.c_str());
    LogInfo("Output omaha image to %s", data_dir.c_str());
    LogInfo("Output omaha config to %s", conf.c_str());

    ManifestRecord rec{.board = job.board, .subfolder = job.subfolder};
    auto data = [&](const char* name) { return JoinPath(data_dir, name); };
    Artifact a;

    const PayloadSource release_kernel =
        job.release_kernel ? PayloadSource{.path = *job.release_kernel}
                           : PayloadSource{.path = job.release, .partition = kKernelA};
    if (auto r = pipeline_.CompressMemento(release_kernel, {.path = job.release, .partition = kRootfsA},
                                           data(artifact::kReleaseRootfs), a);
        !r.is_ok()) {
        return r;
    }
    rec.release_checksum = a.digest;
    LogInfo("release: %s", a.digest.c_str());

    if (auto r = pipeline_.CompressPartition(job.release, kOem, data(artifact::kOem), a); !r.is_ok()) return r;
    rec.oem_checksum = a.digest;
    LogInfo("oem: %s", a.digest.c_str());

    if (auto r = pipeline_.CompressMemento({.path = job.factory, .partition = kKernelA},
                                           {.path = job.factory, .partition = kRootfsA},
                                           data(artifact::kFactoryRootfs), a);
        !r.is_ok()) {
        return r;
    }
    rec.factory_checksum = a.digest;
    LogInfo("test: %s", a.digest.c_str());

    if (auto r = pipeline_.CompressPartition(job.factory, kStateful, data(artifact::kState), a); !r.is_ok())
        return r;
    rec.state_checksum = a.digest;
    LogInfo("state: %s", a.digest.c_str());

    if (auto r = pipeline_.CompressPartition(job.factory, kEfi, data(artifact::kEfi), a); !r.is_ok()) return r;
    rec.efi_checksum = a.digest;
    LogInfo("efi: %s", a.digest.c_str());

    if (auto r = CompressOptional(job.firmware_updater, data(artifact::kFirmware), "firmware",
                                  rec.firmware_checksum);
        !r.is_ok()) {
        return r;
    }
    if (auto r = CompressOptional(job.hwid_updater, data(artifact::kHwid), "hwid", rec.hwid_checksum);
        !r.is_ok()) {
        return r;
    }
    if (auto r = CompressOptional(job.complete_script, data(artifact::kComplete), "complete",
                                  rec.complete_checksum);
        !r.is_ok()) {
        return r;
    }

    // Subfolder runs add a board to an existing configuration.
    const bool append = !job.subfolder.empty();
    if (auto r = aggregator_.Record(conf, BuildGroup(rec), append); !r.is_ok()) return r;

    LogInfo("The miniomaha server lives in: %s", job.omaha_dir.c_str());
    out = std::move(rec);
    return Result::Ok();
}

} // namespace fpack
