#include <gtest/gtest.h>

#include "testing.hpp"
#include "util/pack_options.hpp"

namespace fpack {
namespace {

class PackOptionsTest : public ::testing::Test {
  protected:
    void SetUp() override {
        release_ = tmp_.File("release.bin");
        factory_ = tmp_.File("factory.bin");
        file_ = tmp_.File("some.sh");
        for (const auto& p : {release_, factory_, file_}) testutil::WriteFile(p, "x");
    }

    PackOptions Server() const {
        PackOptions opt;
        opt.release = release_;
        opt.factory = factory_;
        opt.board = "x86-generic";
        opt.hwid_updater = "none";
        opt.omaha_dir = tmp_.Path();
        return opt;
    }

    PackOptions Disk() const {
        PackOptions opt;
        opt.release = release_;
        opt.factory = factory_;
        opt.diskimg = tmp_.File("disk.bin");
        opt.hwid_updater = "none";
        return opt;
    }

    PackOptions Usb() const {
        PackOptions opt;
        opt.release = release_;
        opt.factory = factory_;
        opt.usbimg = tmp_.File("usb.bin");
        opt.install_shim = file_;
        opt.hwid_updater = "none";
        return opt;
    }

    testutil::TemporaryDirectory tmp_;
    std::string release_;
    std::string factory_;
    std::string file_;
};

TEST_F(PackOptionsTest, ModeSelection) {
    EXPECT_EQ(Server().Mode(), PackMode::Server);
    EXPECT_EQ(Disk().Mode(), PackMode::DiskImage);
    EXPECT_EQ(Usb().Mode(), PackMode::UsbImage);
    EXPECT_STREQ(PackModeName(PackMode::Server), "mini-omaha");
}

TEST_F(PackOptionsTest, FirmwareSourcePerMode) {
    PackOptions server = Server();
    EXPECT_EQ(server.Firmware(), FirmwareSource::FromRelease);
    server.firmware_updater = "none";
    EXPECT_EQ(server.Firmware(), FirmwareSource::Disabled);
    server.firmware_updater = file_;
    EXPECT_EQ(server.Firmware(), FirmwareSource::File);

    EXPECT_EQ(Disk().Firmware(), FirmwareSource::Disabled);
    EXPECT_EQ(Usb().Firmware(), FirmwareSource::FromRelease);
}

TEST_F(PackOptionsTest, ValidModesPass) {
    PackOptions s = Server();
    PackOptions d = Disk();
    PackOptions u = Usb();
    EXPECT_TRUE(ValidateOptions(s).is_ok());
    EXPECT_TRUE(ValidateOptions(d).is_ok());
    EXPECT_TRUE(ValidateOptions(u).is_ok());
}

TEST_F(PackOptionsTest, UsbAndDiskAreExclusive) {
    PackOptions opt = Usb();
    opt.diskimg = tmp_.File("disk.bin");
    auto r = ValidateOptions(opt);
    EXPECT_FALSE(r.is_ok());
    EXPECT_EQ(r.err, EINVAL);
}

TEST_F(PackOptionsTest, MissingImagesAreReported) {
    PackOptions opt = Server();
    opt.release = tmp_.File("absent.bin");
    auto r = ValidateOptions(opt);
    EXPECT_EQ(r.err, ENOENT);

    opt = Server();
    opt.factory.clear();
    EXPECT_EQ(ValidateOptions(opt).err, EINVAL);
}

TEST_F(PackOptionsTest, HwidUpdaterMustBeFileOrNone) {
    PackOptions opt = Server();
    opt.hwid_updater.clear();
    auto r = ValidateOptions(opt);
    EXPECT_EQ(r.err, EINVAL);
    EXPECT_NE(r.msg.find("hwid_updater"), std::string::npos);

    opt = Disk();
    opt.hwid_updater = file_;
    EXPECT_TRUE(ValidateOptions(opt).is_ok());
    EXPECT_TRUE(opt.HasHwidUpdater());

    opt = Usb();
    opt.hwid_updater = tmp_.File("absent.sh");
    EXPECT_EQ(ValidateOptions(opt).err, ENOENT);
}

TEST_F(PackOptionsTest, DiskModeRejectsOtherModeParameters) {
    PackOptions opt = Disk();
    opt.firmware_updater = file_;
    EXPECT_EQ(ValidateOptions(opt).err, EINVAL);

    opt = Disk();
    opt.complete_script = file_;
    EXPECT_EQ(ValidateOptions(opt).err, EINVAL);

    opt = Disk();
    opt.install_shim = file_;
    EXPECT_EQ(ValidateOptions(opt).err, EINVAL);

    opt = Disk();
    opt.sectors = 0;
    EXPECT_EQ(ValidateOptions(opt).err, EINVAL);
}

TEST_F(PackOptionsTest, UsbModeNeedsShimAndNoCompleteScript) {
    PackOptions opt = Usb();
    opt.install_shim.clear();
    EXPECT_EQ(ValidateOptions(opt).err, EINVAL);

    opt = Usb();
    opt.complete_script = file_;
    EXPECT_EQ(ValidateOptions(opt).err, EINVAL);
}

TEST_F(PackOptionsTest, ServerModeChecks) {
    PackOptions opt = Server();
    opt.board.clear();
    EXPECT_EQ(ValidateOptions(opt).err, EINVAL);

    opt = Server();
    opt.install_shim = file_;
    EXPECT_EQ(ValidateOptions(opt).err, EINVAL);

    opt = Server();
    opt.complete_script = tmp_.File("absent.sh");
    EXPECT_EQ(ValidateOptions(opt).err, ENOENT);

    opt = Server();
    opt.complete_script = file_;
    opt.firmware_updater = "none";
    EXPECT_TRUE(ValidateOptions(opt).is_ok());
}

TEST_F(PackOptionsTest, SubfolderIsSingleComponent) {
    PackOptions opt = Server();
    opt.subfolder = "a/b";
    EXPECT_EQ(ValidateOptions(opt).err, EINVAL);
    opt.subfolder = "..";
    EXPECT_EQ(ValidateOptions(opt).err, EINVAL);
    opt.subfolder = "dvt-board";
    EXPECT_TRUE(ValidateOptions(opt).is_ok());
}

TEST_F(PackOptionsTest, PathsBecomeAbsolute) {
    PackOptions opt = Server();
    opt.release = tmp_.Path() + "/./sub/../release.bin";
    ASSERT_TRUE(ValidateOptions(opt).is_ok());
    EXPECT_EQ(opt.release, release_);
    EXPECT_EQ(opt.hwid_updater, "none");
}

TEST_F(PackOptionsTest, DefaultLocationsFromProgramDir) {
    PackOptions opt;
    ApplyDefaultLocations(opt, "/opt/factory");
    EXPECT_EQ(opt.omaha_dir, "/opt/factory");
    EXPECT_EQ(opt.shim_builder, "/opt/factory/make_universal_factory_shim.sh");

    opt.omaha_dir = "/srv/omaha";
    opt.shim_builder = "/bin/builder";
    ApplyDefaultLocations(opt, "/opt/factory");
    EXPECT_EQ(opt.omaha_dir, "/srv/omaha");
    EXPECT_EQ(opt.shim_builder, "/bin/builder");
}

} // namespace
} // namespace fpack
