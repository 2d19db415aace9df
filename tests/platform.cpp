#include <algorithm>
#include <csignal>
#include <sstream>

#include <gtest/gtest.h>

#include "lib/platform.hpp"
#include "utils/colors.hpp"
#include "utils/logs.hpp"

#include "utils/tempdir.hpp"

using namespace testing;

namespace Platform {

/***********************************************************************************************************************
 * Suite
 **********************************************************************************************************************/

class LinuxSystemTest : public Test {
protected:
    void SetUp() override
    {
        Colors::setEnabled(false);
        Logs::setStreams(mOut, mErr);

        mPrevSigpipe = std::signal(SIGPIPE, SIG_IGN);
    }

    void TearDown() override
    {
        std::signal(SIGPIPE, mPrevSigpipe);

        Logs::resetStreams();
        Logs::setVerbose(false);
    }

    using SignalHandler = void (*)(int);

    LinuxSystem        mSystem;
    testutils::TempDir mTempDir;
    std::ostringstream mOut;
    std::ostringstream mErr;
    SignalHandler      mPrevSigpipe = SIG_DFL;
};

/***********************************************************************************************************************
 * Tests
 **********************************************************************************************************************/

TEST_F(LinuxSystemTest, RunCapturesOutputAndStatus)
{
    auto result = mSystem.run({"sh", "-c", "echo out; echo err >&2; exit 3"});

    EXPECT_EQ(result.exitStatus, 3);
    EXPECT_FALSE(result.succeeded());
    EXPECT_NE(result.output.find("out"), std::string::npos);
    EXPECT_NE(result.output.find("err"), std::string::npos);
}

TEST_F(LinuxSystemTest, RunFeedsInput)
{
    auto result = mSystem.run({"cat"}, "label: dos\nstart=2048, size=+64M\n");

    EXPECT_TRUE(result.succeeded());
    EXPECT_EQ(result.output, "label: dos\nstart=2048, size=+64M\n");
}

TEST_F(LinuxSystemTest, RunToolThatIgnoresInput)
{
    auto result = mSystem.run({"true"}, std::string(1 << 20, 'x'));

    EXPECT_TRUE(result.succeeded());
}

TEST_F(LinuxSystemTest, RunStreamsLargeInputThroughEcho)
{
    std::string input(1 << 20, 'x');

    auto result = mSystem.run({"cat"}, input);

    EXPECT_TRUE(result.succeeded());
    EXPECT_EQ(result.output.size(), input.size());
    EXPECT_EQ(result.output, input);
}

TEST_F(LinuxSystemTest, ChildRunsWithDefaultSigpipe)
{
    auto result = mSystem.run({"cat", "/proc/self/status"});
    ASSERT_TRUE(result.succeeded());

    auto pos = result.output.find("SigIgn:");
    ASSERT_NE(pos, std::string::npos);

    unsigned long long ignored = std::stoull(result.output.substr(pos + 7), nullptr, 16);

    EXPECT_EQ(ignored & (1ULL << (SIGPIPE - 1)), 0u);
}

TEST_F(LinuxSystemTest, RunMissingProgram)
{
    auto result = mSystem.run({"bootcard-no-such-tool"});

    EXPECT_EQ(result.exitStatus, 127);
}

TEST_F(LinuxSystemTest, RunEchoesCommandWhenVerbose)
{
    Logs::setVerbose(true);

    mSystem.run({"sh", "-c", "exit 0"});

    EXPECT_NE(mErr.str().find("+ sh -c 'exit 0'"), std::string::npos);
}

TEST_F(LinuxSystemTest, FindExecutable)
{
    EXPECT_TRUE(mSystem.findExecutable("sh"));
    EXPECT_TRUE(mSystem.findExecutable("/bin/sh"));
    EXPECT_FALSE(mSystem.findExecutable("bootcard-no-such-tool"));
    EXPECT_FALSE(mSystem.findExecutable(""));

    testutils::WriteFile(mTempDir / "plain", "not executable");
    EXPECT_FALSE(mSystem.findExecutable(mTempDir / "plain"));
}

TEST_F(LinuxSystemTest, FileChecks)
{
    testutils::WriteFile(mTempDir / "image.img", "data");

    EXPECT_TRUE(mSystem.isReadableFile(mTempDir / "image.img"));
    EXPECT_FALSE(mSystem.isReadableFile(mTempDir / "missing.img"));
    EXPECT_FALSE(mSystem.isReadableFile(mTempDir.Path().string()));

    EXPECT_FALSE(mSystem.isBlockDevice(mTempDir / "image.img"));
    EXPECT_FALSE(mSystem.isBlockDevice("/dev/bootcard-no-such-device"));
}

TEST_F(LinuxSystemTest, ResolvePathFollowsLinks)
{
    testutils::WriteFile(mTempDir / "node", "data");
    std::filesystem::create_symlink(mTempDir / "node", mTempDir / "by-id-link");

    auto expected = std::filesystem::canonical(mTempDir / "node").string();

    EXPECT_EQ(mSystem.resolvePath(mTempDir / "by-id-link"), expected);
    EXPECT_EQ(mSystem.resolvePath(mTempDir / "node"), expected);
    EXPECT_EQ(mSystem.resolvePath("/dev/bootcard-no-such-device"), "/dev/bootcard-no-such-device");
}

TEST_F(LinuxSystemTest, RereadIsReportedAsIoctl)
{
    testutils::WriteFile(mTempDir / "disk.img", std::string(4096, '\0'));
    Logs::setVerbose(true);

    mSystem.rereadPartitionTable(mTempDir / "disk.img");

    EXPECT_NE(mOut.str().find("ioctl BLKRRPART " + mTempDir / "disk.img"), std::string::npos);
    EXPECT_EQ(mErr.str().find("blockdev"), std::string::npos);
}

TEST_F(LinuxSystemTest, MountTableIsReadable)
{
    auto table = mSystem.mountTable();

    ASSERT_FALSE(table.empty());
    EXPECT_TRUE(std::any_of(table.begin(), table.end(), [](const MountEntry& entry) { return entry.target == "/"; }));
}

TEST_F(LinuxSystemTest, TempDirLifecycle)
{
    auto dir = mSystem.makeTempDir(mTempDir / "sdcard.");

    ASSERT_FALSE(dir.empty());
    EXPECT_EQ(dir.rfind(mTempDir / "sdcard.", 0), 0u);
    EXPECT_TRUE(std::filesystem::is_directory(dir));

    EXPECT_TRUE(mSystem.removeDir(dir));
    EXPECT_FALSE(std::filesystem::exists(dir));
    EXPECT_FALSE(mSystem.removeDir(dir));
}

TEST_F(LinuxSystemTest, TempDirFailure)
{
    EXPECT_TRUE(mSystem.makeTempDir(mTempDir / "missing/sdcard.").empty());
}

TEST_F(LinuxSystemTest, CopyFile)
{
    std::string content("\x00\x01" "binary\xff", 9);

    testutils::WriteFile(mTempDir / "source", content);
    testutils::WriteFile(mTempDir / "target", "old");

    EXPECT_TRUE(mSystem.copyFile(mTempDir / "source", mTempDir / "target"));
    EXPECT_EQ(testutils::ReadFile(mTempDir / "target"), content);

    EXPECT_FALSE(mSystem.copyFile(mTempDir / "missing", mTempDir / "target2"));
    EXPECT_NE(mErr.str().find("missing"), std::string::npos);
}

TEST_F(LinuxSystemTest, MountOfMissingDeviceFails)
{
    auto dir = mSystem.makeTempDir(mTempDir / "mnt.");
    ASSERT_FALSE(dir.empty());

    EXPECT_FALSE(mSystem.mount("/dev/bootcard-no-such-device", dir, "vfat"));
    EXPECT_FALSE(mSystem.unmount(dir, false));
}

} // namespace Platform
