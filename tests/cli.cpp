#include <sstream>

#include <gtest/gtest.h>

#include "lib/cli.hpp"
#include "utils/colors.hpp"
#include "utils/logs.hpp"

using namespace testing;

namespace Cli {

/***********************************************************************************************************************
 * Suite
 **********************************************************************************************************************/

class CliTest : public Test {
protected:
    void SetUp() override
    {
        Colors::setEnabled(false);
        Logs::setStreams(mOut, mErr);
    }

    void TearDown() override { Logs::resetStreams(); }

    ParseResult Parse(std::vector<std::string> args)
    {
        args.insert(args.begin(), "bootcard");

        std::vector<char*> argv;
        for (auto& arg : args) {
            argv.push_back(arg.data());
        }
        argv.push_back(nullptr);

        mOptions = Options();

        return parseArguments(static_cast<int>(args.size()), argv.data(), mBoard, mOptions);
    }

    Board::BoardProfile mBoard = Board::beagleBoneBlack();
    Options             mOptions;
    std::ostringstream  mOut;
    std::ostringstream  mErr;
};

/***********************************************************************************************************************
 * Tests
 **********************************************************************************************************************/

TEST_F(CliTest, DeviceOnly)
{
    ASSERT_EQ(Parse({"/dev/sdb"}), ParseResult::RUN);

    EXPECT_EQ(mOptions.device, "/dev/sdb");
    EXPECT_TRUE(mOptions.sizeExpression.empty());
    EXPECT_TRUE(mOptions.imagesDir.empty());
    EXPECT_FALSE(mOptions.verbose);
}

TEST_F(CliTest, LongOptions)
{
    ASSERT_EQ(Parse({"--verbose", "--size", "+128M", "--images", "/srv/images", "/dev/mmcblk0"}), ParseResult::RUN);

    EXPECT_EQ(mOptions.device, "/dev/mmcblk0");
    EXPECT_EQ(mOptions.sizeExpression, "+128M");
    EXPECT_EQ(mOptions.imagesDir, "/srv/images");
    EXPECT_TRUE(mOptions.verbose);
}

TEST_F(CliTest, ShortOptionsAfterDevice)
{
    ASSERT_EQ(Parse({"/dev/sdc", "-v", "-s", "1G"}), ParseResult::RUN);

    EXPECT_EQ(mOptions.device, "/dev/sdc");
    EXPECT_EQ(mOptions.sizeExpression, "1G");
    EXPECT_TRUE(mOptions.verbose);
}

TEST_F(CliTest, BinaryUnitSizes)
{
    for (const auto& size : {"+64MiB", "+1GiB", "+256m"}) {
        ASSERT_EQ(Parse({"--size", size, "/dev/sdb"}), ParseResult::RUN) << "size: " << size;
        EXPECT_EQ(mOptions.sizeExpression, size);
    }
}

TEST_F(CliTest, OptionsAreResetBetweenParses)
{
    ASSERT_EQ(Parse({"-v", "/dev/sdb"}), ParseResult::RUN);
    ASSERT_EQ(Parse({"/dev/sdc"}), ParseResult::RUN);

    EXPECT_EQ(mOptions.device, "/dev/sdc");
    EXPECT_FALSE(mOptions.verbose);
}

TEST_F(CliTest, HelpPrintsUsageAndRequestsExit)
{
    internal::CaptureStdout();
    auto result = Parse({"--help", "/dev/sdb"});
    auto usage  = internal::GetCapturedStdout();

    EXPECT_EQ(result, ParseResult::EXIT_SUCCESS_REQUESTED);
    EXPECT_NE(usage.find("Usage: bootcard [OPTIONS] <SD_CARD_DEVICE>"), std::string::npos);
    EXPECT_NE(usage.find("barebox-am33xx-beaglebone-mlo.mmc.img -> MLO"), std::string::npos);
    EXPECT_NE(usage.find("barebox-am33xx-beaglebone.img -> barebox.bin"), std::string::npos);
    EXPECT_NE(usage.find("default: +64M"), std::string::npos);
}

TEST_F(CliTest, VersionRequestsExit)
{
    internal::CaptureStdout();
    auto result = Parse({"--version"});
    internal::GetCapturedStdout();

    EXPECT_EQ(result, ParseResult::EXIT_SUCCESS_REQUESTED);
}

TEST_F(CliTest, MissingDevice)
{
    internal::CaptureStderr();
    auto result = Parse({"-v"});
    internal::GetCapturedStderr();

    EXPECT_EQ(result, ParseResult::INVALID);
    EXPECT_NE(mErr.str().find("SD card device not specified"), std::string::npos);
}

TEST_F(CliTest, MultipleDevices)
{
    internal::CaptureStderr();
    auto result = Parse({"/dev/sdb", "/dev/sdc"});
    internal::GetCapturedStderr();

    EXPECT_EQ(result, ParseResult::INVALID);
    EXPECT_NE(mErr.str().find("Multiple devices specified"), std::string::npos);
}

TEST_F(CliTest, UnknownOption)
{
    internal::CaptureStderr();
    auto result = Parse({"--force", "/dev/sdb"});
    auto usage  = internal::GetCapturedStderr();

    EXPECT_EQ(result, ParseResult::INVALID);
    EXPECT_NE(usage.find("Usage:"), std::string::npos);
}

TEST_F(CliTest, SizeWithoutValue)
{
    internal::CaptureStderr();
    auto result = Parse({"/dev/sdb", "--size"});
    internal::GetCapturedStderr();

    EXPECT_EQ(result, ParseResult::INVALID);
}

TEST_F(CliTest, InvalidSizes)
{
    for (const auto& size : {"64 MiB", "+0M", "-64M", "+64X", "M", ""}) {
        auto result = Parse({"--size", size, "/dev/sdb"});

        if (std::string(size).empty()) {
            // An empty value falls back to the board default.
            EXPECT_EQ(result, ParseResult::RUN);
            continue;
        }

        EXPECT_EQ(result, ParseResult::INVALID) << "size: " << size;
    }
}

} // namespace Cli
