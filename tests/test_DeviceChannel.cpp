// tests/test_DeviceChannel.cpp
#include <gtest/gtest.h>
#include "core/CommandEncoder.hpp"
#include "core/DeviceChannel.hpp"
#include "fakes/FakeHidBackend.hpp"

namespace pollswitch {
namespace testing {

class DeviceChannelTest : public ::testing::Test {
protected:
    FakeHidBackend backend;
    const std::string path{"\\\\?\\hid#vid_373e&pid_001e&mi_02#1"};
};

TEST_F(DeviceChannelTest, OpenAndClose) {
    DeviceChannel channel(backend);
    EXPECT_FALSE(channel.isOpen());

    channel.open(path);
    EXPECT_TRUE(channel.isOpen());
    EXPECT_EQ(channel.devicePath(), path);

    channel.close();
    EXPECT_FALSE(channel.isOpen());
    EXPECT_TRUE(channel.devicePath().empty());
    EXPECT_EQ(backend.closeCount(), 1);

    channel.close();
    EXPECT_EQ(backend.closeCount(), 1);
}

TEST_F(DeviceChannelTest, ReopenReleasesPreviousHandle) {
    DeviceChannel channel(backend);
    channel.open(path);
    channel.open(path + "#other");

    EXPECT_EQ(backend.openCount(), 2);
    EXPECT_EQ(backend.closeCount(), 1);
    EXPECT_EQ(channel.devicePath(), path + "#other");
}

TEST_F(DeviceChannelTest, DestructorReleasesHandle) {
    {
        DeviceChannel channel(backend);
        channel.open(path);
    }
    EXPECT_EQ(backend.closeCount(), 1);
}

TEST_F(DeviceChannelTest, OpenFailure) {
    backend.failOpen = true;
    DeviceChannel channel(backend);

    EXPECT_THROW(channel.open(path), DeviceOpenError);
    EXPECT_FALSE(channel.isOpen());
}

TEST_F(DeviceChannelTest, WritesWhenClosedFail) {
    DeviceChannel channel(backend);
    Report report = CommandEncoder::encode(1000);

    IoResult feature = channel.sendFeatureReport(report);
    IoResult output = channel.writeOutputReport(report);

    EXPECT_FALSE(feature.ok);
    EXPECT_FALSE(output.ok);
    EXPECT_FALSE(feature.error.empty());
    EXPECT_TRUE(backend.featureReports().empty());
    EXPECT_TRUE(backend.outputReports().empty());
}

TEST_F(DeviceChannelTest, PassesReportsThrough) {
    DeviceChannel channel(backend);
    channel.open(path);
    Report report = CommandEncoder::encode(4000);

    IoResult result = channel.sendFeatureReport(report);
    EXPECT_TRUE(result.ok);
    EXPECT_EQ(result.bytesTransferred, REPORT_SIZE);

    backend.setRejectFeature(true);
    result = channel.sendFeatureReport(report);
    EXPECT_FALSE(result.ok);
    EXPECT_EQ(result.error, "feature report rejected");

    ASSERT_EQ(backend.featureReports().size(), 1u);
    EXPECT_EQ(backend.featureReports()[0], report);
}

} // namespace testing
} // namespace pollswitch
