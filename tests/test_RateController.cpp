// tests/test_RateController.cpp
#include <gtest/gtest.h>
#include "core/CommandEncoder.hpp"
#include "core/RateController.hpp"
#include "fakes/FakeHidBackend.hpp"
#include <thread>
#include <vector>

namespace pollswitch {
namespace testing {

class RateControllerTest : public ::testing::Test {
protected:
    void SetUp() override {
        addTargetMouse(backend);
        controller = std::make_unique<RateController>(backend);
    }

    void TearDown() override {
        controller.reset();
    }

    FakeHidBackend backend;
    std::unique_ptr<RateController> controller;
};

TEST_F(RateControllerTest, ConnectOpensConfigInterface) {
    controller->connectDevice();

    EXPECT_TRUE(controller->isConnected());
    EXPECT_NO_THROW(controller->testConnection());
    ASSERT_EQ(backend.openedPaths.size(), 1u);
    EXPECT_NE(backend.openedPaths[0].find("mi_02"), std::string::npos);
    EXPECT_EQ(controller->devicePath(), backend.openedPaths[0]);
    EXPECT_EQ(controller->attributes().vendorId, TARGET_VENDOR_ID);
    EXPECT_EQ(controller->attributes().productId, TARGET_PRODUCT_ID);
}

TEST_F(RateControllerTest, FeatureReportFirst) {
    controller->connectDevice();

    EXPECT_EQ(controller->setRate(2000), TransmissionPath::FeatureReport);

    ASSERT_EQ(backend.featureReports().size(), 1u);
    EXPECT_EQ(backend.featureReports()[0], CommandEncoder::encode(2000));
    EXPECT_TRUE(backend.outputReports().empty());
}

TEST_F(RateControllerTest, ManualGameRate) {
    controller->connectDevice();
    controller->setRate(2000);

    ASSERT_EQ(backend.featureReports().size(), 1u);
    EXPECT_EQ(backend.featureReports()[0][8], 32);
}

TEST_F(RateControllerTest, RepeatedRateSendsIdenticalReports) {
    controller->connectDevice();
    controller->setRate(1000);
    controller->setRate(1000);

    const auto reports = backend.featureReports();
    ASSERT_EQ(reports.size(), 2u);
    EXPECT_EQ(reports[0], reports[1]);
}

TEST_F(RateControllerTest, FallsBackToOutputReport) {
    controller->connectDevice();
    backend.setRejectFeature(true);

    EXPECT_EQ(controller->setRate(1000), TransmissionPath::OutputReport);

    ASSERT_EQ(backend.outputReports().size(), 1u);
    EXPECT_EQ(backend.outputReports()[0], CommandEncoder::encode(1000));
}

TEST_F(RateControllerTest, BothPathsRejected) {
    controller->connectDevice();
    backend.setRejectFeature(true);
    backend.setRejectOutput(true);

    try {
        controller->setRate(2000);
        FAIL() << "expected TransmissionError";
    } catch (const TransmissionError& e) {
        EXPECT_EQ(e.code(), ErrorCodes::TRANSMISSION_FAILED);
        EXPECT_EQ(e.featureError(), "feature report rejected");
        EXPECT_EQ(e.outputError(), "output report rejected");
    }

    EXPECT_TRUE(controller->isConnected());
}

TEST_F(RateControllerTest, UnsupportedRateBeforeAnyIo) {
    EXPECT_THROW(controller->setRate(3000), UnsupportedRateError);
    EXPECT_EQ(backend.openCount(), 0);

    controller->connectDevice();
    EXPECT_THROW(controller->setRate(1234), UnsupportedRateError);
    EXPECT_TRUE(backend.featureReports().empty());
    EXPECT_TRUE(backend.outputReports().empty());
}

TEST_F(RateControllerTest, SetRateRequiresConnection) {
    EXPECT_THROW(controller->setRate(1000), NotConnectedError);
    EXPECT_THROW(controller->testConnection(), NotConnectedError);

    controller->connectDevice();
    controller->close();
    EXPECT_THROW(controller->setRate(1000), NotConnectedError);
}

TEST_F(RateControllerTest, FailedConnectLeavesDisconnected) {
    FakeHidBackend empty;
    RateController lonely(empty);
    EXPECT_THROW(lonely.connectDevice(), DeviceNotFoundError);
    EXPECT_FALSE(lonely.isConnected());

    backend.failOpen = true;
    EXPECT_THROW(controller->connectDevice(), DeviceOpenError);
    EXPECT_FALSE(controller->isConnected());
}

TEST_F(RateControllerTest, ReconnectReplacesHandle) {
    controller->connectDevice();
    controller->connectDevice();

    EXPECT_TRUE(controller->isConnected());
    EXPECT_EQ(backend.openCount(), 2);
    EXPECT_EQ(backend.closeCount(), 1);
}

TEST_F(RateControllerTest, CloseIsIdempotent) {
    controller->connectDevice();
    controller->close();
    controller->close();

    EXPECT_FALSE(controller->isConnected());
    EXPECT_EQ(backend.closeCount(), 1);
}

TEST_F(RateControllerTest, ConcurrentWritersAreSerialised) {
    controller->connectDevice();

    std::vector<std::thread> threads;
    for (int i = 0; i < 4; ++i) {
        threads.emplace_back([this, i]() {
            for (int j = 0; j < 25; ++j) {
                controller->setRate(i % 2 ? 2000 : 1000);
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    const auto reports = backend.featureReports();
    ASSERT_EQ(reports.size(), 100u);
    for (const auto& report : reports) {
        EXPECT_TRUE(report == CommandEncoder::encode(1000) ||
                    report == CommandEncoder::encode(2000));
    }
}

} // namespace testing
} // namespace pollswitch
