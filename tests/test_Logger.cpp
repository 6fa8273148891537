// tests/test_Logger.cpp
#include <gtest/gtest.h>
#include "core/Logger.hpp"
#include <QCoreApplication>
#include <QFile>
#include <QTemporaryDir>
#include <memory>

namespace pollswitch {
namespace testing {

class LoggerTest : public ::testing::Test {
protected:
    void SetUp() override {
        app = std::make_unique<QCoreApplication>(argc, argv);
        auto& logger = Logger::instance();
        logger.setLogDestination(LogDestination::Console);
        logger.setLogLevel(LogLevel::Info);
        logger.enableTimestamps(false);
        logger.enableSourceInfo(false);
    }

    void TearDown() override {
        auto& logger = Logger::instance();
        logger.setLogDestination(LogDestination::Console);
        logger.setLogLevel(LogLevel::Info);
        logger.enableTimestamps(true);
        app.reset();
    }

    int argc = 1;
    char* argv[1] = {(char*)"test"};
    std::unique_ptr<QCoreApplication> app;
};

TEST_F(LoggerTest, FiltersBelowLevel) {
    auto& logger = Logger::instance();
    logger.setLogLevel(LogLevel::Warning);

    logger.info("hidden info");
    logger.warning("visible warning");

    auto recent = logger.recentLogs(1);
    ASSERT_EQ(recent.size(), 1u);
    EXPECT_EQ(recent[0], "[WARNING] visible warning");
    EXPECT_EQ(logger.logLevel(), LogLevel::Warning);
}

TEST_F(LoggerTest, SourceInfo) {
    auto& logger = Logger::instance();
    logger.enableSourceInfo(true);

    logger.error("bad thing", "/src/core/RateController.cpp", "setRate");

    auto recent = logger.recentLogs(1);
    ASSERT_EQ(recent.size(), 1u);
    EXPECT_EQ(recent[0], "[ERROR] RateController.cpp:setRate - bad thing");
}

TEST_F(LoggerTest, EmitsLogAdded) {
    auto& logger = Logger::instance();
    std::vector<QString> messages;
    auto connection = QObject::connect(&logger, &Logger::logAdded,
        [&messages](LogLevel level, const QString& message) {
            if (level == LogLevel::Info) {
                messages.push_back(message);
            }
        });

    POLLSWITCH_LOG_INFO("Polling rate set to 2000Hz");
    POLLSWITCH_LOG_DEBUG("not emitted");
    QObject::disconnect(connection);

    ASSERT_EQ(messages.size(), 1u);
    EXPECT_EQ(messages[0], QString("Polling rate set to 2000Hz"));
}

TEST_F(LoggerTest, WritesAndRotatesFile) {
    QTemporaryDir dir;
    ASSERT_TRUE(dir.isValid());
    const QString file = dir.filePath("pollswitch.log");

    auto& logger = Logger::instance();
    logger.setLogFile(file.toStdString());
    logger.setLogDestination(LogDestination::File);
    logger.setMaxFileSize(64);

    logger.info("first line that is long enough to fill the log file");
    logger.info("second line");
    logger.flush();

    QFile current(file);
    ASSERT_TRUE(current.open(QIODevice::ReadOnly));
    EXPECT_EQ(QString::fromUtf8(current.readAll()).trimmed(), QString("[INFO] second line"));
    EXPECT_TRUE(QFile::exists(file + ".1"));

    logger.setMaxFileSize(5 * 1024 * 1024);
    logger.setLogFile("");
}

} // namespace testing
} // namespace pollswitch
