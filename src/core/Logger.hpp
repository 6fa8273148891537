#pragma once
#include <QObject>
#include <QString>
#include <cstddef>
#include <memory>
#include <string>
#include <vector>

namespace pollswitch {

enum class LogLevel {
    Debug,
    Info,
    Warning,
    Error,
    Critical
};

enum class LogDestination {
    Console,
    File,
    System,
    All
};

class Logger : public QObject {
    Q_OBJECT

public:
    static Logger& instance();

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;
    Logger(Logger&&) = delete;
    Logger& operator=(Logger&&) = delete;

    // Configuration
    void setLogLevel(LogLevel level);
    LogLevel logLevel() const;
    void setLogDestination(LogDestination dest);
    void setLogFile(const std::string& filename);
    void setMaxFileSize(std::size_t bytes);
    void enableTimestamps(bool enable);
    void enableSourceInfo(bool enable);


    void debug(const std::string& message,
               const std::string& source = "",
               const std::string& function = "");
    void info(const std::string& message,
              const std::string& source = "",
              const std::string& function = "");
    void warning(const std::string& message,
                 const std::string& source = "",
                 const std::string& function = "");
    void error(const std::string& message,
               const std::string& source = "",
               const std::string& function = "");
    void critical(const std::string& message,
                  const std::string& source = "",
                  const std::string& function = "");

    void flush();
    std::vector<std::string> recentLogs(std::size_t count = 100) const;

signals:
    void logAdded(pollswitch::LogLevel level, const QString& message);

private:
    Logger();
    ~Logger();

    void log(LogLevel level,
             const std::string& message,
             const std::string& source,
             const std::string& function);

    class Private;
    std::unique_ptr<Private> d;
};

#define POLLSWITCH_LOG_DEBUG(msg) \
    ::pollswitch::Logger::instance().debug(msg, __FILE__, __FUNCTION__)
#define POLLSWITCH_LOG_INFO(msg) \
    ::pollswitch::Logger::instance().info(msg, __FILE__, __FUNCTION__)
#define POLLSWITCH_LOG_WARNING(msg) \
    ::pollswitch::Logger::instance().warning(msg, __FILE__, __FUNCTION__)
#define POLLSWITCH_LOG_ERROR(msg) \
    ::pollswitch::Logger::instance().error(msg, __FILE__, __FUNCTION__)
#define POLLSWITCH_LOG_CRITICAL(msg) \
    ::pollswitch::Logger::instance().critical(msg, __FILE__, __FUNCTION__)

} // namespace pollswitch

Q_DECLARE_METATYPE(pollswitch::LogLevel)
