#include "Logger.hpp"
#include <chrono>
#include <ctime>
#include <deque>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>

#ifdef Q_OS_WIN
#include <windows.h>
#else
#include <syslog.h>
#endif

namespace pollswitch {

namespace {

struct LogEntry {
    std::chrono::system_clock::time_point timestamp;
    LogLevel level;
    std::string message;
    std::string source;
    std::string function;
};

const char* levelName(LogLevel level) {
    switch (level) {
        case LogLevel::Debug:    return "DEBUG";
        case LogLevel::Info:     return "INFO";
        case LogLevel::Warning:  return "WARNING";
        case LogLevel::Error:    return "ERROR";
        case LogLevel::Critical: return "CRITICAL";
    }
    return "UNKNOWN";
}

} // namespace

class Logger::Private {
public:
    LogLevel currentLevel{LogLevel::Info};
    LogDestination destination{LogDestination::Console};
    std::string logFile;
    std::size_t maxFileSize{5 * 1024 * 1024};
    bool includeTimestamps{true};
    bool includeSourceInfo{false};

    std::deque<LogEntry> recent;
    std::size_t maxRecent{500};
    mutable std::mutex logMutex;
    std::unique_ptr<std::ofstream> fileStream;

    void openLogFile() {
        if (!logFile.empty()) {
            fileStream = std::make_unique<std::ofstream>(logFile, std::ios::app);
        }
    }

    void closeLogFile() {
        if (fileStream) {
            fileStream->close();
            fileStream.reset();
        }
    }

    std::string format(const LogEntry& entry) const {
        std::ostringstream ss;

        if (includeTimestamps) {
            auto time = std::chrono::system_clock::to_time_t(entry.timestamp);
            std::tm local{};
#ifdef Q_OS_WIN
            localtime_s(&local, &time);
#else
            localtime_r(&time, &local);
#endif
            ss << std::put_time(&local, "%Y-%m-%d %H:%M:%S") << " ";
        }

        ss << "[" << levelName(entry.level) << "] ";

        if (includeSourceInfo && !entry.source.empty()) {
            ss << std::filesystem::path(entry.source).filename().string();
            if (!entry.function.empty()) {
                ss << ":" << entry.function;
            }
            ss << " - ";
        }

        ss << entry.message;
        return ss.str();
    }

    void writeToConsole(LogLevel level, const std::string& line) {
        if (level >= LogLevel::Error) {
            std::cerr << line << std::endl;
        } else {
            std::cout << line << std::endl;
        }
    }

    void writeToFile(const std::string& line) {
        rotateIfNeeded();
        if (!fileStream || !fileStream->is_open()) {
            openLogFile();
        }
        if (fileStream && fileStream->is_open()) {
            (*fileStream) << line << '\n';
            fileStream->flush();
        }
    }

    void writeToSystem(const std::string& line) {
#ifdef Q_OS_WIN
        OutputDebugStringA((line + "\n").c_str());
#else
        syslog(LOG_INFO, "%s", line.c_str());
#endif
    }

    // Keeps a single previous generation next to the active file.
    void rotateIfNeeded() {
        std::error_code ec;
        if (logFile.empty() || !std::filesystem::exists(logFile, ec)) {
            return;
        }
        auto size = std::filesystem::file_size(logFile, ec);
        if (ec || size < maxFileSize) {
            return;
        }

        closeLogFile();
        const std::string previous = logFile + ".1";
        std::filesystem::remove(previous, ec);
        std::filesystem::rename(logFile, previous, ec);
        if (ec) {
            std::cerr << "Failed to rotate log file: " << ec.message() << std::endl;
        }
        openLogFile();
    }
};

Logger& Logger::instance() {
    static Logger instance;
    return instance;
}

Logger::Logger()
    : d(std::make_unique<Private>()) {
    qRegisterMetaType<pollswitch::LogLevel>("pollswitch::LogLevel");
}

Logger::~Logger() = default;

void Logger::setLogLevel(LogLevel level) {
    std::lock_guard<std::mutex> lock(d->logMutex);
    d->currentLevel = level;
}

LogLevel Logger::logLevel() const {
    std::lock_guard<std::mutex> lock(d->logMutex);
    return d->currentLevel;
}

void Logger::setLogDestination(LogDestination dest) {
    std::lock_guard<std::mutex> lock(d->logMutex);
    d->destination = dest;
}

void Logger::setLogFile(const std::string& filename) {
    std::lock_guard<std::mutex> lock(d->logMutex);
    d->closeLogFile();
    d->logFile = filename;
    d->openLogFile();
}

void Logger::setMaxFileSize(std::size_t bytes) {
    std::lock_guard<std::mutex> lock(d->logMutex);
    d->maxFileSize = bytes;
}

void Logger::enableTimestamps(bool enable) {
    std::lock_guard<std::mutex> lock(d->logMutex);
    d->includeTimestamps = enable;
}

void Logger::enableSourceInfo(bool enable) {
    std::lock_guard<std::mutex> lock(d->logMutex);
    d->includeSourceInfo = enable;
}

void Logger::debug(const std::string& message,
                   const std::string& source,
                   const std::string& function) {
    log(LogLevel::Debug, message, source, function);
}

void Logger::info(const std::string& message,
                  const std::string& source,
                  const std::string& function) {
    log(LogLevel::Info, message, source, function);
}

void Logger::warning(const std::string& message,
                     const std::string& source,
                     const std::string& function) {
    log(LogLevel::Warning, message, source, function);
}

void Logger::error(const std::string& message,
                   const std::string& source,
                   const std::string& function) {
    log(LogLevel::Error, message, source, function);
}

void Logger::critical(const std::string& message,
                      const std::string& source,
                      const std::string& function) {
    log(LogLevel::Critical, message, source, function);
}

void Logger::log(LogLevel level,
                 const std::string& message,
                 const std::string& source,
                 const std::string& function) {
    {
        std::lock_guard<std::mutex> lock(d->logMutex);

        if (level < d->currentLevel) {
            return;
        }

        LogEntry entry{std::chrono::system_clock::now(), level, message, source, function};
        const std::string line = d->format(entry);

        d->recent.push_back(std::move(entry));
        while (d->recent.size() > d->maxRecent) {
            d->recent.pop_front();
        }

        if (d->destination == LogDestination::Console ||
            d->destination == LogDestination::All) {
            d->writeToConsole(level, line);
        }

        if (d->destination == LogDestination::File ||
            d->destination == LogDestination::All) {
            d->writeToFile(line);
        }

        if (d->destination == LogDestination::System ||
            d->destination == LogDestination::All) {
            d->writeToSystem(line);
        }
    }

    // Emitted outside the lock so receivers may log themselves.
    emit logAdded(level, QString::fromStdString(message));
}

void Logger::flush() {
    std::lock_guard<std::mutex> lock(d->logMutex);
    if (d->fileStream) {
        d->fileStream->flush();
    }
    std::cout.flush();
}

std::vector<std::string> Logger::recentLogs(std::size_t count) const {
    std::vector<std::string> result;
    std::lock_guard<std::mutex> lock(d->logMutex);

    std::size_t start = (count >= d->recent.size()) ? 0 : d->recent.size() - count;
    result.reserve(d->recent.size() - start);
    for (std::size_t i = start; i < d->recent.size(); ++i) {
        result.push_back(d->format(d->recent[i]));
    }

    return result;
}

} // namespace pollswitch
