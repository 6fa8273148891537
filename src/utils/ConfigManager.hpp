#pragma once
#include <pollswitch/Types.hpp>
#include <QDateTime>
#include <QObject>
#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace pollswitch {

struct WatcherSettings;

struct SteamSettings {
    std::string installPath;
    std::vector<SteamLibrary> libraries;
    QDateTime lastScan;
};

struct AppConfig {
    int defaultPollingRate{DEFAULT_POLLING_RATE};
    int gamePollingRate{GAME_POLLING_RATE};
    std::chrono::milliseconds checkInterval{CHECK_INTERVAL};
    bool notifications{true};
    std::vector<std::string> games;
    std::vector<CustomGame> customGames;
    std::vector<DetectedGame> detectedGames;
    std::optional<SteamSettings> steam;
};

class ConfigManager : public QObject {
    Q_OBJECT

public:
    explicit ConfigManager(QObject* parent = nullptr);
    ~ConfigManager();

    static AppConfig defaults();

    const AppConfig& config() const;

    // Reads a JSON config file. A missing file is created from the defaults
    // and true is returned. Throws ConfigError on unreadable or invalid files.
    bool load(const std::string& filename);

    // Atomic replace. Throws ConfigError.
    void save(const std::string& filename) const;

    void resetToDefaults();

    WatcherSettings watcherSettings() const;

    // Legacy, custom and detected executables, without duplicates.
    std::vector<std::string> watchedProcesses() const;

    // Both throw ConfigError.
    void addCustomGame(const std::string& name,
                       const std::string& executable,
                       const std::string& path = "");
    void removeCustomGame(const std::string& name);

    void updateWithSteamData(const std::string& installPath,
                             const std::vector<SteamLibrary>& libraries,
                             const std::vector<DetectedGame>& games,
                             const QDateTime& scanTime = QDateTime::currentDateTimeUtc());

    // False when the last scan is younger than RESCAN_MIN_AGE hours.
    bool isRescanDue(const QDateTime& now = QDateTime::currentDateTimeUtc()) const;

signals:
    void gamesChanged();

private:
    class Private;
    std::unique_ptr<Private> d;
};

}
