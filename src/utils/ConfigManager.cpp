#include "ConfigManager.hpp"
#include "core/CommandEncoder.hpp"
#include "core/GameWatcher.hpp"
#include "core/Logger.hpp"
#include "core/ProcessSampler.hpp"
#include <pollswitch/Errors.hpp>
#include <QFile>
#include <QFileInfo>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QJsonParseError>
#include <QJsonValue>
#include <QSaveFile>
#include <QVariant>
#include <limits>
#include <unordered_set>

namespace pollswitch {

namespace {

QString qs(const std::string& s) {
    return QString::fromStdString(s);
}

std::string str(const QJsonValue& value) {
    return value.toString().toStdString();
}

} // namespace

class ConfigManager::Private {
public:
    AppConfig config;

    QJsonObject toJson() const {
        QJsonObject root;
        root["default_polling_rate"] = config.defaultPollingRate;
        root["game_polling_rate"] = config.gamePollingRate;
        root["check_interval_ms"] = static_cast<qint64>(config.checkInterval.count());
        root["notifications"] = config.notifications;

        QJsonArray games;
        for (const auto& game : config.games) {
            games.append(qs(game));
        }
        root["games"] = games;

        QJsonArray custom;
        for (const auto& game : config.customGames) {
            QJsonObject entry;
            entry["name"] = qs(game.name);
            entry["executable"] = qs(game.executable);
            if (!game.path.empty()) {
                entry["path"] = qs(game.path);
            }
            custom.append(entry);
        }
        root["custom_games"] = custom;

        QJsonArray detected;
        for (const auto& game : config.detectedGames) {
            QJsonObject entry;
            entry["name"] = qs(game.name);
            entry["app_id"] = qs(game.appId);
            entry["executable"] = qs(game.executable);
            entry["install_path"] = qs(game.installPath);
            entry["library"] = qs(game.library);
            entry["size_mb"] = static_cast<qint64>(game.sizeMb);
            detected.append(entry);
        }
        root["detected_games"] = detected;

        if (config.steam) {
            QJsonObject steam;
            steam["install_path"] = qs(config.steam->installPath);
            QJsonArray libraries;
            for (const auto& library : config.steam->libraries) {
                QJsonObject entry;
                entry["path"] = qs(library.path);
                entry["label"] = qs(library.label);
                libraries.append(entry);
            }
            steam["libraries"] = libraries;
            if (config.steam->lastScan.isValid()) {
                steam["last_scan"] = config.steam->lastScan.toString(Qt::ISODate);
            }
            root["steam"] = steam;
        }

        return root;
    }

    // Keys absent from the document keep their default values.
    void fromJson(const QJsonObject& root) {
        if (root.contains("default_polling_rate")) {
            config.defaultPollingRate = root["default_polling_rate"].toInt();
        }
        if (root.contains("game_polling_rate")) {
            config.gamePollingRate = root["game_polling_rate"].toInt();
        }
        if (root.contains("check_interval_ms")) {
            config.checkInterval = std::chrono::milliseconds(
                root["check_interval_ms"].toVariant().toLongLong());
        }
        if (root.contains("notifications")) {
            config.notifications = root["notifications"].toBool(true);
        }

        if (root.contains("games")) {
            config.games.clear();
            for (const auto& value : root["games"].toArray()) {
                config.games.push_back(str(value));
            }
        }

        config.customGames.clear();
        for (const auto& value : root["custom_games"].toArray()) {
            const QJsonObject entry = value.toObject();
            config.customGames.push_back({str(entry["name"]),
                                          str(entry["executable"]),
                                          str(entry["path"])});
        }

        config.detectedGames.clear();
        for (const auto& value : root["detected_games"].toArray()) {
            const QJsonObject entry = value.toObject();
            DetectedGame game;
            game.name = str(entry["name"]);
            game.appId = str(entry["app_id"]);
            game.executable = str(entry["executable"]);
            game.installPath = str(entry["install_path"]);
            game.library = str(entry["library"]);
            game.sizeMb = entry["size_mb"].toVariant().toLongLong();
            config.detectedGames.push_back(std::move(game));
        }

        config.steam.reset();
        if (root["steam"].isObject()) {
            const QJsonObject steamJson = root["steam"].toObject();
            SteamSettings steam;
            steam.installPath = str(steamJson["install_path"]);
            for (const auto& value : steamJson["libraries"].toArray()) {
                const QJsonObject entry = value.toObject();
                steam.libraries.push_back({str(entry["path"]), str(entry["label"])});
            }
            steam.lastScan = QDateTime::fromString(steamJson["last_scan"].toString(), Qt::ISODate);
            config.steam = std::move(steam);
        }
    }

    void validate() const {
        if (!CommandEncoder::isSupportedRate(config.defaultPollingRate)) {
            throw ConfigError("Invalid default_polling_rate: " +
                              std::to_string(config.defaultPollingRate));
        }
        if (!CommandEncoder::isSupportedRate(config.gamePollingRate)) {
            throw ConfigError("Invalid game_polling_rate: " +
                              std::to_string(config.gamePollingRate));
        }
        if (config.checkInterval.count() <= 0) {
            throw ConfigError("check_interval_ms must be positive");
        }
        if (config.checkInterval.count() > std::numeric_limits<int>::max()) {
            throw ConfigError("check_interval_ms is too large: " +
                              std::to_string(config.checkInterval.count()));
        }
    }
};

namespace {

// "DuneSandbox-Wi.exe" -> "Dunesandbox Wi"
std::string legacyGameName(const std::string& executable) {
    QString name = QString::fromStdString(executable);
    if (name.endsWith(".exe", Qt::CaseInsensitive)) {
        name.chop(4);
    }
    name.replace('_', ' ').replace('-', ' ');
    name = name.toLower();

    bool wordStart = true;
    for (int i = 0; i < name.size(); ++i) {
        if (name[i].isLetter() && wordStart) {
            name[i] = name[i].toUpper();
        }
        wordStart = !name[i].isLetterOrNumber();
    }
    return name.toStdString();
}

} // namespace

ConfigManager::ConfigManager(QObject* parent)
    : QObject(parent)
    , d(std::make_unique<Private>()) {
    d->config = defaults();
}

ConfigManager::~ConfigManager() = default;

AppConfig ConfigManager::defaults() {
    AppConfig config;
    config.games = {
        "HuntGame.exe",
        "DuneSandbox-Wi.exe",
        "eldenring.exe",
        "cs2.exe",
        "valorant.exe",
        "ApexLegends.exe"
    };
    return config;
}

const AppConfig& ConfigManager::config() const {
    return d->config;
}

bool ConfigManager::load(const std::string& filename) {
    QFile file(qs(filename));
    if (!file.exists()) {
        d->config = defaults();
        save(filename);
        POLLSWITCH_LOG_INFO("Created default config file: " + filename);
        return true;
    }

    if (!file.open(QIODevice::ReadOnly)) {
        throw ConfigError("Failed to read config file " + filename + ": " +
                          file.errorString().toStdString());
    }

    QJsonParseError parseError{};
    QJsonDocument doc = QJsonDocument::fromJson(file.readAll(), &parseError);
    if (doc.isNull() || !doc.isObject()) {
        throw ConfigError("Failed to parse config file " + filename + ": " +
                          parseError.errorString().toStdString());
    }

    Private parsed;
    parsed.config = defaults();
    parsed.fromJson(doc.object());
    parsed.validate();

    d->config = std::move(parsed.config);
    emit gamesChanged();
    return false;
}

void ConfigManager::save(const std::string& filename) const {
    QFileInfo info(qs(filename));
    QSaveFile file(info.absoluteFilePath());
    if (!file.open(QIODevice::WriteOnly)) {
        throw ConfigError("Failed to write config file " + filename + ": " +
                          file.errorString().toStdString());
    }

    file.write(QJsonDocument(d->toJson()).toJson(QJsonDocument::Indented));
    if (!file.commit()) {
        throw ConfigError("Failed to save config file " + filename + ": " +
                          file.errorString().toStdString());
    }
}

void ConfigManager::resetToDefaults() {
    d->config = defaults();
    emit gamesChanged();
}

WatcherSettings ConfigManager::watcherSettings() const {
    WatcherSettings settings;
    settings.defaultRate = d->config.defaultPollingRate;
    settings.gameRate = d->config.gamePollingRate;
    settings.checkInterval = d->config.checkInterval;
    settings.games = watchedProcesses();
    return settings;
}

std::vector<std::string> ConfigManager::watchedProcesses() const {
    std::vector<std::string> result;
    std::unordered_set<std::string> seen;

    auto add = [&](const std::string& executable) {
        if (executable.empty()) {
            return;
        }
        if (seen.insert(ProcessSnapshot::fold(executable)).second) {
            result.push_back(executable);
        }
    };

    for (const auto& game : d->config.games) {
        add(game);
    }
    for (const auto& game : d->config.customGames) {
        add(game.executable);
    }
    for (const auto& game : d->config.detectedGames) {
        add(game.executable);
    }

    return result;
}

void ConfigManager::addCustomGame(const std::string& name,
                                  const std::string& executable,
                                  const std::string& path) {
    if (name.empty() || executable.empty()) {
        throw ConfigError("Game name and executable are required");
    }

    const std::string key = ProcessSnapshot::fold(name);
    const std::string executableKey = ProcessSnapshot::fold(executable);
    for (const auto& game : d->config.customGames) {
        if (ProcessSnapshot::fold(game.name) == key) {
            throw ConfigError("Custom game already exists: " + name);
        }
        if (ProcessSnapshot::fold(game.executable) == executableKey) {
            throw ConfigError("Game with executable '" + executable + "' already exists");
        }
    }

    d->config.customGames.push_back({name, executable, path});
    emit gamesChanged();
}

void ConfigManager::removeCustomGame(const std::string& name) {
    const std::string key = ProcessSnapshot::fold(name);
    auto& games = d->config.customGames;

    for (auto it = games.begin(); it != games.end(); ++it) {
        if (ProcessSnapshot::fold(it->name) == key) {
            games.erase(it);
            emit gamesChanged();
            return;
        }
    }

    throw ConfigError("Custom game not found: " + name);
}

void ConfigManager::updateWithSteamData(const std::string& installPath,
                                        const std::vector<SteamLibrary>& libraries,
                                        const std::vector<DetectedGame>& games,
                                        const QDateTime& scanTime) {
    SteamSettings steam;
    steam.installPath = installPath;
    steam.libraries = libraries;
    steam.lastScan = scanTime;
    d->config.steam = std::move(steam);
    d->config.detectedGames = games;

    // First scan: hand-maintained legacy entries become custom games.
    if (d->config.customGames.empty() && !d->config.games.empty()) {
        for (const auto& executable : d->config.games) {
            if (!executable.empty()) {
                d->config.customGames.push_back({legacyGameName(executable), executable, ""});
            }
        }
        POLLSWITCH_LOG_DEBUG("Converted " + std::to_string(d->config.games.size()) +
                             " legacy games to custom games");
        d->config.games.clear();
    }

    emit gamesChanged();
}

bool ConfigManager::isRescanDue(const QDateTime& now) const {
    if (!d->config.steam || !d->config.steam->lastScan.isValid()) {
        return true;
    }
    return d->config.steam->lastScan.secsTo(now) >= qint64(RESCAN_MIN_AGE) * 3600;
}

}
