#include "SteamLocator.hpp"
#include "VdfParser.hpp"
#include "core/Logger.hpp"
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QSettings>
#include <QStringList>
#include <QtGlobal>

namespace pollswitch {

namespace {

QString normalized(const QString& path) {
    return QDir::cleanPath(QDir::fromNativeSeparators(path)).toLower();
}

} // namespace

bool SteamLocator::isValidInstallation(const QString& path) {
    if (path.isEmpty()) {
        return false;
    }
    QDir dir(path);
    return QFileInfo(dir.filePath("steam.exe")).isFile() &&
           QFileInfo(dir.filePath("steamapps")).isDir();
}

bool SteamLocator::isValidLibrary(const QString& path) {
    if (path.isEmpty() || !QFileInfo(path).isDir()) {
        return false;
    }
    QFileInfo steamApps(QDir(path).filePath("steamapps"));
    return steamApps.isDir() && steamApps.isReadable();
}

std::optional<QString> SteamLocator::registryPath() const {
#ifdef Q_OS_WIN
    QSettings user("HKEY_CURRENT_USER\\Software\\Valve\\Steam", QSettings::NativeFormat);
    for (const char* key : {"SteamPath", "InstallPath"}) {
        QString value = user.value(key).toString();
        if (!value.isEmpty()) {
            return QDir::toNativeSeparators(value);
        }
    }

    QSettings machine("HKEY_LOCAL_MACHINE\\SOFTWARE\\WOW6432Node\\Valve\\Steam",
                      QSettings::NativeFormat);
    QString value = machine.value("InstallPath").toString();
    if (!value.isEmpty()) {
        return QDir::toNativeSeparators(value);
    }
#endif
    return std::nullopt;
}

std::optional<std::string> SteamLocator::findInstallation(const std::string& configuredPath) const {
    QStringList candidates;
    if (!configuredPath.empty()) {
        candidates << QString::fromStdString(configuredPath);
    }
    if (auto fromRegistry = registryPath()) {
        candidates << *fromRegistry;
    }
    candidates << "C:/Program Files (x86)/Steam"
               << "C:/Program Files/Steam"
               << "D:/Steam"
               << "E:/Steam";
    const QString fromEnv = qEnvironmentVariable("STEAM_PATH");
    if (!fromEnv.isEmpty()) {
        candidates << fromEnv;
    }

    for (const auto& candidate : candidates) {
        if (isValidInstallation(candidate)) {
            return QDir::toNativeSeparators(candidate).toStdString();
        }
    }
    return std::nullopt;
}

std::vector<SteamLibrary> SteamLocator::discoverLibraries(const std::string& steamPath) const {
    const QString mainPath = QString::fromStdString(steamPath);
    std::vector<SteamLibrary> libraries{{steamPath, "Main"}};

    QFile file(QDir(mainPath).filePath("steamapps/libraryfolders.vdf"));
    if (!file.open(QIODevice::ReadOnly)) {
        POLLSWITCH_LOG_DEBUG("Could not read libraryfolders.vdf: " +
                             file.errorString().toStdString());
        return libraries;
    }

    const auto folders = VdfParser::parseLibraryFolders(file.readAll().toStdString());
    for (const auto& [index, folder] : folders) {
        if (folder.path.empty()) {
            continue;
        }

        const QString path = QString::fromStdString(folder.path);
        if (normalized(path) == normalized(mainPath)) {
            continue;
        }

        if (!isValidLibrary(path)) {
            POLLSWITCH_LOG_DEBUG("Skipping inaccessible library: " + folder.path);
            continue;
        }

        std::string label = folder.label;
        if (label.empty()) {
            if (folder.path.size() >= 2 && folder.path[1] == ':') {
                label = std::string("Drive ") + folder.path[0];
            } else {
                label = "External";
            }
        }
        libraries.push_back({folder.path, label});
    }

    POLLSWITCH_LOG_DEBUG("Found " + std::to_string(libraries.size()) + " Steam libraries");
    return libraries;
}

}
