#pragma once
#include <pollswitch/Types.hpp>
#include <QString>
#include <optional>
#include <string>
#include <vector>

namespace pollswitch {

class SteamLocator {
public:
    // Tries the configured path, the registry, the default install folders
    // and finally %STEAM_PATH%.
    std::optional<std::string> findInstallation(const std::string& configuredPath = "") const;

    // The main library first, then every accessible extra library listed in
    // steamapps/libraryfolders.vdf.
    std::vector<SteamLibrary> discoverLibraries(const std::string& steamPath) const;

    static bool isValidInstallation(const QString& path);
    static bool isValidLibrary(const QString& path);

private:
    std::optional<QString> registryPath() const;
};

}
