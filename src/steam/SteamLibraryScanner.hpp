#pragma once
#include <pollswitch/Types.hpp>
#include <QString>
#include <optional>
#include <string>
#include <vector>

namespace pollswitch {

class SteamLibraryScanner {
public:
    // Installed games of every library, sorted by name. Libraries or
    // manifests that cannot be read are logged and skipped.
    std::vector<DetectedGame> scan(const std::vector<SteamLibrary>& libraries) const;
    std::vector<DetectedGame> scanLibrary(const SteamLibrary& library) const;

    // File name of the most likely main executable below installDir.
    static std::optional<std::string> findExecutable(const QString& installDir,
                                                     const std::string& gameName);

    static std::vector<std::string> executablePatterns(const std::string& gameName);

    // How well an executable's file name matches the game name; 0 or less is no match.
    static int matchScore(const QString& fileName, const std::string& gameName);
    static bool isHelperExecutable(const QString& fileName);
};

}
