#pragma once
#include <cstdint>
#include <map>
#include <string>

namespace pollswitch {

struct LibraryFolder {
    std::string path;
    std::string label;
    std::string mounted;
};

struct AppManifest {
    std::string appId;
    std::string name;
    std::string installDir;
    std::string stateFlags;
    std::string buildId;
    int64_t sizeOnDisk{0};
};

// Line oriented reader for Valve's KeyValues text files
// (libraryfolders.vdf and appmanifest_*.acf).
class VdfParser {
public:
    // Keyed by the library index ("0", "1", ...). Both the current nested
    // format and the old "1" "D:\\Library" form are understood.
    static std::map<std::string, LibraryFolder> parseLibraryFolders(const std::string& content);

    // Throws ConfigError when appid, name or installdir is missing.
    static AppManifest parseAppManifest(const std::string& content);
};

}
