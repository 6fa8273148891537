#include "SteamLibraryScanner.hpp"
#include "VdfParser.hpp"
#include "core/Logger.hpp"
#include <pollswitch/Errors.hpp>
#include <QDir>
#include <QDirIterator>
#include <QFile>
#include <QFileInfo>
#include <QStringList>
#include <algorithm>
#include <cctype>
#include <set>
#include <sstream>

namespace pollswitch {

namespace {

constexpr qint64 MIN_EXECUTABLE_SIZE = 100 * 1024;

const QStringList SEARCH_SUBDIRS = {
    ".",
    "Binaries/Win64",
    "bin",
    "x64",
    "Game/Binaries/Win64",
    "Shipping/Binaries/Win64"
};

const QStringList HELPER_MARKERS = {
    "unins", "setup", "install", "update", "crash", "report",
    "redist", "vcredist", "directx", "dotnet", "unity", "ue4", "ue5",
    "prerequisites", "support", "helper", "service", "daemon",
    "config", "settings", "options", "benchmark", "test"
};

const std::set<std::string> FILLER_WORDS = {
    "the", "of", "and", "a", "an", "in", "on", "at", "to", "for", "with", "by"
};

const std::vector<std::string> GENERIC_PATTERNS = {"game.exe", "main.exe", "launcher.exe"};

std::vector<std::string> words(const std::string& text) {
    std::vector<std::string> result;
    std::istringstream stream(text);
    std::string word;
    while (stream >> word) {
        result.push_back(word);
    }
    return result;
}

std::string stripChars(std::string s, const std::string& chars) {
    s.erase(std::remove_if(s.begin(), s.end(),
                           [&](char c) { return chars.find(c) != std::string::npos; }),
            s.end());
    return s;
}

bool isSequelNumber(const std::string& word) {
    static const std::set<std::string> roman = {
        "ii", "iii", "iv", "v", "vi", "vii", "viii", "ix", "x"
    };
    return roman.count(word) ||
           (!word.empty() && std::all_of(word.begin(), word.end(),
                                         [](unsigned char c) { return std::isdigit(c); }));
}

bool isCommonWord(const std::string& word) {
    return FILLER_WORDS.count(word) || word == "or" || word == "but" || word == "is";
}

// Words of the lowercased name worth looking for inside a file name.
std::vector<std::string> significantWords(const std::vector<std::string>& nameWords) {
    std::vector<std::string> result;
    for (const auto& word : nameWords) {
        if (word.size() > 2 && !isCommonWord(word)) {
            result.push_back(word);
        }
    }
    return result;
}

std::vector<std::string> namePatterns(const std::string& gameName) {
    const std::string original = QString::fromStdString(gameName).toLower().toStdString();
    std::string clean = stripChars(original, ":'-.,!? ");
    clean = QString::fromStdString(clean).remove(QChar(0x2122)).remove(QChar(0x00AE))
                .remove(QChar(0x00A9)).toStdString();

    std::string underscore = original;
    std::replace(underscore.begin(), underscore.end(), ' ', '_');
    const std::string noSpace = stripChars(original, " ");

    std::vector<std::string> stems = {original, underscore, noSpace, clean};

    const auto parts = words(original);
    if (!parts.empty()) {
        std::string first = stripChars(parts.front(), ":;-");
        if (first.size() > 2) {
            stems.push_back(first);
        }
    }

    // "grand theft auto v" -> "gtav"
    std::string acronym;
    for (const auto& word : parts) {
        if (!FILLER_WORDS.count(word)) {
            acronym += word.front();
        }
    }
    if (acronym.size() > 1) {
        stems.push_back(acronym);
    }

    // "counter-strike 2" -> "cs2"
    for (std::size_t i = 1; i < parts.size(); ++i) {
        if (isSequelNumber(parts[i])) {
            std::string initials;
            for (std::size_t j = 0; j < i; ++j) {
                for (const auto& piece : QString::fromStdString(parts[j])
                                             .split('-', Qt::SkipEmptyParts)) {
                    if (!FILLER_WORDS.count(piece.toStdString())) {
                        initials += piece.at(0).toLatin1();
                    }
                }
            }
            if (!initials.empty()) {
                stems.push_back(initials + parts[i]);
            }
            break;
        }
    }

    for (const auto& suffix : {"win64", "game", "client", "main"}) {
        stems.push_back(clean + suffix);
        stems.push_back(noSpace + suffix);
    }

    std::vector<std::string> patterns;
    std::set<std::string> seen;
    for (const auto& stem : stems) {
        if (stem.empty()) {
            continue;
        }
        std::string pattern = stem + ".exe";
        if (seen.insert(pattern).second) {
            patterns.push_back(pattern);
        }
    }
    return patterns;
}

} // namespace

std::vector<std::string> SteamLibraryScanner::executablePatterns(const std::string& gameName) {
    std::vector<std::string> patterns = namePatterns(gameName);
    for (const auto& generic : GENERIC_PATTERNS) {
        if (std::find(patterns.begin(), patterns.end(), generic) == patterns.end()) {
            patterns.push_back(generic);
        }
    }
    return patterns;
}

int SteamLibraryScanner::matchScore(const QString& fileName, const std::string& gameName) {
    std::string stem = fileName.toLower().toStdString();
    if (stem.size() > 4 && stem.compare(stem.size() - 4, 4, ".exe") == 0) {
        stem.resize(stem.size() - 4);
    }

    for (const auto& pattern : namePatterns(gameName)) {
        if (stem + ".exe" == pattern) {
            return 1000;
        }
    }

    const std::string lowerName = QString::fromStdString(gameName).toLower().toStdString();
    if (stem == lowerName) {
        return 900;
    }

    std::vector<std::string> nameWords;
    for (const auto& word : words(lowerName)) {
        std::string bare = stripChars(word, ":'.,!?");
        if (!bare.empty()) {
            nameWords.push_back(bare);
        }
    }

    int score = 0;
    const auto significant = significantWords(nameWords);
    bool containsAll = !significant.empty();
    for (const auto& word : significant) {
        if (stem.find(word) != std::string::npos) {
            score += static_cast<int>(word.size()) * 10;
        } else {
            containsAll = false;
        }
    }
    if (containsAll) {
        score += 800;
    }

    if (!nameWords.empty() && nameWords.front().size() > 2 &&
        stem.compare(0, nameWords.front().size(), nameWords.front()) == 0) {
        score += 100;
    }

    if (stem.size() < 4) {
        score -= 50;
    }
    return score;
}

bool SteamLibraryScanner::isHelperExecutable(const QString& fileName) {
    const QString name = fileName.toLower();
    for (const auto& marker : HELPER_MARKERS) {
        if (name.contains(marker)) {
            return true;
        }
    }
    return false;
}

std::optional<std::string> SteamLibraryScanner::findExecutable(const QString& installDir,
                                                               const std::string& gameName) {
    if (installDir.isEmpty()) {
        return std::nullopt;
    }

    const auto patterns = executablePatterns(gameName);
    const QDir root(installDir);

    for (const auto& subdir : SEARCH_SUBDIRS) {
        QDir dir(root.filePath(subdir));
        if (!dir.exists()) {
            continue;
        }
        const auto entries = dir.entryInfoList({"*.exe", "*.EXE"}, QDir::Files);
        for (const auto& pattern : patterns) {
            for (const auto& entry : entries) {
                if (entry.fileName().toLower().toStdString() == pattern) {
                    return entry.fileName().toStdString();
                }
            }
        }
    }

    // Best scoring name anywhere in the tree.
    QFileInfo best;
    int bestScore = 0;
    QDirIterator named(installDir, {"*.exe", "*.EXE"}, QDir::Files, QDirIterator::Subdirectories);
    while (named.hasNext()) {
        named.next();
        const QFileInfo info = named.fileInfo();
        if (isHelperExecutable(info.fileName())) {
            continue;
        }
        const int score = matchScore(info.fileName(), gameName);
        if (score > bestScore) {
            bestScore = score;
            best = info;
        }
    }
    if (bestScore > 0) {
        return best.fileName().toStdString();
    }

    // Fall back to the largest executable that is not an installer or helper.
    QFileInfo largest;
    QDirIterator it(installDir, {"*.exe", "*.EXE"}, QDir::Files, QDirIterator::Subdirectories);
    while (it.hasNext()) {
        it.next();
        const QFileInfo info = it.fileInfo();
        if (isHelperExecutable(info.fileName())) {
            continue;
        }
        if (!largest.exists() || info.size() > largest.size()) {
            largest = info;
        }
    }

    if (largest.exists() && largest.size() >= MIN_EXECUTABLE_SIZE) {
        return largest.fileName().toStdString();
    }
    return std::nullopt;
}

std::vector<DetectedGame> SteamLibraryScanner::scanLibrary(const SteamLibrary& library) const {
    std::vector<DetectedGame> games;
    const QDir steamApps(QDir(QString::fromStdString(library.path)).filePath("steamapps"));
    if (!steamApps.exists()) {
        POLLSWITCH_LOG_WARNING("steamapps directory not found in library " + library.label);
        return games;
    }

    const auto manifests = steamApps.entryInfoList({"appmanifest_*.acf"}, QDir::Files);
    for (const auto& manifestInfo : manifests) {
        QFile file(manifestInfo.absoluteFilePath());
        if (!file.open(QIODevice::ReadOnly)) {
            POLLSWITCH_LOG_DEBUG("Skipping unreadable manifest " +
                                 manifestInfo.fileName().toStdString());
            continue;
        }

        AppManifest manifest;
        try {
            manifest = VdfParser::parseAppManifest(file.readAll().toStdString());
        } catch (const ConfigError& e) {
            POLLSWITCH_LOG_DEBUG("Skipping invalid manifest " +
                                 manifestInfo.fileName().toStdString() + ": " + e.what());
            continue;
        }

        const QString installPath = steamApps.filePath(
            "common/" + QString::fromStdString(manifest.installDir));
        if (!QFileInfo(installPath).isDir()) {
            POLLSWITCH_LOG_DEBUG("Skipping uninstalled game: " + manifest.name);
            continue;
        }

        DetectedGame game;
        game.name = manifest.name;
        game.appId = manifest.appId;
        game.installPath = QDir::toNativeSeparators(installPath).toStdString();
        game.library = library.label;
        game.sizeMb = manifest.sizeOnDisk / (1024 * 1024);

        if (auto executable = findExecutable(installPath, manifest.name)) {
            game.executable = *executable;
        } else {
            POLLSWITCH_LOG_DEBUG("Could not find executable for " + manifest.name);
        }

        games.push_back(std::move(game));
    }

    POLLSWITCH_LOG_DEBUG("Library " + library.label + ": found " +
                         std::to_string(games.size()) + " games");
    return games;
}

std::vector<DetectedGame> SteamLibraryScanner::scan(const std::vector<SteamLibrary>& libraries) const {
    std::vector<DetectedGame> all;
    for (const auto& library : libraries) {
        auto games = scanLibrary(library);
        all.insert(all.end(),
                   std::make_move_iterator(games.begin()),
                   std::make_move_iterator(games.end()));
    }

    std::sort(all.begin(), all.end(), [](const DetectedGame& a, const DetectedGame& b) {
        return a.name < b.name;
    });
    return all;
}

}
