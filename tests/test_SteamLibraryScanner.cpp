// tests/test_SteamLibraryScanner.cpp
#include <gtest/gtest.h>
#include "steam/SteamLibraryScanner.hpp"
#include "steam/SteamLocator.hpp"
#include <QCoreApplication>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QTemporaryDir>
#include <algorithm>
#include <memory>

namespace pollswitch {
namespace testing {

namespace {

bool contains(const std::vector<std::string>& list, const std::string& value) {
    return std::find(list.begin(), list.end(), value) != list.end();
}

} // namespace

class SteamLibraryScannerTest : public ::testing::Test {
protected:
    void SetUp() override {
        app = std::make_unique<QCoreApplication>(argc, argv);
        ASSERT_TRUE(tempDir.isValid());
    }

    void TearDown() override {
        app.reset();
    }

    QString makeFile(const QString& relative, qint64 size, const QByteArray& content = {}) {
        const QString full = tempDir.filePath(relative);
        QDir().mkpath(QFileInfo(full).absolutePath());
        QFile file(full);
        EXPECT_TRUE(file.open(QIODevice::WriteOnly));
        if (!content.isEmpty()) {
            file.write(content);
        } else {
            file.resize(size);
        }
        return full;
    }

    QByteArray manifest(const QString& appId, const QString& name, const QString& dir,
                        const QString& size = "1073741824") {
        return QString("\"AppState\"\n{\n"
                       "\t\"appid\"\t\t\"%1\"\n"
                       "\t\"name\"\t\t\"%2\"\n"
                       "\t\"installdir\"\t\t\"%3\"\n"
                       "\t\"SizeOnDisk\"\t\t\"%4\"\n"
                       "}\n").arg(appId, name, dir, size).toUtf8();
    }

    int argc = 1;
    char* argv[1] = {(char*)"test"};
    std::unique_ptr<QCoreApplication> app;
    QTemporaryDir tempDir;
};

TEST_F(SteamLibraryScannerTest, ExecutablePatterns) {
    auto cs = SteamLibraryScanner::executablePatterns("Counter-Strike 2");
    EXPECT_TRUE(contains(cs, "cs2.exe"));
    EXPECT_TRUE(contains(cs, "counter-strike 2.exe"));

    auto elden = SteamLibraryScanner::executablePatterns("ELDEN RING");
    EXPECT_TRUE(contains(elden, "eldenring.exe"));
    EXPECT_TRUE(contains(elden, "elden_ring.exe"));
    EXPECT_TRUE(contains(elden, "elden.exe"));
    EXPECT_TRUE(contains(elden, "er.exe"));

    auto gta = SteamLibraryScanner::executablePatterns("Grand Theft Auto V");
    EXPECT_TRUE(contains(gta, "gtav.exe"));

    auto hunt = SteamLibraryScanner::executablePatterns("Hunt: Showdown");
    EXPECT_TRUE(contains(hunt, "huntshowdown.exe"));
    EXPECT_TRUE(contains(hunt, "hunt.exe"));
    EXPECT_TRUE(contains(hunt, "huntshowdownwin64.exe"));

    auto generic = SteamLibraryScanner::executablePatterns("Quiet Harbor");
    EXPECT_TRUE(contains(generic, "game.exe"));
    EXPECT_TRUE(contains(generic, "main.exe"));
    EXPECT_EQ(generic.back(), "launcher.exe");
}

TEST_F(SteamLibraryScannerTest, MatchScores) {
    EXPECT_EQ(SteamLibraryScanner::matchScore("cs2.exe", "Counter-Strike 2"), 1000);
    EXPECT_EQ(SteamLibraryScanner::matchScore("HuntShowdownClient_x64.exe", "Hunt Showdown"),
              800 + 40 + 80 + 100);
    EXPECT_EQ(SteamLibraryScanner::matchScore("ShowdownClient.exe", "Hunt Showdown"), 80);
    EXPECT_EQ(SteamLibraryScanner::matchScore("huge_editor.exe", "Hunt Showdown"), 0);
    EXPECT_LT(SteamLibraryScanner::matchScore("x.exe", "Hunt Showdown"), 0);
    EXPECT_EQ(SteamLibraryScanner::matchScore("Shadows.exe", "The Shadows of Night"), 70);
}

TEST_F(SteamLibraryScannerTest, HelperExecutables) {
    EXPECT_TRUE(SteamLibraryScanner::isHelperExecutable("unins000.exe"));
    EXPECT_TRUE(SteamLibraryScanner::isHelperExecutable("UnityCrashHandler64.exe"));
    EXPECT_TRUE(SteamLibraryScanner::isHelperExecutable("vc_redist.x64.exe"));
    EXPECT_FALSE(SteamLibraryScanner::isHelperExecutable("eldenring.exe"));
    EXPECT_FALSE(SteamLibraryScanner::isHelperExecutable("cs2.exe"));
}

TEST_F(SteamLibraryScannerTest, FindsExecutableByName) {
    makeFile("game/Game/Binaries/Win64/EldenRing.exe", 1024);
    makeFile("game/Huge.exe", 10 * 1024 * 1024);

    auto found = SteamLibraryScanner::findExecutable(tempDir.filePath("game"), "ELDEN RING");

    ASSERT_TRUE(found.has_value());
    EXPECT_EQ(*found, "EldenRing.exe");
}

TEST_F(SteamLibraryScannerTest, PrefersBestNamedOverLargest) {
    makeFile("hunt/Tools/huge_editor.exe", 2 * 1024 * 1024);
    makeFile("hunt/Game/HuntShowdownClient_x64.exe", 512 * 1024);
    makeFile("hunt/Game/Showdown.exe", 1024 * 1024);

    auto found = SteamLibraryScanner::findExecutable(tempDir.filePath("hunt"), "Hunt: Showdown 1896");

    ASSERT_TRUE(found.has_value());
    EXPECT_EQ(*found, "HuntShowdownClient_x64.exe");
}

TEST_F(SteamLibraryScannerTest, GenericLauncherNameMatches) {
    makeFile("harbor/Launcher.exe", 200 * 1024);
    makeFile("harbor/bin/Engine.exe", 4 * 1024 * 1024);

    auto found = SteamLibraryScanner::findExecutable(tempDir.filePath("harbor"), "Quiet Harbor");

    ASSERT_TRUE(found.has_value());
    EXPECT_EQ(*found, "Launcher.exe");
}

TEST_F(SteamLibraryScannerTest, FallsBackToLargestExecutable) {
    makeFile("game/bin/Small.exe", 200 * 1024);
    makeFile("game/bin/Bigger.exe", 400 * 1024);
    makeFile("game/redist/vcredist_x64.exe", 20 * 1024 * 1024);

    auto found = SteamLibraryScanner::findExecutable(tempDir.filePath("game"), "Nothing Alike");

    ASSERT_TRUE(found.has_value());
    EXPECT_EQ(*found, "Bigger.exe");
}

TEST_F(SteamLibraryScannerTest, IgnoresTinyExecutables) {
    makeFile("game/stub.exe", 4 * 1024);

    EXPECT_FALSE(SteamLibraryScanner::findExecutable(tempDir.filePath("game"), "Stubby").has_value());
    EXPECT_FALSE(SteamLibraryScanner::findExecutable(QString(), "Anything").has_value());
}

TEST_F(SteamLibraryScannerTest, ScansInstalledGames) {
    makeFile("lib/steamapps/appmanifest_730.acf", 0,
             manifest("730", "Counter-Strike 2", "Counter-Strike Global Offensive", "36700160000"));
    makeFile("lib/steamapps/common/Counter-Strike Global Offensive/game/bin/win64/cs2.exe", 1024);
    makeFile("lib/steamapps/appmanifest_1245620.acf", 0,
             manifest("1245620", "ELDEN RING", "ELDEN RING"));
    makeFile("lib/steamapps/common/ELDEN RING/eldenring.exe", 1024);
    makeFile("lib/steamapps/appmanifest_99.acf", 0,
             manifest("99", "Not Installed", "Missing"));
    makeFile("lib/steamapps/appmanifest_98.acf", 0, "\"AppState\"\n{\n}\n");

    SteamLibraryScanner scanner;
    auto games = scanner.scan({{tempDir.filePath("lib").toStdString(), "Main"}});

    ASSERT_EQ(games.size(), 2u);
    EXPECT_EQ(games[0].name, "Counter-Strike 2");
    EXPECT_EQ(games[0].appId, "730");
    EXPECT_EQ(games[0].library, "Main");
    EXPECT_EQ(games[0].sizeMb, 35000);
    EXPECT_EQ(games[0].executable, "cs2.exe");
    EXPECT_EQ(games[1].name, "ELDEN RING");
    EXPECT_EQ(games[1].executable, "eldenring.exe");
    EXPECT_EQ(games[1].sizeMb, 1024);
}

TEST_F(SteamLibraryScannerTest, MissingSteamAppsYieldsNothing) {
    SteamLibraryScanner scanner;
    EXPECT_TRUE(scanner.scanLibrary({tempDir.filePath("nowhere").toStdString(), "X"}).empty());
}

TEST_F(SteamLibraryScannerTest, LocatesInstallationAndLibraries) {
    makeFile("Steam/steam.exe", 1024);
    QDir().mkpath(tempDir.filePath("Steam/steamapps"));
    QDir().mkpath(tempDir.filePath("Extra/steamapps"));

    const QString steam = tempDir.filePath("Steam");
    const QString extra = tempDir.filePath("Extra");
    const QString vdf = QString("\"libraryfolders\"\n{\n"
                                "\t\"0\"\n\t{\n\t\t\"path\"\t\t\"%1\"\n\t}\n"
                                "\t\"1\"\n\t{\n\t\t\"path\"\t\t\"%2\"\n\t}\n"
                                "\t\"2\"\n\t{\n\t\t\"path\"\t\t\"%3\"\n\t}\n"
                                "}\n").arg(steam, extra, tempDir.filePath("Gone"));
    makeFile("Steam/steamapps/libraryfolders.vdf", 0, vdf.toUtf8());

    SteamLocator locator;
    EXPECT_TRUE(SteamLocator::isValidInstallation(steam));
    EXPECT_FALSE(SteamLocator::isValidInstallation(extra));

    auto found = locator.findInstallation(steam.toStdString());
    ASSERT_TRUE(found.has_value());

    auto libraries = locator.discoverLibraries(steam.toStdString());
    ASSERT_EQ(libraries.size(), 2u);
    EXPECT_EQ(libraries[0].label, "Main");
    EXPECT_EQ(libraries[1].path, extra.toStdString());
#ifndef Q_OS_WIN
    EXPECT_EQ(libraries[1].label, "External");
#endif
}

} // namespace testing
} // namespace pollswitch
