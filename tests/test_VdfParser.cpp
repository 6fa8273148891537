// tests/test_VdfParser.cpp
#include <gtest/gtest.h>
#include "steam/VdfParser.hpp"
#include <pollswitch/Errors.hpp>

namespace pollswitch {
namespace testing {

TEST(VdfParserTest, LibraryFolders) {
    const std::string content = R"("libraryfolders"
{
	"contentstatsid"		"-4120925374532749212"
	"0"
	{
		"path"		"C:\\Program Files (x86)\\Steam"
		"label"		""
		"totalsize"		"0"
		"apps"
		{
			"228980"		"386884127"
			"1245620"		"49291000000"
		}
	}
	"1"
	{
		"path"		"D:\\SteamLibrary"
		"label"		"Games SSD"
		"mounted"		"1"
		"apps"
		{
			"730"		"34201005482"
		}
	}
}
)";

    auto folders = VdfParser::parseLibraryFolders(content);

    ASSERT_EQ(folders.size(), 2u);
    EXPECT_EQ(folders["0"].path, "C:\\Program Files (x86)\\Steam");
    EXPECT_TRUE(folders["0"].label.empty());
    EXPECT_EQ(folders["1"].path, "D:\\SteamLibrary");
    EXPECT_EQ(folders["1"].label, "Games SSD");
    EXPECT_EQ(folders["1"].mounted, "1");
}

TEST(VdfParserTest, LegacyLibraryFolders) {
    const std::string content = R"("LibraryFolders"
{
	"TimeNextStatsReport"		"1700000000"
	"ContentStatsID"		"-4120925374532749212"
	"1"		"D:\\SteamLibrary"
	"2"		"E:\\Games\\Steam"
}
)";

    auto folders = VdfParser::parseLibraryFolders(content);

    ASSERT_EQ(folders.size(), 2u);
    EXPECT_EQ(folders["1"].path, "D:\\SteamLibrary");
    EXPECT_EQ(folders["2"].path, "E:\\Games\\Steam");
}

TEST(VdfParserTest, EmptyLibraryFolders) {
    EXPECT_TRUE(VdfParser::parseLibraryFolders("").empty());
    EXPECT_TRUE(VdfParser::parseLibraryFolders("\"libraryfolders\"\n{\n}\n").empty());
}

TEST(VdfParserTest, AppManifest) {
    const std::string content = R"("AppState"
{
	"appid"		"1245620"
	"Universe"		"1"
	"name"		"ELDEN RING"
	"StateFlags"		"4"
	"installdir"		"ELDEN RING"
	"SizeOnDisk"		"49291000000"
	"buildid"		"12345678"
	"UserConfig"
	{
		"name"		"Nested Name"
		"language"		"english"
	}
}
)";

    AppManifest manifest = VdfParser::parseAppManifest(content);

    EXPECT_EQ(manifest.appId, "1245620");
    EXPECT_EQ(manifest.name, "ELDEN RING");
    EXPECT_EQ(manifest.installDir, "ELDEN RING");
    EXPECT_EQ(manifest.stateFlags, "4");
    EXPECT_EQ(manifest.buildId, "12345678");
    EXPECT_EQ(manifest.sizeOnDisk, 49291000000LL);
}

TEST(VdfParserTest, UnescapesQuotes) {
    const std::string content = R"("AppState"
{
	"appid"		"42"
	"name"		"The \"Quoted\" Game"
	"installdir"		"Quoted"
}
)";

    EXPECT_EQ(VdfParser::parseAppManifest(content).name, "The \"Quoted\" Game");
}

TEST(VdfParserTest, AppManifestMissingFields) {
    const std::string content = R"("AppState"
{
	"appid"		"42"
	"name"		"No Install Dir"
}
)";

    EXPECT_THROW(VdfParser::parseAppManifest(content), ConfigError);
    EXPECT_THROW(VdfParser::parseAppManifest(""), ConfigError);
}

} // namespace testing
} // namespace pollswitch
