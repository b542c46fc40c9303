// tests/ConfigTests.cpp
#include <Kiln/Config.hpp>
#include <Kiln/Errors.hpp>
#include "FakeHost.hpp"
#include <gtest/gtest.h>

using namespace Kiln;
using KilnTests::InMemoryFileSystem;

TEST(GameDirectoryTest, DerivesVersionPaths) {
    GameDirectory dir("/mc");
    EXPECT_EQ(dir.manifestPath("1.20.1").generic_string(), "/mc/versions/1.20.1/1.20.1.json");
    EXPECT_EQ(dir.clientJarPath("1.20.1").generic_string(), "/mc/versions/1.20.1/1.20.1.jar");
    EXPECT_EQ(dir.librariesDir.generic_string(), "/mc/libraries");
    EXPECT_EQ(dir.assetsDir.generic_string(), "/mc/assets");
}

TEST(LauncherSettingsTest, MissingFileGivesDefaults) {
    InMemoryFileSystem fs;
    auto settings = LauncherSettings::load(fs, "kiln.json");
    EXPECT_EQ(settings.gameDirectory.generic_string(), ".minecraft");
    EXPECT_EQ(settings.playerName, "Player123");
    EXPECT_EQ(settings.javaPath, "java");
    EXPECT_EQ(settings.memoryMb, 4096u);
    EXPECT_FALSE(settings.useSystemMemory);
}

TEST(LauncherSettingsTest, ReadsValuesFromFile) {
    InMemoryFileSystem fs;
    fs.addFile("kiln.json", R"({
        "gameDirectory": "/games/mc",
        "playerName": "Alice",
        "javaPath": "/opt/jdk17/bin/java",
        "memory": 2048,
        "useSystemMemory": true,
        "logLevel": "debug",
        "somethingElse": 1
    })");
    auto settings = LauncherSettings::load(fs, "kiln.json");
    EXPECT_EQ(settings.gameDirectory.generic_string(), "/games/mc");
    EXPECT_EQ(settings.playerName, "Alice");
    EXPECT_EQ(settings.logLevel, "debug");

    LaunchOptions options = settings.toLaunchOptions();
    EXPECT_EQ(options.executablePath, std::optional<std::string>("/opt/jdk17/bin/java"));
    EXPECT_EQ(options.memoryMb, 2048u);
    EXPECT_TRUE(options.deferToSystemMemory);
}

TEST(LauncherSettingsTest, NullMemoryUnsetsHeapSize) {
    InMemoryFileSystem fs;
    fs.addFile("kiln.json", R"({"memory": null})");
    EXPECT_FALSE(LauncherSettings::load(fs, "kiln.json").memoryMb.has_value());
}

TEST(LauncherSettingsTest, BadFilesAreSettingsErrors) {
    InMemoryFileSystem fs;
    fs.addFile("broken.json", "{ not json");
    fs.addFile("array.json", "[]");
    fs.addFile("type.json", R"({"playerName": 12})");
    fs.addFile("negative.json", R"({"memory": -1})");
    EXPECT_THROW(LauncherSettings::load(fs, "broken.json"), SettingsError);
    EXPECT_THROW(LauncherSettings::load(fs, "array.json"), SettingsError);
    EXPECT_THROW(LauncherSettings::load(fs, "type.json"), SettingsError);
    EXPECT_THROW(LauncherSettings::load(fs, "negative.json"), SettingsError);
}

TEST(LauncherSettingsTest, MemoryOutsideUnsignedRangeIsSettingsError) {
    InMemoryFileSystem fs;
    fs.addFile("zero.json", R"({"memory": 0})");
    fs.addFile("huge.json", R"({"memory": 4294967297})");
    fs.addFile("max.json", R"({"memory": 4294967295})");
    EXPECT_THROW(LauncherSettings::load(fs, "zero.json"), SettingsError);
    EXPECT_THROW(LauncherSettings::load(fs, "huge.json"), SettingsError);
    EXPECT_EQ(LauncherSettings::load(fs, "max.json").memoryMb, 4294967295u);
}

TEST(MemoryRangeTest, AcceptsOneMegabyteUpToUnsignedMax) {
    EXPECT_FALSE(memoryMbInRange(0));
    EXPECT_TRUE(memoryMbInRange(1));
    EXPECT_TRUE(memoryMbInRange(4096));
    EXPECT_TRUE(memoryMbInRange(4294967295ULL));
    EXPECT_FALSE(memoryMbInRange(4294967296ULL));
    EXPECT_FALSE(memoryMbInRange(4294967297ULL));
}
