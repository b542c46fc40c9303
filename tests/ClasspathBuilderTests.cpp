// tests/ClasspathBuilderTests.cpp
#include <Kiln/ClasspathBuilder.hpp>
#include "FakeHost.hpp"
#include <gtest/gtest.h>

using namespace Kiln;
using KilnTests::InMemoryFileSystem;

namespace {

Library library(const std::string& name, std::vector<Rule> rules = {},
                std::map<std::string, std::string> natives = {}) {
    Library lib;
    lib.name = name;
    lib.rules = std::move(rules);
    lib.natives = std::move(natives);
    return lib;
}

Rule allowOn(const std::string& os) {
    Rule r;
    r.action = RuleAction::ALLOW;
    r.os = OS{os, std::nullopt};
    return r;
}

class ClasspathBuilderTest : public ::testing::Test {
protected:
    ClasspathBuilderTest() : gameDir("/mc"), builder(fs, gameDir) {
        version.id = "1.8.9";
        version.mainClass = "net.minecraft.client.main.Main";
    }

    std::filesystem::path lib(const std::string& relative) const {
        return gameDir.librariesDir / relative;
    }

    InMemoryFileSystem fs;
    GameDirectory gameDir;
    ClasspathBuilder builder;
    Version version;
    const PlatformInfo windows64{"windows", "x86_64"};
    const PlatformInfo windows32{"windows", "x86"};
    const PlatformInfo linux64{"linux", "x86_64"};
};

} // namespace

TEST_F(ClasspathBuilderTest, ClientJarComesFirstEvenWithoutLibraries) {
    auto result = builder.build(version, linux64);
    ASSERT_EQ(result.entries.size(), 1u);
    EXPECT_EQ(result.entries[0].string(), gameDir.clientJarPath("1.8.9").string());
    EXPECT_TRUE(result.skipped.empty());
}

TEST_F(ClasspathBuilderTest, ResolvesLibrariesInManifestOrder) {
    fs.addFile(lib("com/google/guava/guava/17.0/guava-17.0.jar"));
    fs.addFile(lib("com/mojang/authlib/1.5.21/authlib-1.5.21.jar"));
    version.libraries = {library("com.mojang:authlib:1.5.21"), library("com.google.guava:guava:17.0")};

    auto result = builder.build(version, linux64);
    ASSERT_EQ(result.entries.size(), 3u);
    EXPECT_EQ(result.entries[0].string(), gameDir.clientJarPath("1.8.9").string());
    EXPECT_EQ(result.entries[1].string(), lib("com/mojang/authlib/1.5.21/authlib-1.5.21.jar").string());
    EXPECT_EQ(result.entries[2].string(), lib("com/google/guava/guava/17.0/guava-17.0.jar").string());
}

TEST_F(ClasspathBuilderTest, RulesDecideInclusionPerPlatform) {
    fs.addFile(lib("tv/twitch/twitch-platform/6.5/twitch-platform-6.5.jar"));
    version.libraries = {library("tv.twitch:twitch-platform:6.5", {allowOn("windows")})};

    EXPECT_EQ(builder.build(version, windows64).entries.size(), 2u);

    auto onLinux = builder.build(version, linux64);
    EXPECT_EQ(onLinux.entries.size(), 1u);
    EXPECT_TRUE(onLinux.skipped.empty()); // excluded by rules, not a resolution failure
}

TEST_F(ClasspathBuilderTest, PrefersNativeClassifierWithArchitectureLabel) {
    const std::map<std::string, std::string> natives = {{"windows", "natives-windows-${arch}"}};
    fs.addFile(lib("tv/twitch/twitch-external-platform/4.5/twitch-external-platform-4.5-natives-windows-64.jar"));
    fs.addFile(lib("tv/twitch/twitch-external-platform/4.5/twitch-external-platform-4.5-natives-windows-32.jar"));
    fs.addFile(lib("tv/twitch/twitch-external-platform/4.5/twitch-external-platform-4.5.jar"));
    version.libraries = {library("tv.twitch:twitch-external-platform:4.5", {}, natives)};

    auto on64 = builder.build(version, windows64);
    ASSERT_EQ(on64.entries.size(), 2u);
    EXPECT_EQ(on64.entries[1].string(), lib("tv/twitch/twitch-external-platform/4.5/twitch-external-platform-4.5-natives-windows-64.jar").string());

    auto on32 = builder.build(version, windows32);
    ASSERT_EQ(on32.entries.size(), 2u);
    EXPECT_EQ(on32.entries[1].string(), lib("tv/twitch/twitch-external-platform/4.5/twitch-external-platform-4.5-natives-windows-32.jar").string());

    // No native declared for linux: the plain jar is used
    auto onLinux = builder.build(version, linux64);
    ASSERT_EQ(onLinux.entries.size(), 2u);
    EXPECT_EQ(onLinux.entries[1].string(), lib("tv/twitch/twitch-external-platform/4.5/twitch-external-platform-4.5.jar").string());
}

TEST_F(ClasspathBuilderTest, FallsBackToPlainJarWhenNativeIsMissing) {
    fs.addFile(lib("org/lwjgl/lwjgl/lwjgl-platform/2.9.4/lwjgl-platform-2.9.4.jar"));
    version.libraries = {library("org.lwjgl.lwjgl:lwjgl-platform:2.9.4", {}, {{"windows", "natives-windows"}})};

    auto result = builder.build(version, windows64);
    ASSERT_EQ(result.entries.size(), 2u);
    EXPECT_EQ(result.entries[1].string(), lib("org/lwjgl/lwjgl/lwjgl-platform/2.9.4/lwjgl-platform-2.9.4.jar").string());
}

TEST_F(ClasspathBuilderTest, MalformedCoordinateIsSkippedWithoutAborting) {
    fs.addFile(lib("com/google/guava/guava/17.0/guava-17.0.jar"));
    version.libraries = {library("com.mojang:brigadier"), library("com.google.guava:guava:17.0")};

    auto result = builder.build(version, linux64);
    ASSERT_EQ(result.entries.size(), 2u);
    EXPECT_EQ(result.entries[1].string(), lib("com/google/guava/guava/17.0/guava-17.0.jar").string());
    ASSERT_EQ(result.skipped.size(), 1u);
    EXPECT_EQ(result.skipped[0].coordinate, "com.mojang:brigadier");
    EXPECT_EQ(result.skipped[0].reason, DependencyResolutionSkip::Reason::MALFORMED_COORDINATE);
}

TEST_F(ClasspathBuilderTest, MissingArtifactIsSkipped) {
    version.libraries = {library("com.google.guava:guava:17.0")};

    auto result = builder.build(version, linux64);
    EXPECT_EQ(result.entries.size(), 1u);
    ASSERT_EQ(result.skipped.size(), 1u);
    EXPECT_EQ(result.skipped[0].reason, DependencyResolutionSkip::Reason::ARTIFACT_NOT_FOUND);
}

TEST_F(ClasspathBuilderTest, DuplicatesAreKept) {
    fs.addFile(lib("com/google/guava/guava/17.0/guava-17.0.jar"));
    version.libraries = {library("com.google.guava:guava:17.0"), library("com.google.guava:guava:17.0")};

    EXPECT_EQ(builder.build(version, linux64).entries.size(), 3u);
}

TEST_F(ClasspathBuilderTest, JoinUsesPlatformSeparator) {
    fs.addFile(lib("com/google/guava/guava/17.0/guava-17.0.jar"));
    version.libraries = {library("com.google.guava:guava:17.0")};
    auto result = builder.build(version, linux64);

    const std::string client = gameDir.clientJarPath("1.8.9").string();
    const std::string guava = lib("com/google/guava/guava/17.0/guava-17.0.jar").string();
    EXPECT_EQ(result.join(Utils::pathListSeparator("linux")), client + ":" + guava);
    EXPECT_EQ(result.join(Utils::pathListSeparator("windows")), client + ";" + guava);
}
