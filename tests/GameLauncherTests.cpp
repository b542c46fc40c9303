// tests/GameLauncherTests.cpp
#include <Kiln/GameLauncher.hpp>
#include <Kiln/Errors.hpp>
#include "FakeHost.hpp"
#include <gtest/gtest.h>

using namespace Kiln;
using KilnTests::InMemoryFileSystem;
using KilnTests::RecordingSpawner;

namespace {

const char* kManifest = R"({
    "id": "1.12.2",
    "mainClass": "net.minecraft.client.main.Main",
    "assets": "1.12",
    "minecraftArguments": "--username ${auth_player_name} --version ${version_name} --assetIndex ${assets_index_name} --userType ${user_type}",
    "libraries": [
        {"name": "com.mojang:patchy:1.1"},
        {"name": "ca.weblite:java-objc-bridge:1.0.0", "rules": [{"action": "allow", "os": {"name": "osx"}}]},
        {"name": "broken-coordinate"},
        {
            "name": "org.lwjgl.lwjgl:lwjgl-platform:2.9.4",
            "natives": {"windows": "natives-windows", "linux": "natives-linux"},
            "rules": [{"action": "allow"}, {"action": "disallow", "os": {"name": "osx"}}]
        }
    ]
})";

class GameLauncherTest : public ::testing::Test {
protected:
    GameLauncherTest() : gameDir("/mc"), launcher(fs, spawner, PlatformInfo{"windows", "x86_64"}) {
        fs.addFile(gameDir.manifestPath("1.12.2"), kManifest);
        fs.addFile(gameDir.librariesDir / "com/mojang/patchy/1.1/patchy-1.1.jar");
        fs.addFile(gameDir.librariesDir / "ca/weblite/java-objc-bridge/1.0.0/java-objc-bridge-1.0.0.jar");
        fs.addFile(gameDir.librariesDir / "org/lwjgl/lwjgl/lwjgl-platform/2.9.4/lwjgl-platform-2.9.4-natives-windows.jar");
    }

    InMemoryFileSystem fs;
    RecordingSpawner spawner;
    GameDirectory gameDir;
    GameLauncher launcher;
};

} // namespace

TEST_F(GameLauncherTest, PrepareBuildsCompletePlan) {
    LaunchOptions options;
    options.memoryMb = 4096;
    LaunchPlan plan = launcher.prepare("/mc", "1.12.2", "Alice", options);

    EXPECT_EQ(plan.executable, "java");
    EXPECT_EQ(plan.mainClass, "net.minecraft.client.main.Main");
    EXPECT_EQ(plan.memoryFlags, (std::vector<std::string>{"-Xmx4096M", "-Xms4096M"}));
    EXPECT_EQ(plan.gameArguments, "--username Alice --version 1.12.2 --assetIndex 1.12 --userType legacy");

    const std::string expectedClasspath =
        gameDir.clientJarPath("1.12.2").string() + ";" +
        (gameDir.librariesDir / "com/mojang/patchy/1.1/patchy-1.1.jar").string() + ";" +
        (gameDir.librariesDir / "org/lwjgl/lwjgl/lwjgl-platform/2.9.4/lwjgl-platform-2.9.4-natives-windows.jar").string();
    EXPECT_EQ(plan.classpath, expectedClasspath);
    EXPECT_TRUE(spawner.spawned.empty());
}

TEST_F(GameLauncherTest, LaunchSpawnsThePreparedPlan) {
    LaunchOptions options;
    options.executablePath = "/opt/jdk8/bin/java";
    options.deferToSystemMemory = true;

    ProcessHandle handle = launcher.launch("/mc", "1.12.2", "Alice", options);
    EXPECT_EQ(handle.pid, 4242);
    ASSERT_EQ(spawner.spawned.size(), 1u);
    EXPECT_EQ(spawner.spawned[0].executable, "/opt/jdk8/bin/java");
    EXPECT_TRUE(spawner.spawned[0].memoryFlags.empty());
    EXPECT_EQ(spawner.spawned[0].commandLine(), launcher.prepare("/mc", "1.12.2", "Alice", options).commandLine());
}

TEST_F(GameLauncherTest, MissingManifestFailsBeforeSpawning) {
    EXPECT_THROW(launcher.launch("/mc", "1.7.10", "Alice", LaunchOptions{}), ManifestReadError);
    EXPECT_TRUE(spawner.spawned.empty());
}

TEST_F(GameLauncherTest, SpawnFailureIsPropagated) {
    spawner.failWith = "not found on PATH";
    EXPECT_THROW(launcher.launch("/mc", "1.12.2", "Alice", LaunchOptions{}), SpawnError);
    EXPECT_EQ(spawner.spawned.size(), 1u); // the command line was fully composed first
}

TEST_F(GameLauncherTest, LinuxUsesLinuxNativesAndSeparator) {
    fs.addFile(gameDir.librariesDir / "org/lwjgl/lwjgl/lwjgl-platform/2.9.4/lwjgl-platform-2.9.4-natives-linux.jar");
    GameLauncher linuxLauncher(fs, spawner, PlatformInfo{"linux", "x86_64"});

    LaunchPlan plan = linuxLauncher.prepare("/mc", "1.12.2", "Alice", LaunchOptions{});
    EXPECT_NE(plan.classpath.find("lwjgl-platform-2.9.4-natives-linux.jar"), std::string::npos);
    EXPECT_EQ(plan.classpath.find(';'), std::string::npos);
    EXPECT_EQ(plan.classpath.find("java-objc-bridge"), std::string::npos);
}
