// src/LaunchPlan.cpp
#include <Kiln/LaunchPlan.hpp>
#include <Kiln/LauncherInfo.hpp>
#include <Kiln/Utils/Strings.hpp>

namespace Kiln {

namespace {

std::string quote_if_needed(const std::string& value) {
    if (value.find_first_of(" \t") == std::string::npos) return value;
    return "\"" + value + "\"";
}

} // namespace

std::string LaunchPlan::commandLine() const {
    std::string command = quote_if_needed(executable);
    for (const auto& flag : memoryFlags) {
        command += " " + flag;
    }
    for (const auto& flag : jvmFlags) {
        command += " " + flag;
    }
    command += " -cp \"" + classpath + "\"";
    command += " " + mainClass;
    if (!gameArguments.empty()) {
        command += " " + gameArguments;
    }
    return command;
}

std::vector<std::string> LaunchPlan::arguments() const {
    std::vector<std::string> args;
    args.push_back(executable);
    args.insert(args.end(), memoryFlags.begin(), memoryFlags.end());
    args.insert(args.end(), jvmFlags.begin(), jvmFlags.end());
    args.push_back("-cp");
    args.push_back(classpath);
    args.push_back(mainClass);
    for (auto& token : Utils::splitArguments(gameArguments)) {
        args.push_back(std::move(token));
    }
    return args;
}

std::vector<std::string> memoryFlags(const LaunchOptions& options) {
    if (options.deferToSystemMemory || !options.memoryMb) {
        return {};
    }
    const std::string size = std::to_string(*options.memoryMb) + "M";
    return {"-Xmx" + size, "-Xms" + size};
}

std::vector<std::string> fixedJvmFlags(const GameDirectory& gameDir, const std::string& versionName) {
    const std::string nativesDir = gameDir.nativesDir(versionName).string();
    return {
        "-Dfile.encoding=GB18030",
        "-Dsun.stdout.encoding=GB18030",
        "-Dsun.stderr.encoding=GB18030",
        "-Djava.rmi.server.useCodebaseOnly=true",
        "-Dcom.sun.jndi.rmi.object.trustURLCodebase=false",
        "-Dcom.sun.jndi.cosnaming.object.trustURLCodebase=false",
        "-Dlog4j2.formatMsgNoLookups=true",
        "-Dlog4j.configurationFile=" + gameDir.log4jConfigPath(versionName).string(),
        "-Dminecraft.client.jar=" + gameDir.clientJarPath(versionName).string(),
        "-XX:+UnlockExperimentalVMOptions",
        "-XX:+UseG1GC",
        "-XX:G1NewSizePercent=20",
        "-XX:G1ReservePercent=20",
        "-XX:MaxGCPauseMillis=50",
        "-XX:G1HeapRegionSize=32m",
        "-XX:-UseAdaptiveSizePolicy",
        "-XX:-OmitStackTraceInFastThrow",
        "-XX:-DontCompileHugeMethods",
        "-Dfml.ignoreInvalidMinecraftCertificates=true",
        "-Dfml.ignorePatchDiscrepancies=true",
        "-XX:HeapDumpPath=MojangTricksIntelDriversForPerformance_javaw.exe_minecraft.exe.heapdump",
        "-Djava.library.path=" + nativesDir,
        "-Djna.tmpdir=" + nativesDir,
        "-Dorg.lwjgl.system.SharedLibraryExtractPath=" + nativesDir,
        "-Dio.netty.native.workdir=" + nativesDir,
        std::string("-Dminecraft.launcher.brand=") + LAUNCHER_BRAND,
        std::string("-Dminecraft.launcher.version=") + LAUNCHER_VERSION,
    };
}

LaunchPlan assembleLaunchPlan(const GameDirectory& gameDir, const std::string& versionName,
                              const std::string& mainClass, const std::string& classpath,
                              const std::string& composedArgs, const LaunchOptions& options) {
    LaunchPlan plan;
    plan.executable = options.executablePath && !options.executablePath->empty()
                          ? *options.executablePath
                          : DEFAULT_JAVA_EXECUTABLE;
    plan.memoryFlags = memoryFlags(options);
    plan.jvmFlags = fixedJvmFlags(gameDir, versionName);
    plan.classpath = classpath;
    plan.mainClass = mainClass;
    plan.gameArguments = composedArgs;
    return plan;
}

} // namespace Kiln
