#pragma once
#include <string>
#include <vector>
#include "bridge_client.hpp"
#include "device_model.hpp"
#include "result.hpp"

namespace droidpilot {

/**
 * Application install state machine on top of the bridge.
 *
 * Installation state is never cached: every check re-lists the packages on
 * the device. Each mutation is verified against a fresh listing afterwards.
 */
class InstallManager {
public:
    static constexpr int INSTALL_TIMEOUT_MS = 60000;

    explicit InstallManager(BridgeClient& bridge) : bridge_(bridge) {}

    // Uninstalls first when already present; recurses into the test-server
    Result<void> install(const Application& app);

    // Installs only what is missing; recurses into the test-server
    Result<void> ensureInstalled(const Application& app);

    Result<void> uninstall(const Application& app);
    Result<void> uninstallPackage(const std::string& package);

    // Package must be installed
    Result<void> clearData(const Application& app);

    // `pm list packages`
    Result<std::vector<std::string>> installedPackages();

    // `pm list packages -f`
    Result<std::vector<InstalledApp>> installedApps();

    Result<bool> isInstalled(const std::string& package);

private:
    // `adb install -r <path>`, checked and verified
    Result<void> bridgeInstall(const Application& app);

    BridgeClient& bridge_;
};

// Parse `pm list packages` output ("package:<id>" per line)
std::vector<std::string> parsePackageList(const std::string& output);

// Parse `pm list packages -f` output ("package:<path>=<id>" per line)
std::vector<InstalledApp> parseInstalledApps(const std::string& output);

} // namespace droidpilot
