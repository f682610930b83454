#include "install_manager.hpp"
#include "adb_security.hpp"
#include "droidpilot_log.hpp"

#include <algorithm>
#include <cstring>
#include <sstream>

namespace droidpilot {

namespace {

void trim(std::string& s) {
    while (!s.empty() && (s.back() == '\r' || s.back() == '\n' || s.back() == ' ')) s.pop_back();
    size_t first = s.find_first_not_of(" \t");
    s.erase(0, first == std::string::npos ? s.size() : first);
}

constexpr const char* PACKAGE_PREFIX = "package:";

} // anonymous namespace

// =============================================================================
// Package listing
// =============================================================================

std::vector<std::string> parsePackageList(const std::string& output) {
    std::vector<std::string> packages;
    std::istringstream iss(output);
    std::string line;
    while (std::getline(iss, line)) {
        trim(line);
        if (line.rfind(PACKAGE_PREFIX, 0) == 0) line.erase(0, std::strlen(PACKAGE_PREFIX));
        if (!line.empty()) packages.push_back(line);
    }
    return packages;
}

std::vector<InstalledApp> parseInstalledApps(const std::string& output) {
    std::vector<InstalledApp> apps;
    std::istringstream iss(output);
    std::string line;
    while (std::getline(iss, line)) {
        trim(line);
        if (line.rfind(PACKAGE_PREFIX, 0) == 0) line.erase(0, std::strlen(PACKAGE_PREFIX));
        if (line.empty()) continue;

        // The path itself may contain '=' (split APK dirs): the id follows the last one
        InstalledApp app;
        size_t eq = line.rfind('=');
        if (eq == std::string::npos) {
            app.package = line;
        } else {
            app.path = line.substr(0, eq);
            app.package = line.substr(eq + 1);
        }
        apps.push_back(std::move(app));
    }
    return apps;
}

Result<std::vector<std::string>> InstallManager::installedPackages() {
    auto out = bridge_.shell("pm list packages");
    if (out.is_err()) return out.error();
    return Ok(parsePackageList(out.value()));
}

Result<std::vector<InstalledApp>> InstallManager::installedApps() {
    auto out = bridge_.shell("pm list packages -f");
    if (out.is_err()) return out.error();
    return Ok(parseInstalledApps(out.value()));
}

Result<bool> InstallManager::isInstalled(const std::string& package) {
    auto packages = DP_TRY(installedPackages());
    return Ok(std::find(packages.begin(), packages.end(), package) != packages.end());
}

// =============================================================================
// Install / uninstall
// =============================================================================

Result<void> InstallManager::bridgeInstall(const Application& app) {
    DPLOG_INFO("install", "Installing %s", app.path.c_str());

    auto out = bridge_.command({"install", "-r", app.path}, INSTALL_TIMEOUT_MS);
    if (out.is_err()) return out.error();

    if (!reportsSuccess(out.value())) {
        return Error(ErrorKind::Install,
                     "Could not install app: " + lastNonEmptyLine(out.value()), out.value());
    }

    bool present = DP_TRY(isInstalled(app.identifier));
    if (!present) {
        return Error(ErrorKind::Install, "App was not installed",
                     "adb reported success but '" + app.identifier + "' is not listed");
    }
    return Ok();
}

Result<void> InstallManager::install(const Application& app) {
    DPLOG_INFO("install", "About to install %s", app.path.c_str());

    bool present = DP_TRY(isInstalled(app.identifier));
    if (present) {
        DPLOG_INFO("install", "Application is already installed. Uninstalling application.");
        DP_TRY(uninstall(app));
    }

    DP_TRY(bridgeInstall(app));

    if (app.test_server) {
        DPLOG_INFO("install", "Installing the test-server as well");
        DP_TRY(install(*app.test_server));
    }
    return Ok();
}

Result<void> InstallManager::ensureInstalled(const Application& app) {
    DPLOG_INFO("install", "Ensuring %s is installed", app.path.c_str());

    bool present = DP_TRY(isInstalled(app.identifier));
    if (present) {
        DPLOG_INFO("install", "Application is already installed. Will not install.");
    } else {
        DP_TRY(bridgeInstall(app));
    }

    if (app.test_server) {
        DPLOG_INFO("install", "Ensuring the test-server is installed as well");
        DP_TRY(ensureInstalled(*app.test_server));
    }
    return Ok();
}

Result<void> InstallManager::uninstall(const Application& app) {
    return uninstallPackage(app.identifier);
}

Result<void> InstallManager::uninstallPackage(const std::string& package) {
    DPLOG_INFO("install", "Uninstalling %s", package.c_str());

    auto out = bridge_.command({"uninstall", package}, INSTALL_TIMEOUT_MS);
    if (out.is_err()) return out.error();

    if (!reportsSuccess(out.value())) {
        return Error(ErrorKind::Install,
                     "Could not uninstall app: " + lastNonEmptyLine(out.value()), out.value());
    }

    bool present = DP_TRY(isInstalled(package));
    if (present) {
        return Error(ErrorKind::Install, "App was not uninstalled",
                     "adb reported success but '" + package + "' is still listed");
    }
    return Ok();
}

Result<void> InstallManager::clearData(const Application& app) {
    const std::string& package = app.identifier;
    DPLOG_INFO("install", "Clearing %s", package.c_str());

    if (!security::isValidPackageName(package)) {
        return Error(ErrorKind::Precondition, "Invalid package name '" + package + "'");
    }

    bool present = DP_TRY(isInstalled(package));
    if (!present) {
        return Error(ErrorKind::Precondition,
                     "Cannot clear app. '" + package + "' is not installed");
    }

    auto out = bridge_.shell("pm clear " + package);
    if (out.is_err()) return out.error();

    if (!reportsSuccess(out.value())) {
        return Error(ErrorKind::Install, "Could not clear app: " + lastNonEmptyLine(out.value()),
                     out.value());
    }
    return Ok();
}

} // namespace droidpilot
