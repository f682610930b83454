#pragma once
#include <string>
#include <memory>

namespace droidpilot {

/**
 * Host/port binding of the on-device test-server.
 * host_port on the host is forwarded by adb to test_server_port on the device.
 */
struct Server {
    std::string host = "127.0.0.1";
    int host_port = 34777;
    int test_server_port = 7102;

    std::string endpoint() const { return host + ":" + std::to_string(host_port); }
};

/**
 * An installable Android package.
 * An application driven through the test-server carries the test-server
 * package as test_server; both must be installed for it to be runnable.
 */
struct Application {
    std::string identifier;     // package name
    std::string path;           // local .apk path
    std::string main_activity;
    std::shared_ptr<const Application> test_server;

    Application() = default;
    Application(std::string id, std::string apk_path, std::string activity = {})
        : identifier(std::move(id)), path(std::move(apk_path)), main_activity(std::move(activity)) {}

    bool hasTestServer() const { return test_server != nullptr; }
};

// One line of `pm list packages -f`: package:<path>=<package>
struct InstalledApp {
    std::string package;
    std::string path;
};

} // namespace droidpilot
