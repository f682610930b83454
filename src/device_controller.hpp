#pragma once
#include <chrono>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "bridge_client.hpp"
#include "config_loader.hpp"
#include "device_model.hpp"
#include "gesture.hpp"
#include "http_transport.hpp"
#include "install_manager.hpp"
#include "request_codec.hpp"
#include "result.hpp"
#include "server_lifecycle.hpp"

namespace droidpilot {

struct GestureOptions {
    Point at{50.0, 50.0};
    std::optional<Offset> offset;
    std::chrono::milliseconds duration{0};
    std::optional<std::chrono::milliseconds> timeout;   // controller default when unset
};

/**
 * One Android device driven through adb and its instrumentation test-server.
 *
 * Owns its own bridge and transport; nothing is shared between instances,
 * so one controller per device is safe. Calls are synchronous and must be
 * serialized by the caller.
 */
class DeviceController {
public:
    DeviceController(std::string identifier, Server server,
                     std::unique_ptr<BridgeClient> bridge,
                     std::unique_ptr<TransportClient> transport);
    DeviceController(std::string identifier, Server server,
                     std::unique_ptr<BridgeClient> bridge,
                     std::unique_ptr<TransportClient> transport,
                     ServerLifecycle::Policies policies, RetryClock clock);

    DeviceController(const DeviceController&) = delete;
    DeviceController& operator=(const DeviceController&) = delete;

    const std::string& identifier() const { return identifier_; }
    const Server& server() const { return server_; }
    void changeServer(const Server& server);

    // Applied to gestures whose options carry no timeout
    std::chrono::milliseconds gestureTimeout() const { return gesture_timeout_; }
    void setGestureTimeout(std::chrono::milliseconds timeout) { gesture_timeout_ = timeout; }

    BridgeClient& bridge() { return *bridge_; }
    ServerState serverState() const { return lifecycle_.state(); }

    // --- RPC ---
    Result<nlohmann::json> performAction(const std::string& action,
                                         const nlohmann::json& arguments = nlohmann::json::array());
    Result<nlohmann::json> enterText(const std::string& text);
    Result<nlohmann::json> mapRoute(const std::string& query, const std::string& method_name,
                                    const std::vector<MethodRef>& method_args = {});

    // --- Gestures ---
    Result<void> executeGesture(const GestureDescriptor& gesture);
    Result<void> tap(const std::string& query, const GestureOptions& options = {});
    Result<void> doubleTap(const std::string& query, const GestureOptions& options = {});
    Result<void> longPress(const std::string& query, const GestureOptions& options = {});
    Result<void> pan(const std::string& query, Point from, Point to, const GestureOptions& options = {});
    Result<void> flick(const std::string& query, Point from, Point to, const GestureOptions& options = {});

    // --- Applications ---
    Result<void> installApp(const Application& app);
    Result<void> ensureAppInstalled(const Application& app);
    Result<void> uninstallApp(const Application& app);
    Result<void> clearAppData(const Application& app);
    Result<std::vector<std::string>> installedPackages();
    Result<std::vector<InstalledApp>> installedApps();

    // --- Test-server ---
    Result<void> startApp(const Application& app,
                          const std::map<std::string, std::string>& env_overrides = {});
    Result<void> stopApp();
    bool testServerResponding() { return lifecycle_.responding(); }
    bool testServerReady() { return lifecycle_.ready(); }

    // PNG from `adb exec-out screencap -p`, written to path
    Result<std::string> screenshot(const std::string& path);

private:
    std::string identifier_;
    Server server_;
    std::unique_ptr<BridgeClient> bridge_;
    std::unique_ptr<TransportClient> transport_;
    InstallManager installer_;
    ServerLifecycle lifecycle_;
    std::chrono::milliseconds gesture_timeout_{30000};
};

// Build a controller from configuration: serial from config / environment or
// the only attached device, adb bridge and HTTP transport per config.
Result<std::unique_ptr<DeviceController>> createDeviceController(const config::AppConfig& config);

} // namespace droidpilot
