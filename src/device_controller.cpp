#include "device_controller.hpp"
#include "droidpilot_log.hpp"

#include <fstream>

namespace droidpilot {

using json = nlohmann::json;

DeviceController::DeviceController(std::string identifier, Server server,
                                   std::unique_ptr<BridgeClient> bridge,
                                   std::unique_ptr<TransportClient> transport)
    : DeviceController(std::move(identifier), std::move(server), std::move(bridge),
                       std::move(transport), ServerLifecycle::Policies{}, RetryClock::system()) {}

DeviceController::DeviceController(std::string identifier, Server server,
                                   std::unique_ptr<BridgeClient> bridge,
                                   std::unique_ptr<TransportClient> transport,
                                   ServerLifecycle::Policies policies, RetryClock clock)
    : identifier_(std::move(identifier)),
      server_(std::move(server)),
      bridge_(std::move(bridge)),
      transport_(std::move(transport)),
      installer_(*bridge_),
      lifecycle_(*bridge_, *transport_, installer_, server_, policies, std::move(clock)) {
    transport_->setEndpoint(server_.host, server_.host_port);
}

void DeviceController::changeServer(const Server& server) {
    DPLOG_INFO("device", "%s: server %s -> %s", identifier_.c_str(),
               server_.endpoint().c_str(), server.endpoint().c_str());
    server_ = server;
    lifecycle_.setServer(server_);
    transport_->setEndpoint(server_.host, server_.host_port);
}

// =============================================================================
// RPC
// =============================================================================

Result<json> DeviceController::performAction(const std::string& action, const json& arguments) {
    DPLOG_INFO("device", "Action: %s - Arguments: %s", action.c_str(), arguments.dump().c_str());

    auto body = transport_->get(codec::encodeAction(action, arguments));
    if (body.is_err()) return body.error();
    return codec::decodeAction(body.value());
}

Result<json> DeviceController::enterText(const std::string& text) {
    return performAction("keyboard_enter_text", json::array({text}));
}

Result<json> DeviceController::mapRoute(const std::string& query, const std::string& method_name,
                                        const std::vector<MethodRef>& method_args) {
    auto body = transport_->get(codec::encodeMap(query, method_name, method_args));
    if (body.is_err()) return body.error();
    return codec::decodeMap(body.value(), query, method_name);
}

// =============================================================================
// Gestures
// =============================================================================

Result<void> DeviceController::executeGesture(const GestureDescriptor& gesture) {
    if (!gesture.isBound()) {
        return Error(ErrorKind::Precondition, "Gesture has no query string / timeout attached",
                     gestureKindStr(gesture.kind()));
    }

    RequestOptions opts;
    opts.timeout_ms = static_cast<int>(codec::gestureRequestTimeout(gesture).count());

    auto body = transport_->get(codec::encodeGesture(gesture), opts);
    if (body.is_err()) return body.error();
    return codec::decodeGesture(body.value());
}

Result<void> DeviceController::tap(const std::string& query, const GestureOptions& options) {
    auto gesture = GestureBuilder::tap(options.at.x, options.at.y, options.offset);
    return executeGesture(GestureBuilder::withParameters(gesture, query,
                                                         options.timeout.value_or(gesture_timeout_)));
}

Result<void> DeviceController::doubleTap(const std::string& query, const GestureOptions& options) {
    auto gesture = GestureBuilder::doubleTap(options.at.x, options.at.y, options.offset);
    return executeGesture(GestureBuilder::withParameters(gesture, query,
                                                         options.timeout.value_or(gesture_timeout_)));
}

Result<void> DeviceController::longPress(const std::string& query, const GestureOptions& options) {
    auto gesture = GestureBuilder::longPress(options.at.x, options.at.y, options.offset,
                                             options.duration);
    return executeGesture(GestureBuilder::withParameters(gesture, query,
                                                         options.timeout.value_or(gesture_timeout_)));
}

Result<void> DeviceController::pan(const std::string& query, Point from, Point to,
                                   const GestureOptions& options) {
    auto gesture = GestureBuilder::swipe(from, to, options.duration);
    return executeGesture(GestureBuilder::withParameters(gesture, query,
                                                         options.timeout.value_or(gesture_timeout_)));
}

Result<void> DeviceController::flick(const std::string& query, Point from, Point to,
                                     const GestureOptions& options) {
    auto gesture = GestureBuilder::flick(from, to, options.duration);
    return executeGesture(GestureBuilder::withParameters(gesture, query,
                                                         options.timeout.value_or(gesture_timeout_)));
}

// =============================================================================
// Applications / test-server
// =============================================================================

Result<void> DeviceController::installApp(const Application& app) { return installer_.install(app); }
Result<void> DeviceController::ensureAppInstalled(const Application& app) { return installer_.ensureInstalled(app); }
Result<void> DeviceController::uninstallApp(const Application& app) { return installer_.uninstall(app); }
Result<void> DeviceController::clearAppData(const Application& app) { return installer_.clearData(app); }
Result<std::vector<std::string>> DeviceController::installedPackages() { return installer_.installedPackages(); }
Result<std::vector<InstalledApp>> DeviceController::installedApps() { return installer_.installedApps(); }

Result<void> DeviceController::startApp(const Application& app,
                                        const std::map<std::string, std::string>& env_overrides) {
    return lifecycle_.start(app, env_overrides);
}

Result<void> DeviceController::stopApp() {
    return lifecycle_.stop();
}

Result<std::string> DeviceController::screenshot(const std::string& path) {
    DPLOG_INFO("device", "Taking screenshot of %s", identifier_.c_str());

    auto png = bridge_->command({"exec-out", "screencap", "-p"});
    if (png.is_err()) return png.error();
    if (png.value().empty()) {
        return Err<std::string>(ErrorKind::Bridge, "Could not take screenshot", "screencap returned no data");
    }

    std::ofstream file(path, std::ios::binary | std::ios::trunc);
    if (!file.is_open()) {
        return Err<std::string>(ErrorKind::Io, "Could not open " + path + " for writing");
    }
    file.write(png.value().data(), static_cast<std::streamsize>(png.value().size()));
    if (!file.good()) {
        return Err<std::string>(ErrorKind::Io, "Could not write screenshot to " + path);
    }

    DPLOG_INFO("device", "Saved screenshot as %s (%zu bytes)", path.c_str(), png.value().size());
    return Ok(path);
}

// =============================================================================
// Factory
// =============================================================================

Result<std::unique_ptr<DeviceController>> createDeviceController(const config::AppConfig& config) {
    std::string serial = config.bridge.serial;
    if (serial.empty()) {
        AdbBridgeClient enumerator(config.bridge.adb_path, "", config.bridge.command_timeout_ms);
        serial = DP_TRY(defaultSerial(enumerator));
    }
    DPLOG_INFO("device", "Using device %s", serial.c_str());

    Server server;
    server.host = config.server.host;
    server.host_port = config.server.host_port;
    server.test_server_port = config.server.test_server_port;

    HttpTransportClient::Defaults http_defaults;
    http_defaults.timeout_ms = config.timeouts.http_timeout_ms;

    auto bridge = std::make_unique<AdbBridgeClient>(config.bridge.adb_path, serial,
                                                    config.bridge.command_timeout_ms);
    auto transport = std::make_unique<HttpTransportClient>(server.host, server.host_port, http_defaults);

    ServerLifecycle::Policies policies;
    policies.probe_timeout_ms = config.timeouts.http_timeout_ms;

    auto controller = std::make_unique<DeviceController>(serial, server, std::move(bridge), std::move(transport),
                                                         policies, RetryClock::system());
    controller->setGestureTimeout(std::chrono::seconds(config.timeouts.gesture_timeout_s));
    return Ok(std::move(controller));
}

} // namespace droidpilot
