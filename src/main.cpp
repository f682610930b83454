// =============================================================================
// DroidPilot - command line front end
// =============================================================================
// Usage: droidpilot [--config <file>] <command> [args...]
// =============================================================================

#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <memory>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

#include "config_loader.hpp"
#include "device_controller.hpp"
#include "droidpilot_log.hpp"

using namespace droidpilot;
using json = nlohmann::json;

namespace {

void usage() {
    fprintf(stderr,
        "usage: droidpilot [--config <file>] <command> [args...]\n"
        "\n"
        "commands:\n"
        "  devices                                   list attached serials\n"
        "  packages                                  list installed packages\n"
        "  install <pkg> <apk> [<ts-pkg> <ts-apk>]   (re)install app and test-server\n"
        "  ensure  <pkg> <apk> [<ts-pkg> <ts-apk>]   install only what is missing\n"
        "  uninstall <pkg>\n"
        "  clear <pkg>\n"
        "  start <pkg> <ts-pkg> [<main-activity>]    launch the test-server\n"
        "  stop\n"
        "  ping                                      responding / ready probes\n"
        "  action <name> [<json-array>]\n"
        "  map <query> <method> [<json-array>]\n"
        "  text <string>                             type into the focused view\n"
        "  tap <query> [<x> <y>]\n"
        "  screenshot <path>\n");
}

Application makeApp(const std::vector<std::string>& args, size_t first) {
    Application app(args[first], args.size() > first + 1 ? args[first + 1] : "");
    if (args.size() > first + 3) {
        app.test_server = std::make_shared<Application>(args[first + 2], args[first + 3]);
    }
    return app;
}

int report(const Error& e) {
    fprintf(stderr, "%s\n", e.describe().c_str());
    return 1;
}

int report(const Result<void>& r) {
    if (r.is_err()) return report(r.error());
    printf("OK\n");
    return 0;
}

Result<json> parseJsonArg(const std::vector<std::string>& args, size_t index) {
    if (args.size() <= index) return Ok(json::array());
    return codec::parseBody(args[index]);
}

int runDeviceCommand(DeviceController& device, const config::AppConfig& cfg,
                     const std::string& cmd, const std::vector<std::string>& args) {
    if (cmd == "packages") {
        auto packages = device.installedPackages();
        if (packages.is_err()) return report(packages.error());
        for (const auto& p : packages.value()) printf("%s\n", p.c_str());
        return 0;
    }
    if ((cmd == "install" || cmd == "ensure") && args.size() >= 2) {
        Application app = makeApp(args, 0);
        return report(cmd == "install" ? device.installApp(app) : device.ensureAppInstalled(app));
    }
    if (cmd == "uninstall" && args.size() >= 1) {
        return report(device.uninstallApp(Application(args[0], "")));
    }
    if (cmd == "clear" && args.size() >= 1) {
        return report(device.clearAppData(Application(args[0], "")));
    }
    if (cmd == "start" && args.size() >= 2) {
        Application app(args[0], "", args.size() > 2 ? args[2] : "");
        app.test_server = std::make_shared<Application>(args[1], "");
        return report(device.startApp(app));
    }
    if (cmd == "stop") {
        return report(device.stopApp());
    }
    if (cmd == "ping") {
        bool responding = device.testServerResponding();
        bool ready = responding && device.testServerReady();
        printf("responding=%s ready=%s\n", responding ? "true" : "false", ready ? "true" : "false");
        return responding ? 0 : 1;
    }
    if (cmd == "action" && args.size() >= 1) {
        auto arguments = parseJsonArg(args, 1);
        if (arguments.is_err()) return report(arguments.error());
        auto result = device.performAction(args[0], arguments.value());
        if (result.is_err()) return report(result.error());
        printf("%s\n", result.value().dump(2).c_str());
        return 0;
    }
    if (cmd == "map" && args.size() >= 2) {
        auto raw = parseJsonArg(args, 2);
        if (raw.is_err()) return report(raw.error());
        auto refs = methodRefsFromJson(raw.value());
        if (refs.is_err()) return report(refs.error());
        auto result = device.mapRoute(args[0], args[1], refs.value());
        if (result.is_err()) return report(result.error());
        printf("%s\n", result.value().dump(2).c_str());
        return 0;
    }
    if (cmd == "text" && args.size() >= 1) {
        auto result = device.enterText(args[0]);
        if (result.is_err()) return report(result.error());
        printf("OK\n");
        return 0;
    }
    if (cmd == "tap" && args.size() >= 1) {
        GestureOptions opts;
        if (args.size() >= 3) {
            opts.at = Point{std::atof(args[1].c_str()), std::atof(args[2].c_str())};
        }
        return report(device.tap(args[0], opts));
    }
    if (cmd == "screenshot" && args.size() >= 1) {
        auto saved = device.screenshot(args[0]);
        if (saved.is_err()) return report(saved.error());
        printf("%s\n", saved.value().c_str());
        return 0;
    }

    usage();
    return 2;
}

} // anonymous namespace

int main(int argc, char** argv) {
    std::string config_path = "droidpilot.json";
    int i = 1;
    if (argc > 2 && std::strcmp(argv[1], "--config") == 0) {
        config_path = argv[2];
        i = 3;
    }
    if (i >= argc) {
        usage();
        return 2;
    }

    std::string cmd = argv[i++];
    std::vector<std::string> args(argv + i, argv + argc);

    config::AppConfig cfg = config::loadConfig(config_path);
    droidpilot::log::setLogLevel(droidpilot::log::parseLevel(cfg.log.level));
    if (!cfg.log.log_path.empty() && !droidpilot::log::openLogFile(cfg.log.log_path.c_str())) {
        DPLOG_WARN("main", "Could not open log file %s", cfg.log.log_path.c_str());
    }

    int rc = 0;
    if (cmd == "devices") {
        AdbBridgeClient enumerator(cfg.bridge.adb_path, "", cfg.bridge.command_timeout_ms);
        auto serials = listSerials(enumerator);
        if (serials.is_err()) {
            rc = report(serials.error());
        } else {
            for (const auto& s : serials.value()) printf("%s\n", s.c_str());
        }
    } else {
        auto device = createDeviceController(cfg);
        rc = device.is_err() ? report(device.error()) : runDeviceCommand(*device.value(), cfg, cmd, args);
    }

    droidpilot::log::closeLogFile();
    return rc;
}
