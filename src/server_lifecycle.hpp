#pragma once
#include <map>
#include <string>
#include "bounded_retry.hpp"
#include "bridge_client.hpp"
#include "device_model.hpp"
#include "http_transport.hpp"
#include "install_manager.hpp"
#include "result.hpp"

namespace droidpilot {

enum class ServerState {
    NotStarted,
    Started,      // instrumentation launched, port forwarded
    Responding,   // "ping" answered "pong"
    Ready,        // "ready" answered "true"
    Failed
};

const char* serverStateStr(ServerState s);

/**
 * Instrumentation test-server lifecycle.
 *
 * start():  preconditions -> am instrument -> adb forward -> wait for
 *           "pong" (responding budget) -> wait for "true" (ready budget).
 * stop():   "kill" until the server is gone or the stop budget runs out.
 */
class ServerLifecycle {
public:
    static constexpr const char* INSTRUMENTATION_BACKEND =
        "sh.calaba.instrumentationbackend.InstrumentationBackend";
    static constexpr const char* TEST_RUNNER =
        "sh.calaba.instrumentationbackend.CalabashInstrumentationTestRunner";

    struct Policies {
        RetryPolicy responding{30, std::chrono::seconds(1), std::chrono::milliseconds(30000)};
        RetryPolicy ready{10, std::chrono::seconds(1), std::chrono::milliseconds(10000)};
        RetryPolicy stop{5, std::chrono::seconds(1), std::nullopt};
        int probe_timeout_ms = 5000;   // per probe call, clamped to the loop budget
    };

    ServerLifecycle(BridgeClient& bridge, TransportClient& transport, InstallManager& installer,
                    Server server);
    ServerLifecycle(BridgeClient& bridge, TransportClient& transport, InstallManager& installer,
                    Server server, Policies policies, RetryClock clock);

    // Caller keys override the defaults; test_server_port is always ours
    Result<void> start(const Application& app,
                       const std::map<std::string, std::string>& env_overrides = {});

    Result<void> stop();

    // Single probes; any transport error reads as false
    bool responding();
    bool ready();

    // adb forward tcp:<host_port> tcp:<test_server_port>
    Result<void> portForward(int host_port);

    ServerState state() const { return state_; }
    const Server& server() const { return server_; }
    void setServer(const Server& server) { server_ = server; }

    // Environment passed to the instrumentation runner
    std::map<std::string, std::string> buildEnvironment(
        const Application& app, const std::map<std::string, std::string>& env_overrides) const;

    // "am instrument -e "k" "v" ... <test-server>/<runner>"
    std::string buildInstrumentCommand(const Application& app,
                                       const std::map<std::string, std::string>& env) const;

private:
    Result<bool> probe(const char* route, const char* expected, int timeout_ms);
    int probeTimeout(const RetryAttempt& attempt) const;
    void transition(ServerState next);

    BridgeClient& bridge_;
    TransportClient& transport_;
    InstallManager& installer_;
    Server server_;
    Policies policies_;
    RetryClock clock_;
    ServerState state_ = ServerState::NotStarted;
};

} // namespace droidpilot
