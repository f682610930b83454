#include "server_lifecycle.hpp"
#include "adb_security.hpp"
#include "droidpilot_log.hpp"
#include "request_codec.hpp"

#include <algorithm>

namespace droidpilot {

using std::chrono::milliseconds;

const char* serverStateStr(ServerState s) {
    switch (s) {
        case ServerState::NotStarted: return "NotStarted";
        case ServerState::Started:    return "Started";
        case ServerState::Responding: return "Responding";
        case ServerState::Ready:      return "Ready";
        case ServerState::Failed:     return "Failed";
    }
    return "?";
}

ServerLifecycle::ServerLifecycle(BridgeClient& bridge, TransportClient& transport,
                                 InstallManager& installer, Server server)
    : ServerLifecycle(bridge, transport, installer, std::move(server), Policies{},
                      RetryClock::system()) {}

ServerLifecycle::ServerLifecycle(BridgeClient& bridge, TransportClient& transport,
                                 InstallManager& installer, Server server,
                                 Policies policies, RetryClock clock)
    : bridge_(bridge), transport_(transport), installer_(installer),
      server_(std::move(server)), policies_(policies), clock_(std::move(clock)) {}

void ServerLifecycle::transition(ServerState next) {
    DPLOG_DEBUG("server", "%s -> %s", serverStateStr(state_), serverStateStr(next));
    state_ = next;
}

// =============================================================================
// Probes
// =============================================================================

Result<bool> ServerLifecycle::probe(const char* route, const char* expected, int timeout_ms) {
    RequestOptions opts;
    opts.timeout_ms = timeout_ms;
    opts.retries = 1;
    opts.interval_ms = 0;

    auto body = transport_.get(HttpRequest(route), opts);
    if (body.is_err()) return body.error();
    return Ok(body.value() == expected);
}

int ServerLifecycle::probeTimeout(const RetryAttempt& attempt) const {
    int t = policies_.probe_timeout_ms;
    if (attempt.remaining) {
        t = static_cast<int>(std::min<long long>(t, attempt.remaining->count()));
    }
    return std::max(t, 1);
}

bool ServerLifecycle::responding() {
    return probe(codec::ROUTE_PING, "pong", policies_.probe_timeout_ms).value_or(false);
}

bool ServerLifecycle::ready() {
    return probe(codec::ROUTE_READY, "true", policies_.probe_timeout_ms).value_or(false);
}

Result<void> ServerLifecycle::portForward(int host_port) {
    auto out = bridge_.command({"forward", "tcp:" + std::to_string(host_port),
                                "tcp:" + std::to_string(server_.test_server_port)});
    if (out.is_err()) return out.error();
    DPLOG_INFO("server", "Forwarded tcp:%d -> device tcp:%d", host_port, server_.test_server_port);
    return Ok();
}

// =============================================================================
// Start
// =============================================================================

std::map<std::string, std::string> ServerLifecycle::buildEnvironment(
    const Application& app, const std::map<std::string, std::string>& env_overrides) const {
    std::map<std::string, std::string> env = env_overrides;

    env["test_server_port"] = std::to_string(server_.test_server_port);
    env.emplace("class", INSTRUMENTATION_BACKEND);
    env.emplace("target_package", app.identifier);
    if (!app.main_activity.empty()) {
        env.emplace("main_activity", app.main_activity);
    }
    return env;
}

std::string ServerLifecycle::buildInstrumentCommand(
    const Application& app, const std::map<std::string, std::string>& env) const {
    std::string cmd = "am instrument";
    for (const auto& [key, value] : env) {
        cmd += " -e \"" + security::escapeDoubleQuoted(key) + "\" \"" +
               security::escapeDoubleQuoted(value) + "\"";
    }
    cmd += " " + app.test_server->identifier + "/" + TEST_RUNNER;
    return cmd;
}

Result<void> ServerLifecycle::start(const Application& app,
                                    const std::map<std::string, std::string>& env_overrides) {
    transition(ServerState::NotStarted);

    if (!app.test_server) {
        return Error(ErrorKind::Precondition, "Invalid application. No test-server set.",
                     app.identifier);
    }

    auto env = buildEnvironment(app, env_overrides);
    const std::string& target = env["target_package"];
    const std::string& test_server = app.test_server->identifier;

    if (!security::isValidPackageName(target) || !security::isValidPackageName(test_server)) {
        return Error(ErrorKind::Precondition,
                     "Invalid package name '" + target + "' / '" + test_server + "'");
    }

    auto packages = DP_TRY(installer_.installedPackages());
    auto installed = [&](const std::string& id) {
        return std::find(packages.begin(), packages.end(), id) != packages.end();
    };
    if (!installed(target)) {
        return Error(ErrorKind::Precondition, "The application '" + target + "' is not installed");
    }
    if (!installed(test_server)) {
        return Error(ErrorKind::Precondition, "The test-server '" + test_server + "' is not installed");
    }

    // Started
    std::string cmd = buildInstrumentCommand(app, env);
    DPLOG_INFO("server", "Starting test server using: '%s'", cmd.c_str());

    auto launched = bridge_.shell(cmd);
    if (launched.is_err()) {
        DPLOG_ERROR("server", "Could not start the application. adb shell output:");
        DPLOG_ERROR("server", "%s", launched.error().detail.c_str());
        transition(ServerState::Failed);
        return Error(ErrorKind::Bridge, "Failed to start the application",
                     launched.error().describe());
    }
    transition(ServerState::Started);

    auto forwarded = portForward(server_.host_port);
    if (forwarded.is_err()) {
        transition(ServerState::Failed);
        return forwarded.error();
    }

    // Responding
    auto alive = retryBounded(
        policies_.responding,
        [this](const RetryAttempt& a) { return probe(codec::ROUTE_PING, "pong", probeTimeout(a)); },
        isTransientError, clock_, "test-server ping");
    if (alive.is_err()) {
        DPLOG_ERROR("server", "Could not contact test-server");
        DPLOG_ERROR("server", "For information, see the adb logcat");
        transition(ServerState::Failed);
        return Error(ErrorKind::Timeout, "Could not contact test-server",
                     alive.error().message + "\n" + alive.error().detail);
    }
    transition(ServerState::Responding);

    // Ready
    auto ready = retryBounded(
        policies_.ready,
        [this](const RetryAttempt& a) { return probe(codec::ROUTE_READY, "true", probeTimeout(a)); },
        isTransientError, clock_, "test-server ready");
    if (ready.is_err()) {
        DPLOG_ERROR("server", "Test-server was never ready");
        DPLOG_ERROR("server", "For information, see the adb logcat");
        transition(ServerState::Failed);
        return Error(ErrorKind::Timeout, "Test-server was never ready",
                     ready.error().message + "\n" + ready.error().detail);
    }
    transition(ServerState::Ready);

    DPLOG_INFO("server", "Test-server ready on %s (%d attempt(s) to respond)",
               server_.endpoint().c_str(), alive.value().attempts);
    return Ok();
}

// =============================================================================
// Stop
// =============================================================================

Result<void> ServerLifecycle::stop() {
    auto killed = retryBounded(
        policies_.stop,
        [this](const RetryAttempt&) -> Result<bool> {
            RequestOptions kill_opts;
            kill_opts.timeout_ms = policies_.probe_timeout_ms;
            kill_opts.retries = 1;
            kill_opts.interval_ms = 0;

            auto kill = transport_.get(HttpRequest(codec::ROUTE_KILL), kill_opts);
            if (kill.is_ok()) return Ok(true);

            // The server may already be gone; only an answered liveness probe
            // can tell. A probe that errors leaves it unconfirmed: try again.
            auto alive = probe(codec::ROUTE_PING, "pong", policies_.probe_timeout_ms);
            if (alive.is_err()) return alive.error();
            return Ok(!alive.value());
        },
        isTransientError, clock_, "test-server kill");

    if (killed.is_err()) {
        DPLOG_ERROR("server", "Could not kill the test-server");
        return Error(ErrorKind::Timeout, "Could not kill the test-server",
                     killed.error().message + "\n" + killed.error().detail);
    }

    transition(ServerState::NotStarted);
    return Ok();
}

} // namespace droidpilot
