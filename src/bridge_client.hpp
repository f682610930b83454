#pragma once
#include <string>
#include <vector>
#include "result.hpp"

namespace droidpilot {

/**
 * Device bridge (adb) command channel.
 *
 * command() runs `adb [-s <serial>] <args...>` and returns captured stdout.
 * A non-zero exit, a spawn failure or a timeout is a Bridge error whose detail
 * holds the captured stderr.
 */
class BridgeClient {
public:
    virtual ~BridgeClient() = default;

    // timeout_ms <= 0 uses the client's default timeout
    virtual Result<std::string> command(const std::vector<std::string>& args,
                                        int timeout_ms = 0) = 0;

    // `adb shell <cmd>`
    Result<std::string> shell(const std::string& cmd, int timeout_ms = 0) {
        return command({"shell", cmd}, timeout_ms);
    }

    virtual const std::string& serial() const = 0;
};

/**
 * BridgeClient backed by the adb executable.
 * Arguments are passed as an argv vector (no host shell in between).
 */
class AdbBridgeClient : public BridgeClient {
public:
    // serial may be empty for device-independent commands (`adb devices`)
    AdbBridgeClient(std::string adb_path, std::string serial, int default_timeout_ms = 30000);

    Result<std::string> command(const std::vector<std::string>& args,
                                int timeout_ms = 0) override;

    const std::string& serial() const override { return serial_; }
    const std::string& adbPath() const { return adb_path_; }

private:
    std::string adb_path_;
    std::string serial_;
    int default_timeout_ms_;
};

// Output of one child process run
struct ProcessOutput {
    int exit_code = -1;
    bool timed_out = false;
    std::string out;
    std::string err;
};

// Spawn argv[0] with argv, capture stdout/stderr, kill it after timeout_ms.
// Returns an Io error only when the process could not be started at all.
Result<ProcessOutput> runProcess(const std::vector<std::string>& argv, int timeout_ms);

// Last non-empty line of adb output, trimmed of trailing "\r" and spaces
std::string lastNonEmptyLine(const std::string& output);

// True when the last non-empty line reads "success" (case-insensitive)
bool reportsSuccess(const std::string& output);

// =============================================================================
// Device enumeration
// =============================================================================

// Parse `adb devices` output: header "List of devices attached", then one
// record per line starting with the serial. Missing header is a Parse error.
Result<std::vector<std::string>> parseDeviceList(const std::string& output);

// `adb devices` through the given (serial-less) bridge
Result<std::vector<std::string>> listSerials(BridgeClient& bridge);

// The one attached serial; error when none or more than one is attached
Result<std::string> defaultSerial(BridgeClient& bridge);

} // namespace droidpilot
