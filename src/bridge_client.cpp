#include "bridge_client.hpp"
#include "adb_security.hpp"
#include "droidpilot_log.hpp"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <sstream>

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

namespace droidpilot {

namespace {

// adb output beyond this is dropped (screencap PNGs stay well below)
constexpr size_t MAX_OUTPUT_BYTES = 64 * 1024 * 1024;

// RAII wrapper for a pipe fd
struct Fd {
    int fd = -1;
    Fd() = default;
    explicit Fd(int f) : fd(f) {}
    Fd(const Fd&) = delete;
    Fd& operator=(const Fd&) = delete;
    ~Fd() { reset(); }
    void reset() {
        if (fd >= 0) ::close(fd);
        fd = -1;
    }
};

bool makePipe(Fd& read_end, Fd& write_end) {
    int fds[2];
    if (::pipe(fds) != 0) return false;
    read_end.fd = fds[0];
    write_end.fd = fds[1];
    ::fcntl(read_end.fd, F_SETFD, FD_CLOEXEC);
    ::fcntl(write_end.fd, F_SETFD, FD_CLOEXEC);
    return true;
}

std::string joinArgs(const std::vector<std::string>& args) {
    std::string out;
    for (const auto& a : args) {
        if (!out.empty()) out += ' ';
        out += a;
    }
    return out;
}

void trimRight(std::string& s) {
    while (!s.empty() && (s.back() == '\n' || s.back() == '\r' || s.back() == ' ' || s.back() == '\t')) {
        s.pop_back();
    }
}

} // anonymous namespace

// =============================================================================
// Process execution
// =============================================================================

Result<ProcessOutput> runProcess(const std::vector<std::string>& argv, int timeout_ms) {
    if (argv.empty()) {
        return Err<ProcessOutput>(ErrorKind::Io, "empty command line");
    }

    Fd out_r, out_w, err_r, err_w;
    if (!makePipe(out_r, out_w) || !makePipe(err_r, err_w)) {
        return Err<ProcessOutput>(ErrorKind::Io, std::string("pipe() failed: ") + std::strerror(errno));
    }

    std::vector<char*> c_argv;
    c_argv.reserve(argv.size() + 1);
    for (const auto& a : argv) c_argv.push_back(const_cast<char*>(a.c_str()));
    c_argv.push_back(nullptr);

    pid_t pid = ::fork();
    if (pid < 0) {
        return Err<ProcessOutput>(ErrorKind::Io, std::string("fork() failed: ") + std::strerror(errno));
    }

    if (pid == 0) {
        ::dup2(out_w.fd, STDOUT_FILENO);
        ::dup2(err_w.fd, STDERR_FILENO);
        int devnull = ::open("/dev/null", O_RDONLY);
        if (devnull >= 0) ::dup2(devnull, STDIN_FILENO);
        ::execvp(c_argv[0], c_argv.data());
        // exec failed: report on stderr, 127 like a shell would
        const char* msg = "exec failed: ";
        ssize_t ignored = ::write(STDERR_FILENO, msg, std::strlen(msg));
        ignored = ::write(STDERR_FILENO, c_argv[0], std::strlen(c_argv[0]));
        (void)ignored;
        ::_exit(127);
    }

    out_w.reset();
    err_w.reset();

    ProcessOutput result;
    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);
    char buffer[4096];
    bool out_open = true, err_open = true;

    while (out_open || err_open) {
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now()).count();
        if (timeout_ms > 0 && remaining <= 0) {
            ::kill(pid, SIGKILL);
            result.timed_out = true;
            break;
        }

        pollfd fds[2];
        nfds_t nfds = 0;
        if (out_open) fds[nfds++] = {out_r.fd, POLLIN, 0};
        if (err_open) fds[nfds++] = {err_r.fd, POLLIN, 0};

        int wait_ms = timeout_ms > 0 ? static_cast<int>(std::min<long long>(remaining, 250)) : 250;
        int rc = ::poll(fds, nfds, wait_ms);
        if (rc < 0) {
            if (errno == EINTR) continue;
            ::kill(pid, SIGKILL);
            break;
        }

        for (nfds_t i = 0; i < nfds; ++i) {
            if (!(fds[i].revents & (POLLIN | POLLHUP | POLLERR))) continue;
            ssize_t n = ::read(fds[i].fd, buffer, sizeof(buffer));
            bool is_out = fds[i].fd == out_r.fd;
            if (n <= 0) {
                (is_out ? out_open : err_open) = false;
                continue;
            }
            std::string& sink = is_out ? result.out : result.err;
            if (sink.size() < MAX_OUTPUT_BYTES) sink.append(buffer, static_cast<size_t>(n));
        }
    }

    int status = 0;
    while (::waitpid(pid, &status, 0) < 0 && errno == EINTR) {}
    if (WIFEXITED(status)) {
        result.exit_code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        result.exit_code = 128 + WTERMSIG(status);
    }

    return Ok(std::move(result));
}

// =============================================================================
// AdbBridgeClient
// =============================================================================

AdbBridgeClient::AdbBridgeClient(std::string adb_path, std::string serial, int default_timeout_ms)
    : adb_path_(std::move(adb_path)), serial_(std::move(serial)),
      default_timeout_ms_(default_timeout_ms) {}

Result<std::string> AdbBridgeClient::command(const std::vector<std::string>& args, int timeout_ms) {
    if (!serial_.empty() && !security::isValidSerial(serial_)) {
        DPLOG_ERROR("adb", "Invalid device serial rejected: %s", serial_.c_str());
        return Err<std::string>(ErrorKind::Bridge, "invalid device serial '" + serial_ + "'");
    }

    std::vector<std::string> argv;
    argv.reserve(args.size() + 3);
    argv.push_back(adb_path_);
    if (!serial_.empty()) {
        argv.push_back("-s");
        argv.push_back(serial_);
    }
    argv.insert(argv.end(), args.begin(), args.end());

    int effective_timeout = timeout_ms > 0 ? timeout_ms : default_timeout_ms_;
    DPLOG_DEBUG("adb", "exec: %s (timeout %d ms)", joinArgs(argv).c_str(), effective_timeout);

    auto run = runProcess(argv, effective_timeout);
    if (run.is_err()) {
        return Error(ErrorKind::Bridge, "could not run adb: " + run.error().message);
    }

    ProcessOutput& proc = run.value();
    if (proc.timed_out) {
        return Error(ErrorKind::Bridge,
                     "adb " + joinArgs(args) + " timed out after " + std::to_string(effective_timeout) + " ms",
                     proc.err, proc.exit_code);
    }
    if (proc.exit_code != 0) {
        std::string err = proc.err.empty() ? proc.out : proc.err;
        trimRight(err);
        return Error(ErrorKind::Bridge,
                     "adb " + joinArgs(args) + " exited with code " + std::to_string(proc.exit_code),
                     err, proc.exit_code);
    }

    return Ok(std::move(proc.out));
}

// =============================================================================
// Output helpers
// =============================================================================

std::string lastNonEmptyLine(const std::string& output) {
    std::istringstream iss(output);
    std::string line, last;
    while (std::getline(iss, line)) {
        trimRight(line);
        if (!line.empty()) last = line;
    }
    return last;
}

bool reportsSuccess(const std::string& output) {
    std::string last = lastNonEmptyLine(output);
    std::transform(last.begin(), last.end(), last.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return last == "success";
}

// =============================================================================
// Device enumeration
// =============================================================================

Result<std::vector<std::string>> parseDeviceList(const std::string& output) {
    std::istringstream iss(output);
    std::string line;
    bool header_seen = false;
    std::vector<std::string> serials;

    while (std::getline(iss, line)) {
        if (!header_seen) {
            if (line.rfind("List of devices attached", 0) == 0) header_seen = true;
            continue;
        }

        std::istringstream fields(line);
        std::string serial;
        if (fields >> serial) serials.push_back(serial);
    }

    if (!header_seen) {
        return Err<std::vector<std::string>>(ErrorKind::Parse,
                                             "Could not parse adb devices output", output);
    }
    return Ok(std::move(serials));
}

Result<std::vector<std::string>> listSerials(BridgeClient& bridge) {
    auto out = bridge.command({"devices"});
    if (out.is_err()) return out.error();
    return parseDeviceList(out.value());
}

Result<std::string> defaultSerial(BridgeClient& bridge) {
    auto serials = DP_TRY(listSerials(bridge));

    if (serials.empty()) {
        return Err<std::string>(ErrorKind::Precondition,
                                "No devices visible on adb. Ensure a device is visible in `adb devices`");
    }
    if (serials.size() > 1) {
        return Err<std::string>(ErrorKind::Precondition,
                                "More than one device connected. Use DROIDPILOT_IDENTIFIER to select serial");
    }
    return Ok(serials.front());
}

} // namespace droidpilot
