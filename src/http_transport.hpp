#pragma once
#include <string>
#include <optional>
#include "result.hpp"

namespace droidpilot {

/**
 * One request to the test-server.
 * route is the path below "/" (e.g. "ping", "map", "" for actions).
 * When json is set the body is the single form field json=<text>.
 */
struct HttpRequest {
    std::string route;
    std::optional<std::string> json;

    HttpRequest() = default;
    explicit HttpRequest(std::string r) : route(std::move(r)) {}
    HttpRequest(std::string r, std::string j) : route(std::move(r)), json(std::move(j)) {}
};

// Error::code values for Transport errors without an HTTP status.
// A positive code is the HTTP status of a non-2xx response.
constexpr int TRANSPORT_CONNECT_FAILED = -1;   // unresolvable, refused, reset
constexpr int TRANSPORT_TIMED_OUT = -2;        // no complete answer in time

// Per-call knobs. Zero / negative means "use the client default".
struct RequestOptions {
    int timeout_ms = 0;     // budget for the whole call, all tries included
    int retries = 0;        // total number of tries
    int interval_ms = -1;   // pause between tries
};

/**
 * HTTP transport to the forwarded test-server port.
 * get() returns the response body; connection failure, timeout or a non-2xx
 * status is a Transport error (code = HTTP status when there was one).
 */
class TransportClient {
public:
    virtual ~TransportClient() = default;

    virtual Result<std::string> get(const HttpRequest& request,
                                    const RequestOptions& options = {}) = 0;

    // Re-point at another endpoint (change_server)
    virtual void setEndpoint(const std::string& host, int port) = 0;
};

// TransportClient over libcurl, one easy handle per try
class HttpTransportClient : public TransportClient {
public:
    struct Defaults {
        int timeout_ms = 5000;
        int retries = 15;
        int interval_ms = 500;
    };

    HttpTransportClient(std::string host, int port);
    HttpTransportClient(std::string host, int port, Defaults defaults);

    Result<std::string> get(const HttpRequest& request,
                            const RequestOptions& options = {}) override;

    void setEndpoint(const std::string& host, int port) override;

    const std::string& host() const { return host_; }
    int port() const { return port_; }

private:
    // Single try with the given budget
    Result<std::string> getOnce(const HttpRequest& request, int timeout_ms);

    std::string url(const std::string& route) const;

    std::string host_;
    int port_;
    Defaults defaults_;
};

} // namespace droidpilot
