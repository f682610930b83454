#include "http_transport.hpp"
#include "droidpilot_log.hpp"

#include <chrono>
#include <memory>
#include <thread>

#include <curl/curl.h>

namespace droidpilot {

namespace {

using Clock = std::chrono::steady_clock;

// =============================================================================
// libcurl helpers
// =============================================================================

struct CurlEasyDeleter {
    void operator()(CURL* h) const { if (h) curl_easy_cleanup(h); }
};
using CurlEasy = std::unique_ptr<CURL, CurlEasyDeleter>;

struct CurlStringDeleter {
    void operator()(char* s) const { if (s) curl_free(s); }
};
using CurlString = std::unique_ptr<char, CurlStringDeleter>;

struct CurlSlistDeleter {
    void operator()(curl_slist* l) const { if (l) curl_slist_free_all(l); }
};
using CurlSlist = std::unique_ptr<curl_slist, CurlSlistDeleter>;

// curl_global_init is not thread-safe; run it once before the first handle
bool ensureCurlInitialized() {
    static const bool ok = curl_global_init(CURL_GLOBAL_DEFAULT) == CURLE_OK;
    return ok;
}

size_t appendBody(char* data, size_t size, size_t nmemb, void* userp) {
    auto* out = static_cast<std::string*>(userp);
    out->append(data, size * nmemb);
    return size * nmemb;
}

int transportCode(CURLcode rc) {
    switch (rc) {
        case CURLE_OPERATION_TIMEDOUT:
            return TRANSPORT_TIMED_OUT;
        case CURLE_COULDNT_CONNECT:
        case CURLE_COULDNT_RESOLVE_HOST:
        case CURLE_GOT_NOTHING:
        case CURLE_SEND_ERROR:
        case CURLE_RECV_ERROR:
            return TRANSPORT_CONNECT_FAILED;
        default:
            return 0;
    }
}

int remainingMs(Clock::time_point deadline) {
    auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - Clock::now()).count();
    return left > 0 ? static_cast<int>(left) : 0;
}

} // anonymous namespace

// =============================================================================
// HttpTransportClient
// =============================================================================

HttpTransportClient::HttpTransportClient(std::string host, int port)
    : HttpTransportClient(std::move(host), port, Defaults{}) {}

HttpTransportClient::HttpTransportClient(std::string host, int port, Defaults defaults)
    : host_(std::move(host)), port_(port), defaults_(defaults) {}

void HttpTransportClient::setEndpoint(const std::string& host, int port) {
    host_ = host;
    port_ = port;
    DPLOG_INFO("http", "Endpoint changed to %s:%d", host_.c_str(), port_);
}

std::string HttpTransportClient::url(const std::string& route) const {
    std::string path = route;
    if (path.empty() || path.front() != '/') path.insert(path.begin(), '/');
    return "http://" + host_ + ":" + std::to_string(port_) + path;
}

Result<std::string> HttpTransportClient::get(const HttpRequest& request, const RequestOptions& options) {
    int timeout_ms = options.timeout_ms > 0 ? options.timeout_ms : defaults_.timeout_ms;
    int tries = options.retries > 0 ? options.retries : defaults_.retries;
    int interval_ms = options.interval_ms >= 0 ? options.interval_ms : defaults_.interval_ms;

    auto deadline = Clock::now() + std::chrono::milliseconds(timeout_ms);
    Error last(ErrorKind::Transport, "no attempt made within " + std::to_string(timeout_ms) + " ms",
               {}, TRANSPORT_TIMED_OUT);

    for (int attempt = 1; attempt <= tries; ++attempt) {
        int budget = remainingMs(deadline);
        if (budget <= 0) break;

        auto result = getOnce(request, budget);
        if (result.is_ok()) return result;

        last = result.error();
        DPLOG_DEBUG("http", "GET /%s try %d/%d failed: %s",
                    request.route.c_str(), attempt, tries, last.message.c_str());

        if (attempt < tries && interval_ms > 0) {
            if (remainingMs(deadline) <= interval_ms) break;
            std::this_thread::sleep_for(std::chrono::milliseconds(interval_ms));
        }
    }

    return last;
}

Result<std::string> HttpTransportClient::getOnce(const HttpRequest& request, int timeout_ms) {
    const std::string endpoint = host_ + ":" + std::to_string(port_);

    if (!ensureCurlInitialized()) {
        return Error(ErrorKind::Transport, "curl_global_init failed");
    }
    CurlEasy curl(curl_easy_init());
    if (!curl) {
        return Error(ErrorKind::Transport, "curl_easy_init failed");
    }

    const std::string target = url(request.route);
    std::string body;
    char errbuf[CURL_ERROR_SIZE] = {0};

    curl_easy_setopt(curl.get(), CURLOPT_URL, target.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_PROXY, "");
    curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT_MS, static_cast<long>(timeout_ms));
    curl_easy_setopt(curl.get(), CURLOPT_CONNECTTIMEOUT_MS, static_cast<long>(timeout_ms));
    curl_easy_setopt(curl.get(), CURLOPT_ERRORBUFFER, errbuf);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, appendBody);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &body);

    // The test-server reads its parameters from a form body on a GET
    std::string form;
    CurlSlist headers;
    if (request.json) {
        CurlString escaped(curl_easy_escape(curl.get(), request.json->c_str(),
                                            static_cast<int>(request.json->size())));
        if (!escaped) {
            return Error(ErrorKind::Transport, "could not url-encode request for /" + request.route);
        }
        form = std::string("json=") + escaped.get();
        headers.reset(curl_slist_append(nullptr, "Content-Type: application/x-www-form-urlencoded"));
        curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, headers.get());
        curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDS, form.c_str());
        curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDSIZE, static_cast<long>(form.size()));
        curl_easy_setopt(curl.get(), CURLOPT_CUSTOMREQUEST, "GET");
    } else {
        curl_easy_setopt(curl.get(), CURLOPT_HTTPGET, 1L);
    }

    CURLcode rc = curl_easy_perform(curl.get());
    if (rc != CURLE_OK) {
        std::string what = errbuf[0] ? errbuf : curl_easy_strerror(rc);
        return Error(ErrorKind::Transport, what + " (" + endpoint + ")", {}, transportCode(rc));
    }

    long status = 0;
    curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &status);
    if (status < 200 || status >= 300) {
        return Error(ErrorKind::Transport,
                     "HTTP status " + std::to_string(status) + " for /" + request.route +
                     " (" + endpoint + ")",
                     body, static_cast<int>(status));
    }
    return Ok(std::move(body));
}

} // namespace droidpilot
