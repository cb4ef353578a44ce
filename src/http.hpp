#pragma once
#include <atomic>
#include <cstddef>
#include <functional>
#include <string>
#include <utility>
#include <vector>

namespace agentstream {

// Initialize libcurl (call once at startup, before any thread issues requests).
void http_init();

// Cleanup libcurl (call once at shutdown).
void http_cleanup();

// Set a global abort flag checked by all in-flight transfers (~1s granularity).
// When the flag becomes true, in-flight HTTP requests abort promptly.
void http_set_abort_flag(const std::atomic<bool>* flag);

using Header = std::pair<std::string, std::string>;

struct HttpResponse {
    long status_code = 0; // 0 = transport failure (DNS, connect, TLS, abort)
    std::string body;     // full body for post(); unset for streams
    std::string error;    // transport error text when status_code is 0
};

// Raw-chunk streaming callback: receives bytes as they arrive, unparsed.
// Return false to abort the stream.
using RawChunkCallback = std::function<bool(const char* data, size_t len)>;

// Abstract HTTP client interface (injectable for testing)
class HttpClient {
public:
    virtual ~HttpClient() = default;

    virtual HttpResponse post(const std::string& url,
                              const std::string& body,
                              const std::vector<Header>& headers,
                              long timeout_seconds = 120) = 0;

    // POST whose response body is delivered incrementally. timeout_seconds
    // bounds the whole transfer; a stream that stalls is cut off sooner.
    virtual HttpResponse stream_post_raw(const std::string& url,
                                         const std::string& body,
                                         const std::vector<Header>& headers,
                                         RawChunkCallback callback,
                                         long timeout_seconds = 300) = 0;
};

class CurlHttpClient : public HttpClient {
public:
    // A stream receiving less than one byte per second for this long is
    // treated as dead.
    static constexpr long STREAM_STALL_SECONDS = 60;
    static constexpr long CONNECT_TIMEOUT_SECONDS = 15;

    HttpResponse post(const std::string& url,
                      const std::string& body,
                      const std::vector<Header>& headers,
                      long timeout_seconds = 120) override;

    HttpResponse stream_post_raw(const std::string& url,
                                 const std::string& body,
                                 const std::vector<Header>& headers,
                                 RawChunkCallback callback,
                                 long timeout_seconds = 300) override;
};

} // namespace agentstream
