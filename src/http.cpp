#include "http.hpp"

#include <curl/curl.h>
#include <string>

namespace agentstream {

static const std::atomic<bool>* g_http_abort_flag = nullptr;

void http_init() {
    curl_global_init(CURL_GLOBAL_ALL);
}

void http_cleanup() {
    curl_global_cleanup();
}

void http_set_abort_flag(const std::atomic<bool>* flag) {
    g_http_abort_flag = flag;
}

// Called by curl ~once per second; return non-zero to abort the transfer.
static int abort_progress_cb(void* /*clientp*/,
                              curl_off_t /*dltotal*/, curl_off_t /*dlnow*/,
                              curl_off_t /*ultotal*/, curl_off_t /*ulnow*/) {
    if (g_http_abort_flag && g_http_abort_flag->load(std::memory_order_relaxed))
        return 1;
    return 0;
}

static size_t body_write_callback(char* ptr, size_t size, size_t nmemb, void* userdata) {
    size_t total = size * nmemb;
    static_cast<std::string*>(userdata)->append(ptr, total);
    return total;
}

// Returning less than `total` makes curl fail the transfer with
// CURLE_WRITE_ERROR, which is how the consumer stops a stream.
static size_t chunk_write_callback(char* ptr, size_t size, size_t nmemb, void* userdata) {
    size_t total = size * nmemb;
    auto* callback = static_cast<RawChunkCallback*>(userdata);
    return (*callback)(ptr, total) ? total : 0;
}

// ── RAII curl handle ──────────────────────────────────────────

class CurlRequest {
public:
    CurlRequest(const std::string& url, const std::string& body,
                const std::vector<Header>& headers, long timeout_seconds) {
        if (!curl_) return;
        for (const auto& h : headers) {
            std::string entry = h.first + ": " + h.second;
            hlist_ = curl_slist_append(hlist_, entry.c_str());
        }
        curl_easy_setopt(curl_, CURLOPT_URL, url.c_str());
        curl_easy_setopt(curl_, CURLOPT_HTTPHEADER, hlist_);
        curl_easy_setopt(curl_, CURLOPT_TIMEOUT, timeout_seconds);
        curl_easy_setopt(curl_, CURLOPT_CONNECTTIMEOUT, CurlHttpClient::CONNECT_TIMEOUT_SECONDS);
        // Requests run on worker threads
        curl_easy_setopt(curl_, CURLOPT_NOSIGNAL, 1L);
        curl_easy_setopt(curl_, CURLOPT_ERRORBUFFER, errbuf_);
        curl_easy_setopt(curl_, CURLOPT_POST, 1L);
        curl_easy_setopt(curl_, CURLOPT_POSTFIELDS, body.c_str());
        curl_easy_setopt(curl_, CURLOPT_POSTFIELDSIZE, static_cast<long>(body.size()));
        if (g_http_abort_flag) {
            curl_easy_setopt(curl_, CURLOPT_NOPROGRESS, 0L);
            curl_easy_setopt(curl_, CURLOPT_XFERINFOFUNCTION, abort_progress_cb);
        }
    }

    ~CurlRequest() {
        curl_slist_free_all(hlist_);
        if (curl_) curl_easy_cleanup(curl_);
    }

    CurlRequest(const CurlRequest&) = delete;
    CurlRequest& operator=(const CurlRequest&) = delete;

    void stall_limit(long seconds) {
        curl_easy_setopt(curl_, CURLOPT_LOW_SPEED_LIMIT, 1L);
        curl_easy_setopt(curl_, CURLOPT_LOW_SPEED_TIME, seconds);
    }

    void write_to(curl_write_callback fn, void* userdata) {
        curl_easy_setopt(curl_, CURLOPT_WRITEFUNCTION, fn);
        curl_easy_setopt(curl_, CURLOPT_WRITEDATA, userdata);
    }

    HttpResponse perform(HttpResponse response = {}) {
        if (!curl_) {
            response.error = "curl_easy_init failed";
            return response;
        }
        CURLcode res = curl_easy_perform(curl_);
        if (res == CURLE_OK) {
            curl_easy_getinfo(curl_, CURLINFO_RESPONSE_CODE, &response.status_code);
        } else {
            response.error = errbuf_[0] ? errbuf_ : curl_easy_strerror(res);
        }
        return response;
    }

private:
    CURL* curl_ = curl_easy_init();
    curl_slist* hlist_ = nullptr;
    char errbuf_[CURL_ERROR_SIZE] = {0};
};

// ── CurlHttpClient ────────────────────────────────────────────

HttpResponse CurlHttpClient::post(const std::string& url,
                                   const std::string& body,
                                   const std::vector<Header>& headers,
                                   long timeout_seconds) {
    CurlRequest req(url, body, headers, timeout_seconds);
    std::string response_body;
    req.write_to(body_write_callback, &response_body);
    HttpResponse response = req.perform();
    response.body = std::move(response_body);
    return response;
}

HttpResponse CurlHttpClient::stream_post_raw(const std::string& url,
                                             const std::string& body,
                                             const std::vector<Header>& headers,
                                             RawChunkCallback callback,
                                             long timeout_seconds) {
    std::vector<Header> stream_headers = headers;
    stream_headers.emplace_back("accept", "text/event-stream");

    CurlRequest req(url, body, stream_headers, timeout_seconds);
    req.stall_limit(STREAM_STALL_SECONDS);
    req.write_to(chunk_write_callback, &callback);
    return req.perform();
}

} // namespace agentstream
