#pragma once

#ifdef __cplusplus

#include <deque>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <vector>

namespace hearth {

/// Failure talking to the remote service. status is the HTTP status code,
/// or 0 when the request never produced a response.
class remote_error : public std::runtime_error {
public:
    remote_error(const std::string& msg, int status = 0)
        : std::runtime_error(msg), status_(status) {}

    int status() const { return status_; }

private:
    int status_;
};

// ============================================================================
// HTTP Client Interface
// ============================================================================

struct http_response {
    int status_code = 0;
    std::map<std::string, std::string> headers;
    std::vector<uint8_t> body;

    bool is_success() const { return status_code >= 200 && status_code < 300; }
    std::string body_string() const {
        return std::string(body.begin(), body.end());
    }

    static http_response with_body(int status, const std::string& s) {
        http_response r;
        r.status_code = status;
        r.body = std::vector<uint8_t>(s.begin(), s.end());
        return r;
    }
};

struct http_request {
    std::string method = "GET";
    std::string url;
    std::map<std::string, std::string> headers;
    std::vector<uint8_t> body;

    void set_body(const std::string& s) {
        body = std::vector<uint8_t>(s.begin(), s.end());
    }

    void set_json_body(const std::string& json) {
        set_body(json);
        headers["Content-Type"] = "application/json";
    }

    std::string body_string() const {
        return std::string(body.begin(), body.end());
    }
};

class http_client {
public:
    virtual ~http_client() = default;

    /// Blocks until complete. Throws remote_error on transport failure;
    /// HTTP error statuses are returned, not thrown.
    virtual http_response send(const http_request& request) = 0;
};

// ============================================================================
// libcurl implementation
// ============================================================================

class curl_http_client : public http_client {
public:
    explicit curl_http_client(long timeout_seconds = 30);

    http_response send(const http_request& request) override;

private:
    long timeout_seconds_;
};

// ============================================================================
// Mock implementation for testing
// ============================================================================
//
// Replies with queued responses in order, then with the fallback. Every
// request is recorded.

class mock_http_client : public http_client {
public:
    using handler_t = std::function<http_response(const http_request&)>;

    http_response send(const http_request& request) override {
        std::lock_guard<std::mutex> lock(mutex_);
        requests_.push_back(request);
        if (handler_) return handler_(request);
        if (!queued_.empty()) {
            http_response r = std::move(queued_.front());
            queued_.pop_front();
            return r;
        }
        return fallback_;
    }

    // Test helpers
    void enqueue(http_response response) {
        std::lock_guard<std::mutex> lock(mutex_);
        queued_.push_back(std::move(response));
    }

    void enqueue_json(int status, const std::string& json) {
        enqueue(http_response::with_body(status, json));
    }

    void set_handler(handler_t handler) {
        std::lock_guard<std::mutex> lock(mutex_);
        handler_ = std::move(handler);
    }

    void set_fallback(http_response response) {
        std::lock_guard<std::mutex> lock(mutex_);
        fallback_ = std::move(response);
    }

    std::vector<http_request> requests() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return requests_;
    }

    void clear_requests() {
        std::lock_guard<std::mutex> lock(mutex_);
        requests_.clear();
    }

private:
    mutable std::mutex mutex_;
    std::deque<http_response> queued_;
    http_response fallback_ = http_response::with_body(503, "");  // Service Unavailable
    handler_t handler_;
    std::vector<http_request> requests_;
};

} // namespace hearth

#endif // __cplusplus
