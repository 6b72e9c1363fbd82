#pragma once

#include <string>
#include <functional>
#include <map>
#include <atomic>
#include <condition_variable>
#include <mutex>
#include <set>

namespace confrun {

// Simple HTTP request
struct HttpRequest {
    std::string method;
    std::string path;
    std::map<std::string, std::string> headers;
    std::string body;
    std::string client_ip;
};

// Simple HTTP response
struct HttpResponse {
    int status_code = 200;
    std::map<std::string, std::string> headers;
    std::string body;

    HttpResponse() {
        headers["Content-Type"] = "application/json";
    }
};

// Request handler function type
using HandlerFunc = std::function<HttpResponse(const HttpRequest&)>;

// Minimal HTTP/1.1 server, one thread per connection
class HttpServer {
public:
    HttpServer(const std::string& host, int port);
    ~HttpServer();

    // Register route handlers (exact method + path match)
    void route(const std::string& method, const std::string& path, HandlerFunc handler);

    // Start server (blocks until stop())
    void start();

    // Stop accepting, close open connections and wait for their handlers
    void stop();

    bool is_running() const { return running_; }

    // Dispatch a parsed request to its route; never throws
    HttpResponse dispatch(const HttpRequest& req) const;

    static HttpRequest parse_request(const std::string& raw);
    static std::string build_response(const HttpResponse& resp);
    static std::string status_text(int status_code);

private:
    std::string host_;
    int port_;
    std::atomic<int> server_fd_;
    std::atomic<bool> running_;
    std::map<std::string, HandlerFunc> routes_;

    // Connections whose handler thread has not finished yet
    std::mutex conn_mutex_;
    std::condition_variable conn_cv_;
    std::set<int> client_fds_;

    void handle_client(int client_fd, const std::string& client_ip);
};

// Case-insensitive header lookup; nullptr when absent
const std::string* find_header(const std::map<std::string, std::string>& headers,
                               const std::string& name);

// Write the whole buffer, retrying on short writes. Returns false on error.
bool write_all(int fd, const std::string& data);

} // namespace confrun
