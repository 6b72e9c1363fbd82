#include "http_server.h"
#include "constants.h"

#include <sys/socket.h>
#include <netinet/in.h>
#include <arpa/inet.h>
#include <unistd.h>
#include <sys/time.h>
#include <cctype>
#include <cerrno>
#include <cstring>
#include <sstream>
#include <iostream>
#include <stdexcept>
#include <thread>
#include <algorithm>
#include <chrono>

namespace confrun {

namespace {

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

HttpResponse error_response(int status, const std::string& message) {
    HttpResponse resp;
    resp.status_code = status;
    resp.body = "{\"status\":\"error\",\"message\":\"" + message + "\"}";
    return resp;
}

bool is_decimal(const std::string& s) {
    return !s.empty() && std::all_of(s.begin(), s.end(),
                                     [](unsigned char c) { return std::isdigit(c) != 0; });
}

} // namespace

const std::string* find_header(const std::map<std::string, std::string>& headers,
                               const std::string& name) {
    std::string wanted = to_lower(name);
    for (const auto& [key, value] : headers) {
        if (to_lower(key) == wanted) {
            return &value;
        }
    }
    return nullptr;
}

bool write_all(int fd, const std::string& data) {
    size_t written = 0;
    while (written < data.size()) {
        ssize_t n = send(fd, data.data() + written, data.size() - written, MSG_NOSIGNAL);
        if (n < 0) {
            if (errno == EINTR) continue;
            return false;
        }
        written += static_cast<size_t>(n);
    }
    return true;
}

HttpServer::HttpServer(const std::string& host, int port)
    : host_(host), port_(port), server_fd_(-1), running_(false) {}

HttpServer::~HttpServer() {
    stop();
}

void HttpServer::route(const std::string& method, const std::string& path, HandlerFunc handler) {
    routes_[method + " " + path] = std::move(handler);
}

void HttpServer::start() {
    // Create socket
    int fd = socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC, 0);
    if (fd < 0) {
        throw std::runtime_error(std::string("Failed to create socket: ") + std::strerror(errno));
    }

    // Allow reuse
    int opt = 1;
    setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt));

    // Bind
    struct sockaddr_in addr;
    std::memset(&addr, 0, sizeof(addr));
    addr.sin_family = AF_INET;
    addr.sin_port = htons(port_);
    if (inet_pton(AF_INET, host_.c_str(), &addr.sin_addr) != 1) {
        close(fd);
        throw std::runtime_error("Invalid listen address: " + host_);
    }

    if (bind(fd, (struct sockaddr*)&addr, sizeof(addr)) < 0) {
        int err = errno;
        close(fd);
        throw std::runtime_error("Failed to bind to " + host_ + ":" + std::to_string(port_) +
                                 ": " + std::strerror(err));
    }

    // Listen
    if (listen(fd, LISTEN_BACKLOG) < 0) {
        int err = errno;
        close(fd);
        throw std::runtime_error(std::string("Failed to listen: ") + std::strerror(err));
    }

    {
        std::lock_guard<std::mutex> lock(conn_mutex_);
        server_fd_ = fd;
        running_ = true;
    }
    std::cout << "Server listening on " << host_ << ":" << port_ << std::endl;

    // Accept connections
    while (running_) {
        struct sockaddr_in client_addr;
        socklen_t client_len = sizeof(client_addr);

        // Close-on-exec so spawned runners never inherit client connections
        int client_fd = accept4(fd, (struct sockaddr*)&client_addr, &client_len, SOCK_CLOEXEC);
        if (client_fd < 0) {
            if (running_ && (errno == EINTR || errno == ECONNABORTED)) continue;
            if (running_) {
                std::cerr << "accept() failed: " << std::strerror(errno) << std::endl;
                continue;
            }
            break;
        }

        // A stalled client must not pin its handler thread forever
        struct timeval tv;
        tv.tv_sec = CLIENT_RECV_TIMEOUT_SECONDS;
        tv.tv_usec = 0;
        setsockopt(client_fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
        setsockopt(client_fd, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv));

        char ip_buf[INET_ADDRSTRLEN] = {0};
        inet_ntop(AF_INET, &client_addr.sin_addr, ip_buf, sizeof(ip_buf));
        std::string client_ip = ip_buf;

        {
            std::lock_guard<std::mutex> lock(conn_mutex_);
            if (!running_) {
                close(client_fd);
                break;
            }
            client_fds_.insert(client_fd);
        }

        // Handle in new thread; stop() waits for it through client_fds_
        std::thread([this, client_fd, client_ip]() {
            handle_client(client_fd, client_ip);
            std::lock_guard<std::mutex> lock(conn_mutex_);
            client_fds_.erase(client_fd);
            close(client_fd);
            conn_cv_.notify_all();
        }).detach();
    }
}

void HttpServer::stop() {
    std::unique_lock<std::mutex> lock(conn_mutex_);
    running_ = false;
    int fd = server_fd_.exchange(-1);
    if (fd >= 0) {
        // shutdown() wakes a thread blocked in accept()
        shutdown(fd, SHUT_RDWR);
        close(fd);
    }

    // Wake handlers blocked in recv(); the fds stay open until each handler closes its own
    for (int client_fd : client_fds_) {
        shutdown(client_fd, SHUT_RDWR);
    }
    conn_cv_.wait(lock, [this]() { return client_fds_.empty(); });
}

void HttpServer::handle_client(int client_fd, const std::string& client_ip) {
    std::string request_data;
    request_data.reserve(INITIAL_HTTP_BUFFER);

    char buffer[PIPE_BUFFER_SIZE];
    ssize_t bytes_read;
    size_t expected_size = 0;

    // Read until headers are complete, then until Content-Length is satisfied
    while (true) {
        bytes_read = recv(client_fd, buffer, sizeof(buffer), 0);
        if (bytes_read < 0 && errno == EINTR) continue;
        if (bytes_read <= 0) break;

        request_data.append(buffer, bytes_read);
        if (request_data.size() > MAX_REQUEST_SIZE) {
            write_all(client_fd, build_response(error_response(413, "Request exceeds size limit")));
            return;
        }

        size_t header_end = request_data.find("\r\n\r\n");
        if (header_end == std::string::npos) continue;

        HttpRequest head = parse_request(request_data.substr(0, header_end + 4));
        const std::string* length_str = find_header(head.headers, "Content-Length");
        size_t content_length = 0;
        if (length_str) {
            // Digits only: stoul would accept "-1" and wrap it
            if (!is_decimal(*length_str)) {
                write_all(client_fd, build_response(error_response(400, "Invalid Content-Length")));
                return;
            }
            try {
                content_length = std::stoul(*length_str);
            } catch (const std::exception&) {
                content_length = MAX_REQUEST_SIZE + 1;  // out of range for unsigned long
            }
        }

        if (content_length > MAX_REQUEST_SIZE - (header_end + 4)) {
            write_all(client_fd, build_response(error_response(413, "Request exceeds size limit")));
            return;
        }
        expected_size = header_end + 4 + content_length;

        while (request_data.size() < expected_size) {
            bytes_read = recv(client_fd, buffer,
                std::min(sizeof(buffer), expected_size - request_data.size()), 0);
            if (bytes_read < 0 && errno == EINTR) continue;
            if (bytes_read <= 0) break;
            request_data.append(buffer, bytes_read);
        }
        break;
    }

    if (request_data.empty()) return;
    if (expected_size == 0 || request_data.size() < expected_size) {
        // Connection closed before a complete request arrived
        write_all(client_fd, build_response(error_response(400, "Incomplete request")));
        return;
    }

    HttpRequest req = parse_request(request_data);
    req.client_ip = client_ip;

    auto started = std::chrono::steady_clock::now();
    HttpResponse resp = dispatch(req);
    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started);
    std::cout << client_ip << " " << req.method << " " << req.path << " "
              << resp.status_code << " (" << elapsed.count() << " ms)" << std::endl;

    if (!write_all(client_fd, build_response(resp))) {
        std::cerr << "Failed to send response to " << client_ip << ": "
                  << std::strerror(errno) << std::endl;
    }
}

HttpResponse HttpServer::dispatch(const HttpRequest& req) const {
    // Ignore query string when matching
    std::string path = req.path.substr(0, req.path.find('?'));

    auto it = routes_.find(req.method + " " + path);
    if (it == routes_.end()) {
        for (const auto& [key, handler] : routes_) {
            if (key.substr(key.find(' ') + 1) == path) {
                return error_response(405, "Method not allowed");
            }
        }
        return error_response(404, "Not found");
    }

    try {
        return it->second(req);
    } catch (const std::exception& e) {
        std::cerr << "Unhandled error in " << req.method << " " << path << ": "
                  << e.what() << std::endl;
        return error_response(500, "Internal server error");
    }
}

HttpRequest HttpServer::parse_request(const std::string& raw) {
    HttpRequest req;

    size_t header_end = raw.find("\r\n\r\n");
    std::string head = header_end == std::string::npos ? raw : raw.substr(0, header_end);
    if (header_end != std::string::npos) {
        req.body = raw.substr(header_end + 4);
    }

    std::istringstream stream(head);

    // Parse request line
    std::string line;
    std::getline(stream, line);
    if (!line.empty() && line.back() == '\r') line.pop_back();

    size_t space1 = line.find(' ');
    size_t space2 = line.find(' ', space1 + 1);

    if (space1 != std::string::npos && space2 != std::string::npos) {
        req.method = line.substr(0, space1);
        req.path = line.substr(space1 + 1, space2 - space1 - 1);
    }

    // Parse headers
    while (std::getline(stream, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (line.empty()) break;

        size_t colon = line.find(':');
        if (colon != std::string::npos) {
            std::string key = line.substr(0, colon);
            size_t value_start = line.find_first_not_of(" \t", colon + 1);
            std::string value = value_start == std::string::npos ? "" : line.substr(value_start);
            req.headers[key] = value;
        }
    }

    return req;
}

std::string HttpServer::status_text(int status_code) {
    switch (status_code) {
        case 200: return "OK";
        case 400: return "Bad Request";
        case 404: return "Not Found";
        case 405: return "Method Not Allowed";
        case 413: return "Payload Too Large";
        case 500: return "Internal Server Error";
        default: return "Unknown";
    }
}

std::string HttpServer::build_response(const HttpResponse& resp) {
    std::ostringstream out;

    // Status line
    out << "HTTP/1.1 " << resp.status_code << " " << status_text(resp.status_code) << "\r\n";

    // Headers
    for (const auto& [key, value] : resp.headers) {
        out << key << ": " << value << "\r\n";
    }

    out << "Content-Length: " << resp.body.length() << "\r\n";
    out << "Connection: close\r\n";
    out << "\r\n";

    // Body
    out << resp.body;

    return out.str();
}

} // namespace confrun
