/**
 * HTTP Server Integration Tests
 *
 * Drives the service through real socket connections and checks the wire
 * format: status lines, headers, error envelopes and framing limits.
 */

#include "service_fixture.h"
#include "constants.h"
#include "uploader.h"

#include <cerrno>

namespace confrun {
namespace {

class HttpIntegrationTest : public testing_support::ServiceFixture {};

// ============================================================================
// Basic Request/Response Tests
// ============================================================================

TEST_F(HttpIntegrationTest, HealthCheck) {
    // When: Sending GET /health
    std::string response = send_raw("GET /health HTTP/1.1\r\nHost: localhost\r\n\r\n");

    // Then: 200 with the health body
    EXPECT_EQ(response.rfind("HTTP/1.1 200 OK\r\n", 0), 0u) << response;
    EXPECT_NE(response.find("Content-Type: application/json\r\n"), std::string::npos);
    EXPECT_NE(response.find("Connection: close\r\n"), std::string::npos);
    EXPECT_EQ(body_of(response), "{\"status\":\"healthy\"}");
}

TEST_F(HttpIntegrationTest, RunReturnsJsonEnvelope) {
    // Given: A runner that passes
    write_runner("echo PASS\nexit 0\n");

    // When
    std::string response = send_raw(post_request("/run", "{\"program\":\"exit 0 test\"}"));

    // Then
    EXPECT_EQ(response.rfind("HTTP/1.1 200 OK\r\n", 0), 0u) << response;
    std::string body = body_of(response);
    EXPECT_NE(response.find("Content-Length: " + std::to_string(body.size()) + "\r\n"),
              std::string::npos);

    Json::Value json = json_of(body);
    EXPECT_EQ(json["status"].asString(), "success");
    EXPECT_TRUE(json["result"]["success"].asBool());
    EXPECT_EQ(json["result"]["stdout"].asString(), "PASS\n");
}

TEST_F(HttpIntegrationTest, QueryStringIsIgnoredForRouting) {
    std::string response = send_raw("GET /health?verbose=1 HTTP/1.1\r\nHost: localhost\r\n\r\n");

    EXPECT_EQ(response.rfind("HTTP/1.1 200 OK\r\n", 0), 0u) << response;
}

TEST_F(HttpIntegrationTest, HeaderNamesAreCaseInsensitive) {
    std::string body = "{\"program\":\"x\"}";
    std::string request =
        "POST /run HTTP/1.1\r\n"
        "host: localhost\r\n"
        "content-length: " + std::to_string(body.size()) + "\r\n"
        "\r\n" + body;

    std::string response = send_raw(request);

    EXPECT_EQ(response.rfind("HTTP/1.1 200 OK\r\n", 0), 0u) << response;
}

TEST_F(HttpIntegrationTest, BodyArrivingInPiecesIsAssembled) {
    // Given: The body is larger than one read buffer
    std::string program(3 * PIPE_BUFFER_SIZE + 17, 'a');
    write_runner("wc -c < \"$2\"\n");

    // When
    std::string response = send_raw(post_request("/run", build_upload_body(program)));

    // Then: The runner saw every byte
    Json::Value json = json_of(body_of(response));
    EXPECT_EQ(std::stoul(json["result"]["stdout"].asString()), program.size());
}

// ============================================================================
// Error Handling Tests
// ============================================================================

TEST_F(HttpIntegrationTest, UnknownPathIs404) {
    std::string response = send_raw("GET /nonexistent HTTP/1.1\r\nHost: localhost\r\n\r\n");

    EXPECT_EQ(response.rfind("HTTP/1.1 404 Not Found\r\n", 0), 0u) << response;
    Json::Value json = json_of(body_of(response));
    EXPECT_EQ(json["status"].asString(), "error");
    EXPECT_EQ(json["message"].asString(), "Not found");
}

TEST_F(HttpIntegrationTest, WrongMethodIs405) {
    std::string response = send_raw("GET /run HTTP/1.1\r\nHost: localhost\r\n\r\n");

    EXPECT_EQ(response.rfind("HTTP/1.1 405 Method Not Allowed\r\n", 0), 0u) << response;
}

TEST_F(HttpIntegrationTest, MissingProgramIs400) {
    std::string response = send_raw(post_request("/run", "{}"));

    EXPECT_EQ(response.rfind("HTTP/1.1 400 Bad Request\r\n", 0), 0u) << response;
    Json::Value json = json_of(body_of(response));
    EXPECT_EQ(json["status"].asString(), "error");
    EXPECT_EQ(json["message"].asString(), "Request must include 'program' field");
}

TEST_F(HttpIntegrationTest, InvalidJsonIs400) {
    std::string response = send_raw(post_request("/run", "{not json"));

    EXPECT_EQ(response.rfind("HTTP/1.1 400 Bad Request\r\n", 0), 0u) << response;
    EXPECT_EQ(json_of(body_of(response))["message"].asString(),
              "Request must include 'program' field");
}

TEST_F(HttpIntegrationTest, OversizedContentLengthIs413) {
    // Given: A declared body larger than the request limit
    std::string request =
        "POST /run HTTP/1.1\r\n"
        "Host: localhost\r\n"
        "Content-Length: " + std::to_string(MAX_REQUEST_SIZE + 1) + "\r\n"
        "\r\n"
        "{\"program\":";

    // When
    std::string response = send_raw(request);

    // Then: Rejected before the body is read
    EXPECT_EQ(response.rfind("HTTP/1.1 413 Payload Too Large\r\n", 0), 0u) << response;
    EXPECT_EQ(staging.entry_count(), 0u);
}

TEST_F(HttpIntegrationTest, NegativeContentLengthIs400) {
    // Given: A signed length that would wrap if parsed as unsigned
    std::string request =
        "POST /run HTTP/1.1\r\n"
        "Host: localhost\r\n"
        "Content-Length: -1\r\n"
        "\r\n"
        "{}";

    // When
    std::string response = send_raw(request);

    // Then
    EXPECT_EQ(response.rfind("HTTP/1.1 400 Bad Request\r\n", 0), 0u) << response;
    EXPECT_EQ(json_of(body_of(response))["message"].asString(), "Invalid Content-Length");
    EXPECT_EQ(staging.entry_count(), 0u);
}

TEST_F(HttpIntegrationTest, NonNumericContentLengthIs400) {
    std::string response = send_raw(
        "POST /run HTTP/1.1\r\nHost: localhost\r\nContent-Length: 12abc\r\n\r\n{}");

    EXPECT_EQ(response.rfind("HTTP/1.1 400 Bad Request\r\n", 0), 0u) << response;
}

TEST_F(HttpIntegrationTest, ContentLengthBeyondUnsignedRangeIs413) {
    std::string response = send_raw(
        "POST /run HTTP/1.1\r\nHost: localhost\r\n"
        "Content-Length: 99999999999999999999999999\r\n\r\n{}");

    EXPECT_EQ(response.rfind("HTTP/1.1 413 Payload Too Large\r\n", 0), 0u) << response;
}

TEST_F(HttpIntegrationTest, TruncatedBodyIs400) {
    // Given: Fewer body bytes than declared, then the client stops sending
    std::string request =
        "POST /run HTTP/1.1\r\n"
        "Host: localhost\r\n"
        "Content-Length: 100\r\n"
        "\r\n"
        "{\"program\":\"";

    // When
    std::string response = send_raw(request, true);

    // Then
    EXPECT_EQ(response.rfind("HTTP/1.1 400 Bad Request\r\n", 0), 0u) << response;
    EXPECT_EQ(staging.entry_count(), 0u);
}

TEST_F(HttpIntegrationTest, ServerKeepsServingAfterBadRequests) {
    send_raw("garbage\r\n\r\n");
    send_raw(post_request("/run", "[]"));

    std::string response = send_raw("GET /health HTTP/1.1\r\nHost: localhost\r\n\r\n");

    EXPECT_EQ(response.rfind("HTTP/1.1 200 OK\r\n", 0), 0u) << response;
}

// ============================================================================
// Shutdown
// ============================================================================

TEST_F(HttpIntegrationTest, StopClosesConnectionWithPartialHeaders) {
    // Given: A client that has sent only part of its request headers
    int sock = socket(AF_INET, SOCK_STREAM, 0);
    ASSERT_GE(sock, 0);
    struct sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(port);
    inet_pton(AF_INET, "127.0.0.1", &addr.sin_addr);
    struct timeval tv;
    tv.tv_sec = 5;
    tv.tv_usec = 0;
    setsockopt(sock, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
    ASSERT_EQ(connect(sock, (struct sockaddr*)&addr, sizeof(addr)), 0);
    ASSERT_TRUE(write_all(sock, "GET /health HTTP/1.1\r\nHost: loc"));
    std::this_thread::sleep_for(std::chrono::milliseconds(200));

    // When: The server is stopped and destroyed
    auto started = std::chrono::steady_clock::now();
    server->stop();
    auto elapsed = std::chrono::steady_clock::now() - started;
    server_thread.join();
    server.reset();

    // Then: stop() returned without waiting out the read timeout
    EXPECT_LT(elapsed, std::chrono::seconds(CLIENT_RECV_TIMEOUT_SECONDS));

    // And: The client sees the connection closed rather than its own timeout
    char buffer[256];
    ssize_t n;
    std::string received;
    while ((n = recv(sock, buffer, sizeof(buffer), 0)) > 0) {
        received.append(buffer, n);
    }
    int recv_errno = errno;
    close(sock);
    if (n < 0) {
        EXPECT_NE(recv_errno, EAGAIN);
        EXPECT_NE(recv_errno, EWOULDBLOCK);
    }
}

TEST_F(HttpIntegrationTest, StopWithNoClientsReturns) {
    server->stop();
    server_thread.join();

    EXPECT_FALSE(server->is_running());
    // A second stop is harmless
    server->stop();
}

} // namespace
} // namespace confrun
