#pragma once

#include <ostream>
#include <stdexcept>
#include <string>

namespace confrun {

// The file to upload does not exist or cannot be read
class FileNotFound : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// The request could not be delivered or no HTTP response came back
class TransportError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

struct HttpReply {
    long status_code = 0;
    std::string body;
};

// Reads the whole file. Throws FileNotFound for anything that prevents it.
std::string read_program_file(const std::string& filepath);

// {"program": <content>}
std::string build_upload_body(const std::string& program);

// One POST with Content-Type: application/json over http:// or https://.
// A timeout of 0 waits indefinitely. Throws TransportError.
HttpReply http_post_json(const std::string& url, const std::string& body, long timeout_seconds);

// Upload `filepath` to `url` and print the reply to `out`. Diagnostics go to
// `err`. Returns the process exit status: 0 whenever a response arrived,
// 1 when the file is missing or the request could not be sent.
int send_program(const std::string& url, const std::string& filepath,
                 std::ostream& out, std::ostream& err);

} // namespace confrun
