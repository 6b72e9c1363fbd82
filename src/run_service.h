#pragma once

#include <string>
#include "constants.h"
#include "http_server.h"
#include "invoker.h"

namespace confrun {

// Handles POST /run: validates the envelope, stages the program in a
// request-scoped directory, hands it to the invoker and wraps the result.
class RunService {
public:
    RunService(Invoker& invoker,
               std::string staging_dir,
               int default_timeout = DEFAULT_TIMEOUT_SECONDS,
               int max_timeout = DEFAULT_MAX_TIMEOUT_SECONDS);

    // POST /run and GET /health
    void register_routes(HttpServer& server);

    HttpResponse handle_run(const HttpRequest& req);
    HttpResponse handle_health(const HttpRequest& req) const;

    static const char* const MISSING_PROGRAM_MESSAGE;

private:
    Invoker& invoker_;
    std::string staging_dir_;
    int default_timeout_;
    int max_timeout_;

    // Absent or null -> default. Otherwise a positive integer, no greater
    // than max when a cap is configured.
    bool read_timeout(const Json::Value& body, int& timeout, std::string& error) const;
};

// {"status":"error","message":...} with the given HTTP status
HttpResponse error_envelope(int status_code, const std::string& message);

// {"status":"success"|"error","result":...}, always HTTP 200
HttpResponse result_envelope(const RunResult& result);

} // namespace confrun
