#include "run_service.h"
#include "digest.h"
#include "json_utils.h"
#include "staging.h"

#include <chrono>
#include <iostream>
#include <limits>
#include <utility>

namespace confrun {

const char* const RunService::MISSING_PROGRAM_MESSAGE = "Request must include 'program' field";

HttpResponse error_envelope(int status_code, const std::string& message) {
    Json::Value body(Json::objectValue);
    body["status"] = "error";
    body["message"] = message;

    HttpResponse resp;
    resp.status_code = status_code;
    resp.body = to_json(body);
    return resp;
}

HttpResponse result_envelope(const RunResult& result) {
    Json::Value body(Json::objectValue);
    body["status"] = result.success() ? "success" : "error";
    body["result"] = result.to_json();

    HttpResponse resp;
    resp.status_code = 200;
    resp.body = to_json(body);
    return resp;
}

RunService::RunService(Invoker& invoker, std::string staging_dir,
                       int default_timeout, int max_timeout)
    : invoker_(invoker),
      staging_dir_(std::move(staging_dir)),
      default_timeout_(default_timeout),
      max_timeout_(max_timeout) {}

void RunService::register_routes(HttpServer& server) {
    server.route("POST", "/run", [this](const HttpRequest& req) {
        return handle_run(req);
    });
    server.route("GET", "/health", [this](const HttpRequest& req) {
        return handle_health(req);
    });
}

HttpResponse RunService::handle_health(const HttpRequest&) const {
    HttpResponse resp;
    resp.body = "{\"status\":\"healthy\"}";
    return resp;
}

bool RunService::read_timeout(const Json::Value& body, int& timeout, std::string& error) const {
    if (!body.isMember("timeout") || body["timeout"].isNull()) {
        timeout = default_timeout_;
        return true;
    }

    // isUInt64() also admits integral doubles such as 2.0
    const Json::Value& value = body["timeout"];
    if (!value.isUInt64() || value.asUInt64() == 0) {
        error = max_timeout_ > 0
            ? "'timeout' must be a positive integer no greater than " + std::to_string(max_timeout_)
            : std::string("'timeout' must be a positive integer");
        return false;
    }

    Json::UInt64 requested = value.asUInt64();
    if (max_timeout_ > 0 && requested > static_cast<Json::UInt64>(max_timeout_)) {
        error = "'timeout' must be a positive integer no greater than " + std::to_string(max_timeout_);
        return false;
    }

    // Deadlines beyond INT_MAX seconds (68 years) are indistinguishable from none
    const Json::UInt64 limit = static_cast<Json::UInt64>(std::numeric_limits<int>::max());
    if (requested > limit) {
        std::cout << "[run] timeout " << requested << "s clamped to " << limit << "s" << std::endl;
        requested = limit;
    }
    timeout = static_cast<int>(requested);
    return true;
}

HttpResponse RunService::handle_run(const HttpRequest& req) {
    auto started = std::chrono::steady_clock::now();

    Json::Value body;
    if (!parse_json(req.body, body) || !body.isObject() ||
        !body.isMember("program") || body["program"].isNull()) {
        std::cout << "[run] " << req.client_ip << " rejected: missing program" << std::endl;
        return error_envelope(400, MISSING_PROGRAM_MESSAGE);
    }
    if (!body["program"].isString()) {
        std::cout << "[run] " << req.client_ip << " rejected: program is not a string" << std::endl;
        return error_envelope(400, "'program' field must be a string");
    }

    int timeout = 0;
    std::string timeout_error;
    if (!read_timeout(body, timeout, timeout_error)) {
        std::cout << "[run] " << req.client_ip << " rejected: " << timeout_error << std::endl;
        return error_envelope(400, timeout_error);
    }

    const std::string program = body["program"].asString();

    try {
        StagingDirectory staging(staging_dir_);
        std::string program_path = staging.write_file(STAGED_PROGRAM_NAME, program);

        std::cout << "[run] " << req.client_ip
                  << " staged " << program.size() << " bytes"
                  << " sha256=" << sha256_hex(program).substr(0, 16)
                  << " timeout=" << timeout << "s" << std::endl;

        RunResult result = invoker_.invoke(program_path, timeout);

        auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - started);
        std::cout << "[run] " << req.client_ip << " " << kind_to_string(result.kind);
        if (result.kind == RunResult::Kind::COMPLETED) {
            std::cout << " return_code=" << result.return_code;
        }
        std::cout << " (" << elapsed.count() << " ms)" << std::endl;

        return result_envelope(result);
    } catch (const std::exception& e) {
        std::cerr << "[run] " << req.client_ip << " server error: " << e.what() << std::endl;
        return error_envelope(500, std::string("Server error: ") + e.what());
    }
}

} // namespace confrun
