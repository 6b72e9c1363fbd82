#include "uploader.h"
#include "constants.h"
#include "json_utils.h"

#include <curl/curl.h>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <system_error>

namespace confrun {

namespace {

size_t append_to_string(char* data, size_t size, size_t count, void* target) {
    static_cast<std::string*>(target)->append(data, size * count);
    return size * count;
}

} // namespace

std::string read_program_file(const std::string& filepath) {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(filepath, ec)) {
        throw FileNotFound("File '" + filepath + "' does not exist");
    }

    std::ifstream file(filepath, std::ios::binary);
    if (!file.is_open()) {
        throw FileNotFound("File '" + filepath + "' cannot be read");
    }
    std::string content((std::istreambuf_iterator<char>(file)),
                        std::istreambuf_iterator<char>());
    if (file.bad()) {
        throw FileNotFound("File '" + filepath + "' cannot be read");
    }
    return content;
}

std::string build_upload_body(const std::string& program) {
    Json::Value body(Json::objectValue);
    body["program"] = program;
    return to_json(body);
}

HttpReply http_post_json(const std::string& url, const std::string& body, long timeout_seconds) {
    CURL* curl = curl_easy_init();
    if (!curl) {
        throw TransportError("unable to initialize libcurl");
    }

    struct curl_slist* headers = nullptr;
    headers = curl_slist_append(headers, "Content-Type: application/json");
    headers = curl_slist_append(headers, "Accept: */*");

    HttpReply reply;
    char error_buffer[CURL_ERROR_SIZE] = {0};
    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_PROTOCOLS_STR, "http,https");
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);
    curl_easy_setopt(curl, CURLOPT_POSTFIELDS, body.data());
    curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE_LARGE, static_cast<curl_off_t>(body.size()));
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, append_to_string);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &reply.body);
    curl_easy_setopt(curl, CURLOPT_ERRORBUFFER, error_buffer);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT, UPLOAD_CONNECT_TIMEOUT_SECONDS);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT, timeout_seconds);

    CURLcode res = curl_easy_perform(curl);
    if (res == CURLE_OK) {
        curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &reply.status_code);
    }
    curl_slist_free_all(headers);
    curl_easy_cleanup(curl);

    if (res != CURLE_OK) {
        throw TransportError(error_buffer[0] ? std::string(error_buffer)
                                             : std::string(curl_easy_strerror(res)));
    }
    return reply;
}

int send_program(const std::string& url, const std::string& filepath,
                 std::ostream& out, std::ostream& err) {
    std::string program;
    try {
        program = read_program_file(filepath);
    } catch (const FileNotFound& e) {
        err << "Error: " << e.what() << std::endl;
        return 1;
    }

    try {
        HttpReply reply = http_post_json(url, build_upload_body(program), UPLOAD_TIMEOUT_SECONDS);
        out << "Response status code: " << reply.status_code << std::endl;
        out << "Response content:" << std::endl;
        out << reply.body << std::endl;
    } catch (const TransportError& e) {
        err << "Error sending request: " << e.what() << std::endl;
        return 1;
    }
    return 0;
}

} // namespace confrun
