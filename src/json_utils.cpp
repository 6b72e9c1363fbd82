#include "json_utils.h"
#include <memory>

namespace confrun {

bool parse_json(const std::string& text, Json::Value& out, std::string* errors) {
    Json::CharReaderBuilder builder;
    builder["failIfExtra"] = true;
    builder["collectComments"] = false;
    std::unique_ptr<Json::CharReader> reader(builder.newCharReader());

    std::string parse_errors;
    bool ok = reader->parse(text.data(), text.data() + text.size(), &out, &parse_errors);
    if (!ok && errors) {
        *errors = parse_errors;
    }
    return ok;
}

std::string to_json(const Json::Value& value) {
    Json::StreamWriterBuilder builder;
    builder["indentation"] = "";
    return Json::writeString(builder, value);
}

} // namespace confrun
