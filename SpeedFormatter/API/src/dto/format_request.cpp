#include "dto/format_request.h"

#include <nlohmann/json.hpp>

using nlohmann::json;

FormatRequestError parse_format_request(const std::string& body,
                                        FormatRequest& out,
                                        std::string& details) {
    json payload = json::parse(body, nullptr, false);
    if (payload.is_discarded() || !payload.is_object()) {
        details = "Expected JSON object body";
        return FormatRequestError::InvalidJson;
    }

    if (!payload.contains("code") || payload["code"].is_null()) {
        details = "Please provide code to format";
        return FormatRequestError::MissingCode;
    }
    if (!payload["code"].is_string()) {
        details = "Field 'code' must be a string";
        return FormatRequestError::InvalidField;
    }
    if (!payload.contains("language") || !payload["language"].is_string()) {
        details = "Field 'language' must be a string";
        return FormatRequestError::InvalidField;
    }

    out.code = payload["code"].get<std::string>();
    out.language = payload["language"].get<std::string>();
    out.formatter.reset();
    if (payload.contains("formatter") && !payload["formatter"].is_null()) {
        if (!payload["formatter"].is_string()) {
            details = "Field 'formatter' must be a string";
            return FormatRequestError::InvalidField;
        }
        out.formatter = payload["formatter"].get<std::string>();
    }
    return FormatRequestError::None;
}
