#pragma once
#include <optional>
#include <string>

struct FormatRequest {
    std::string code;
    std::string language;
    std::optional<std::string> formatter;   // optional tool override
};

enum class FormatRequestError { None, InvalidJson, MissingCode, InvalidField };

// Parses a POST /format body. On failure returns the error kind and fills
// `details` with a client-facing explanation.
FormatRequestError parse_format_request(const std::string& body,
                                        FormatRequest& out,
                                        std::string& details);
