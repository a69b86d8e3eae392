#pragma once
#include <cstddef>
#include <string>

#include <nlohmann/json.hpp>

struct FormatResponse {
    std::string formatted_code;
    long long execution_time_ms = 0;
    std::string formatter_used;
    std::size_t input_length = 0;
    std::size_t output_length = 0;

    std::string to_json() const {
        return nlohmann::json{
            {"formatted_code", formatted_code},
            {"execution_time_ms", execution_time_ms},
            {"formatter_used", formatter_used},
            {"status", "success"},
            {"input_length", input_length},
            {"output_length", output_length}
        }.dump();
    }
};

struct ErrorResponse {
    std::string error;
    std::string details;

    std::string to_json() const {
        // details may carry raw tool output
        return nlohmann::json{{"error", error}, {"details", details}}
            .dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
    }
};
