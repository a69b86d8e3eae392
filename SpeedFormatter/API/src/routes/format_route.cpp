// API/src/routes/format_route.cpp
#include "routes/format_route.h"
#include "dto/format_request.h"
#include "dto/format_response.h"

#include <chrono>
#include <cstdint>
#include <iostream>
#include <random>
#include <sstream>
#include <string>

// ----------------- logging + response helpers -----------------

static std::string gen_request_id() {
    static thread_local std::mt19937_64 rng{ std::random_device{}() };
    const uint64_t a = rng();
    const uint64_t b = rng();
    std::ostringstream os;
    os << std::hex << a << b;
    return os.str();
}

static long long ms_since(const std::chrono::steady_clock::time_point& start) {
    using namespace std::chrono;
    return duration_cast<milliseconds>(steady_clock::now() - start).count();
}

static void set_common_headers(httplib::Response& res, const std::string& request_id) {
    res.set_header("Access-Control-Allow-Origin", "*");
    res.set_header("X-Request-Id", request_id);
}

static void send_json(httplib::Response& res, int status, const std::string& request_id, const std::string& body) {
    res.status = status;
    set_common_headers(res, request_id);
    res.set_content(body, "application/json");
}

static std::string make_error_json(const std::string& error, const std::string& details) {
    return ErrorResponse{error, details}.to_json();
}

// ----------------- status mapping -----------------

int http_status_for(FormatErrorKind kind) {
    switch (kind) {
        case FormatErrorKind::None:                return 200;
        case FormatErrorKind::UnsupportedLanguage:
        case FormatErrorKind::UnsupportedFormatter: return 400;
        case FormatErrorKind::Timeout:             return 504;
        case FormatErrorKind::ProcessSpawnFailure:
        case FormatErrorKind::ProcessIOFailure:
        case FormatErrorKind::FormatterRejection:  return 500;
    }
    return 500;
}

std::string error_category_for(FormatErrorKind kind) {
    switch (kind) {
        case FormatErrorKind::UnsupportedLanguage: return "Unsupported language";
        case FormatErrorKind::UnsupportedFormatter: return "Unsupported formatter";
        case FormatErrorKind::Timeout:             return "Formatting timed out";
        default:                                   return "Formatting failed";
    }
}

// ----------------- routes -----------------

void register_format_route(httplib::Server& server, const FormatterDispatcher& dispatcher) {
    server.Options("/format", [](const httplib::Request&, httplib::Response& res) {
        res.set_header("Access-Control-Allow-Origin", "*");
        res.set_header("Access-Control-Allow-Methods", "POST, OPTIONS");
        res.set_header("Access-Control-Allow-Headers", "Content-Type");
        res.status = 204;
    });

    server.Post("/format", [&dispatcher](const httplib::Request& req, httplib::Response& res) {
        const auto t0 = std::chrono::steady_clock::now();
        const std::string request_id = gen_request_id();

        std::cout << "[REQ " << request_id << "] START "
                  << req.method << " " << req.path << "\n";

        auto finish_log = [&](int status) {
            std::cout << "[REQ " << request_id << "] END status=" << status
                      << " ms=" << ms_since(t0) << "\n";
        };

        FormatRequest fr;
        std::string details;
        switch (parse_format_request(req.body, fr, details)) {
            case FormatRequestError::None:
                break;
            case FormatRequestError::MissingCode:
                send_json(res, 400, request_id, make_error_json("No code provided", details));
                finish_log(res.status);
                return;
            case FormatRequestError::InvalidJson:
            case FormatRequestError::InvalidField:
                send_json(res, 400, request_id, make_error_json("Invalid request", details));
                finish_log(res.status);
                return;
        }

        std::cout << "[REQ " << request_id << "] Formatting " << fr.language
                  << " code with " << fr.code.size() << " characters\n";
        if (fr.formatter && !tool_for_hint(*fr.formatter)) {
            std::cout << "[REQ " << request_id << "] ignoring unknown formatter hint '"
                      << *fr.formatter << "'\n";
        }

        const auto dispatch_start = std::chrono::steady_clock::now();
        const FormatResult result = dispatcher.dispatch(fr);
        const long long execution_ms = ms_since(dispatch_start);

        if (!result.ok) {
            std::cerr << "[REQ " << request_id << "] Formatting failed: " << result.message << "\n";
            send_json(res, http_status_for(result.error_kind), request_id,
                      make_error_json(error_category_for(result.error_kind), result.message));
            finish_log(res.status);
            return;
        }

        std::cout << "[REQ " << request_id << "] Successfully formatted in " << execution_ms
                  << "ms using " << result.formatter_used << "\n";

        FormatResponse body;
        body.formatted_code = result.formatted_code;
        body.execution_time_ms = execution_ms;
        body.formatter_used = result.formatter_used;
        body.input_length = fr.code.size();
        body.output_length = result.formatted_code.size();
        send_json(res, 200, request_id, body.to_json());
        finish_log(res.status);
    });
}
