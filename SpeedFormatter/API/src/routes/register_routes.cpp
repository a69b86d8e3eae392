#include "routes/register_routes.h"
#include "routes/format_route.h"
#include "dto/format_response.h"

#include <chrono>
#include <ctime>
#include <exception>
#include <fstream>
#include <iostream>
#include <iterator>
#include <sstream>
#include <string>

#include <nlohmann/json.hpp>

namespace {
using nlohmann::json;

constexpr const char* kServiceName = "speed-formatter";
constexpr const char* kServiceVersion = "0.1.0";

std::string now_utc_iso8601() {
    const auto now = std::chrono::system_clock::now();
    const std::time_t t = std::chrono::system_clock::to_time_t(now);
    std::tm tm_utc{};
    gmtime_r(&t, &tm_utc);
    char buf[32]{0};
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &tm_utc);
    return std::string(buf);
}

void set_cors_public(httplib::Response& res) {
    res.set_header("Access-Control-Allow-Origin", "*");
}

bool read_file(const std::string& path, std::string& out) {
    std::ifstream in(path, std::ios::binary);
    if (!in.is_open()) return false;
    out.assign((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    return !in.bad();
}

std::string error_title_for(int status) {
    switch (status) {
        case 404: return "Not found";
        case 405: return "Method not allowed";
        case 413: return "Payload too large";
        default:  return "Request failed";
    }
}
} // namespace

void register_routes(httplib::Server& server, const FormatterDispatcher& dispatcher, const ServerConfig& config) {
    server.set_payload_max_length(config.payload_max_bytes);

    server.Get("/health", [](const httplib::Request&, httplib::Response& res) {
        set_cors_public(res);
        res.set_content(json{
            {"status", "healthy"},
            {"service", kServiceName},
            {"version", kServiceVersion},
            {"timestamp", now_utc_iso8601()}
        }.dump(), "application/json");
    });

    const std::string ui_path = config.ui_path;
    server.Get("/", [ui_path](const httplib::Request&, httplib::Response& res) {
        std::string html;
        if (!read_file(ui_path, html)) {
            std::cerr << "[SERVER] failed to read UI page " << ui_path << "\n";
            res.status = 500;
            res.set_content("Error loading interface", "text/plain");
            return;
        }
        res.set_content(html, "text/html; charset=utf-8");
    });

    register_format_route(server, dispatcher);
    register_benchmark_route(server, dispatcher, config.benchmark_budget);

    // Routes fill their own error bodies; only bare httplib errors land here.
    server.set_error_handler([](const httplib::Request& req, httplib::Response& res) {
        if (!res.body.empty()) return;
        set_cors_public(res);
        res.set_content(ErrorResponse{error_title_for(res.status), req.method + " " + req.path}.to_json(),
                        "application/json");
    });

    server.set_exception_handler([](const httplib::Request& req, httplib::Response& res, std::exception_ptr ep) {
        std::string what = "Unknown error";
        try {
            std::rethrow_exception(ep);
        } catch (const std::exception& e) {
            what = e.what();
        } catch (...) {
            // non-std exception: reported as "Unknown error" below
        }
        std::cerr << "[SERVER] INTERNAL_ERROR " << req.method << " " << req.path << ": " << what << "\n";
        set_cors_public(res);
        res.status = 500;
        res.set_content(ErrorResponse{"Internal server error", what}.to_json(), "application/json");
    });

    server.set_logger([](const httplib::Request& req, const httplib::Response& res) {
        std::ostringstream os;
        os << "[SERVER] " << req.method << " " << req.path << " -> " << res.status << "\n";
        std::cout << os.str();
    });
}
