#include "routes/format_route.h"
#include "dto/format_response.h"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <iostream>
#include <limits>
#include <stdexcept>
#include <string>

#include <nlohmann/json.hpp>

namespace {
using nlohmann::json;

const char kSampleCode[] =
    "const messyCode={name:\"test\",value:123,items:[1,2,3,4,5],"
    "processItems:function(){return this.items.map(x=>x*2).filter(x=>x>4);}};";

constexpr int kDefaultIterations = 100;
constexpr int kMaxIterations = 1000;

double round2(double v) {
    return std::round(v * 100.0) / 100.0;
}

int iterations_param(const httplib::Request& req) {
    if (!req.has_param("iterations")) return kDefaultIterations;
    try {
        const int n = std::stoi(req.get_param_value("iterations"));
        return std::min(std::max(n, 1), kMaxIterations);
    } catch (const std::exception&) {
        return kDefaultIterations;
    }
}
} // namespace

void register_benchmark_route(httplib::Server& server, const FormatterDispatcher& dispatcher,
                              std::chrono::milliseconds budget) {
    server.Get("/benchmark", [&dispatcher, budget](const httplib::Request& req, httplib::Response& res) {
        res.set_header("Access-Control-Allow-Origin", "*");

        const int requested = iterations_param(req);
        const std::string sample = kSampleCode;
        const auto run_start = std::chrono::steady_clock::now();

        int iterations = 0;
        bool truncated = false;
        double total = 0.0;
        double min_ms = std::numeric_limits<double>::max();
        double max_ms = 0.0;
        while (iterations < requested) {
            if (iterations > 0 && budget.count() > 0 &&
                std::chrono::steady_clock::now() - run_start >= budget) {
                truncated = true;
                break;
            }
            const auto start = std::chrono::steady_clock::now();
            const FormatResult r = dispatcher.dispatch(sample, "javascript");
            const double ms = std::chrono::duration<double, std::milli>(
                std::chrono::steady_clock::now() - start).count();

            if (!r.ok) {
                std::cerr << "[BENCHMARK] iteration " << iterations << " failed: " << r.message << "\n";
                res.status = http_status_for(r.error_kind);
                res.set_content(ErrorResponse{error_category_for(r.error_kind), r.message}.to_json(),
                                "application/json");
                return;
            }
            ++iterations;
            total += ms;
            min_ms = std::min(min_ms, ms);
            max_ms = std::max(max_ms, ms);
        }

        const double avg = total / iterations;
        const double throughput = avg > 0.0 ? std::round(sample.size() / avg) : 0.0;
        std::cout << "[BENCHMARK] " << iterations << "/" << requested << " iterations, avg="
                  << round2(avg) << "ms" << (truncated ? " (budget reached)" : "") << "\n";

        res.set_content(json{
            {"iterations", iterations},
            {"requested_iterations", requested},
            {"truncated", truncated},
            {"average_time_ms", round2(avg)},
            {"min_time_ms", round2(min_ms)},
            {"max_time_ms", round2(max_ms)},
            {"sample_code_length", sample.size()},
            {"throughput_chars_per_ms", throughput}
        }.dump(), "application/json");
    });
}
