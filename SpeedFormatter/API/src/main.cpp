#include <iostream>
#include <string>
#include <vector>

#include <httplib.h>

#include "config/server_config.h"
#include "routes/register_routes.h"
#include "services/formatter_dispatcher.h"
#include "services/formatter_provider.h"

namespace {
std::string join_argv(const std::vector<std::string>& argv) {
    std::string out;
    for (const auto& a : argv) {
        if (!out.empty()) out += ' ';
        out += a;
    }
    return out;
}
} // namespace

int main() {
    const ServerConfig config = load_server_config();

    ProcessFormatterProvider provider(config.commands, config.formatter_timeout);
    FormatterDispatcher dispatcher(provider);

    httplib::Server server;
    const std::size_t workers = config.workers;
    server.new_task_queue = [workers] { return new httplib::ThreadPool(workers); };

    register_routes(server, dispatcher, config);

    std::cout << "[SERVER] prettier: " << join_argv(config.commands.prettier) << "\n";
    std::cout << "[SERVER] rustfmt: " << join_argv(config.commands.rustfmt) << "\n";
    std::cout << "[SERVER] formatter timeout: " << config.formatter_timeout.count() << " ms, workers: "
              << workers << ", benchmark budget: " << config.benchmark_budget.count() << " ms\n";
    std::cout << "[SERVER] Speed Formatter running on http://" << config.host << ":" << config.port << "\n";
    std::cout << "[SERVER] Health check: GET /health, Format API: POST /format, Benchmark: GET /benchmark\n";

    if (!server.listen(config.host, config.port)) {
        std::cerr << "[SERVER] Failed to listen on " << config.host << ":" << config.port << ".\n";
        return 1;
    }
    return 0;
}
