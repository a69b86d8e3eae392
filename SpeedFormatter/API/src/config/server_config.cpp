#include "config/server_config.h"
#include "utils/text.h"

#include <algorithm>
#include <cstdlib>
#include <stdexcept>
#include <thread>

#ifndef SPEED_FORMATTER_DEFAULT_UI_PATH
#define SPEED_FORMATTER_DEFAULT_UI_PATH "static/index.html"
#endif

namespace {
std::string env_string(const char* name, const std::string& fallback) {
    const char* raw = std::getenv(name);
    if (!raw) return fallback;
    const std::string v = trim_copy(raw);
    return v.empty() ? fallback : v;
}

long long env_int(const char* name, long long fallback) {
    const char* raw = std::getenv(name);
    if (!raw || !*raw) return fallback;
    try {
        return std::stoll(raw);
    } catch (const std::exception&) {
        return fallback;
    }
}
} // namespace

ServerConfig load_server_config() {
    ServerConfig cfg;

    cfg.host = env_string("SPEED_FORMATTER_HOST", cfg.host);

    const long long port = env_int("SPEED_FORMATTER_PORT", cfg.port);
    if (port > 0 && port <= 65535) cfg.port = static_cast<int>(port);

    const std::size_t hw = std::max<std::size_t>(4, std::thread::hardware_concurrency());
    const long long workers = env_int("SPEED_FORMATTER_WORKERS", static_cast<long long>(hw));
    cfg.workers = workers > 0 ? static_cast<std::size_t>(workers) : hw;

    const long long payload = env_int("SPEED_FORMATTER_PAYLOAD_MAX_BYTES",
                                      static_cast<long long>(cfg.payload_max_bytes));
    cfg.payload_max_bytes = std::max<std::size_t>(1024 * 1024, static_cast<std::size_t>(std::max(0LL, payload)));

    const long long timeout_ms = env_int("SPEED_FORMATTER_TIMEOUT_MS", cfg.formatter_timeout.count());
    if (timeout_ms >= 0) cfg.formatter_timeout = std::chrono::milliseconds(timeout_ms);

    const long long budget_ms = env_int("SPEED_FORMATTER_BENCHMARK_BUDGET_MS", cfg.benchmark_budget.count());
    if (budget_ms >= 0) cfg.benchmark_budget = std::chrono::milliseconds(budget_ms);

    // The override names prettier itself, replacing the `npx prettier` launcher.
    const std::string prettier_bin = env_string("SPEED_FORMATTER_PRETTIER_BIN", "");
    if (!prettier_bin.empty()) {
        cfg.commands.prettier = {prettier_bin, "--stdin-filepath", "file.js", "--parser", "babel"};
    }
    cfg.commands.rustfmt.front() = env_string("SPEED_FORMATTER_RUSTFMT_BIN", cfg.commands.rustfmt.front());

    cfg.ui_path = env_string("SPEED_FORMATTER_UI_PATH", SPEED_FORMATTER_DEFAULT_UI_PATH);
    return cfg;
}
