#pragma once
#include <chrono>
#include <cstddef>
#include <string>

#include "services/formatter_provider.h"

struct ServerConfig {
    std::string host = "0.0.0.0";
    int port = 3000;
    std::size_t workers = 4;
    std::size_t payload_max_bytes = 10 * 1024 * 1024;
    std::chrono::milliseconds formatter_timeout{30000};
    // Wall-clock cap on one GET /benchmark run; 0 disables.
    std::chrono::milliseconds benchmark_budget{30000};
    FormatterCommands commands;
    std::string ui_path;
};

// Reads SPEED_FORMATTER_* environment variables; bad values keep defaults.
ServerConfig load_server_config();
