#pragma once
#include <chrono>
#include <string>

#include <httplib.h>

#include "services/formatter_dispatcher.h"

// HTTP status and short "error" category for a failed dispatch.
int http_status_for(FormatErrorKind kind);
std::string error_category_for(FormatErrorKind kind);

void register_format_route(httplib::Server& server, const FormatterDispatcher& dispatcher);
// Runs stop early once `budget` has elapsed (0 = no cap); the response says so.
void register_benchmark_route(httplib::Server& server, const FormatterDispatcher& dispatcher,
                              std::chrono::milliseconds budget);
