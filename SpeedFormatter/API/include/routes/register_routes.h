#pragma once
#include <httplib.h>

#include "config/server_config.h"
#include "services/formatter_dispatcher.h"

void register_routes(httplib::Server& server, const FormatterDispatcher& dispatcher, const ServerConfig& config);
