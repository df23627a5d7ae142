#pragma once

#include "piperpc/catalog.hpp"
#include "piperpc/dispatcher.hpp"

#include <string>

namespace piperpc {

struct ServerInfo {
    std::string name    = "piperpc-server";
    std::string version = "1.0.0";
};

// Registers initialize, tools/list, tools/call, resources/list,
// resources/read, prompts/list, prompts/get and the
// notifications/initialized notification. The catalogs must outlive the
// dispatcher.
void register_protocol_methods(Dispatcher & dispatcher, const Catalogs & catalogs, const ServerInfo & info = {});

} // namespace piperpc
