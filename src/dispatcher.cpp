#include "piperpc/dispatcher.hpp"
#include "piperpc/errors.hpp"
#include "piperpc/log.hpp"

#include <algorithm>
#include <stdexcept>

namespace piperpc {

void Dispatcher::add(std::unique_ptr<MethodHandler> handler) {
    if (!handler) {
        return;
    }

    std::string method = handler->name();
    if (handlers.count(method) > 0) {
        throw std::invalid_argument("method already registered: " + method);
    }
    handlers.emplace(std::move(method), std::move(handler));
}

bool Dispatcher::remove(const std::string & method) {
    return handlers.erase(method) > 0;
}

MethodHandler * Dispatcher::find(const std::string & method) const {
    auto it = handlers.find(method);
    if (it == handlers.end()) {
        return nullptr;
    }
    return it->second.get();
}

std::vector<std::string> Dispatcher::methods() const {
    std::vector<std::string> names;
    names.reserve(handlers.size());
    for (const auto & entry : handlers) {
        names.push_back(entry.first);
    }
    std::sort(names.begin(), names.end());
    return names;
}

Message Dispatcher::dispatch(const Message & request) const {
    MethodHandler * handler = find(request.method);
    if (!handler) {
        PIPERPC_LOG_WARN("%s: method not found: %s\n", __func__, request.method.c_str());
        return Message::make_error(request.id, ErrorCode::METHOD_NOT_FOUND, "Method not found: " + request.method);
    }

    PIPERPC_LOG_DEBUG("%s: processing method: %s\n", __func__, request.method.c_str());

    const json params = request.has_params && !request.params.is_null() ? request.params : json::object();

    try {
        return Message::make_result(request.id, handler->handle(params));
    } catch (const RpcError & e) {
        PIPERPC_LOG_INFO("%s: %s failed with %d: %s\n", __func__, request.method.c_str(), e.code(), e.what());
        return Message::make_error(request.id, e.code(), e.what());
    } catch (const std::exception & e) {
        PIPERPC_LOG_ERROR("%s: exception in handler for %s: %s\n", __func__, request.method.c_str(), e.what());
        return Message::make_error(request.id, ErrorCode::INTERNAL_ERROR, std::string("Internal error: ") + e.what());
    } catch (...) {
        PIPERPC_LOG_ERROR("%s: unknown exception in handler for %s\n", __func__, request.method.c_str());
        return Message::make_error(request.id, ErrorCode::INTERNAL_ERROR, "Internal error: unknown exception");
    }
}

} // namespace piperpc
