#include "piperpc/client.hpp"
#include "piperpc/errors.hpp"
#include "piperpc/log.hpp"

#include <algorithm>
#include <climits>
#include <stdexcept>
#include <utility>
#include <vector>

namespace piperpc {

namespace {

int to_write_timeout(std::chrono::milliseconds timeout) {
    return (int) std::min<int64_t>(std::max<int64_t>(timeout.count(), 0), INT_MAX);
}

// runs a result accessor, turning a payload of the wrong shape into ProtocolViolation
template <typename F>
auto extract(const char * method, F && accessor) -> decltype(accessor()) {
    try {
        return accessor();
    } catch (const json::exception & e) {
        throw ProtocolViolation(std::string("malformed ") + method + " result: " + e.what());
    }
}

json list_field(const json & result, const char * field, const char * method) {
    json entries = extract(method, [&]() { return result.value(field, json::array()); });
    if (!entries.is_array()) {
        throw ProtocolViolation(std::string("malformed ") + method + " result: '" + field + "' is not an array");
    }
    return entries;
}

} // namespace

Client::Client(std::unique_ptr<Connection> connection) : connection(std::move(connection)) {
    if (!this->connection) {
        throw std::invalid_argument("Connection cannot be null");
    }

    reader = std::thread(&Client::reader_loop, this);
}

Client::~Client() {
    close();
}

Message Client::call(const std::string & method, const json & params, std::chrono::milliseconds timeout) {
    auto request = std::make_shared<PendingRequest>();
    std::future<Message> response;
    {
        std::lock_guard<std::mutex> lock(mutex);
        if (closed) {
            throw ConnectionClosed(close_reason);
        }
        if (method != "initialize" && !initialized.load()) {
            throw NotInitialized("client is not initialized, cannot call " + method);
        }

        request->id        = ++request_id_counter;
        request->method    = method;
        request->issued_at = std::chrono::steady_clock::now();
        response           = request->completion.get_future();

        pending.emplace(request->id, request);
    }

    PIPERPC_LOG_DEBUG("%s: -> %s (id %lld)\n", __func__, method.c_str(), (long long) request->id);

    // the write and the wait for the response share one deadline
    const auto deadline = request->issued_at + timeout;

    try {
        connection->write_line(encode(Message::make_request(request->id, method, params)), to_write_timeout(timeout));
    } catch (const Timeout &) {
        {
            std::lock_guard<std::mutex> lock(mutex);
            pending.erase(request->id);
        }
        throw Timeout("request " + std::to_string(request->id) + " (" + method + ") timed out after " +
                      std::to_string(timeout.count()) + " ms while writing");
    } catch (const Error &) {
        std::lock_guard<std::mutex> lock(mutex);
        pending.erase(request->id);
        throw;
    }

    if (response.wait_until(deadline) == std::future_status::timeout) {
        std::lock_guard<std::mutex> lock(mutex);
        // the reader may have completed the entry while the wait expired
        if (pending.erase(request->id) > 0) {
            throw Timeout("request " + std::to_string(request->id) + " (" + method + ") timed out after " +
                          std::to_string(timeout.count()) + " ms");
        }
    }

    return response.get();
}

void Client::notify(const std::string & method, const json & params) {
    {
        std::lock_guard<std::mutex> lock(mutex);
        if (closed) {
            throw ConnectionClosed(close_reason);
        }
        if (!initialized.load()) {
            throw NotInitialized("client is not initialized, cannot notify " + method);
        }
    }

    PIPERPC_LOG_DEBUG("%s: -> %s (notification)\n", __func__, method.c_str());
    connection->write_line(encode(Message::make_notification(method, params)), to_write_timeout(get_request_timeout()));
}

void Client::reader_loop() {
    std::string line;

    while (connection->read_line(line)) {
        if (is_blank(line)) {
            continue;
        }

        Message msg;
        try {
            msg = decode(line);
        } catch (const Error & e) {
            PIPERPC_LOG_WARN("%s: skipping undecodable line: %s\n", __func__, e.what());
            continue;
        }

        if (!msg.is_response()) {
            PIPERPC_LOG_WARN("%s: ignoring unexpected request '%s' from server\n", __func__, msg.method.c_str());
            continue;
        }

        if (!msg.id.is_number_integer()) {
            PIPERPC_LOG_WARN("%s: dropping response without a request id: %s\n", __func__,
                             msg.is_error() ? msg.error_message.c_str() : "(result)");
            continue;
        }

        const int64_t id = msg.id.get<int64_t>();

        std::shared_ptr<PendingRequest> request;
        {
            std::lock_guard<std::mutex> lock(mutex);
            auto it = pending.find(id);
            if (it != pending.end()) {
                request = it->second;
                pending.erase(it);
            }
        }

        if (!request) {
            PIPERPC_LOG_WARN("%s: dropping response for unknown or expired request id %lld\n", __func__, (long long) id);
            continue;
        }

        const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - request->issued_at);
        PIPERPC_LOG_DEBUG("%s: <- %s (id %lld) in %lld ms\n", __func__, request->method.c_str(), (long long) id,
                          (long long) elapsed.count());

        request->completion.set_value(std::move(msg));
    }

    fail_pending("connection closed");
}

void Client::fail_pending(const std::string & reason) {
    std::map<int64_t, std::shared_ptr<PendingRequest>> failed;
    {
        std::lock_guard<std::mutex> lock(mutex);
        if (!closed) {
            closed       = true;
            close_reason = reason;
        }
        failed.swap(pending);
    }

    for (auto & entry : failed) {
        PIPERPC_LOG_DEBUG("%s: failing request %lld (%s): %s\n", __func__, (long long) entry.first,
                          entry.second->method.c_str(), reason.c_str());
        entry.second->completion.set_exception(std::make_exception_ptr(ConnectionClosed(reason)));
    }
}

void Client::close() {
    std::lock_guard<std::mutex> lock(join_mutex);

    connection->close();
    if (reader.joinable()) {
        reader.join();
    }

    fail_pending("connection closed");
    initialized = false;
}

bool Client::is_closed() const {
    std::lock_guard<std::mutex> lock(mutex);
    return closed;
}

size_t Client::pending_count() const {
    std::lock_guard<std::mutex> lock(mutex);
    return pending.size();
}

int64_t Client::last_request_id() const {
    std::lock_guard<std::mutex> lock(mutex);
    return request_id_counter;
}

json Client::expect_result(const Message & response) {
    if (response.is_error()) {
        throw RpcError(response.error_code, response.error_message);
    }
    return response.result;
}

json Client::initialize(const std::string & client_name, const std::string & client_version) {
    json params = {
        {"protocolVersion", mcp_protocol_version},
        {"capabilities", json::object()},
        {"clientInfo", {
            {"name", client_name},
            {"version", client_version}
        }}
    };

    json result = expect_result(call("initialize", params, get_request_timeout()));
    initialized = true;

    notify("notifications/initialized");

    std::string server_name    = "unknown server";
    std::string server_version = "";
    if (result.contains("serverInfo") && result["serverInfo"].is_object()) {
        server_name    = result["serverInfo"].value("name", server_name);
        server_version = result["serverInfo"].value("version", server_version);
    }
    PIPERPC_LOG_INFO("%s: connected to %s %s\n", __func__, server_name.c_str(), server_version.c_str());

    return result;
}

json Client::list_tools() {
    json result = expect_result(call("tools/list", json(), get_request_timeout()));
    return list_field(result, "tools", "tools/list");
}

std::string Client::call_tool(const std::string & tool_name, const json & arguments) {
    json params = {
        {"name", tool_name},
        {"arguments", arguments}
    };

    json result  = expect_result(call("tools/call", params, get_request_timeout()));
    json content = list_field(result, "content", "tools/call");
    if (content.empty()) {
        return "";
    }
    return extract("tools/call", [&]() { return content.at(0).value("text", ""); });
}

json Client::list_resources() {
    json result = expect_result(call("resources/list", json(), get_request_timeout()));
    return list_field(result, "resources", "resources/list");
}

std::string Client::read_resource(const std::string & uri) {
    json result   = expect_result(call("resources/read", {{"uri", uri}}, get_request_timeout()));
    json contents = list_field(result, "contents", "resources/read");
    if (contents.empty()) {
        return "";
    }
    return extract("resources/read", [&]() { return contents.at(0).value("text", ""); });
}

json Client::list_prompts() {
    json result = expect_result(call("prompts/list", json(), get_request_timeout()));
    return list_field(result, "prompts", "prompts/list");
}

std::string Client::get_prompt(const std::string & prompt_name, const json & arguments) {
    json params = {{"name", prompt_name}};
    if (!arguments.empty()) {
        params["arguments"] = arguments;
    }

    json result   = expect_result(call("prompts/get", params, get_request_timeout()));
    json messages = list_field(result, "messages", "prompts/get");
    if (messages.empty()) {
        return "";
    }
    return extract("prompts/get", [&]() { return messages.at(0).at("content").value("text", ""); });
}

} // namespace piperpc
