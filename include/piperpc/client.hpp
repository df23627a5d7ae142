#pragma once

#include "piperpc/connection.hpp"
#include "piperpc/message.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

namespace piperpc {

// The requesting side of the protocol.
//
// Every call gets a fresh integer id and a pending entry keyed by that id;
// a reader thread completes entries as responses arrive, in any order. Calls
// may therefore be issued concurrently from several threads. A response
// whose id has no pending entry (it arrived after its call timed out) is
// logged and dropped.
class Client {
public:
    static constexpr std::chrono::milliseconds default_timeout{10000};

    explicit Client(std::unique_ptr<Connection> connection);
    ~Client();

    Client(const Client &) = delete;
    Client & operator=(const Client &) = delete;

    // Sends one request and waits for its response, at most `timeout`.
    // Returns the response (success or error). Throws NotInitialized before
    // the handshake, Timeout, ConnectionClosed or ConnectionError.
    Message call(const std::string & method,
                 const json & params = json(),
                 std::chrono::milliseconds timeout = default_timeout);

    // Writes a notification; nothing is awaited. Throws ConnectionClosed once
    // closed, NotInitialized before the handshake, ConnectionError.
    void notify(const std::string & method, const json & params = json());

    // MCP protocol methods
    json initialize(const std::string & client_name = "piperpc-client",
                    const std::string & client_version = "1.0.0");
    json list_tools();
    std::string call_tool(const std::string & tool_name, const json & arguments);
    json list_resources();
    std::string read_resource(const std::string & uri);
    json list_prompts();
    std::string get_prompt(const std::string & prompt_name, const json & arguments = json::object());

    // Closes the connection and fails every pending call with ConnectionClosed.
    void close();

    bool is_initialized() const { return initialized.load(); }
    bool is_closed() const;
    size_t pending_count() const;
    int64_t last_request_id() const;

    // timeout used by the protocol helpers above and by notify(); safe to
    // change while other threads are calling
    void set_request_timeout(std::chrono::milliseconds timeout) { request_timeout_ms = timeout.count(); }
    std::chrono::milliseconds get_request_timeout() const { return std::chrono::milliseconds(request_timeout_ms.load()); }

private:
    struct PendingRequest {
        int64_t                               id = 0;
        std::string                           method;
        std::chrono::steady_clock::time_point issued_at;
        std::promise<Message>                 completion;
    };

    void reader_loop();
    void fail_pending(const std::string & reason);

    // result of a success response; RpcError for an error response
    static json expect_result(const Message & response);

    std::unique_ptr<Connection> connection;
    std::thread                 reader;

    mutable std::mutex                                  mutex;
    std::map<int64_t, std::shared_ptr<PendingRequest>> pending;
    int64_t                                             request_id_counter = 0;
    bool                                                closed             = false;
    std::string                                         close_reason;

    std::mutex           join_mutex;
    std::atomic<bool>    initialized{false};
    std::atomic<int64_t> request_timeout_ms{default_timeout.count()};
};

} // namespace piperpc
