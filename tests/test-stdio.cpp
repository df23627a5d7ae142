#include "piperpc/client.hpp"
#include "piperpc/connection.hpp"
#include "piperpc/errors.hpp"
#include "piperpc/message.hpp"

#include <chrono>
#include <cstdio>
#include <memory>
#include <string>
#include <thread>

#include <signal.h>
#include <unistd.h>

#ifdef NDEBUG
#undef NDEBUG
#endif
#include <cassert>

#ifndef PIPERPC_SERVER_PATH
#error "PIPERPC_SERVER_PATH is not defined"
#endif

using piperpc::json;
using piperpc::Message;

using namespace std::chrono_literals;

static std::unique_ptr<piperpc::Connection> spawn_server() {
    return piperpc::Connection::spawn(PIPERPC_SERVER_PATH, {"--quiet"});
}

void test_session() {
    auto connection = spawn_server();
    assert(connection->is_open());
    assert(connection->pid() > 0);

    piperpc::Client client(std::move(connection));

    json init = client.initialize("test-stdio", "1.0.0");
    assert(init.at("protocolVersion") == "2024-11-05");
    assert(init.at("serverInfo").at("name") == "piperpc-server");
    assert(init.at("capabilities").contains("tools"));

    json tools = client.list_tools();
    assert(tools.size() == 3);

    // echo tool
    assert(client.call_tool("echo", {{"message", "hi"}}) == "Echo: hi");

    // arithmetic
    assert(client.call_tool("calculate", {{"expression", "10 + 5 * 2"}}) == "20");
    assert(client.call_tool("calculate", {{"expression", "10 / 4"}}) == "2.5");

    // anything but arithmetic is refused
    const std::string rejected = client.call_tool("calculate", {{"expression", "import os"}});
    assert(rejected.rfind("Error calculating", 0) == 0);

    // unknown resource
    Message missing = client.call("resources/read", {{"uri", "resource://unknown"}});
    assert(missing.is_error());
    assert(missing.error_code == -32602);

    int code = 0;
    try {
        client.read_resource("resource://unknown");
    } catch (const piperpc::RpcError & e) {
        code = e.code();
    }
    assert(code == -32602);

    Message unknown_method = client.call("no/such");
    assert(unknown_method.error_code == -32601);

    assert(client.call_tool("get_time", json::object()).size() == 19);

    json resources = client.list_resources();
    assert(resources.size() == 2);
    assert(client.read_resource("resource://greeting") == "Hello! Welcome to the MCP Tutorial Server!");
    assert(json::parse(client.read_resource("resource://system_info")).contains("platform"));

    json prompts = client.list_prompts();
    assert(prompts.size() == 1);
    const std::string prompt = client.get_prompt("helpful_assistant", {{"topic", "Python programming"}});
    assert(prompt.find("specialized in Python programming") != std::string::npos);

    client.close();
    assert(client.is_closed());
    client.close();
}

void test_garbage_gets_no_reply() {
    auto connection = spawn_server();

    connection->write_line("this is not json");
    connection->write_line("");
    connection->write_line("{\"jsonrpc\":\"2.0\",\"method\":\"notifications/initialized\"}");
    connection->write_line(piperpc::encode(Message::make_request(42, "tools/list")));

    // the first line back answers the last request: nothing else produced output
    std::string line;
    assert(connection->read_line(line));
    Message response = piperpc::decode(line);
    assert(response.id == 42);
    assert(response.result.at("tools").size() == 3);

    const pid_t pid = connection->pid();
    connection->close();
    assert(connection->state() == piperpc::connection_state::disconnected);
    // the child has been reaped
    assert(kill(pid, 0) == -1);

    // idempotent
    connection->close();
}

void test_spawn_failure() {
    bool threw = false;
    try {
        piperpc::Connection::spawn("/nonexistent/piperpc-server-missing");
    } catch (const piperpc::ConnectionError & e) {
        threw = true;
        assert(std::string(e.what()).find("failed to start") != std::string::npos);
    }
    assert(threw);

    threw = false;
    try {
        piperpc::Connection::connect("/nonexistent/piperpc.sock");
    } catch (const piperpc::ConnectionError &) {
        threw = true;
    }
    assert(threw);
}

void test_socket_mode() {
    const std::string socket_path = "/tmp/piperpc-test-" + std::to_string(getpid()) + ".sock";

    // the listening server ignores its stdin; a short grace period keeps close() quick
    auto server = piperpc::Connection::spawn(PIPERPC_SERVER_PATH, {"--quiet", "--socket", socket_path}, 100);

    std::unique_ptr<piperpc::Connection> connection;
    for (int attempt = 0; attempt < 200 && !connection; attempt++) {
        try {
            connection = piperpc::Connection::connect(socket_path);
        } catch (const piperpc::ConnectionError &) {
            std::this_thread::sleep_for(10ms);
        }
    }
    assert(connection);

    {
        piperpc::Client client(std::move(connection));
        client.initialize();
        assert(client.call_tool("echo", {{"message", "over a socket"}}) == "Echo: over a socket");
    }

    // a second client is served after the first disconnects
    {
        piperpc::Client client(piperpc::Connection::connect(socket_path));
        client.initialize();
        assert(client.call_tool("calculate", {{"expression", "(1 + 2) * 3"}}) == "9");
    }

    server->close();
    unlink(socket_path.c_str());
}

int main() {
    test_session();
    test_garbage_gets_no_reply();
    test_spawn_failure();
    test_socket_mode();

    printf("test-stdio: all tests passed\n");

    return 0;
}
