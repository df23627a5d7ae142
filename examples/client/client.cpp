#include "piperpc/client.hpp"
#include "piperpc/connection.hpp"
#include "piperpc/errors.hpp"
#include "piperpc/log.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <string>

namespace {

// command-line parameters
struct client_params {
    bool interactive = false;
    bool verbose     = false;

    int32_t timeout_ms = 10000;

    std::string server_command;  // empty: piperpc-server next to this binary
    std::string socket_path;     // connect to a listening server instead of spawning one
};

void client_print_usage(int /*argc*/, char ** argv, const client_params & params) {
    fprintf(stderr, "\n");
    fprintf(stderr, "usage: %s [options]\n", argv[0]);
    fprintf(stderr, "\n");
    fprintf(stderr, "Runs a short demo against a piperpc server, or an interactive session with -i.\n");
    fprintf(stderr, "\n");
    fprintf(stderr, "options:\n");
    fprintf(stderr, "  -h,        --help          [default] show this help message and exit\n");
    fprintf(stderr, "  -s CMD,    --server CMD    [%-7s] server executable to spawn\n",             params.server_command.empty() ? "auto" : params.server_command.c_str());
    fprintf(stderr, "             --socket PATH   [%-7s] connect to a server listening on PATH\n",  params.socket_path.c_str());
    fprintf(stderr, "  -t N,      --timeout N     [%-7d] request timeout in milliseconds\n",         params.timeout_ms);
    fprintf(stderr, "  -i,        --interactive   [%-7s] read commands from stdin\n",                params.interactive ? "true" : "false");
    fprintf(stderr, "  -v,        --verbose       [%-7s] print debug logs\n",                        params.verbose ? "true" : "false");
    fprintf(stderr, "\n");
}

bool client_params_parse(int argc, char ** argv, client_params & params) {
    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];

        auto next_value = [&]() -> const char * {
            if (i + 1 >= argc) {
                fprintf(stderr, "error: missing value for argument: %s\n", arg.c_str());
                return nullptr;
            }
            return argv[++i];
        };

        if (arg == "-h" || arg == "--help") {
            client_print_usage(argc, argv, params);
            exit(0);
        }
        else if (arg == "-i" || arg == "--interactive") { params.interactive = true; }
        else if (arg == "-v" || arg == "--verbose")     { params.verbose     = true; }
        else if (arg == "-s" || arg == "--server")      { const char * v = next_value(); if (!v) return false; params.server_command = v; }
        else if (               arg == "--socket")      { const char * v = next_value(); if (!v) return false; params.socket_path    = v; }
        else if (arg == "-t" || arg == "--timeout")     {
            const char * v = next_value();
            if (!v) return false;
            try {
                params.timeout_ms = std::stoi(v);
            } catch (const std::exception &) {
                fprintf(stderr, "error: invalid timeout: %s\n", v);
                return false;
            }
            if (params.timeout_ms <= 0) {
                fprintf(stderr, "error: timeout must be positive: %s\n", v);
                return false;
            }
        }
        else {
            fprintf(stderr, "error: unknown argument: %s\n", arg.c_str());
            return false;
        }
    }

    return true;
}

std::string default_server_command(const char * argv0) {
    const std::string self = argv0;
    const size_t      pos  = self.rfind('/');
    if (pos == std::string::npos) {
        return "./piperpc-server";
    }
    return self.substr(0, pos + 1) + "piperpc-server";
}

std::string names_of(const piperpc::json & entries) {
    std::string out = "[";
    for (size_t i = 0; i < entries.size(); i++) {
        if (i > 0) {
            out += ", ";
        }
        out += "'" + entries[i].value("name", std::string()) + "'";
    }
    return out + "]";
}

void print_entries(const piperpc::json & entries) {
    for (const auto & entry : entries) {
        printf("  %s: %s\n", entry.value("name", std::string()).c_str(),
                             entry.value("description", std::string()).c_str());
    }
}

int run_demo(piperpc::Client & client) {
    printf("\n=== TOOLS ===\n");
    printf("Available tools: %s\n", names_of(client.list_tools()).c_str());
    printf("Echo tool result: %s\n", client.call_tool("echo", {{"message", "Hello, MCP!"}}).c_str());
    printf("Calculate tool result: %s\n", client.call_tool("calculate", {{"expression", "10 + 5 * 2"}}).c_str());
    printf("Get time tool result: %s\n", client.call_tool("get_time", piperpc::json::object()).c_str());

    printf("\n=== RESOURCES ===\n");
    printf("Available resources: %s\n", names_of(client.list_resources()).c_str());
    printf("Greeting resource: %s\n", client.read_resource("resource://greeting").c_str());
    printf("System info resource: %s\n", client.read_resource("resource://system_info").c_str());

    printf("\n=== PROMPTS ===\n");
    printf("Available prompts: %s\n", names_of(client.list_prompts()).c_str());
    printf("Helpful assistant prompt: %s\n",
           client.get_prompt("helpful_assistant", {{"topic", "Python programming"}}).c_str());

    return 0;
}

void print_help() {
    printf("Commands:\n");
    printf("  tools             - List available tools\n");
    printf("  echo <message>    - Test echo tool\n");
    printf("  calc <expression> - Test calculator tool\n");
    printf("  time              - Get current time\n");
    printf("  resources         - List available resources\n");
    printf("  greeting          - Read greeting resource\n");
    printf("  sysinfo           - Read system info resource\n");
    printf("  prompts           - List available prompts\n");
    printf("  prompt [topic]    - Render the helpful_assistant prompt\n");
    printf("  quit              - Exit\n");
}

// returns false when the session should end
bool run_command(piperpc::Client & client, const std::string & line) {
    const size_t      space = line.find(' ');
    std::string       verb  = line.substr(0, space);
    const std::string rest  = space == std::string::npos ? "" : line.substr(space + 1);

    std::transform(verb.begin(), verb.end(), verb.begin(), [](unsigned char c) { return std::tolower(c); });

    if (verb == "quit" || verb == "exit") {
        return false;
    }

    if (verb == "help") {
        print_help();
    } else if (verb == "tools") {
        print_entries(client.list_tools());
    } else if (verb == "echo" && !rest.empty()) {
        printf("Result: %s\n", client.call_tool("echo", {{"message", rest}}).c_str());
    } else if (verb == "calc" && !rest.empty()) {
        printf("Result: %s\n", client.call_tool("calculate", {{"expression", rest}}).c_str());
    } else if (verb == "time") {
        printf("Current time: %s\n", client.call_tool("get_time", piperpc::json::object()).c_str());
    } else if (verb == "resources") {
        print_entries(client.list_resources());
    } else if (verb == "greeting") {
        printf("Greeting: %s\n", client.read_resource("resource://greeting").c_str());
    } else if (verb == "sysinfo") {
        printf("System info: %s\n", client.read_resource("resource://system_info").c_str());
    } else if (verb == "prompts") {
        print_entries(client.list_prompts());
    } else if (verb == "prompt") {
        piperpc::json arguments = piperpc::json::object();
        if (!rest.empty()) {
            arguments["topic"] = rest;
        }
        printf("Prompt: %s\n", client.get_prompt("helpful_assistant", arguments).c_str());
    } else {
        printf("Unknown command. Type 'help' for available commands.\n");
    }

    return true;
}

int run_interactive(piperpc::Client & client) {
    printf("Connected! Type 'help' for commands, 'quit' to exit.\n");

    std::string line;
    while (true) {
        printf("\n> ");
        fflush(stdout);

        if (!std::getline(std::cin, line)) {
            printf("\n");
            break;
        }

        const size_t first = line.find_first_not_of(" \t\r");
        if (first == std::string::npos) {
            continue;
        }
        const size_t last = line.find_last_not_of(" \t\r");
        line = line.substr(first, last - first + 1);

        try {
            if (!run_command(client, line)) {
                break;
            }
        } catch (const piperpc::RpcError & e) {
            printf("Error: %s (code %d)\n", e.what(), e.code());
        } catch (const piperpc::ConnectionClosed & e) {
            printf("Error: %s\n", e.what());
            return 1;
        } catch (const piperpc::Error & e) {
            printf("Error: %s\n", e.what());
        } catch (const std::exception & e) {
            // e.g. a reply whose payload does not have the expected shape
            printf("Error: unexpected reply: %s\n", e.what());
        }
    }

    return 0;
}

}  // namespace

int main(int argc, char ** argv) {
    client_params params;

    if (client_params_parse(argc, argv, params) == false) {
        client_print_usage(argc, argv, params);
        return 1;
    }

    piperpc_log_set_level(params.verbose ? PIPERPC_LOG_LEVEL_DEBUG : PIPERPC_LOG_LEVEL_WARN);

    if (params.server_command.empty()) {
        params.server_command = default_server_command(argv[0]);
    }

    int rc = 0;

    try {
        std::unique_ptr<piperpc::Connection> connection;
        if (!params.socket_path.empty()) {
            printf("Connecting to MCP server at %s...\n", params.socket_path.c_str());
            connection = piperpc::Connection::connect(params.socket_path);
        } else {
            printf("Connecting to MCP server (%s)...\n", params.server_command.c_str());
            // keep the server quiet unless we are debugging
            connection = piperpc::Connection::spawn(params.server_command,
                                                    {params.verbose ? "--verbose" : "--quiet"});
        }

        piperpc::Client client(std::move(connection));
        client.set_request_timeout(std::chrono::milliseconds(params.timeout_ms));

        printf("Initializing connection...\n");
        client.initialize("piperpc-client", "1.0.0");

        if (params.interactive) {
            rc = run_interactive(client);
        } else {
            rc = run_demo(client);
        }

        client.close();
        printf("\nDisconnected from server\n");
    } catch (const std::exception & e) {
        fprintf(stderr, "Error: %s\n", e.what());
        return 1;
    }

    return rc;
}
