#include "piperpc/builtin.hpp"
#include "piperpc/connection.hpp"
#include "piperpc/dispatcher.hpp"
#include "piperpc/log.hpp"
#include "piperpc/methods.hpp"
#include "piperpc/server.hpp"

#include <cstdio>
#include <cstdlib>
#include <string>

#include <unistd.h>

namespace {

// command-line parameters
struct server_params {
    bool verbose = false;
    bool quiet   = false;

    std::string socket_path;  // empty: serve stdin/stdout
    std::string name    = "piperpc-server";
    std::string version = "1.0.0";
};

void server_print_usage(int /*argc*/, char ** argv, const server_params & params) {
    fprintf(stderr, "\n");
    fprintf(stderr, "usage: %s [options]\n", argv[0]);
    fprintf(stderr, "\n");
    fprintf(stderr, "Answers JSON-RPC requests, one JSON document per line, on stdin/stdout.\n");
    fprintf(stderr, "\n");
    fprintf(stderr, "options:\n");
    fprintf(stderr, "  -h,        --help              [default] show this help message and exit\n");
    fprintf(stderr, "  -v,        --verbose           [%-7s] log every request (debug level)\n",           params.verbose ? "true" : "false");
    fprintf(stderr, "  -q,        --quiet             [%-7s] only log errors\n",                            params.quiet ? "true" : "false");
    fprintf(stderr, "  -s PATH,   --socket PATH       [%-7s] serve a Unix domain socket instead of stdio\n", params.socket_path.c_str());
    fprintf(stderr, "             --name NAME         [%-7s] server name reported by initialize\n",         params.name.c_str());
    fprintf(stderr, "             --version-string V  [%-7s] server version reported by initialize\n",      params.version.c_str());
    fprintf(stderr, "\n");
}

bool server_params_parse(int argc, char ** argv, server_params & params) {
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
            server_print_usage(argc, argv, params);
            exit(0);
        }
        else if (arg == "-v" || arg == "--verbose")        { params.verbose = true; }
        else if (arg == "-q" || arg == "--quiet")          { params.quiet   = true; }
        else if (arg == "-s" || arg == "--socket")         { const char * v = next_value(); if (!v) return false; params.socket_path = v; }
        else if (               arg == "--name")           { const char * v = next_value(); if (!v) return false; params.name        = v; }
        else if (               arg == "--version-string") { const char * v = next_value(); if (!v) return false; params.version     = v; }
        else {
            fprintf(stderr, "error: unknown argument: %s\n", arg.c_str());
            return false;
        }
    }

    return true;
}

}  // namespace

int main(int argc, char ** argv) {
    server_params params;

    if (server_params_parse(argc, argv, params) == false) {
        server_print_usage(argc, argv, params);
        return 1;
    }

    if (params.verbose) {
        piperpc_log_set_level(PIPERPC_LOG_LEVEL_DEBUG);
    } else if (params.quiet) {
        piperpc_log_set_level(PIPERPC_LOG_LEVEL_ERROR);
    }

    PIPERPC_LOG_INFO("%s starting...\n", params.name.c_str());

    try {
        const piperpc::ToolCatalog     tools     = piperpc::make_builtin_tools();
        const piperpc::ResourceCatalog resources = piperpc::make_builtin_resources();
        const piperpc::PromptCatalog   prompts   = piperpc::make_builtin_prompts();

        piperpc::ServerInfo info;
        info.name    = params.name;
        info.version = params.version;

        piperpc::Dispatcher dispatcher;
        piperpc::register_protocol_methods(dispatcher, {tools, resources, prompts}, info);

        piperpc::Server server(dispatcher);

        if (!params.socket_path.empty()) {
            return server.listen(params.socket_path);
        }

        auto connection = piperpc::Connection::adopt(STDIN_FILENO, STDOUT_FILENO, false);

        PIPERPC_LOG_INFO("server ready, listening on stdin...\n");
        const int rc = server.run(*connection);
        PIPERPC_LOG_INFO("server shutting down\n");

        return rc;
    } catch (const std::exception & e) {
        PIPERPC_LOG_ERROR("fatal error: %s\n", e.what());
        return 1;
    }
}
