#include "piperpc/builtin.hpp"
#include "piperpc/errors.hpp"
#include "piperpc/expression.hpp"

#include <ctime>
#include <string>

#include <sys/utsname.h>

namespace piperpc {

namespace {

std::string string_argument(const json & arguments, const char * key) {
    auto it = arguments.find(key);
    if (it == arguments.end() || it->is_null()) {
        return "";
    }
    if (it->is_string()) {
        return it->get<std::string>();
    }
    return it->dump();
}

std::string tool_echo(const json & arguments) {
    return "Echo: " + string_argument(arguments, "message");
}

std::string tool_calculate(const json & arguments) {
    const std::string expression = string_argument(arguments, "expression");
    try {
        return format_number(evaluate_expression(expression));
    } catch (const InvalidExpression & e) {
        return std::string("Error calculating: ") + e.what();
    }
}

std::string tool_get_time(const json & /*arguments*/) {
    std::time_t now = std::time(nullptr);
    std::tm tm_now{};
    localtime_r(&now, &tm_now);

    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", &tm_now);
    return buf;
}

std::string read_system_info() {
    json info = json::object();

    struct utsname uts;
    if (uname(&uts) == 0) {
        info["platform"]     = uts.sysname;
        info["release"]      = uts.release;
        info["architecture"] = uts.machine;
    } else {
        info["platform"]     = "unknown";
        info["release"]      = "unknown";
        info["architecture"] = sizeof(void *) == 8 ? "64bit" : "32bit";
    }

#if defined(__clang__)
    info["compiler"] = std::string("clang ") + __clang_version__;
#elif defined(__GNUC__)
    info["compiler"] = std::string("gcc ") + __VERSION__;
#else
    info["compiler"] = "unknown";
#endif

    return info.dump();
}

} // namespace

ToolCatalog make_builtin_tools() {
    std::vector<Tool> tools;

    tools.push_back({
        "echo",
        "Echo back the input message",
        {
            {"type", "object"},
            {"properties", {
                {"message", {
                    {"type", "string"},
                    {"description", "Message to echo back"}
                }}
            }},
            {"required", json::array({"message"})}
        },
        tool_echo
    });

    tools.push_back({
        "calculate",
        "Perform basic mathematical calculations",
        {
            {"type", "object"},
            {"properties", {
                {"expression", {
                    {"type", "string"},
                    {"description", "Mathematical expression to evaluate (e.g., '2 + 2', '10 * 5')"}
                }}
            }},
            {"required", json::array({"expression"})}
        },
        tool_calculate
    });

    tools.push_back({
        "get_time",
        "Get current date and time",
        {
            {"type", "object"},
            {"properties", json::object()},
            {"required", json::array()}
        },
        tool_get_time
    });

    return ToolCatalog(std::move(tools));
}

ResourceCatalog make_builtin_resources() {
    std::vector<Resource> resources;

    resources.push_back({
        "resource://greeting",
        "Greeting Message",
        "A simple greeting message",
        "text/plain",
        []() { return std::string("Hello! Welcome to the MCP Tutorial Server!"); }
    });

    resources.push_back({
        "resource://system_info",
        "System Information",
        "Basic system information",
        "application/json",
        read_system_info
    });

    return ResourceCatalog(std::move(resources));
}

PromptCatalog make_builtin_prompts() {
    std::vector<Prompt> prompts;

    prompts.push_back({
        "helpful_assistant",
        "A helpful assistant prompt",
        {
            {"topic", "The topic to be helpful about", false}
        },
        [](const json & arguments) {
            std::string topic = string_argument(arguments, "topic");
            if (topic.empty()) {
                topic = "general assistance";
            }
            return PromptText{
                "Helpful assistant prompt for " + topic,
                "You are a helpful assistant specialized in " + topic +
                    ". Please provide clear, accurate, and helpful responses."
            };
        }
    });

    return PromptCatalog(std::move(prompts));
}

} // namespace piperpc
