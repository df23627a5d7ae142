#include "piperpc/methods.hpp"
#include "piperpc/errors.hpp"
#include "piperpc/log.hpp"

#include <memory>

namespace piperpc {

namespace {

std::string require_string(const json & params, const char * key) {
    auto it = params.find(key);
    if (it == params.end() || !it->is_string()) {
        throw RpcError(ErrorCode::INVALID_PARAMS, std::string("Missing required parameter: ") + key);
    }
    return it->get<std::string>();
}

json optional_arguments(const json & params) {
    auto it = params.find("arguments");
    if (it == params.end() || it->is_null()) {
        return json::object();
    }
    if (!it->is_object()) {
        throw RpcError(ErrorCode::INVALID_PARAMS, "Invalid parameter: arguments must be an object");
    }
    return *it;
}

void check_params_object(const json & params) {
    if (!params.is_object()) {
        throw RpcError(ErrorCode::INVALID_PARAMS, "Invalid params: expected an object");
    }
}

class InitializeMethod final : public MethodHandler {
public:
    explicit InitializeMethod(const ServerInfo & info) : info(info) {}

    const char * name() const override { return "initialize"; }

    json handle(const json & params) override {
        if (params.is_object() && params.contains("clientInfo") && params["clientInfo"].is_object()) {
            const json & client = params["clientInfo"];
            PIPERPC_LOG_INFO("%s: client %s %s, protocol %s\n", __func__,
                             client.value("name", std::string("unknown")).c_str(),
                             client.value("version", std::string("")).c_str(),
                             params.value("protocolVersion", std::string("unspecified")).c_str());
        }

        return json{
            {"protocolVersion", mcp_protocol_version},
            {"capabilities", {
                {"tools",     json::object()},
                {"resources", json::object()},
                {"prompts",   json::object()}
            }},
            {"serverInfo", {
                {"name",    info.name},
                {"version", info.version}
            }}
        };
    }

private:
    ServerInfo info;
};

class InitializedNotification final : public MethodHandler {
public:
    const char * name() const override { return "notifications/initialized"; }

    json handle(const json & /*params*/) override {
        PIPERPC_LOG_INFO("%s: client initialization completed\n", __func__);
        return json::object();
    }
};

class ToolsListMethod final : public MethodHandler {
public:
    explicit ToolsListMethod(const ToolCatalog & tools) : tools(tools) {}

    const char * name() const override { return "tools/list"; }

    json handle(const json & /*params*/) override {
        return json{{"tools", describe(tools)}};
    }

private:
    const ToolCatalog & tools;
};

class ToolsCallMethod final : public MethodHandler {
public:
    explicit ToolsCallMethod(const ToolCatalog & tools) : tools(tools) {}

    const char * name() const override { return "tools/call"; }

    json handle(const json & params) override {
        check_params_object(params);

        const std::string tool_name = require_string(params, "name");
        const json        arguments = optional_arguments(params);

        const Tool * tool = tools.find(tool_name);
        if (!tool) {
            throw RpcError(ErrorCode::INVALID_PARAMS, "Unknown tool: " + tool_name);
        }

        for (const auto & required : tool->required_arguments()) {
            if (!arguments.contains(required)) {
                throw RpcError(ErrorCode::INVALID_PARAMS,
                               "Missing required argument '" + required + "' for tool '" + tool_name + "'");
            }
        }

        PIPERPC_LOG_DEBUG("%s: calling tool %s\n", __func__, tool_name.c_str());

        return json{
            {"content", json::array({
                {
                    {"type", "text"},
                    {"text", tool->invoke(arguments)}
                }
            })}
        };
    }

private:
    const ToolCatalog & tools;
};

class ResourcesListMethod final : public MethodHandler {
public:
    explicit ResourcesListMethod(const ResourceCatalog & resources) : resources(resources) {}

    const char * name() const override { return "resources/list"; }

    json handle(const json & /*params*/) override {
        return json{{"resources", describe(resources)}};
    }

private:
    const ResourceCatalog & resources;
};

class ResourcesReadMethod final : public MethodHandler {
public:
    explicit ResourcesReadMethod(const ResourceCatalog & resources) : resources(resources) {}

    const char * name() const override { return "resources/read"; }

    json handle(const json & params) override {
        check_params_object(params);

        const std::string uri = require_string(params, "uri");

        const Resource * resource = resources.find(uri);
        if (!resource) {
            throw RpcError(ErrorCode::INVALID_PARAMS, "Unknown resource: " + uri);
        }

        return json{
            {"contents", json::array({
                {
                    {"uri",      resource->uri},
                    {"mimeType", resource->mime_type},
                    {"text",     resource->read()}
                }
            })}
        };
    }

private:
    const ResourceCatalog & resources;
};

class PromptsListMethod final : public MethodHandler {
public:
    explicit PromptsListMethod(const PromptCatalog & prompts) : prompts(prompts) {}

    const char * name() const override { return "prompts/list"; }

    json handle(const json & /*params*/) override {
        return json{{"prompts", describe(prompts)}};
    }

private:
    const PromptCatalog & prompts;
};

class PromptsGetMethod final : public MethodHandler {
public:
    explicit PromptsGetMethod(const PromptCatalog & prompts) : prompts(prompts) {}

    const char * name() const override { return "prompts/get"; }

    json handle(const json & params) override {
        check_params_object(params);

        const std::string prompt_name = require_string(params, "name");
        const json        arguments   = optional_arguments(params);

        const Prompt * prompt = prompts.find(prompt_name);
        if (!prompt) {
            throw RpcError(ErrorCode::INVALID_PARAMS, "Unknown prompt: " + prompt_name);
        }

        for (const auto & argument : prompt->arguments) {
            if (argument.required && !arguments.contains(argument.name)) {
                throw RpcError(ErrorCode::INVALID_PARAMS,
                               "Missing required argument '" + argument.name + "' for prompt '" + prompt_name + "'");
            }
        }

        PromptText rendered = prompt->render(arguments);

        return json{
            {"description", rendered.description},
            {"messages", json::array({
                {
                    {"role", "system"},
                    {"content", {
                        {"type", "text"},
                        {"text", rendered.text}
                    }}
                }
            })}
        };
    }

private:
    const PromptCatalog & prompts;
};

} // namespace

void register_protocol_methods(Dispatcher & dispatcher, const Catalogs & catalogs, const ServerInfo & info) {
    dispatcher.add(std::make_unique<InitializeMethod>(info));
    dispatcher.add(std::make_unique<InitializedNotification>());
    dispatcher.add(std::make_unique<ToolsListMethod>(catalogs.tools));
    dispatcher.add(std::make_unique<ToolsCallMethod>(catalogs.tools));
    dispatcher.add(std::make_unique<ResourcesListMethod>(catalogs.resources));
    dispatcher.add(std::make_unique<ResourcesReadMethod>(catalogs.resources));
    dispatcher.add(std::make_unique<PromptsListMethod>(catalogs.prompts));
    dispatcher.add(std::make_unique<PromptsGetMethod>(catalogs.prompts));
}

} // namespace piperpc
