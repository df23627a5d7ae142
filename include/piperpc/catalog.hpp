#pragma once

#include "piperpc/message.hpp"

#include <functional>
#include <string>
#include <unordered_map>
#include <vector>

namespace piperpc {

struct Tool {
    std::string name;
    std::string description;
    json        input_schema;

    std::function<std::string(const json & arguments)> invoke;

    // names listed under input_schema["required"]
    std::vector<std::string> required_arguments() const;
};

struct Resource {
    std::string uri;
    std::string name;
    std::string description;
    std::string mime_type;

    std::function<std::string()> read;
};

struct PromptArgument {
    std::string name;
    std::string description;
    bool        required = false;
};

struct PromptText {
    std::string description;
    std::string text;
};

struct Prompt {
    std::string                 name;
    std::string                 description;
    std::vector<PromptArgument> arguments;

    std::function<PromptText(const json & arguments)> render;
};

// Read-only, name-keyed list of entries. Built once at startup; duplicate
// keys throw std::invalid_argument.
template <typename T>
class Catalog {
public:
    Catalog() = default;
    explicit Catalog(std::vector<T> entries);

    // nullptr if absent
    const T * find(const std::string & key) const;

    const std::vector<T> & entries() const { return items; }
    size_t size() const { return items.size(); }
    bool empty() const { return items.empty(); }

private:
    std::vector<T>                          items;
    std::unordered_map<std::string, size_t> index;
};

using ToolCatalog     = Catalog<Tool>;
using ResourceCatalog = Catalog<Resource>;
using PromptCatalog   = Catalog<Prompt>;

extern template class Catalog<Tool>;
extern template class Catalog<Resource>;
extern template class Catalog<Prompt>;

// payloads of tools/list, resources/list and prompts/list
json describe(const ToolCatalog & tools);
json describe(const ResourceCatalog & resources);
json describe(const PromptCatalog & prompts);

struct Catalogs {
    const ToolCatalog     & tools;
    const ResourceCatalog & resources;
    const PromptCatalog   & prompts;
};

} // namespace piperpc
