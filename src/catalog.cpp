#include "piperpc/catalog.hpp"

#include <stdexcept>

namespace piperpc {

namespace {

const std::string & catalog_key(const Tool & tool)         { return tool.name; }
const std::string & catalog_key(const Resource & resource) { return resource.uri; }
const std::string & catalog_key(const Prompt & prompt)     { return prompt.name; }

} // namespace

std::vector<std::string> Tool::required_arguments() const {
    std::vector<std::string> names;
    if (!input_schema.is_object()) {
        return names;
    }

    auto required = input_schema.find("required");
    if (required == input_schema.end() || !required->is_array()) {
        return names;
    }

    for (const auto & name : *required) {
        if (name.is_string()) {
            names.push_back(name.get<std::string>());
        }
    }
    return names;
}

template <typename T>
Catalog<T>::Catalog(std::vector<T> entries) : items(std::move(entries)) {
    for (size_t i = 0; i < items.size(); ++i) {
        const std::string & key = catalog_key(items[i]);
        if (!index.emplace(key, i).second) {
            throw std::invalid_argument("duplicate catalog entry: " + key);
        }
    }
}

template <typename T>
const T * Catalog<T>::find(const std::string & key) const {
    auto it = index.find(key);
    if (it == index.end()) {
        return nullptr;
    }
    return &items[it->second];
}

template class Catalog<Tool>;
template class Catalog<Resource>;
template class Catalog<Prompt>;

json describe(const ToolCatalog & tools) {
    json list = json::array();
    for (const auto & tool : tools.entries()) {
        list.push_back({
            {"name",        tool.name},
            {"description", tool.description},
            {"inputSchema", tool.input_schema}
        });
    }
    return list;
}

json describe(const ResourceCatalog & resources) {
    json list = json::array();
    for (const auto & resource : resources.entries()) {
        list.push_back({
            {"uri",         resource.uri},
            {"name",        resource.name},
            {"description", resource.description},
            {"mimeType",    resource.mime_type}
        });
    }
    return list;
}

json describe(const PromptCatalog & prompts) {
    json list = json::array();
    for (const auto & prompt : prompts.entries()) {
        json arguments = json::array();
        for (const auto & argument : prompt.arguments) {
            arguments.push_back({
                {"name",        argument.name},
                {"description", argument.description},
                {"required",    argument.required}
            });
        }
        list.push_back({
            {"name",        prompt.name},
            {"description", prompt.description},
            {"arguments",   arguments}
        });
    }
    return list;
}

} // namespace piperpc
