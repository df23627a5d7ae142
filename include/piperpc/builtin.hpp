#pragma once

#include "piperpc/catalog.hpp"

namespace piperpc {

// tools: echo, calculate, get_time
ToolCatalog make_builtin_tools();

// resources: resource://greeting, resource://system_info
ResourceCatalog make_builtin_resources();

// prompts: helpful_assistant
PromptCatalog make_builtin_prompts();

} // namespace piperpc
