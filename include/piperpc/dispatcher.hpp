#pragma once

#include "piperpc/message.hpp"

#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

namespace piperpc {

// One concrete handler type per protocol method.
//
// handle() returns the value placed in the response's "result". To answer
// with a specific error code throw RpcError; any other exception becomes an
// INTERNAL_ERROR response.
class MethodHandler {
public:
    virtual ~MethodHandler() = default;
    virtual const char * name() const = 0;
    virtual json handle(const json & params) = 0;
};

class Dispatcher {
public:
    // Throws std::invalid_argument if the method is already registered.
    void add(std::unique_ptr<MethodHandler> handler);
    bool remove(const std::string & method);

    MethodHandler * find(const std::string & method) const;
    bool has(const std::string & method) const { return find(method) != nullptr; }
    std::vector<std::string> methods() const;

    // Never throws for handler failures: they are turned into error responses
    // carrying the request's id. For a notification the returned message
    // only reports the outcome and is not meant to be sent.
    Message dispatch(const Message & request) const;

private:
    std::unordered_map<std::string, std::unique_ptr<MethodHandler>> handlers;
};

} // namespace piperpc
