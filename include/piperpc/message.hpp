#pragma once

#include "piperpc/errors.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <string>

namespace piperpc {

using json = nlohmann::ordered_json;

// value of the "jsonrpc" member carried by every message
constexpr const char * jsonrpc_version = "2.0";

// protocolVersion exchanged by the initialize handshake
constexpr const char * mcp_protocol_version = "2024-11-05";

enum class message_kind {
    request,   // has a method; a request without id is a notification
    response,  // carries result
    error,     // carries error
};

struct Message {
    message_kind kind = message_kind::request;

    json id;            // integer, string or null
    bool has_id = false;

    std::string method;
    json        params;
    bool        has_params = false;

    json result;

    int         error_code = 0;
    std::string error_message;

    static Message make_request(int64_t id, const std::string & method, const json & params = json());
    static Message make_notification(const std::string & method, const json & params = json());
    static Message make_result(const json & id, const json & result);
    static Message make_error(const json & id, int code, const std::string & message);
    static Message make_error(const json & id, ErrorCode code, const std::string & message);

    bool is_request()      const { return kind == message_kind::request && has_id; }
    bool is_notification() const { return kind == message_kind::request && !has_id; }
    bool is_response()     const { return kind != message_kind::request; }
    bool is_error()        const { return kind == message_kind::error; }

    bool operator==(const Message & other) const;
    bool operator!=(const Message & other) const { return !(*this == other); }
};

// Serializes one message as a single line of compact JSON terminated by '\n'.
std::string encode(const Message & msg);

// Parses one line (a trailing "\r\n" or "\n" is tolerated).
// Throws MalformedMessage if the text is not JSON and ProtocolViolation if
// it is JSON but not a valid request or response.
Message decode(const std::string & line);

// Blank and whitespace-only lines are skipped by readers, never decoded.
bool is_blank(const std::string & line);

} // namespace piperpc
