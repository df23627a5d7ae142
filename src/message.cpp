#include "piperpc/message.hpp"

#include <cctype>

namespace piperpc {

Message Message::make_request(int64_t id, const std::string & method, const json & params) {
    Message msg;
    msg.kind       = message_kind::request;
    msg.id         = id;
    msg.has_id     = true;
    msg.method     = method;
    msg.params     = params;
    msg.has_params = !params.is_null();
    return msg;
}

Message Message::make_notification(const std::string & method, const json & params) {
    Message msg;
    msg.kind       = message_kind::request;
    msg.method     = method;
    msg.params     = params;
    msg.has_params = !params.is_null();
    return msg;
}

Message Message::make_result(const json & id, const json & result) {
    Message msg;
    msg.kind   = message_kind::response;
    msg.id     = id;
    msg.has_id = true;
    msg.result = result;
    return msg;
}

Message Message::make_error(const json & id, int code, const std::string & message) {
    Message msg;
    msg.kind          = message_kind::error;
    msg.id            = id;
    msg.has_id        = true;
    msg.error_code    = code;
    msg.error_message = message;
    return msg;
}

Message Message::make_error(const json & id, ErrorCode code, const std::string & message) {
    return make_error(id, static_cast<int>(code), message);
}

bool Message::operator==(const Message & other) const {
    if (kind != other.kind || has_id != other.has_id || id != other.id) {
        return false;
    }

    switch (kind) {
        case message_kind::request:
            return method == other.method && has_params == other.has_params && params == other.params;
        case message_kind::response:
            return result == other.result;
        case message_kind::error:
            return error_code == other.error_code && error_message == other.error_message;
    }

    return false;
}

std::string encode(const Message & msg) {
    json doc = json::object();
    doc["jsonrpc"] = jsonrpc_version;

    switch (msg.kind) {
        case message_kind::request:
            if (msg.has_id) {
                doc["id"] = msg.id;
            }
            doc["method"] = msg.method;
            if (msg.has_params) {
                doc["params"] = msg.params;
            }
            break;
        case message_kind::response:
            doc["id"]     = msg.id;
            doc["result"] = msg.result;
            break;
        case message_kind::error:
            doc["id"]    = msg.id;
            doc["error"] = {
                {"code",    msg.error_code},
                {"message", msg.error_message}
            };
            break;
    }

    // compact dump escapes control characters, so the document never spans lines
    return doc.dump(-1, ' ', false, json::error_handler_t::replace) + "\n";
}

Message decode(const std::string & line) {
    std::string text = line;
    while (!text.empty() && (text.back() == '\n' || text.back() == '\r')) {
        text.pop_back();
    }

    json doc;
    try {
        doc = json::parse(text);
    } catch (const json::parse_error & e) {
        throw MalformedMessage(std::string("invalid JSON: ") + e.what());
    }

    if (!doc.is_object()) {
        throw ProtocolViolation("message is not a JSON object");
    }

    auto tag = doc.find("jsonrpc");
    if (tag == doc.end() || !tag->is_string() || tag->get<std::string>() != jsonrpc_version) {
        throw ProtocolViolation("missing or unsupported jsonrpc version");
    }

    Message msg;

    auto id = doc.find("id");
    if (id != doc.end()) {
        if (!id->is_number_integer() && !id->is_string() && !id->is_null()) {
            throw ProtocolViolation("id must be an integer, a string or null");
        }
        msg.id     = *id;
        msg.has_id = true;
    }

    const bool has_result = doc.contains("result");
    const bool has_error  = doc.contains("error");

    auto method = doc.find("method");
    if (method != doc.end()) {
        if (!method->is_string()) {
            throw ProtocolViolation("method must be a string");
        }
        if (has_result || has_error) {
            throw ProtocolViolation("request must not carry result or error");
        }

        msg.kind   = message_kind::request;
        msg.method = method->get<std::string>();

        auto params = doc.find("params");
        if (params != doc.end()) {
            msg.params     = *params;
            msg.has_params = true;
        }
        return msg;
    }

    if (has_result && has_error) {
        throw ProtocolViolation("response carries both result and error");
    }
    if (!has_result && !has_error) {
        throw ProtocolViolation("message has no method, result or error");
    }
    if (!msg.has_id) {
        throw ProtocolViolation("response without id");
    }

    if (has_result) {
        if (msg.id.is_null()) {
            throw ProtocolViolation("success response with null id");
        }
        msg.kind   = message_kind::response;
        msg.result = doc.at("result");
        return msg;
    }

    const json & error = doc.at("error");
    if (!error.is_object()) {
        throw ProtocolViolation("error must be an object");
    }

    auto code = error.find("code");
    if (code == error.end() || !code->is_number_integer()) {
        throw ProtocolViolation("error.code must be an integer");
    }

    auto message = error.find("message");
    if (message == error.end() || !message->is_string()) {
        throw ProtocolViolation("error.message must be a string");
    }

    msg.kind          = message_kind::error;
    msg.error_code    = code->get<int>();
    msg.error_message = message->get<std::string>();
    return msg;
}

bool is_blank(const std::string & line) {
    for (char c : line) {
        if (!std::isspace(static_cast<unsigned char>(c))) {
            return false;
        }
    }
    return true;
}

} // namespace piperpc
