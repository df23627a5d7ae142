#include "piperpc/errors.hpp"
#include "piperpc/message.hpp"

#include <cstdio>
#include <string>

#ifdef NDEBUG
#undef NDEBUG
#endif
#include <cassert>

using piperpc::json;
using piperpc::Message;

template <typename E>
bool decode_throws(const std::string & line) {
    try {
        piperpc::decode(line);
    } catch (const E &) {
        return true;
    }
    return false;
}

void test_encode_request() {
    Message msg = Message::make_request(1, "tools/list");
    std::string line = piperpc::encode(msg);

    assert(line == "{\"jsonrpc\":\"2.0\",\"id\":1,\"method\":\"tools/list\"}\n");
    assert(line.find('\n') == line.size() - 1);

    Message with_params = Message::make_request(7, "tools/call", {{"name", "echo"}, {"arguments", {{"message", "hi"}}}});
    assert(piperpc::encode(with_params) ==
           "{\"jsonrpc\":\"2.0\",\"id\":7,\"method\":\"tools/call\",\"params\":{\"name\":\"echo\",\"arguments\":{\"message\":\"hi\"}}}\n");
}

void test_encode_notification() {
    Message msg = Message::make_notification("notifications/initialized");
    assert(msg.is_notification());
    assert(!msg.is_request());
    assert(piperpc::encode(msg) == "{\"jsonrpc\":\"2.0\",\"method\":\"notifications/initialized\"}\n");
}

void test_encode_responses() {
    Message ok = Message::make_result(3, {{"tools", json::array()}});
    assert(ok.is_response());
    assert(!ok.is_error());
    assert(piperpc::encode(ok) == "{\"jsonrpc\":\"2.0\",\"id\":3,\"result\":{\"tools\":[]}}\n");

    Message err = Message::make_error(4, piperpc::ErrorCode::METHOD_NOT_FOUND, "Method not found: foo");
    assert(err.is_response());
    assert(err.is_error());
    assert(err.error_code == -32601);
    assert(piperpc::encode(err) ==
           "{\"jsonrpc\":\"2.0\",\"id\":4,\"error\":{\"code\":-32601,\"message\":\"Method not found: foo\"}}\n");
}

void test_embedded_newlines_stay_on_one_line() {
    Message msg = Message::make_result(5, {{"text", "line one\nline two\r\n"}});
    std::string line = piperpc::encode(msg);

    assert(line.find('\n') == line.size() - 1);
    assert(line.find("\\n") != std::string::npos);

    Message back = piperpc::decode(line);
    assert(back.result["text"] == "line one\nline two\r\n");
}

void test_decode_request() {
    Message msg = piperpc::decode("{\"jsonrpc\":\"2.0\",\"id\":1,\"method\":\"tools/list\"}\r\n");
    assert(msg.is_request());
    assert(msg.id == 1);
    assert(msg.method == "tools/list");
    assert(!msg.has_params);

    Message string_id = piperpc::decode("{\"jsonrpc\":\"2.0\",\"id\":\"abc\",\"method\":\"initialize\",\"params\":{}}");
    assert(string_id.is_request());
    assert(string_id.id == "abc");
    assert(string_id.has_params);
    assert(string_id.params.is_object());

    Message note = piperpc::decode("{\"jsonrpc\":\"2.0\",\"method\":\"notifications/initialized\"}");
    assert(note.is_notification());
    assert(!note.has_id);
}

void test_decode_responses() {
    Message ok = piperpc::decode("{\"jsonrpc\":\"2.0\",\"id\":2,\"result\":{\"a\":1}}");
    assert(ok.kind == piperpc::message_kind::response);
    assert(ok.id == 2);
    assert(ok.result["a"] == 1);

    Message err = piperpc::decode("{\"jsonrpc\":\"2.0\",\"id\":null,\"error\":{\"code\":-32700,\"message\":\"Parse error\"}}");
    assert(err.is_error());
    assert(err.id.is_null());
    assert(err.error_code == -32700);
    assert(err.error_message == "Parse error");

    // a null result is still a result
    Message null_result = piperpc::decode("{\"jsonrpc\":\"2.0\",\"id\":9,\"result\":null}");
    assert(null_result.kind == piperpc::message_kind::response);
    assert(null_result.result.is_null());
}

void test_decode_rejects_garbage() {
    assert(decode_throws<piperpc::MalformedMessage>("this is not json"));
    assert(decode_throws<piperpc::MalformedMessage>("{\"jsonrpc\":\"2.0\",\"id\":1,"));
    assert(decode_throws<piperpc::MalformedMessage>(""));
}

void test_decode_rejects_protocol_violations() {
    // not an object
    assert(decode_throws<piperpc::ProtocolViolation>("[1,2,3]"));
    assert(decode_throws<piperpc::ProtocolViolation>("42"));
    // protocol tag
    assert(decode_throws<piperpc::ProtocolViolation>("{\"id\":1,\"method\":\"x\"}"));
    assert(decode_throws<piperpc::ProtocolViolation>("{\"jsonrpc\":\"1.0\",\"id\":1,\"method\":\"x\"}"));
    assert(decode_throws<piperpc::ProtocolViolation>("{\"jsonrpc\":2,\"id\":1,\"method\":\"x\"}"));
    // id type
    assert(decode_throws<piperpc::ProtocolViolation>("{\"jsonrpc\":\"2.0\",\"id\":1.5,\"method\":\"x\"}"));
    assert(decode_throws<piperpc::ProtocolViolation>("{\"jsonrpc\":\"2.0\",\"id\":[1],\"method\":\"x\"}"));
    // method type
    assert(decode_throws<piperpc::ProtocolViolation>("{\"jsonrpc\":\"2.0\",\"id\":1,\"method\":5}"));
    // request carrying a result
    assert(decode_throws<piperpc::ProtocolViolation>("{\"jsonrpc\":\"2.0\",\"id\":1,\"method\":\"x\",\"result\":{}}"));
    // both or neither of result and error
    assert(decode_throws<piperpc::ProtocolViolation>("{\"jsonrpc\":\"2.0\",\"id\":1,\"result\":{},\"error\":{\"code\":1,\"message\":\"m\"}}"));
    assert(decode_throws<piperpc::ProtocolViolation>("{\"jsonrpc\":\"2.0\",\"id\":1}"));
    // response without id, success with null id
    assert(decode_throws<piperpc::ProtocolViolation>("{\"jsonrpc\":\"2.0\",\"result\":{}}"));
    assert(decode_throws<piperpc::ProtocolViolation>("{\"jsonrpc\":\"2.0\",\"id\":null,\"result\":{}}"));
    // error shape
    assert(decode_throws<piperpc::ProtocolViolation>("{\"jsonrpc\":\"2.0\",\"id\":1,\"error\":\"boom\"}"));
    assert(decode_throws<piperpc::ProtocolViolation>("{\"jsonrpc\":\"2.0\",\"id\":1,\"error\":{\"code\":\"x\",\"message\":\"m\"}}"));
    assert(decode_throws<piperpc::ProtocolViolation>("{\"jsonrpc\":\"2.0\",\"id\":1,\"error\":{\"code\":-1}}"));
}

void test_round_trip_preserves_messages() {
    const Message messages[] = {
        Message::make_request(1, "initialize", {{"protocolVersion", "2024-11-05"}, {"capabilities", json::object()}}),
        Message::make_notification("notifications/initialized"),
        Message::make_result(1, {{"content", json::array({{{"type", "text"}, {"text", "Echo: hi"}}})}}),
        Message::make_error(2, -32602, "Unknown tool: nope"),
        Message::make_error(json(), piperpc::ErrorCode::PARSE_ERROR, "Parse error"),
    };

    for (const Message & msg : messages) {
        assert(piperpc::decode(piperpc::encode(msg)) == msg);
    }

    assert(Message::make_request(1, "a") != Message::make_request(2, "a"));
    assert(Message::make_request(1, "a") != Message::make_notification("a"));
}

void test_is_blank() {
    assert(piperpc::is_blank(""));
    assert(piperpc::is_blank("   \t\r"));
    assert(!piperpc::is_blank(" {} "));
}

int main() {
    test_encode_request();
    test_encode_notification();
    test_encode_responses();
    test_embedded_newlines_stay_on_one_line();
    test_decode_request();
    test_decode_responses();
    test_decode_rejects_garbage();
    test_decode_rejects_protocol_violations();
    test_round_trip_preserves_messages();
    test_is_blank();

    printf("test-message: all tests passed\n");

    return 0;
}
