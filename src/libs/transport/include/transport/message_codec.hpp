#pragma once

#include <scene_model/errors.hpp>
#include <string>
#include <vector>

namespace transport {

enum class MessageType {
    Source,         // {"type":"source","payload":"..."} or plain text
    Ping,           // {"type":"ping"}
    Unknown,        // any other type
    InvalidPayload  // source message whose payload is not a string
};

struct ClientMessage {
    MessageType type = MessageType::Source;
    std::string payload;
    std::string type_name;
};

// Text that is not a JSON object is taken as raw DSL source.
ClientMessage decode_client_message(const std::string& text);

// {"type":"render","output":...,"errors":[...]}
std::string encode_render_response(const std::string& output, const std::vector<scene_model::ErrorInfo>& errors);

// {"type":"error","message":...,"errors":[...]}
std::string encode_error_response(const std::string& message, const std::vector<scene_model::ErrorInfo>& errors);

// {"type":"pong"}
std::string encode_pong();

} // namespace transport
