#include <transport/message_codec.hpp>
#include <scene_io/error_json.hpp>
#include <nlohmann/json.hpp>

namespace transport {

namespace {

// Source text may carry invalid UTF-8; it is replaced rather than thrown on.
std::string dump(const nlohmann::json& j) {
    return j.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

} // namespace

ClientMessage decode_client_message(const std::string& text) {
    ClientMessage msg;
    nlohmann::json j;
    try {
        j = nlohmann::json::parse(text);
    } catch (const nlohmann::json::parse_error&) {
        msg.type = MessageType::Source;
        msg.payload = text;
        return msg;
    }

    if (!j.is_object()) {
        msg.type = MessageType::Source;
        msg.payload = text;
        return msg;
    }

    msg.type_name = j.contains("type") && j["type"].is_string() ? j["type"].get<std::string>() : "";
    if (msg.type_name == "ping") {
        msg.type = MessageType::Ping;
    } else if (msg.type_name == "source") {
        if (j.contains("payload") && j["payload"].is_string()) {
            msg.type = MessageType::Source;
            msg.payload = j["payload"].get<std::string>();
        } else {
            msg.type = MessageType::InvalidPayload;
        }
    } else {
        msg.type = MessageType::Unknown;
    }
    return msg;
}

std::string encode_render_response(const std::string& output, const std::vector<scene_model::ErrorInfo>& errors) {
    nlohmann::json j;
    j["type"] = "render";
    j["output"] = output;
    j["errors"] = scene_io::errors_to_json(errors);
    return dump(j);
}

std::string encode_error_response(const std::string& message, const std::vector<scene_model::ErrorInfo>& errors) {
    nlohmann::json j;
    j["type"] = "error";
    j["message"] = message;
    j["errors"] = scene_io::errors_to_json(errors);
    return dump(j);
}

std::string encode_pong() {
    return dump(nlohmann::json{ { "type", "pong" } });
}

} // namespace transport
