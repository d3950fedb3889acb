#include <transport/render_session.hpp>
#include <transport/message_codec.hpp>
#include <scene_model/log.hpp>
#include <scene_pipeline/pipeline.hpp>
#include <exception>

namespace transport {

using scene_model::ErrorCode;
using scene_model::ErrorInfo;

namespace {

ErrorInfo transport_error(ErrorCode code, std::string message) {
    ErrorInfo e;
    e.code = code;
    e.message = std::move(message);
    e.recovery = scene_model::RecoveryAction::Skip;
    return e;
}

// Clears the in-flight flag if the drain loop leaves through an exception.
class InFlightGuard {
public:
    explicit InFlightGuard(std::function<void()> release) : release_(std::move(release)) {}
    ~InFlightGuard() { if (release_) release_(); }
    void dismiss() { release_ = nullptr; }

    InFlightGuard(const InFlightGuard&) = delete;
    InFlightGuard& operator=(const InFlightGuard&) = delete;

private:
    std::function<void()> release_;
};

} // namespace

RenderSession::RenderSession(Sender send)
    : RenderSession(std::move(send), [](const std::string& source) {
        return scene_pipeline::render_with_errors(source);
    })
{
}

RenderSession::RenderSession(Sender send, Renderer renderer)
    : send_(std::move(send))
    , render_(std::move(renderer))
{
}

void RenderSession::handle_message(const std::string& text) {
    const ClientMessage msg = decode_client_message(text);
    switch (msg.type) {
    case MessageType::Source:
        submit(msg.payload);
        break;
    case MessageType::Ping:
        send_(encode_pong());
        break;
    case MessageType::Unknown: {
        const std::string message = "Unknown message type: " + msg.type_name;
        scene_model::pipeline_logger()->warn("session: {}", message);
        send_(encode_error_response(message, { transport_error(ErrorCode::TransportInvalidMessage, message) }));
        break;
    }
    case MessageType::InvalidPayload: {
        const std::string message = "Source payload must be a string";
        scene_model::pipeline_logger()->warn("session: {}", message);
        send_(encode_error_response(message, { transport_error(ErrorCode::TransportInvalidPayload, message) }));
        break;
    }
    }
}

std::string RenderSession::process(const std::string& source) {
    try {
        const scene_render::RenderResult result = render_(source);
        return encode_render_response(result.document, result.errors);
    } catch (const std::exception& ex) {
        scene_model::pipeline_logger()->error("session: render failed: {}", ex.what());
        const std::string message = std::string("Render failed: ") + ex.what();
        return encode_error_response(message, { transport_error(ErrorCode::RenderFailed, message) });
    }
}

void RenderSession::release() {
    std::lock_guard<std::mutex> lock(mutex_);
    in_flight_ = false;
    pending_.reset();
}

void RenderSession::submit(std::string source) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (in_flight_) {
            if (pending_) ++superseded_;
            pending_ = std::move(source);
            scene_model::pipeline_logger()->debug("session: render in flight, source parked");
            return;
        }
        in_flight_ = true;
    }

    InFlightGuard guard([this] { release(); });
    std::string current = std::move(source);
    while (true) {
        send_(process(current));

        std::lock_guard<std::mutex> lock(mutex_);
        ++renders_completed_;
        if (!pending_) {
            in_flight_ = false;
            guard.dismiss();
            return;
        }
        current = std::move(*pending_);
        pending_.reset();
    }
}

std::size_t RenderSession::renders_completed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return renders_completed_;
}

std::size_t RenderSession::superseded() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return superseded_;
}

} // namespace transport
