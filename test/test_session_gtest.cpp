#include <gtest/gtest.h>
#include <transport/message_codec.hpp>
#include <transport/render_session.hpp>
#include <nlohmann/json.hpp>
#include <condition_variable>
#include <future>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

using namespace transport;

class SessionTest : public ::testing::Test {
protected:
    std::mutex sent_mutex;
    std::vector<std::string> sent;

    RenderSession::Sender recorder() {
        return [this](const std::string& message) {
            std::lock_guard<std::mutex> lock(sent_mutex);
            sent.push_back(message);
        };
    }

    // Echoes the source back as the document.
    static scene_render::RenderResult echo(const std::string& source) {
        scene_render::RenderResult result;
        result.document = "<svg>" + source + "</svg>";
        return result;
    }

    nlohmann::json last() {
        std::lock_guard<std::mutex> lock(sent_mutex);
        return nlohmann::json::parse(sent.back());
    }
};

TEST_F(SessionTest, DecodeRecognizesMessageShapes) {
    EXPECT_EQ(decode_client_message(R"({"type":"ping"})").type, MessageType::Ping);

    auto source = decode_client_message(R"({"type":"source","payload":"rect"})");
    EXPECT_EQ(source.type, MessageType::Source);
    EXPECT_EQ(source.payload, "rect");

    EXPECT_EQ(decode_client_message(R"({"type":"source","payload":42})").type, MessageType::InvalidPayload);
    EXPECT_EQ(decode_client_message(R"({"type":"source"})").type, MessageType::InvalidPayload);

    auto unknown = decode_client_message(R"({"type":"subscribe"})");
    EXPECT_EQ(unknown.type, MessageType::Unknown);
    EXPECT_EQ(unknown.type_name, "subscribe");
}

TEST_F(SessionTest, NonObjectTextIsRawSource) {
    auto raw = decode_client_message("canvas giant\nrect");
    EXPECT_EQ(raw.type, MessageType::Source);
    EXPECT_EQ(raw.payload, "canvas giant\nrect");

    auto number = decode_client_message("42");
    EXPECT_EQ(number.type, MessageType::Source);
    EXPECT_EQ(number.payload, "42");
}

TEST_F(SessionTest, EncodedResponses) {
    scene_model::ErrorInfo e;
    e.code = scene_model::ErrorCode::ParseUnknownCommand;
    e.message = "Unknown command 'x'";
    e.line = 1;
    e.column = 1;

    const auto render = nlohmann::json::parse(encode_render_response("<svg/>", { e }));
    EXPECT_EQ(render["type"], "render");
    EXPECT_EQ(render["output"], "<svg/>");
    ASSERT_EQ(render["errors"].size(), 1u);
    EXPECT_EQ(render["errors"][0]["code"], 2004);

    const auto error = nlohmann::json::parse(encode_error_response("boom", {}));
    EXPECT_EQ(error["type"], "error");
    EXPECT_EQ(error["message"], "boom");
    EXPECT_TRUE(error["errors"].empty());

    EXPECT_EQ(nlohmann::json::parse(encode_pong())["type"], "pong");
}

TEST_F(SessionTest, InvalidUtf8IsReplacedNotThrown) {
    std::string response;
    EXPECT_NO_THROW(response = encode_render_response("bad \xff byte", {}));
    EXPECT_NO_THROW(static_cast<void>(nlohmann::json::parse(response)));
}

TEST_F(SessionTest, PingAndUnknownMessages) {
    RenderSession session(recorder(), echo);
    session.handle_message(R"({"type":"ping"})");
    EXPECT_EQ(last()["type"], "pong");

    session.handle_message(R"({"type":"subscribe"})");
    auto unknown = last();
    EXPECT_EQ(unknown["type"], "error");
    EXPECT_EQ(unknown["errors"][0]["code"], 4001);

    session.handle_message(R"({"type":"source","payload":[1]})");
    EXPECT_EQ(last()["errors"][0]["code"], 4002);
    EXPECT_EQ(session.renders_completed(), 0u);
}

TEST_F(SessionTest, SourceMessageRendersThroughPipeline) {
    RenderSession session(recorder());
    session.handle_message(R"({"type":"source","payload":"canvas giant fill #1a1a2e"})");
    auto response = last();
    EXPECT_EQ(response["type"], "render");
    const std::string output = response["output"];
    EXPECT_NE(output.find("width=\"512\""), std::string::npos);
    EXPECT_TRUE(response["errors"].empty());
    EXPECT_EQ(session.renders_completed(), 1u);
}

TEST_F(SessionTest, RawTextRendersWithErrors) {
    RenderSession session(recorder());
    session.handle_message("unknown_shape at 50,50");
    auto response = last();
    EXPECT_EQ(response["type"], "render");
    ASSERT_EQ(response["errors"].size(), 1u);
    EXPECT_EQ(response["errors"][0]["category"], "parser");
}

TEST_F(SessionTest, RendererExceptionBecomesErrorResponse) {
    RenderSession session(recorder(), [](const std::string&) -> scene_render::RenderResult {
        throw std::runtime_error("out of paper");
    });
    session.submit("rect");
    auto response = last();
    EXPECT_EQ(response["type"], "error");
    EXPECT_EQ(response["message"], "Render failed: out of paper");
    EXPECT_EQ(response["errors"][0]["code"], 5002);

    session.submit("rect");
    EXPECT_EQ(session.renders_completed(), 2u) << "the session stays usable";
}

TEST_F(SessionTest, SourcesArrivingDuringRenderCoalesce) {
    std::mutex gate_mutex;
    std::condition_variable gate;
    bool released = false;
    std::promise<void> first_send_started;
    bool first = true;

    RenderSession::Sender blocking = [&](const std::string& message) {
        bool wait = false;
        {
            std::lock_guard<std::mutex> lock(sent_mutex);
            sent.push_back(message);
            wait = first;
            first = false;
        }
        if (!wait) return;
        first_send_started.set_value();
        std::unique_lock<std::mutex> lock(gate_mutex);
        gate.wait(lock, [&] { return released; });
    };

    RenderSession session(blocking, echo);
    std::thread worker([&] { session.submit("a"); });

    first_send_started.get_future().wait();
    session.submit("b");
    session.submit("c");
    EXPECT_EQ(session.superseded(), 1u);

    {
        std::lock_guard<std::mutex> lock(gate_mutex);
        released = true;
    }
    gate.notify_all();
    worker.join();

    ASSERT_EQ(sent.size(), 2u);
    EXPECT_EQ(nlohmann::json::parse(sent[0])["output"], "<svg>a</svg>");
    EXPECT_EQ(nlohmann::json::parse(sent[1])["output"], "<svg>c</svg>") << "the latest source wins";
    EXPECT_EQ(session.renders_completed(), 2u);
    EXPECT_EQ(session.superseded(), 1u);
}

TEST_F(SessionTest, SequentialSubmitsAllRender) {
    RenderSession session(recorder(), echo);
    session.submit("a");
    session.submit("b");
    session.submit("c");
    EXPECT_EQ(sent.size(), 3u);
    EXPECT_EQ(session.renders_completed(), 3u);
    EXPECT_EQ(session.superseded(), 0u);
}
