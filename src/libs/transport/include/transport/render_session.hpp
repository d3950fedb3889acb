#pragma once

#include <scene_render/svg_renderer.hpp>
#include <cstddef>
#include <functional>
#include <mutex>
#include <optional>
#include <string>

namespace transport {

// One client connection. At most one render runs at a time; a source that
// arrives meanwhile replaces any source still waiting, and the thread that
// owns the running render picks up the waiting one when it is done.
//
// The sender may be called from whichever thread submitted the render that
// is running, so it must be safe to call from several threads.
class RenderSession {
public:
    using Sender = std::function<void(const std::string&)>;
    using Renderer = std::function<scene_render::RenderResult(const std::string&)>;

    explicit RenderSession(Sender send);
    RenderSession(Sender send, Renderer renderer);

    // Decodes one client message and answers it.
    void handle_message(const std::string& text);

    // Renders now, or parks the source if a render is already running.
    void submit(std::string source);

    std::size_t renders_completed() const;
    std::size_t superseded() const;

private:
    std::string process(const std::string& source);
    void release();

    Sender send_;
    Renderer render_;

    mutable std::mutex mutex_;
    bool in_flight_ = false;
    std::optional<std::string> pending_;
    std::size_t renders_completed_ = 0;
    std::size_t superseded_ = 0;
};

} // namespace transport
