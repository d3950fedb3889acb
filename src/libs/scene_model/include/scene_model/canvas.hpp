#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace scene_model {

enum class CanvasSize {
    Nano,
    Micro,
    Tiny,
    Small,
    Medium,
    Large,
    XLarge,
    Huge,
    Massive,
    Giant
};

struct Canvas {
    CanvasSize size = CanvasSize::Medium;
    std::string fill = "#fff";
};

int canvas_pixels(CanvasSize size);
const char* canvas_size_name(CanvasSize size);

// Case-insensitive tier lookup ("giant", "XLarge").
std::optional<CanvasSize> parse_canvas_size(std::string_view name);

} // namespace scene_model
