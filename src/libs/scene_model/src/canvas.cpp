#include <scene_model/canvas.hpp>
#include <array>
#include <cctype>

namespace scene_model {

namespace {

struct Tier {
    CanvasSize size;
    const char* name;
    int pixels;
};

constexpr std::array<Tier, 10> tiers = {{
    { CanvasSize::Nano, "nano", 16 },
    { CanvasSize::Micro, "micro", 24 },
    { CanvasSize::Tiny, "tiny", 32 },
    { CanvasSize::Small, "small", 48 },
    { CanvasSize::Medium, "medium", 64 },
    { CanvasSize::Large, "large", 96 },
    { CanvasSize::XLarge, "xlarge", 128 },
    { CanvasSize::Huge, "huge", 192 },
    { CanvasSize::Massive, "massive", 256 },
    { CanvasSize::Giant, "giant", 512 },
}};

bool equals_ignore_case(std::string_view a, std::string_view b) {
    if (a.size() != b.size()) return false;
    for (std::size_t i = 0; i < a.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(a[i])) != std::tolower(static_cast<unsigned char>(b[i])))
            return false;
    }
    return true;
}

} // namespace

int canvas_pixels(CanvasSize size) {
    for (const auto& t : tiers) {
        if (t.size == size) return t.pixels;
    }
    return 64;
}

const char* canvas_size_name(CanvasSize size) {
    for (const auto& t : tiers) {
        if (t.size == size) return t.name;
    }
    return "medium";
}

std::optional<CanvasSize> parse_canvas_size(std::string_view name) {
    for (const auto& t : tiers) {
        if (equals_ignore_case(name, t.name)) return t.size;
    }
    return std::nullopt;
}

} // namespace scene_model
