#include <scene_render/svg_renderer.hpp>
#include "markup.hpp"
#include <spdlog/fmt/fmt.h>
#include <cmath>
#include <type_traits>
#include <variant>

namespace scene_render {

using scene_model::GradientDef;
using scene_model::ShadowDef;

namespace {

constexpr double pi = 3.14159265358979323846;

void write_stops(std::string& out, const GradientDef& g) {
    out += "<stop offset=\"0%\"";
    detail::append_attr(out, "stop-color", g.from);
    out += "/><stop offset=\"100%\"";
    detail::append_attr(out, "stop-color", g.to);
    out += "/>";
}

void write_gradient(std::string& out, const std::string& id, const GradientDef& g) {
    if (g.kind == scene_model::GradientKind::Radial) {
        out += "<radialGradient";
        detail::append_attr(out, "id", id);
        out += '>';
        write_stops(out, g);
        out += "</radialGradient>";
        return;
    }

    // 90 degrees runs left to right.
    const double rad = (g.angle - 90.0) * pi / 180.0;
    const double x2 = 50.0 + 50.0 * std::cos(rad);
    const double y2 = 50.0 + 50.0 * std::sin(rad);
    out += "<linearGradient";
    detail::append_attr(out, "id", id);
    out += fmt::format(" x1=\"0%\" y1=\"0%\" x2=\"{:.1f}%\" y2=\"{:.1f}%\">", x2, y2);
    write_stops(out, g);
    out += "</linearGradient>";
}

void write_shadow(std::string& out, const std::string& id, const ShadowDef& s) {
    out += "<filter";
    detail::append_attr(out, "id", id);
    out += " x=\"-50%\" y=\"-50%\" width=\"200%\" height=\"200%\"><feDropShadow";
    detail::append_attr(out, "dx", s.x);
    detail::append_attr(out, "dy", s.y);
    detail::append_attr(out, "stdDeviation", s.blur);
    detail::append_attr(out, "flood-color", s.color);
    out += "/></filter>";
}

} // namespace

std::string serialize_definitions(const scene_model::ResourceRegistry& resources, std::string_view symbols) {
    if (resources.empty() && symbols.empty()) return "";

    std::string out = "<defs>";
    for (const auto& entry : resources.entries()) {
        std::visit([&](const auto& def) {
            using T = std::decay_t<decltype(def)>;
            if constexpr (std::is_same_v<T, GradientDef>) write_gradient(out, entry.id, def);
            else write_shadow(out, entry.id, def);
        }, entry.definition);
    }
    out += symbols;
    out += "</defs>";
    return out;
}

} // namespace scene_render
