#include <scene_render/svg_escape.hpp>

namespace scene_render {

namespace {

std::string escape(std::string_view text, bool quotes) {
    std::string out;
    out.reserve(text.size());
    for (char c : text) {
        switch (c) {
        case '&': out += "&amp;"; break;
        case '<': out += "&lt;"; break;
        case '>': out += "&gt;"; break;
        case '"':
            if (quotes) out += "&quot;";
            else out += c;
            break;
        default: out += c; break;
        }
    }
    return out;
}

} // namespace

std::string escape_text(std::string_view text) {
    return escape(text, false);
}

std::string escape_attribute(std::string_view text) {
    return escape(text, true);
}

} // namespace scene_render
