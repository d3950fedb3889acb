#pragma once

#include <string>
#include <string_view>

namespace scene_render {

// Text content: & < >
std::string escape_text(std::string_view text);

// Attribute values: & < > "
std::string escape_attribute(std::string_view text);

} // namespace scene_render
