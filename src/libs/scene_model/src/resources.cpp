#include <scene_model/resources.hpp>

namespace scene_model {

std::string ResourceRegistry::next_id() {
    return "d" + std::to_string(++counter_);
}

std::string ResourceRegistry::register_gradient(const GradientDef& gradient) {
    std::string id = next_id();
    entries_.push_back({ id, gradient });
    return id;
}

std::string ResourceRegistry::register_shadow(const ShadowDef& shadow) {
    std::string id = next_id();
    entries_.push_back({ id, shadow });
    return id;
}

} // namespace scene_model
