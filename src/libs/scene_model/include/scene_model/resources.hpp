#pragma once

#include <scene_model/ast.hpp>
#include <string>
#include <variant>
#include <vector>

namespace scene_model {

struct ResourceEntry {
    std::string id;
    std::variant<GradientDef, ShadowDef> definition;
};

// Append-only table of shared definitions. Ids are "d1", "d2", ... in
// registration order; a fresh registry restarts the numbering.
class ResourceRegistry {
public:
    std::string register_gradient(const GradientDef& gradient);
    std::string register_shadow(const ShadowDef& shadow);

    const std::vector<ResourceEntry>& entries() const { return entries_; }
    bool empty() const { return entries_.empty(); }
    std::size_t size() const { return entries_.size(); }

private:
    std::string next_id();

    std::vector<ResourceEntry> entries_;
    int counter_ = 0;
};

} // namespace scene_model
