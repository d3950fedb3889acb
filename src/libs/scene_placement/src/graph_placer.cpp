#include <scene_placement/graph_placer.hpp>
#include <scene_placement/layout_constants.hpp>
#include <algorithm>
#include <cmath>

namespace scene_placement {

using namespace scene_model;

Extent node_extent(const GraphNode& node) {
    if (node.size) return { node.size->x, node.size->y };
    return { layout::default_node_width, layout::default_node_height };
}

Rect node_rect(const GraphNode& node) {
    return Rect::centered(node.at.value_or(Point{}), node_extent(node));
}

namespace {

Extent largest_extent(const std::vector<GraphNode>& nodes) {
    Extent out;
    for (const auto& n : nodes) {
        const Extent e = node_extent(n);
        out.width = std::max(out.width, e.width);
        out.height = std::max(out.height, e.height);
    }
    return out;
}

void place_hierarchical(GraphProps& graph) {
    const Extent largest = largest_extent(graph.nodes);
    const bool vertical = graph.direction == Direction::Vertical;
    const double cross_center = graph.spacing + (vertical ? largest.width : largest.height) * 0.5;

    double cursor = graph.spacing;
    for (auto& node : graph.nodes) {
        const Extent e = node_extent(node);
        const double primary = vertical ? e.height : e.width;
        const double center = cursor + primary * 0.5;
        node.at = vertical ? Point{ cross_center, center } : Point{ center, cross_center };
        cursor += primary + graph.spacing;
    }
}

void place_grid(GraphProps& graph) {
    if (graph.nodes.empty()) return;
    const Extent largest = largest_extent(graph.nodes);
    const auto columns = static_cast<std::size_t>(std::ceil(std::sqrt(static_cast<double>(graph.nodes.size()))));
    const double cell_w = largest.width + graph.spacing;
    const double cell_h = largest.height + graph.spacing;

    for (std::size_t i = 0; i < graph.nodes.size(); ++i) {
        const double col = static_cast<double>(i % columns);
        const double row = static_cast<double>(i / columns);
        graph.nodes[i].at = Point{
            graph.spacing + col * cell_w + largest.width * 0.5,
            graph.spacing + row * cell_h + largest.height * 0.5 };
    }
}

} // namespace

void place_graph_nodes(GraphProps& graph) {
    switch (graph.layout) {
    case GraphLayout::Hierarchical:
        place_hierarchical(graph);
        break;
    case GraphLayout::Grid:
        place_grid(graph);
        break;
    case GraphLayout::Manual:
        for (auto& node : graph.nodes) {
            if (!node.at) node.at = Point{};
        }
        break;
    }
}

} // namespace scene_placement
