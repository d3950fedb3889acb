#include <scene_placement/edge_anchors.hpp>
#include <scene_placement/graph_placer.hpp>
#include <algorithm>
#include <cmath>
#include <unordered_map>

namespace scene_placement {

scene_model::EdgeAnchors edge_anchors(const Rect& from, const Rect& to) {
    const double dx = to.cx() - from.cx();
    const double dy = to.cy() - from.cy();

    scene_model::EdgeAnchors a;
    if (std::abs(dy) > std::abs(dx)) {
        a.vertical = true;
        if (dy > 0) {
            a.from = { from.cx(), from.bottom() };
            a.to = { to.cx(), to.top() };
        } else {
            a.from = { from.cx(), from.top() };
            a.to = { to.cx(), to.bottom() };
        }
    } else {
        a.vertical = false;
        if (dx >= 0) {
            a.from = { from.right(), from.cy() };
            a.to = { to.left(), to.cy() };
        } else {
            a.from = { from.left(), from.cy() };
            a.to = { to.right(), to.cy() };
        }
    }
    return a;
}

std::size_t route_graph_edges(scene_model::GraphProps& graph) {
    std::unordered_map<std::string, Rect> rects;
    for (const auto& node : graph.nodes) rects.emplace(node.id, node_rect(node));

    const std::size_t before = graph.edges.size();
    graph.edges.erase(std::remove_if(graph.edges.begin(), graph.edges.end(),
        [&rects](const scene_model::GraphEdge& e) {
            return rects.find(e.from) == rects.end() || rects.find(e.to) == rects.end();
        }), graph.edges.end());

    for (auto& edge : graph.edges) {
        edge.anchors = edge_anchors(rects.at(edge.from), rects.at(edge.to));
    }
    return before - graph.edges.size();
}

} // namespace scene_placement
