#pragma once

#include <scene_model/types.hpp>

namespace scene_placement {

struct Extent {
    double width = 0;
    double height = 0;
};

struct Rect {
    double x = 0;
    double y = 0;
    double width = 0;
    double height = 0;

    double cx() const { return x + width * 0.5; }
    double cy() const { return y + height * 0.5; }
    double top() const { return y; }
    double bottom() const { return y + height; }
    double left() const { return x; }
    double right() const { return x + width; }

    static Rect centered(scene_model::Point center, Extent extent) {
        return { center.x - extent.width * 0.5, center.y - extent.height * 0.5, extent.width, extent.height };
    }
};

} // namespace scene_placement
