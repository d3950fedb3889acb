#pragma once

namespace scene_model {

struct Point {
    double x = 0;
    double y = 0;
};

inline bool operator==(const Point& a, const Point& b) {
    return a.x == b.x && a.y == b.y;
}

} // namespace scene_model
