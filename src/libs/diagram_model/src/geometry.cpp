#include <diagram_model/geometry.hpp>
#include <algorithm>
#include <cmath>

namespace diagram_model {

const std::string* find_attribute(const AttributeList& attributes, const std::string& name) {
    for (const auto& a : attributes)
        if (a.name == name) return &a.value;
    return nullptr;
}

Rect union_rect(const Rect& a, const Rect& b) {
    const double left = std::min(a.x, b.x);
    const double top = std::min(a.y, b.y);
    const double right = std::max(a.x + a.width, b.x + b.width);
    const double bottom = std::max(a.y + a.height, b.y + b.height);
    return Rect{ left, top, right - left, bottom - top };
}

void Geometry::translate(double dx, double dy) {
    if (!relative) {
        x += dx;
        y += dy;
    }
    for (auto& p : points) {
        p.x += dx;
        p.y += dy;
    }
    if (source_point) {
        source_point->x += dx;
        source_point->y += dy;
    }
    if (target_point) {
        target_point->x += dx;
        target_point->y += dy;
    }
}

bool is_valid_size(double width, double height) {
    return std::isfinite(width) && std::isfinite(height) && width >= 0 && height >= 0;
}

bool is_finite_point(double x, double y) {
    return std::isfinite(x) && std::isfinite(y);
}

} // namespace diagram_model
