#pragma once

#include <optional>
#include <string>
#include <vector>

namespace diagram_model {

// Attribute kept verbatim for output even though nothing interprets it.
struct Attribute {
    std::string name;
    std::string value;

    bool operator==(const Attribute&) const = default;
};

using AttributeList = std::vector<Attribute>;

const std::string* find_attribute(const AttributeList& attributes, const std::string& name);

struct Point {
    double x = 0;
    double y = 0;

    bool operator==(const Point&) const = default;
};

struct Rect {
    double x = 0;
    double y = 0;
    double width = 0;
    double height = 0;

    double center_x() const { return x + width * 0.5; }
    double center_y() const { return y + height * 0.5; }

    bool operator==(const Rect&) const = default;
};

Rect union_rect(const Rect& a, const Rect& b);

struct Geometry {
    double x = 0;
    double y = 0;
    double width = 0;
    double height = 0;
    bool relative = false;
    std::vector<Point> points;           // connector waypoints, in order
    std::optional<Point> source_point;   // floating source end
    std::optional<Point> target_point;   // floating target end
    std::optional<Point> offset;
    AttributeList extra_attributes;
    std::vector<std::string> extra_children; // serialized unknown child nodes
    bool present = true;                 // false when the cell had no geometry node

    Rect bounds() const { return Rect{ x, y, width, height }; }
    void translate(double dx, double dy);

    bool operator==(const Geometry&) const = default;
};

bool is_valid_size(double width, double height);
bool is_finite_point(double x, double y);

} // namespace diagram_model
