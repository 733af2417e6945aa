#pragma once

#include <diagram_model/geometry.hpp>
#include <diagram_style/style.hpp>
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace diagram_model {

enum class ElementKind { Shape, Connector, Group };

const char* to_string(ElementKind kind);

struct ShapeData {
    std::string shape_type = "rectangle"; // derived from the style

    bool operator==(const ShapeData&) const = default;
};

enum class EndpointSide { Source, Target };

struct ConnectorData {
    std::optional<std::string> source_id;
    std::optional<std::string> target_id;
    // A dangling end keeps its id although nothing in the page carries it.
    bool source_dangling = false;
    bool target_dangling = false;
    std::string routing; // edgeStyle, empty for straight

    const std::optional<std::string>& endpoint(EndpointSide side) const {
        return side == EndpointSide::Source ? source_id : target_id;
    }
    std::optional<std::string>& endpoint(EndpointSide side) {
        return side == EndpointSide::Source ? source_id : target_id;
    }
    bool& dangling(EndpointSide side) {
        return side == EndpointSide::Source ? source_dangling : target_dangling;
    }
    bool dangling(EndpointSide side) const {
        return side == EndpointSide::Source ? source_dangling : target_dangling;
    }

    bool operator==(const ConnectorData&) const = default;
};

struct GroupData {
    std::vector<std::string> child_ids;

    bool operator==(const GroupData&) const = default;
};

// UserObject / object node wrapping a cell; it carries the id and label.
struct CellWrapper {
    std::string tag = "UserObject";
    AttributeList attributes; // everything except id and label
    std::vector<std::string> extra_children; // children other than the mxCell

    bool operator==(const CellWrapper&) const = default;
};

struct Element {
    std::string id;
    std::string parent_id; // layer, group or container cell; weak
    std::string label;
    Geometry geometry;
    diagram_style::StyleRecord style;
    std::size_t z_order = 0;
    bool visible = true;
    AttributeList extra_attributes;
    std::vector<std::string> extra_children;
    std::optional<CellWrapper> wrapper;
    std::variant<ShapeData, ConnectorData, GroupData> payload;

    ElementKind kind() const;
    bool is_shape() const { return std::holds_alternative<ShapeData>(payload); }
    bool is_connector() const { return std::holds_alternative<ConnectorData>(payload); }
    bool is_group() const { return std::holds_alternative<GroupData>(payload); }

    ShapeData* shape() { return std::get_if<ShapeData>(&payload); }
    const ShapeData* shape() const { return std::get_if<ShapeData>(&payload); }
    ConnectorData* connector() { return std::get_if<ConnectorData>(&payload); }
    const ConnectorData* connector() const { return std::get_if<ConnectorData>(&payload); }
    GroupData* group() { return std::get_if<GroupData>(&payload); }
    const GroupData* group() const { return std::get_if<GroupData>(&payload); }

    bool locked() const;

    bool operator==(const Element&) const = default;
};

Element make_shape(std::string id, std::string label, const Rect& bounds,
    std::string_view style = {}, std::string parent_id = {});
Element make_connector(std::string id, std::optional<std::string> source_id,
    std::optional<std::string> target_id, std::string_view style = {}, std::string parent_id = {});
Element make_group(std::string id, std::string parent_id = {});

// Keeps derived payload fields (shape type, routing) in step with the style.
void refresh_derived_fields(Element& element);
std::string shape_type_from_style(const diagram_style::StyleRecord& style);
// The "group" style token marks a group even while it has no members.
bool is_group_style(const diagram_style::StyleRecord& style);

// Root cell (no parent) and layer cells of a page.
struct LayerCell {
    std::string id;
    std::optional<std::string> parent_id;
    AttributeList attributes; // value, style and anything else, verbatim
    std::vector<std::string> extra_children;
    std::optional<CellWrapper> wrapper; // custom layer properties; attributes keep the label

    bool operator==(const LayerCell&) const = default;
};

struct PageSettings {
    bool grid_enabled = true;
    double grid_size = 10;
    std::string background;
    AttributeList extra_attributes; // dx, dy, pageWidth, ... in source order

    bool operator==(const PageSettings&) const = default;
};

// How the page was stored; not part of the page's content.
struct PageEncoding {
    bool compressed = false;
    bool uri_encoded = false;
};

struct Page {
    std::string id;
    std::string name;
    PageSettings settings;
    std::vector<LayerCell> layers;
    std::vector<Element> elements; // z-order, back to front
    AttributeList extra_attributes;
    std::vector<std::string> extra_children;        // unknown children of the page node
    std::vector<std::string> extra_model_children;  // unknown children of the graph model node
    std::vector<std::string> extra_root_children;   // non-cell children of the root node
    AttributeList root_attributes;                  // attributes of the root node
    PageEncoding encoding;

    Element* find(const std::string& element_id);
    const Element* find(const std::string& element_id) const;
    std::optional<std::size_t> index_of(const std::string& element_id) const;
    const LayerCell* find_layer(const std::string& cell_id) const;
    bool contains_cell(const std::string& cell_id) const;
    // First layer below the root cell; the parent of new top-level elements.
    std::string default_parent() const;
    // Sets z_order to the element's position and relists group members in z-order.
    // A group left without members and without the group style token turns into a
    // shape; a shape given the token turns into a group.
    void renumber();

    bool operator==(const Page& other) const;
};

// New page with draw.io's root cell "0" and default layer "1".
Page make_page(std::string id, std::string name);

struct Document {
    std::string id;
    std::string name;
    std::string version;
    AttributeList extra_attributes;
    std::vector<std::string> extra_children;
    std::vector<Page> pages;
    // Single page stored as a bare mxGraphModel. A storage detail like PageEncoding,
    // so equality ignores it.
    bool bare_graph_model = false;
    bool xml_declaration = false;

    Page* find_page(const std::string& page_id);
    const Page* find_page(const std::string& page_id) const;
    std::optional<std::size_t> page_index(const std::string& page_id) const;

    bool operator==(const Document& other) const;
};

} // namespace diagram_model
