#include <diagram_model/types.hpp>
#include <algorithm>
#include <array>
#include <unordered_map>

namespace diagram_model {

namespace {

// Bare style tokens that select a shape in draw.io styles.
constexpr std::array<const char*, 12> shape_flags = {
    "ellipse", "rhombus", "triangle", "swimlane", "text", "image", "label",
    "line", "cylinder", "hexagon", "cloud", "doubleEllipse",
};

} // namespace

const char* to_string(ElementKind kind) {
    switch (kind) {
    case ElementKind::Shape: return "shape";
    case ElementKind::Connector: return "connector";
    case ElementKind::Group: return "group";
    }
    return "unknown";
}

ElementKind Element::kind() const {
    if (is_connector()) return ElementKind::Connector;
    if (is_group()) return ElementKind::Group;
    return ElementKind::Shape;
}

bool Element::locked() const {
    return style.get_bool("locked").value_or(false);
}

std::string shape_type_from_style(const diagram_style::StyleRecord& style) {
    if (auto shape = style.get("shape"); shape && !shape->empty())
        return *shape;
    for (const auto& e : style.entries()) {
        if (e.has_value) continue;
        for (const char* flag : shape_flags)
            if (e.key == flag) return e.key;
    }
    return "rectangle";
}

void refresh_derived_fields(Element& element) {
    if (auto* s = element.shape()) {
        s->shape_type = shape_type_from_style(element.style);
    } else if (auto* c = element.connector()) {
        c->routing = element.style.get("edgeStyle").value_or("");
    }
}

bool is_group_style(const diagram_style::StyleRecord& style) {
    return style.contains("group");
}

Element make_shape(std::string id, std::string label, const Rect& bounds,
    std::string_view style, std::string parent_id)
{
    Element e;
    e.id = std::move(id);
    e.label = std::move(label);
    e.parent_id = std::move(parent_id);
    e.geometry.x = bounds.x;
    e.geometry.y = bounds.y;
    e.geometry.width = bounds.width;
    e.geometry.height = bounds.height;
    e.style = diagram_style::parse_style(style).record;
    e.payload = ShapeData{};
    refresh_derived_fields(e);
    return e;
}

Element make_connector(std::string id, std::optional<std::string> source_id,
    std::optional<std::string> target_id, std::string_view style, std::string parent_id)
{
    Element e;
    e.id = std::move(id);
    e.parent_id = std::move(parent_id);
    e.geometry.relative = true;
    e.style = diagram_style::parse_style(style).record;
    ConnectorData data;
    data.source_id = std::move(source_id);
    data.target_id = std::move(target_id);
    e.payload = std::move(data);
    refresh_derived_fields(e);
    return e;
}

Element make_group(std::string id, std::string parent_id) {
    Element e;
    e.id = std::move(id);
    e.parent_id = std::move(parent_id);
    e.style = diagram_style::parse_style("group").record;
    e.payload = GroupData{};
    return e;
}

Element* Page::find(const std::string& element_id) {
    for (auto& e : elements)
        if (e.id == element_id) return &e;
    return nullptr;
}

const Element* Page::find(const std::string& element_id) const {
    for (const auto& e : elements)
        if (e.id == element_id) return &e;
    return nullptr;
}

std::optional<std::size_t> Page::index_of(const std::string& element_id) const {
    for (std::size_t i = 0; i < elements.size(); ++i)
        if (elements[i].id == element_id) return i;
    return std::nullopt;
}

const LayerCell* Page::find_layer(const std::string& cell_id) const {
    for (const auto& l : layers)
        if (l.id == cell_id) return &l;
    return nullptr;
}

bool Page::contains_cell(const std::string& cell_id) const {
    return find_layer(cell_id) != nullptr || find(cell_id) != nullptr;
}

std::string Page::default_parent() const {
    for (const auto& l : layers)
        if (l.parent_id) return l.id;
    return layers.empty() ? std::string() : layers.front().id;
}

void Page::renumber() {
    std::unordered_map<std::string, std::size_t> groups;
    for (std::size_t i = 0; i < elements.size(); ++i) {
        elements[i].z_order = i;
        if (GroupData* g = elements[i].group()) {
            g->child_ids.clear();
            groups.emplace(elements[i].id, i);
        }
    }
    for (const auto& e : elements) {
        auto it = groups.find(e.parent_id);
        if (it != groups.end()) elements[it->second].group()->child_ids.push_back(e.id);
    }
    // Only the group style token or members make a group.
    for (auto& e : elements) {
        if (const GroupData* g = e.group(); g && g->child_ids.empty() && !is_group_style(e.style)) {
            e.payload = ShapeData{};
            refresh_derived_fields(e);
        } else if (e.is_shape() && is_group_style(e.style)) {
            e.payload = GroupData{};
        }
    }
}

bool Page::operator==(const Page& other) const {
    return id == other.id && name == other.name && settings == other.settings
        && layers == other.layers && elements == other.elements
        && extra_attributes == other.extra_attributes
        && extra_children == other.extra_children
        && extra_model_children == other.extra_model_children
        && extra_root_children == other.extra_root_children
        && root_attributes == other.root_attributes;
}

bool Document::operator==(const Document& other) const {
    return id == other.id && name == other.name && version == other.version
        && extra_attributes == other.extra_attributes && extra_children == other.extra_children
        && pages == other.pages && xml_declaration == other.xml_declaration;
}

Page make_page(std::string id, std::string name) {
    Page page;
    page.id = std::move(id);
    page.name = std::move(name);
    page.layers.push_back(LayerCell{ "0", std::nullopt, {}, {} });
    page.layers.push_back(LayerCell{ "1", std::string("0"), {}, {} });
    return page;
}

Page* Document::find_page(const std::string& page_id) {
    for (auto& p : pages)
        if (p.id == page_id) return &p;
    return nullptr;
}

const Page* Document::find_page(const std::string& page_id) const {
    for (const auto& p : pages)
        if (p.id == page_id) return &p;
    return nullptr;
}

std::optional<std::size_t> Document::page_index(const std::string& page_id) const {
    for (std::size_t i = 0; i < pages.size(); ++i)
        if (pages[i].id == page_id) return i;
    return std::nullopt;
}

} // namespace diagram_model
