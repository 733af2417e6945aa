#include <diagram_model/invariants.hpp>
#include <algorithm>
#include <unordered_set>

namespace diagram_model {

namespace {

Status violation(const Page& page, const std::string& message) {
    return make_error(ErrorCode::InvariantViolation, message, "page '" + page.id + "'");
}

// Parent of any cell, layers included; nullopt for the root cell or unknown ids.
std::optional<std::string> parent_of(const Page& page, const std::string& cell_id) {
    if (const Element* e = page.find(cell_id)) return e->parent_id;
    if (const LayerCell* l = page.find_layer(cell_id)) return l->parent_id;
    return std::nullopt;
}

} // namespace

Status check_page_invariants(const Page& page) {
    std::unordered_set<std::string> ids;
    for (const auto& layer : page.layers) {
        if (layer.id.empty()) return violation(page, "layer cell without id");
        if (!ids.insert(layer.id).second) return violation(page, "duplicate cell id '" + layer.id + "'");
    }
    for (const auto& e : page.elements) {
        if (e.id.empty()) return violation(page, "element without id");
        if (!ids.insert(e.id).second) return violation(page, "duplicate cell id '" + e.id + "'");
    }
    for (const auto& layer : page.layers) {
        if (layer.parent_id && !page.find_layer(*layer.parent_id))
            return violation(page, "layer '" + layer.id + "' has unknown parent '" + *layer.parent_id + "'");
    }

    for (std::size_t i = 0; i < page.elements.size(); ++i) {
        const Element& e = page.elements[i];
        if (e.z_order != i)
            return violation(page, "z-order of '" + e.id + "' is not its position");
        if (!page.contains_cell(e.parent_id))
            return violation(page, "element '" + e.id + "' has unknown parent '" + e.parent_id + "'");

        if (const Element* parent = page.find(e.parent_id); parent && parent->is_shape())
            return violation(page, "shape '" + parent->id + "' contains '" + e.id + "'");
        if (const GroupData* g = e.group(); g && g->child_ids.empty() && !is_group_style(e.style))
            return violation(page, "group '" + e.id + "' has no members and no group style");
        if (e.is_shape() && is_group_style(e.style))
            return violation(page, "shape '" + e.id + "' carries the group style");
        if (const Element* parent = page.find(e.parent_id); parent && parent->is_group()) {
            const auto& children = parent->group()->child_ids;
            if (std::count(children.begin(), children.end(), e.id) != 1)
                return violation(page, "element '" + e.id + "' missing from group '" + parent->id + "'");
        }
        if (const GroupData* g = e.group()) {
            std::unordered_set<std::string> seen;
            for (const auto& child_id : g->child_ids) {
                const Element* child = page.find(child_id);
                if (!child || child->parent_id != e.id)
                    return violation(page, "group '" + e.id + "' lists '" + child_id + "' which is not its child");
                if (!seen.insert(child_id).second)
                    return violation(page, "group '" + e.id + "' lists '" + child_id + "' twice");
            }
        }
        if (const ConnectorData* c = e.connector()) {
            for (EndpointSide side : { EndpointSide::Source, EndpointSide::Target }) {
                const auto& ref = c->endpoint(side);
                if (!ref) {
                    if (c->dangling(side)) return violation(page, "connector '" + e.id + "' flags a missing end as dangling");
                    continue;
                }
                if (c->dangling(side)) continue;
                if (!page.find(*ref))
                    return violation(page, "connector '" + e.id + "' references unknown element '" + *ref + "'");
            }
        }
    }

    // Every parent chain must reach a layer within as many steps as there are cells.
    const std::size_t limit = page.elements.size() + page.layers.size() + 1;
    for (const auto& e : page.elements) {
        std::string current = e.parent_id;
        std::size_t steps = 0;
        while (page.find(current)) {
            if (current == e.id || ++steps > limit)
                return violation(page, "containment cycle through '" + e.id + "'");
            current = page.find(current)->parent_id;
        }
    }
    return Status::success();
}

Status check_document_invariants(const Document& document) {
    std::unordered_set<std::string> ids;
    for (const auto& page : document.pages) {
        if (page.id.empty())
            return make_error(ErrorCode::InvariantViolation, "page without id");
        if (!ids.insert(page.id).second)
            return make_error(ErrorCode::InvariantViolation, "duplicate page id '" + page.id + "'");
        Status status = check_page_invariants(page);
        if (!status.ok()) return status;
    }
    return Status::success();
}

bool is_ancestor(const Page& page, const std::string& ancestor_id, const std::string& cell_id) {
    std::optional<std::string> current = parent_of(page, cell_id);
    std::size_t steps = 0;
    const std::size_t limit = page.elements.size() + page.layers.size() + 1;
    while (current && steps++ <= limit) {
        if (*current == ancestor_id) return true;
        current = parent_of(page, *current);
    }
    return false;
}

std::vector<std::string> descendants_of(const Page& page, const std::string& element_id) {
    std::vector<std::string> out;
    for (const auto& e : page.elements)
        if (e.id != element_id && is_ancestor(page, element_id, e.id))
            out.push_back(e.id);
    return out;
}

Point container_origin(const Page& page, const std::string& cell_id) {
    Point origin;
    std::string current = cell_id;
    std::size_t steps = 0;
    const std::size_t limit = page.elements.size() + 1;
    while (steps++ <= limit) {
        const Element* e = page.find(current);
        if (!e) break;
        if (!e->geometry.relative) {
            origin.x += e->geometry.x;
            origin.y += e->geometry.y;
        }
        current = e->parent_id;
    }
    return origin;
}

Rect absolute_bounds(const Page& page, const Element& element) {
    const Point origin = container_origin(page, element.parent_id);
    return Rect{ origin.x + element.geometry.x, origin.y + element.geometry.y,
        element.geometry.width, element.geometry.height };
}

} // namespace diagram_model
