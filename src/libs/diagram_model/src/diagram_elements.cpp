#include <diagram_model/diagram.hpp>
#include <diagram_model/invariants.hpp>
#include <diagram_model/logging.hpp>
#include <algorithm>
#include <unordered_set>

namespace diagram_model {

namespace {

Status violation(const std::string& message, const std::string& page_id) {
    return make_error(ErrorCode::InvariantViolation, message, "page '" + page_id + "'");
}

Status find_element(Page& page, const std::string& element_id, Element*& out) {
    out = page.find(element_id);
    if (!out) return violation("unknown element '" + element_id + "'", page.id);
    return Status::success();
}

Status find_connector(Page& page, const std::string& connector_id, Element*& out) {
    if (Status s = find_element(page, connector_id, out); !s.ok()) return s;
    if (!out->is_connector()) return violation("'" + connector_id + "' is not a connector", page.id);
    return Status::success();
}

Status check_geometry(const Geometry& g, const std::string& page_id) {
    if (!is_finite_point(g.x, g.y) || !is_valid_size(g.width, g.height))
        return violation("geometry must be finite with non-negative size", page_id);
    for (const auto& p : g.points)
        if (!is_finite_point(p.x, p.y)) return violation("waypoint must be finite", page_id);
    return Status::success();
}

// Floats a connector end at the centre of where `removed` used to be.
void pin_endpoint(const Page& page, Element& connector, EndpointSide side, const Element* removed) {
    ConnectorData& data = *connector.connector();
    if (removed) {
        const Rect bounds = absolute_bounds(page, *removed);
        const Point origin = container_origin(page, connector.parent_id);
        const Point pinned{ bounds.center_x() - origin.x, bounds.center_y() - origin.y };
        if (side == EndpointSide::Source)
            connector.geometry.source_point = pinned;
        else
            connector.geometry.target_point = pinned;
    }
    data.endpoint(side).reset();
    data.dangling(side) = false;
}

} // namespace

Status Diagram::create_element(const std::string& page_id, Element element, std::optional<std::size_t> index) {
    if (Status s = check_mutable(); !s.ok()) return s;
    Page* p = nullptr;
    if (Status s = find_page(page_id, p); !s.ok()) return s;

    if (element.id.empty()) return violation("element id must not be empty", page_id);
    if (p->contains_cell(element.id)) return violation("id collision '" + element.id + "'", page_id);
    if (element.parent_id.empty()) element.parent_id = p->default_parent();
    if (element.parent_id.empty() || !p->contains_cell(element.parent_id))
        return violation("unknown parent '" + element.parent_id + "'", page_id);
    if (const Element* parent = p->find(element.parent_id); parent && parent->is_shape())
        return violation("shape '" + element.parent_id + "' cannot contain cells", page_id);
    if (const GroupData* g = element.group(); g && !g->child_ids.empty())
        return violation("a new group must be empty; use group_elements", page_id);
    if (Status s = check_geometry(element.geometry, page_id); !s.ok()) return s;
    if (ConnectorData* c = element.connector()) {
        for (EndpointSide side : { EndpointSide::Source, EndpointSide::Target }) {
            const auto& ref = c->endpoint(side);
            if (ref && (*ref == element.id || !p->find(*ref)))
                return violation("connector end '" + *ref + "' does not resolve", page_id);
            c->dangling(side) = false;
        }
    }
    const std::size_t at = index ? *index : p->elements.size();
    if (at > p->elements.size()) return violation("z-order index out of range", page_id);

    refresh_derived_fields(element);
    const std::string id = element.id;
    p->elements.insert(p->elements.begin() + static_cast<std::ptrdiff_t>(at), std::move(element));

    // An id that was dangling until now resolves to the new element.
    std::vector<std::string> affected{ id };
    for (auto& e : p->elements) {
        ConnectorData* c = e.connector();
        if (!c) continue;
        bool resolved = false;
        for (EndpointSide side : { EndpointSide::Source, EndpointSide::Target }) {
            if (c->dangling(side) && c->endpoint(side) == id) {
                c->dangling(side) = false;
                resolved = true;
            }
        }
        if (resolved) affected.push_back(e.id);
    }
    p->renumber();
    publish(ChangeKind::ElementCreated, page_id, std::move(affected));
    return Status::success();
}

Status Diagram::move_element(const std::string& page_id, const std::string& element_id, double x, double y) {
    if (Status s = check_mutable(); !s.ok()) return s;
    Page* p = nullptr;
    if (Status s = find_page(page_id, p); !s.ok()) return s;
    Element* e = nullptr;
    if (Status s = find_element(*p, element_id, e); !s.ok()) return s;
    if (e->is_connector())
        return violation("connector '" + element_id + "' has no position; set its waypoints", page_id);
    if (!is_finite_point(x, y)) return violation("position must be finite", page_id);

    Geometry& g = e->geometry;
    if (g.relative) {
        // Relative x/y is a position along the parent connector, not a point in the page.
        g.x = x;
        g.y = y;
    } else {
        g.translate(x - g.x, y - g.y);
    }
    publish(ChangeKind::ElementMoved, page_id, { element_id });
    return Status::success();
}

Status Diagram::resize_element(const std::string& page_id, const std::string& element_id, double width, double height) {
    if (Status s = check_mutable(); !s.ok()) return s;
    Page* p = nullptr;
    if (Status s = find_page(page_id, p); !s.ok()) return s;
    Element* e = nullptr;
    if (Status s = find_element(*p, element_id, e); !s.ok()) return s;
    if (e->is_connector()) return violation("connectors have no size", page_id);
    if (!is_valid_size(width, height)) return violation("size must be finite and non-negative", page_id);

    e->geometry.width = width;
    e->geometry.height = height;
    publish(ChangeKind::ElementResized, page_id, { element_id });
    return Status::success();
}

Status Diagram::restyle_element(const std::string& page_id, const std::string& element_id,
    diagram_style::StyleRecord style)
{
    if (Status s = check_mutable(); !s.ok()) return s;
    Page* p = nullptr;
    if (Status s = find_page(page_id, p); !s.ok()) return s;
    Element* e = nullptr;
    if (Status s = find_element(*p, element_id, e); !s.ok()) return s;

    e->style = std::move(style);
    refresh_derived_fields(*e);
    p->renumber();
    publish(ChangeKind::ElementRestyled, page_id, { element_id });
    return Status::success();
}

Status Diagram::set_label(const std::string& page_id, const std::string& element_id, std::string label) {
    if (Status s = check_mutable(); !s.ok()) return s;
    Page* p = nullptr;
    if (Status s = find_page(page_id, p); !s.ok()) return s;
    Element* e = nullptr;
    if (Status s = find_element(*p, element_id, e); !s.ok()) return s;

    e->label = std::move(label);
    publish(ChangeKind::ElementRelabeled, page_id, { element_id });
    return Status::success();
}

Status Diagram::set_visible(const std::string& page_id, const std::string& element_id, bool visible) {
    if (Status s = check_mutable(); !s.ok()) return s;
    Page* p = nullptr;
    if (Status s = find_page(page_id, p); !s.ok()) return s;
    Element* e = nullptr;
    if (Status s = find_element(*p, element_id, e); !s.ok()) return s;

    e->visible = visible;
    publish(ChangeKind::ElementVisibilityChanged, page_id, { element_id });
    return Status::success();
}

Status Diagram::set_waypoints(const std::string& page_id, const std::string& connector_id, std::vector<Point> points) {
    if (Status s = check_mutable(); !s.ok()) return s;
    Page* p = nullptr;
    if (Status s = find_page(page_id, p); !s.ok()) return s;
    Element* e = nullptr;
    if (Status s = find_connector(*p, connector_id, e); !s.ok()) return s;
    for (const auto& pt : points)
        if (!is_finite_point(pt.x, pt.y)) return violation("waypoint must be finite", page_id);

    e->geometry.points = std::move(points);
    publish(ChangeKind::ConnectorRerouted, page_id, { connector_id });
    return Status::success();
}

Status Diagram::set_endpoint(const std::string& page_id, const std::string& connector_id,
    EndpointSide side, const std::string& element_id)
{
    if (Status s = check_mutable(); !s.ok()) return s;
    Page* p = nullptr;
    if (Status s = find_page(page_id, p); !s.ok()) return s;
    Element* e = nullptr;
    if (Status s = find_connector(*p, connector_id, e); !s.ok()) return s;
    if (element_id == connector_id || !p->find(element_id))
        return violation("connector end '" + element_id + "' does not resolve", page_id);

    ConnectorData& data = *e->connector();
    data.endpoint(side) = element_id;
    data.dangling(side) = false;
    if (side == EndpointSide::Source)
        e->geometry.source_point.reset();
    else
        e->geometry.target_point.reset();
    publish(ChangeKind::EndpointConnected, page_id, { connector_id, element_id });
    return Status::success();
}

Status Diagram::disconnect(const std::string& page_id, const std::string& connector_id,
    std::optional<EndpointSide> side)
{
    if (Status s = check_mutable(); !s.ok()) return s;
    Page* p = nullptr;
    if (Status s = find_page(page_id, p); !s.ok()) return s;
    Element* e = nullptr;
    if (Status s = find_connector(*p, connector_id, e); !s.ok()) return s;

    std::vector<EndpointSide> sides;
    if (side)
        sides.push_back(*side);
    else
        sides = { EndpointSide::Source, EndpointSide::Target };
    for (EndpointSide s : sides) {
        const auto& ref = e->connector()->endpoint(s);
        if (!ref) continue;
        // A dangling end has no geometry to pin to and keeps its floating point.
        pin_endpoint(*p, *e, s, p->find(*ref));
    }
    publish(ChangeKind::EndpointDisconnected, page_id, { connector_id });
    return Status::success();
}

Status Diagram::group_elements(const std::string& page_id, const std::string& group_id,
    const std::vector<std::string>& child_ids)
{
    if (Status s = check_mutable(); !s.ok()) return s;
    Page* p = nullptr;
    if (Status s = find_page(page_id, p); !s.ok()) return s;

    if (group_id.empty()) return violation("group id must not be empty", page_id);
    if (p->contains_cell(group_id)) return violation("id collision '" + group_id + "'", page_id);
    if (child_ids.empty()) return violation("a group needs at least one child", page_id);

    std::unordered_set<std::string> seen;
    std::string common_parent;
    std::size_t first_index = p->elements.size();
    std::optional<Rect> bounds;
    for (const auto& child_id : child_ids) {
        if (!seen.insert(child_id).second) return violation("'" + child_id + "' listed twice", page_id);
        const Element* child = p->find(child_id);
        if (!child) return violation("unknown element '" + child_id + "'", page_id);
        if (common_parent.empty())
            common_parent = child->parent_id;
        else if (child->parent_id != common_parent)
            return violation("grouped elements must share a parent", page_id);
        first_index = std::min(first_index, *p->index_of(child_id));
        if (!child->geometry.relative)
            bounds = bounds ? union_rect(*bounds, child->geometry.bounds()) : child->geometry.bounds();
    }

    Element group = make_group(group_id, common_parent);
    if (bounds) {
        group.geometry.x = bounds->x;
        group.geometry.y = bounds->y;
        group.geometry.width = bounds->width;
        group.geometry.height = bounds->height;
    }
    const double gx = group.geometry.x;
    const double gy = group.geometry.y;

    for (const auto& child_id : child_ids) {
        Element* child = p->find(child_id);
        child->parent_id = group_id;
        child->geometry.translate(-gx, -gy);
    }
    p->elements.insert(p->elements.begin() + static_cast<std::ptrdiff_t>(first_index), std::move(group));
    p->renumber();

    std::vector<std::string> affected{ group_id };
    affected.insert(affected.end(), child_ids.begin(), child_ids.end());
    publish(ChangeKind::ElementsGrouped, page_id, std::move(affected));
    return Status::success();
}

Status Diagram::add_to_group(const std::string& page_id, const std::string& group_id, const std::string& element_id) {
    if (Status s = check_mutable(); !s.ok()) return s;
    Page* p = nullptr;
    if (Status s = find_page(page_id, p); !s.ok()) return s;
    Element* group = nullptr;
    if (Status s = find_element(*p, group_id, group); !s.ok()) return s;
    if (!group->is_group()) return violation("'" + group_id + "' is not a group", page_id);
    Element* e = nullptr;
    if (Status s = find_element(*p, element_id, e); !s.ok()) return s;
    if (element_id == group_id || is_ancestor(*p, element_id, group_id))
        return violation("adding '" + element_id + "' to '" + group_id + "' creates a group cycle", page_id);
    if (e->parent_id == group_id) return violation("'" + element_id + "' is already in the group", page_id);

    const Point from = container_origin(*p, e->parent_id);
    const Point to = container_origin(*p, group_id);
    e->parent_id = group_id;
    e->geometry.translate(from.x - to.x, from.y - to.y);
    p->renumber();

    publish(ChangeKind::ElementsGrouped, page_id, { group_id, element_id });
    return Status::success();
}

Status Diagram::ungroup(const std::string& page_id, const std::string& group_id) {
    if (Status s = check_mutable(); !s.ok()) return s;
    Page* p = nullptr;
    if (Status s = find_page(page_id, p); !s.ok()) return s;
    Element* group = nullptr;
    if (Status s = find_element(*p, group_id, group); !s.ok()) return s;
    if (!group->is_group()) return violation("'" + group_id + "' is not a group", page_id);

    const Element removed = *group;
    const std::vector<std::string> children = removed.group()->child_ids;
    for (const auto& child_id : children) {
        Element* child = p->find(child_id);
        child->parent_id = removed.parent_id;
        child->geometry.translate(removed.geometry.x, removed.geometry.y);
    }
    std::vector<std::string> affected{ group_id };
    affected.insert(affected.end(), children.begin(), children.end());
    for (auto& e : p->elements) {
        ConnectorData* c = e.connector();
        if (!c) continue;
        for (EndpointSide side : { EndpointSide::Source, EndpointSide::Target }) {
            if (!c->dangling(side) && c->endpoint(side) == group_id) {
                pin_endpoint(*p, e, side, &removed);
                affected.push_back(e.id);
            }
        }
    }
    p->elements.erase(p->elements.begin() + static_cast<std::ptrdiff_t>(*p->index_of(group_id)));
    p->renumber();

    publish(ChangeKind::ElementsUngrouped, page_id, std::move(affected));
    return Status::success();
}

Status Diagram::reorder_element(const std::string& page_id, const std::string& element_id, std::size_t new_index) {
    if (Status s = check_mutable(); !s.ok()) return s;
    Page* p = nullptr;
    if (Status s = find_page(page_id, p); !s.ok()) return s;
    const auto index = p->index_of(element_id);
    if (!index) return violation("unknown element '" + element_id + "'", page_id);
    if (new_index >= p->elements.size()) return violation("z-order index out of range", page_id);

    Element moved = std::move(p->elements[*index]);
    p->elements.erase(p->elements.begin() + static_cast<std::ptrdiff_t>(*index));
    p->elements.insert(p->elements.begin() + static_cast<std::ptrdiff_t>(new_index), std::move(moved));
    p->renumber();
    publish(ChangeKind::ElementReordered, page_id, { element_id });
    return Status::success();
}

Status Diagram::delete_element(const std::string& page_id, const std::string& element_id, ReconnectPolicy policy) {
    if (Status s = check_mutable(); !s.ok()) return s;
    Page* p = nullptr;
    if (Status s = find_page(page_id, p); !s.ok()) return s;
    if (!p->find(element_id)) return violation("unknown element '" + element_id + "'", page_id);

    std::unordered_set<std::string> removed{ element_id };
    for (const auto& id : descendants_of(*p, element_id))
        removed.insert(id);

    if (policy == ReconnectPolicy::Cascade) {
        bool grew = true;
        while (grew) {
            grew = false;
            for (const auto& e : p->elements) {
                const ConnectorData* c = e.connector();
                if (!c || removed.count(e.id)) continue;
                const bool depends =
                    (c->source_id && !c->source_dangling && removed.count(*c->source_id)) ||
                    (c->target_id && !c->target_dangling && removed.count(*c->target_id));
                if (!depends) continue;
                removed.insert(e.id);
                for (const auto& id : descendants_of(*p, e.id))
                    removed.insert(id);
                grew = true;
            }
        }
    }

    std::vector<std::string> affected;
    for (const auto& e : p->elements)
        if (removed.count(e.id)) affected.push_back(e.id);

    // Detach survivors before anything is erased so pinned points see the old geometry.
    const Page snapshot = *p;
    for (auto& e : p->elements) {
        if (removed.count(e.id)) continue;
        ConnectorData* c = e.connector();
        if (!c) continue;
        bool touched = false;
        for (EndpointSide side : { EndpointSide::Source, EndpointSide::Target }) {
            const auto& ref = c->endpoint(side);
            if (ref && !c->dangling(side) && removed.count(*ref)) {
                pin_endpoint(snapshot, e, side, snapshot.find(*ref));
                touched = true;
            }
        }
        if (touched) affected.push_back(e.id);
    }
    p->elements.erase(std::remove_if(p->elements.begin(), p->elements.end(),
        [&](const Element& e) { return removed.count(e.id) != 0; }), p->elements.end());
    p->renumber();

    core_logger()->debug("deleted {} element(s) from page '{}'", removed.size(), page_id);
    publish(ChangeKind::ElementsDeleted, page_id, std::move(affected));
    return Status::success();
}

} // namespace diagram_model
