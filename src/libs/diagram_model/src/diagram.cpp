#include <diagram_model/diagram.hpp>
#include <diagram_model/invariants.hpp>
#include <diagram_model/logging.hpp>
#include <algorithm>
#include <cmath>
#include <unordered_map>

namespace diagram_model {

namespace {

std::vector<std::string> element_order(const Page& page) {
    std::vector<std::string> ids;
    ids.reserve(page.elements.size());
    for (const auto& e : page.elements)
        ids.push_back(e.id);
    return ids;
}

} // namespace

ElementDelta diff_pages(const Page& before, const Page& after) {
    ElementDelta delta;
    delta.page_id = after.id;
    delta.order_before = element_order(before);
    delta.order_after = element_order(after);

    for (const auto& e : after.elements) {
        const Element* old = before.find(e.id);
        if (!old)
            delta.changes.push_back(ElementState{ e.id, std::nullopt, e });
        else if (!(*old == e))
            delta.changes.push_back(ElementState{ e.id, *old, e });
    }
    for (const auto& e : before.elements) {
        if (!after.find(e.id))
            delta.changes.push_back(ElementState{ e.id, e, std::nullopt });
    }
    return delta;
}

Diagram::Diagram() {
    document_.pages.push_back(make_page("page-1", "Page-1"));
}

Diagram::Diagram(Document document) : document_(std::move(document)) {
    for (auto& page : document_.pages)
        page.renumber();
}

const Element* Diagram::element(const std::string& page_id, const std::string& element_id) const {
    const Page* p = page(page_id);
    return p ? p->find(element_id) : nullptr;
}

Status Diagram::check_mutable() const {
    if (bus_.is_publishing())
        return make_error(ErrorCode::ReentrantMutation, "model mutated from inside a change notification");
    return Status::success();
}

Status Diagram::find_page(const std::string& page_id, Page*& out) {
    out = document_.find_page(page_id);
    if (!out)
        return make_error(ErrorCode::InvariantViolation, "unknown page '" + page_id + "'");
    return Status::success();
}

void Diagram::publish(ChangeKind kind, const std::string& page_id, std::vector<std::string> element_ids) {
    ChangeEvent event;
    event.kind = kind;
    event.page_id = page_id;
    event.element_ids = std::move(element_ids);
    bus_.publish(event);
}

Status Diagram::set_document_name(const std::string& name) {
    if (Status s = check_mutable(); !s.ok()) return s;
    document_.name = name;
    publish(ChangeKind::DocumentRenamed, {});
    return Status::success();
}

Status Diagram::add_page(Page page, std::optional<std::size_t> index) {
    if (Status s = check_mutable(); !s.ok()) return s;
    if (page.id.empty())
        return make_error(ErrorCode::InvariantViolation, "page id must not be empty");
    if (document_.find_page(page.id))
        return make_error(ErrorCode::InvariantViolation, "page id collision '" + page.id + "'");
    const std::size_t at = index ? *index : document_.pages.size();
    if (at > document_.pages.size())
        return make_error(ErrorCode::InvariantViolation, "page index out of range");
    page.renumber();
    if (Status s = check_page_invariants(page); !s.ok()) return s;

    const std::string id = page.id;
    document_.pages.insert(document_.pages.begin() + static_cast<std::ptrdiff_t>(at), std::move(page));
    publish(ChangeKind::PageAdded, id);
    return Status::success();
}

Status Diagram::remove_page(const std::string& page_id) {
    if (Status s = check_mutable(); !s.ok()) return s;
    const auto index = document_.page_index(page_id);
    if (!index)
        return make_error(ErrorCode::InvariantViolation, "unknown page '" + page_id + "'");
    document_.pages.erase(document_.pages.begin() + static_cast<std::ptrdiff_t>(*index));
    publish(ChangeKind::PageRemoved, page_id);
    return Status::success();
}

Status Diagram::rename_page(const std::string& page_id, const std::string& name) {
    if (Status s = check_mutable(); !s.ok()) return s;
    Page* p = nullptr;
    if (Status s = find_page(page_id, p); !s.ok()) return s;
    p->name = name;
    publish(ChangeKind::PageRenamed, page_id);
    return Status::success();
}

Status Diagram::move_page(const std::string& page_id, std::size_t new_index) {
    if (Status s = check_mutable(); !s.ok()) return s;
    const auto index = document_.page_index(page_id);
    if (!index)
        return make_error(ErrorCode::InvariantViolation, "unknown page '" + page_id + "'");
    if (new_index >= document_.pages.size())
        return make_error(ErrorCode::InvariantViolation, "page index out of range");
    Page moved = std::move(document_.pages[*index]);
    document_.pages.erase(document_.pages.begin() + static_cast<std::ptrdiff_t>(*index));
    document_.pages.insert(document_.pages.begin() + static_cast<std::ptrdiff_t>(new_index), std::move(moved));
    publish(ChangeKind::PageMoved, page_id);
    return Status::success();
}

Status Diagram::set_page_settings(const std::string& page_id, PageSettings settings) {
    if (Status s = check_mutable(); !s.ok()) return s;
    Page* p = nullptr;
    if (Status s = find_page(page_id, p); !s.ok()) return s;
    if (!std::isfinite(settings.grid_size) || settings.grid_size <= 0)
        return make_error(ErrorCode::InvariantViolation, "grid size must be positive");
    p->settings = std::move(settings);
    publish(ChangeKind::PageSettingsChanged, page_id);
    return Status::success();
}

Status Diagram::apply_delta(const ElementDelta& delta, DeltaDirection direction) {
    if (Status s = check_mutable(); !s.ok()) return s;
    Page* p = nullptr;
    if (Status s = find_page(delta.page_id, p); !s.ok()) return s;

    const bool forward = direction == DeltaDirection::Forward;
    const auto& expected_order = forward ? delta.order_before : delta.order_after;
    const auto& target_order = forward ? delta.order_after : delta.order_before;
    if (element_order(*p) != expected_order)
        return make_error(ErrorCode::InvariantViolation, "page order does not match recorded history",
            "page '" + p->id + "'");

    for (const auto& change : delta.changes) {
        const auto& expected = forward ? change.before : change.after;
        const Element* current = p->find(change.id);
        const bool matches = expected ? (current && *current == *expected) : current == nullptr;
        if (!matches)
            return make_error(ErrorCode::InvariantViolation,
                "element '" + change.id + "' does not match recorded history", "page '" + p->id + "'");
    }

    std::unordered_map<std::string, Element> by_id;
    for (auto& e : p->elements)
        by_id.emplace(e.id, std::move(e));
    std::vector<std::string> touched;
    for (const auto& change : delta.changes) {
        const auto& target = forward ? change.after : change.before;
        if (target)
            by_id[change.id] = *target;
        else
            by_id.erase(change.id);
        touched.push_back(change.id);
    }

    std::vector<Element> rebuilt;
    rebuilt.reserve(target_order.size());
    for (const auto& id : target_order) {
        auto it = by_id.find(id);
        if (it != by_id.end()) rebuilt.push_back(std::move(it->second));
    }
    p->elements = std::move(rebuilt);
    p->renumber();

    core_logger()->debug("replayed {} element state(s) on page '{}' ({})",
        touched.size(), p->id, forward ? "forward" : "backward");
    publish(ChangeKind::ElementsRestored, p->id, std::move(touched));
    return Status::success();
}

} // namespace diagram_model
