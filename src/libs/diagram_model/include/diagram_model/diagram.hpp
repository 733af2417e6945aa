#pragma once

#include <diagram_model/change_bus.hpp>
#include <diagram_model/errors.hpp>
#include <diagram_model/types.hpp>
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace diagram_model {

// What happens to connectors whose end is deleted.
enum class ReconnectPolicy {
    Detach,  // end becomes floating, pinned where the element was
    Cascade, // dependent connectors are deleted too
};

struct ElementState {
    std::string id;
    std::optional<Element> before;
    std::optional<Element> after;
};

// Element-level difference between two states of one page.
struct ElementDelta {
    std::string page_id;
    std::vector<ElementState> changes;
    std::vector<std::string> order_before;
    std::vector<std::string> order_after;

    bool empty() const { return changes.empty() && order_before == order_after; }
};

enum class DeltaDirection { Backward, Forward };

ElementDelta diff_pages(const Page& before, const Page& after);

// Owns the document. Every mutation is validated before anything changes and
// is announced on the change bus once committed.
class Diagram {
public:
    Diagram();
    explicit Diagram(Document document);

    Diagram(const Diagram&) = delete;
    Diagram& operator=(const Diagram&) = delete;
    Diagram(Diagram&&) noexcept = default;
    Diagram& operator=(Diagram&&) noexcept = default;

    const Document& document() const { return document_; }
    const Page* page(const std::string& page_id) const { return document_.find_page(page_id); }
    const Element* element(const std::string& page_id, const std::string& element_id) const;

    SubscriptionId subscribe(ModelObserver* observer) { return bus_.subscribe(observer); }
    bool unsubscribe(SubscriptionId id) { return bus_.unsubscribe(id); }
    // True while observers are being notified; mutations fail meanwhile.
    bool is_notifying() const { return bus_.is_publishing(); }

    Status set_document_name(const std::string& name);
    Status add_page(Page page, std::optional<std::size_t> index = std::nullopt);
    Status remove_page(const std::string& page_id);
    Status rename_page(const std::string& page_id, const std::string& name);
    Status move_page(const std::string& page_id, std::size_t new_index);
    Status set_page_settings(const std::string& page_id, PageSettings settings);

    Status create_element(const std::string& page_id, Element element,
        std::optional<std::size_t> index = std::nullopt);
    Status move_element(const std::string& page_id, const std::string& element_id, double x, double y);
    Status resize_element(const std::string& page_id, const std::string& element_id, double width, double height);
    Status restyle_element(const std::string& page_id, const std::string& element_id,
        diagram_style::StyleRecord style);
    Status set_label(const std::string& page_id, const std::string& element_id, std::string label);
    Status set_visible(const std::string& page_id, const std::string& element_id, bool visible);
    Status set_waypoints(const std::string& page_id, const std::string& connector_id, std::vector<Point> points);
    Status set_endpoint(const std::string& page_id, const std::string& connector_id,
        EndpointSide side, const std::string& element_id);
    // Floats one end, or both when side is empty.
    Status disconnect(const std::string& page_id, const std::string& connector_id,
        std::optional<EndpointSide> side = std::nullopt);
    Status group_elements(const std::string& page_id, const std::string& group_id,
        const std::vector<std::string>& child_ids);
    Status add_to_group(const std::string& page_id, const std::string& group_id, const std::string& element_id);
    Status ungroup(const std::string& page_id, const std::string& group_id);
    Status reorder_element(const std::string& page_id, const std::string& element_id, std::size_t new_index);
    Status delete_element(const std::string& page_id, const std::string& element_id,
        ReconnectPolicy policy = ReconnectPolicy::Detach);

    // Replays captured element states. The page must currently hold the
    // opposite side of the delta.
    Status apply_delta(const ElementDelta& delta, DeltaDirection direction);

private:
    Status check_mutable() const;
    Status find_page(const std::string& page_id, Page*& out);
    void publish(ChangeKind kind, const std::string& page_id, std::vector<std::string> element_ids = {});

    Document document_;
    ChangeBus bus_;
};

} // namespace diagram_model
