#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace diagram_model {

enum class ChangeKind {
    DocumentRenamed,
    PageAdded,
    PageRemoved,
    PageRenamed,
    PageMoved,
    PageSettingsChanged,
    ElementCreated,
    ElementMoved,
    ElementResized,
    ElementRestyled,
    ElementRelabeled,
    ElementVisibilityChanged,
    ConnectorRerouted,
    EndpointConnected,
    EndpointDisconnected,
    ElementsGrouped,
    ElementsUngrouped,
    ElementReordered,
    ElementsDeleted,
    ElementsRestored, // undo / redo of an element command
};

const char* to_string(ChangeKind kind);

struct ChangeEvent {
    ChangeKind kind = ChangeKind::ElementCreated;
    std::string page_id;
    std::vector<std::string> element_ids;
};

class ModelObserver {
public:
    virtual ~ModelObserver() = default;
    virtual void on_model_changed(const ChangeEvent& event) = 0;
};

using SubscriptionId = std::uint64_t;

// Synchronous, in-process delivery in registration order.
// Observers are not owned; unsubscribe before destroying one.
class ChangeBus {
public:
    SubscriptionId subscribe(ModelObserver* observer);
    bool unsubscribe(SubscriptionId id);
    std::size_t observer_count() const;

    void publish(const ChangeEvent& event);
    bool is_publishing() const { return publishing_; }

private:
    struct Entry {
        SubscriptionId id = 0;
        ModelObserver* observer = nullptr;
    };

    std::vector<Entry> observers_;
    SubscriptionId next_id_ = 1;
    bool publishing_ = false;
};

} // namespace diagram_model
