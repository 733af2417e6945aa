#include <diagram_model/change_bus.hpp>
#include <algorithm>

namespace diagram_model {

const char* to_string(ChangeKind kind) {
    switch (kind) {
    case ChangeKind::DocumentRenamed: return "DocumentRenamed";
    case ChangeKind::PageAdded: return "PageAdded";
    case ChangeKind::PageRemoved: return "PageRemoved";
    case ChangeKind::PageRenamed: return "PageRenamed";
    case ChangeKind::PageMoved: return "PageMoved";
    case ChangeKind::PageSettingsChanged: return "PageSettingsChanged";
    case ChangeKind::ElementCreated: return "ElementCreated";
    case ChangeKind::ElementMoved: return "ElementMoved";
    case ChangeKind::ElementResized: return "ElementResized";
    case ChangeKind::ElementRestyled: return "ElementRestyled";
    case ChangeKind::ElementRelabeled: return "ElementRelabeled";
    case ChangeKind::ElementVisibilityChanged: return "ElementVisibilityChanged";
    case ChangeKind::ConnectorRerouted: return "ConnectorRerouted";
    case ChangeKind::EndpointConnected: return "EndpointConnected";
    case ChangeKind::EndpointDisconnected: return "EndpointDisconnected";
    case ChangeKind::ElementsGrouped: return "ElementsGrouped";
    case ChangeKind::ElementsUngrouped: return "ElementsUngrouped";
    case ChangeKind::ElementReordered: return "ElementReordered";
    case ChangeKind::ElementsDeleted: return "ElementsDeleted";
    case ChangeKind::ElementsRestored: return "ElementsRestored";
    }
    return "Unknown";
}

SubscriptionId ChangeBus::subscribe(ModelObserver* observer) {
    if (!observer) return 0;
    const SubscriptionId id = next_id_++;
    observers_.push_back(Entry{ id, observer });
    return id;
}

bool ChangeBus::unsubscribe(SubscriptionId id) {
    auto it = std::find_if(observers_.begin(), observers_.end(),
        [id](const Entry& e) { return e.id == id; });
    if (it == observers_.end()) return false;
    // Leave a hole while publishing so the delivery loop stays valid.
    if (publishing_)
        it->observer = nullptr;
    else
        observers_.erase(it);
    return true;
}

namespace {

struct PublishingScope {
    explicit PublishingScope(bool& flag) : flag_(flag) { flag_ = true; }
    ~PublishingScope() { flag_ = false; }
    bool& flag_;
};

} // namespace

std::size_t ChangeBus::observer_count() const {
    return static_cast<std::size_t>(std::count_if(observers_.begin(), observers_.end(),
        [](const Entry& e) { return e.observer != nullptr; }));
}

void ChangeBus::publish(const ChangeEvent& event) {
    // Drop holes left by unsubscribes during the previous delivery.
    observers_.erase(std::remove_if(observers_.begin(), observers_.end(),
        [](const Entry& e) { return e.observer == nullptr; }), observers_.end());

    PublishingScope scope(publishing_);
    // Observers subscribed during delivery start with the next event.
    const std::size_t count = observers_.size();
    for (std::size_t i = 0; i < count; ++i) {
        ModelObserver* observer = observers_[i].observer;
        if (observer) observer->on_model_changed(event);
    }
}

} // namespace diagram_model
