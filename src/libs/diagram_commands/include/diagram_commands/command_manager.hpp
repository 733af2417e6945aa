#pragma once

#include <diagram_commands/command.hpp>
#include <diagram_model/diagram.hpp>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace diagram_commands {

enum class HistoryAction { Executed, Undone, Redone, Cleared, LimitChanged };

const char* to_string(HistoryAction action);

struct HistoryEvent {
    HistoryAction action = HistoryAction::Executed;
    std::string description; // the command concerned; empty for Cleared and LimitChanged
    bool can_undo = false;
    bool can_redo = false;
};

class HistoryListener {
public:
    virtual ~HistoryListener() = default;
    virtual void on_history_changed(const HistoryEvent& event) = 0;
};

using ListenerId = std::uint64_t;

// Linear undo history over one Diagram. Executing a command drops whatever
// could still be redone; the oldest entries fall off past the history limit.
// The history cannot change while the diagram or the manager is notifying:
// execute, undo, redo, clear and set_history_limit fail with ReentrantMutation.
class CommandManager {
public:
    static constexpr std::size_t default_history_limit = 100;

    explicit CommandManager(Diagram& diagram, std::size_t history_limit = default_history_limit,
        diagram_model::ReconnectPolicy reconnect_policy = diagram_model::ReconnectPolicy::Detach);

    Diagram& diagram() { return diagram_; }
    const Diagram& diagram() const { return diagram_; }

    // The command is kept only when it succeeds.
    Status execute(std::unique_ptr<Command> command);
    Status undo();
    Status redo();

    bool can_undo() const { return cursor_ > 0; }
    bool can_redo() const { return cursor_ < history_.size(); }
    bool can_execute(const Command& command) const;
    Status validate(const Command& command) const;

    std::optional<std::string> undo_description() const;
    std::optional<std::string> redo_description() const;

    Status clear();
    std::size_t history_size() const { return history_.size(); }
    std::size_t history_limit() const { return history_limit_; }
    Status set_history_limit(std::size_t limit);

    // Used by delete_element when the caller names no policy.
    diagram_model::ReconnectPolicy reconnect_policy() const { return reconnect_policy_; }
    void set_reconnect_policy(diagram_model::ReconnectPolicy policy) { reconnect_policy_ = policy; }

    // Listeners are told after every history change, in registration order.
    // They are not owned; remove one before destroying it.
    ListenerId add_listener(HistoryListener* listener);
    bool remove_listener(ListenerId id);
    std::size_t listener_count() const;

    Status create_element(const std::string& page_id, diagram_model::Element element,
        std::optional<std::size_t> index = std::nullopt);
    Status move_element(const std::string& page_id, const std::string& element_id, double x, double y);
    Status resize_element(const std::string& page_id, const std::string& element_id, double width, double height);
    Status restyle_element(const std::string& page_id, const std::string& element_id,
        diagram_style::StyleRecord style);
    Status set_label(const std::string& page_id, const std::string& element_id, std::string label);
    Status connect(const std::string& page_id, const std::string& connector_id, const std::string& source_id,
        const std::string& target_id, std::string_view style = {});
    Status disconnect(const std::string& page_id, const std::string& connector_id,
        std::optional<diagram_model::EndpointSide> side = std::nullopt);
    Status group(const std::string& page_id, const std::string& group_id, const std::vector<std::string>& child_ids);
    Status ungroup(const std::string& page_id, const std::string& group_id);
    Status delete_element(const std::string& page_id, const std::string& element_id,
        std::optional<diagram_model::ReconnectPolicy> policy = std::nullopt);
    Status set_visible(const std::string& page_id, const std::string& element_id, bool visible);

private:
    struct Listener {
        ListenerId id = 0;
        HistoryListener* listener = nullptr;
    };

    Status check_history_mutable() const;
    void trim_history();
    void notify(HistoryAction action, std::string description);

    Diagram& diagram_;
    std::vector<std::unique_ptr<Command>> history_;
    std::size_t cursor_ = 0;
    std::size_t history_limit_;
    diagram_model::ReconnectPolicy reconnect_policy_;
    std::vector<Listener> listeners_;
    ListenerId next_listener_id_ = 1;
    bool notifying_ = false;
};

} // namespace diagram_commands
