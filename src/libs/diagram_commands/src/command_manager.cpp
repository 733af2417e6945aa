#include <diagram_commands/command_manager.hpp>
#include <diagram_commands/commands.hpp>
#include <diagram_model/logging.hpp>
#include <algorithm>

namespace diagram_commands {

using diagram_model::ErrorCode;
using diagram_model::core_logger;
using diagram_model::make_error;

const char* to_string(HistoryAction action) {
    switch (action) {
    case HistoryAction::Executed: return "Executed";
    case HistoryAction::Undone: return "Undone";
    case HistoryAction::Redone: return "Redone";
    case HistoryAction::Cleared: return "Cleared";
    case HistoryAction::LimitChanged: return "LimitChanged";
    }
    return "Unknown";
}

namespace {

struct NotifyingScope {
    explicit NotifyingScope(bool& flag) : flag_(flag) { flag_ = true; }
    ~NotifyingScope() { flag_ = false; }
    bool& flag_;
};

} // namespace

CommandManager::CommandManager(Diagram& diagram, std::size_t history_limit,
    diagram_model::ReconnectPolicy reconnect_policy)
    : diagram_(diagram), history_limit_(history_limit), reconnect_policy_(reconnect_policy) {}

Status CommandManager::check_history_mutable() const {
    if (diagram_.is_notifying())
        return make_error(ErrorCode::ReentrantMutation, "history changed from inside a change notification");
    if (notifying_)
        return make_error(ErrorCode::ReentrantMutation, "history changed from inside a history notification");
    return Status::success();
}

Status CommandManager::execute(std::unique_ptr<Command> command) {
    if (!command) return make_error(ErrorCode::InvariantViolation, "null command");
    if (Status s = check_history_mutable(); !s.ok()) return s;
    Status status = command->execute(diagram_);
    if (!status.ok()) {
        core_logger()->info("rejected '{}': {}", command->description(), diagram_model::describe(status.error()));
        return status;
    }
    std::string description = command->description();
    core_logger()->debug("executed '{}'", description);

    history_.erase(history_.begin() + static_cast<std::ptrdiff_t>(cursor_), history_.end());
    history_.push_back(std::move(command));
    cursor_ = history_.size();
    trim_history();
    notify(HistoryAction::Executed, std::move(description));
    return Status::success();
}

Status CommandManager::undo() {
    if (Status s = check_history_mutable(); !s.ok()) return s;
    if (!can_undo()) return make_error(ErrorCode::NothingToUndo, "nothing to undo");
    Command& command = *history_[cursor_ - 1];
    std::string description = command.description();
    if (Status s = command.undo(diagram_); !s.ok()) {
        core_logger()->info("undo of '{}' failed: {}", description, diagram_model::describe(s.error()));
        return s;
    }
    --cursor_;
    core_logger()->debug("undid '{}'", description);
    notify(HistoryAction::Undone, std::move(description));
    return Status::success();
}

Status CommandManager::redo() {
    if (Status s = check_history_mutable(); !s.ok()) return s;
    if (!can_redo()) return make_error(ErrorCode::NothingToRedo, "nothing to redo");
    Command& command = *history_[cursor_];
    std::string description = command.description();
    if (Status s = command.redo(diagram_); !s.ok()) {
        core_logger()->info("redo of '{}' failed: {}", description, diagram_model::describe(s.error()));
        return s;
    }
    ++cursor_;
    core_logger()->debug("redid '{}'", description);
    notify(HistoryAction::Redone, std::move(description));
    return Status::success();
}

Status CommandManager::validate(const Command& command) const {
    if (diagram_.is_notifying())
        return make_error(ErrorCode::ReentrantMutation, "model mutated from inside a change notification");
    return command.validate(diagram_);
}

bool CommandManager::can_execute(const Command& command) const {
    return validate(command).ok();
}

std::optional<std::string> CommandManager::undo_description() const {
    if (!can_undo()) return std::nullopt;
    return history_[cursor_ - 1]->description();
}

std::optional<std::string> CommandManager::redo_description() const {
    if (!can_redo()) return std::nullopt;
    return history_[cursor_]->description();
}

Status CommandManager::clear() {
    if (Status s = check_history_mutable(); !s.ok()) return s;
    history_.clear();
    cursor_ = 0;
    notify(HistoryAction::Cleared, {});
    return Status::success();
}

Status CommandManager::set_history_limit(std::size_t limit) {
    if (Status s = check_history_mutable(); !s.ok()) return s;
    history_limit_ = limit;
    trim_history();
    notify(HistoryAction::LimitChanged, {});
    return Status::success();
}

void CommandManager::trim_history() {
    if (history_.size() <= history_limit_) return;
    const std::size_t excess = history_.size() - history_limit_;
    history_.erase(history_.begin(), history_.begin() + static_cast<std::ptrdiff_t>(excess));
    cursor_ = cursor_ > excess ? cursor_ - excess : 0;
}

ListenerId CommandManager::add_listener(HistoryListener* listener) {
    if (!listener) return 0;
    const ListenerId id = next_listener_id_++;
    listeners_.push_back(Listener{ id, listener });
    return id;
}

bool CommandManager::remove_listener(ListenerId id) {
    auto it = std::find_if(listeners_.begin(), listeners_.end(),
        [id](const Listener& l) { return l.id == id; });
    if (it == listeners_.end()) return false;
    if (notifying_)
        it->listener = nullptr;
    else
        listeners_.erase(it);
    return true;
}

std::size_t CommandManager::listener_count() const {
    return static_cast<std::size_t>(std::count_if(listeners_.begin(), listeners_.end(),
        [](const Listener& l) { return l.listener != nullptr; }));
}

void CommandManager::notify(HistoryAction action, std::string description) {
    listeners_.erase(std::remove_if(listeners_.begin(), listeners_.end(),
        [](const Listener& l) { return l.listener == nullptr; }), listeners_.end());
    if (listeners_.empty()) return;

    const HistoryEvent event{ action, std::move(description), can_undo(), can_redo() };
    NotifyingScope scope(notifying_);
    const std::size_t count = listeners_.size();
    for (std::size_t i = 0; i < count; ++i) {
        HistoryListener* listener = listeners_[i].listener;
        if (listener) listener->on_history_changed(event);
    }
}

Status CommandManager::create_element(const std::string& page_id, diagram_model::Element element,
    std::optional<std::size_t> index)
{
    return execute(std::make_unique<CreateElementCommand>(page_id, std::move(element), index));
}

Status CommandManager::move_element(const std::string& page_id, const std::string& element_id, double x, double y) {
    return execute(std::make_unique<MoveElementCommand>(page_id, element_id, x, y));
}

Status CommandManager::resize_element(const std::string& page_id, const std::string& element_id,
    double width, double height)
{
    return execute(std::make_unique<ResizeElementCommand>(page_id, element_id, width, height));
}

Status CommandManager::restyle_element(const std::string& page_id, const std::string& element_id,
    diagram_style::StyleRecord style)
{
    return execute(std::make_unique<RestyleElementCommand>(page_id, element_id, std::move(style)));
}

Status CommandManager::set_label(const std::string& page_id, const std::string& element_id, std::string label) {
    return execute(std::make_unique<SetLabelCommand>(page_id, element_id, std::move(label)));
}

Status CommandManager::connect(const std::string& page_id, const std::string& connector_id,
    const std::string& source_id, const std::string& target_id, std::string_view style)
{
    return execute(std::make_unique<ConnectCommand>(page_id, connector_id, source_id, target_id, std::string(style)));
}

Status CommandManager::disconnect(const std::string& page_id, const std::string& connector_id,
    std::optional<diagram_model::EndpointSide> side)
{
    return execute(std::make_unique<DisconnectCommand>(page_id, connector_id, side));
}

Status CommandManager::group(const std::string& page_id, const std::string& group_id,
    const std::vector<std::string>& child_ids)
{
    return execute(std::make_unique<GroupCommand>(page_id, group_id, child_ids));
}

Status CommandManager::ungroup(const std::string& page_id, const std::string& group_id) {
    return execute(std::make_unique<UngroupCommand>(page_id, group_id));
}

Status CommandManager::delete_element(const std::string& page_id, const std::string& element_id,
    std::optional<diagram_model::ReconnectPolicy> policy)
{
    return execute(std::make_unique<DeleteElementCommand>(page_id, element_id, policy.value_or(reconnect_policy_)));
}

Status CommandManager::set_visible(const std::string& page_id, const std::string& element_id, bool visible) {
    return execute(std::make_unique<SetVisibleCommand>(page_id, element_id, visible));
}

} // namespace diagram_commands
