#include <diagram_commands/commands.hpp>

namespace diagram_commands {

using diagram_model::ErrorCode;
using diagram_model::make_error;

AddPageCommand::AddPageCommand(diagram_model::Page page, std::optional<std::size_t> index)
    : page_(std::move(page)), index_(index) {}

Status AddPageCommand::apply(Diagram& diagram) const {
    return diagram.add_page(page_, index_);
}

Status AddPageCommand::execute(Diagram& diagram) {
    if (Status s = apply(diagram); !s.ok()) return s;
    index_ = diagram.document().page_index(page_.id);
    return Status::success();
}

Status AddPageCommand::undo(Diagram& diagram) {
    const diagram_model::Page* current = diagram.page(page_.id);
    if (!current) return make_error(ErrorCode::InvariantViolation, "page '" + page_.id + "' is gone");
    diagram_model::Page snapshot = *current;
    if (Status s = diagram.remove_page(page_.id); !s.ok()) return s;
    page_ = std::move(snapshot);
    return Status::success();
}

Status AddPageCommand::redo(Diagram& diagram) {
    return apply(diagram);
}

std::string AddPageCommand::description() const {
    return "Add page '" + page_.name + "'";
}

RemovePageCommand::RemovePageCommand(std::string page_id) : page_id_(std::move(page_id)) {}

Status RemovePageCommand::apply(Diagram& diagram) const {
    return diagram.remove_page(page_id_);
}

Status RemovePageCommand::execute(Diagram& diagram) {
    const auto index = diagram.document().page_index(page_id_);
    if (!index) return make_error(ErrorCode::InvariantViolation, "unknown page '" + page_id_ + "'");
    diagram_model::Page snapshot = *diagram.page(page_id_);
    if (Status s = apply(diagram); !s.ok()) return s;
    removed_ = std::move(snapshot);
    index_ = *index;
    return Status::success();
}

Status RemovePageCommand::undo(Diagram& diagram) {
    if (!removed_) return make_error(ErrorCode::InvariantViolation, "command was never executed");
    return diagram.add_page(*removed_, index_);
}

Status RemovePageCommand::redo(Diagram& diagram) {
    return apply(diagram);
}

std::string RemovePageCommand::description() const {
    return "Remove page '" + (removed_ ? removed_->name : page_id_) + "'";
}

RenamePageCommand::RenamePageCommand(std::string page_id, std::string name)
    : page_id_(std::move(page_id)), name_(std::move(name)) {}

Status RenamePageCommand::apply(Diagram& diagram) const {
    return diagram.rename_page(page_id_, name_);
}

Status RenamePageCommand::execute(Diagram& diagram) {
    const diagram_model::Page* page = diagram.page(page_id_);
    if (!page) return make_error(ErrorCode::InvariantViolation, "unknown page '" + page_id_ + "'");
    const std::string previous = page->name;
    if (Status s = apply(diagram); !s.ok()) return s;
    previous_name_ = previous;
    return Status::success();
}

Status RenamePageCommand::undo(Diagram& diagram) {
    return diagram.rename_page(page_id_, previous_name_);
}

Status RenamePageCommand::redo(Diagram& diagram) {
    return apply(diagram);
}

std::string RenamePageCommand::description() const {
    return "Rename page to '" + name_ + "'";
}

MovePageCommand::MovePageCommand(std::string page_id, std::size_t new_index)
    : page_id_(std::move(page_id)), new_index_(new_index) {}

Status MovePageCommand::apply(Diagram& diagram) const {
    return diagram.move_page(page_id_, new_index_);
}

Status MovePageCommand::execute(Diagram& diagram) {
    const auto index = diagram.document().page_index(page_id_);
    if (!index) return make_error(ErrorCode::InvariantViolation, "unknown page '" + page_id_ + "'");
    if (Status s = apply(diagram); !s.ok()) return s;
    previous_index_ = *index;
    return Status::success();
}

Status MovePageCommand::undo(Diagram& diagram) {
    return diagram.move_page(page_id_, previous_index_);
}

Status MovePageCommand::redo(Diagram& diagram) {
    return apply(diagram);
}

std::string MovePageCommand::description() const {
    return "Move page '" + page_id_ + "'";
}

SetPageSettingsCommand::SetPageSettingsCommand(std::string page_id, diagram_model::PageSettings settings)
    : page_id_(std::move(page_id)), settings_(std::move(settings)) {}

Status SetPageSettingsCommand::apply(Diagram& diagram) const {
    return diagram.set_page_settings(page_id_, settings_);
}

Status SetPageSettingsCommand::execute(Diagram& diagram) {
    const diagram_model::Page* page = diagram.page(page_id_);
    if (!page) return make_error(ErrorCode::InvariantViolation, "unknown page '" + page_id_ + "'");
    diagram_model::PageSettings previous = page->settings;
    if (Status s = apply(diagram); !s.ok()) return s;
    previous_ = std::move(previous);
    return Status::success();
}

Status SetPageSettingsCommand::undo(Diagram& diagram) {
    return diagram.set_page_settings(page_id_, previous_);
}

Status SetPageSettingsCommand::redo(Diagram& diagram) {
    return apply(diagram);
}

std::string SetPageSettingsCommand::description() const {
    return "Change settings of page '" + page_id_ + "'";
}

SetDocumentNameCommand::SetDocumentNameCommand(std::string name) : name_(std::move(name)) {}

Status SetDocumentNameCommand::apply(Diagram& diagram) const {
    return diagram.set_document_name(name_);
}

Status SetDocumentNameCommand::execute(Diagram& diagram) {
    const std::string previous = diagram.document().name;
    if (Status s = apply(diagram); !s.ok()) return s;
    previous_name_ = previous;
    return Status::success();
}

Status SetDocumentNameCommand::undo(Diagram& diagram) {
    return diagram.set_document_name(previous_name_);
}

Status SetDocumentNameCommand::redo(Diagram& diagram) {
    return apply(diagram);
}

std::string SetDocumentNameCommand::description() const {
    return "Rename document to '" + name_ + "'";
}

} // namespace diagram_commands
