#include <diagram_commands/command.hpp>

namespace diagram_commands {

using diagram_model::ErrorCode;
using diagram_model::make_error;

Status Command::validate(const Diagram& diagram) const {
    Diagram scratch{ diagram_model::Document(diagram.document()) };
    return apply(scratch);
}

Status ElementCommand::execute(Diagram& diagram) {
    const diagram_model::Page* page = diagram.page(page_id_);
    if (!page) return make_error(ErrorCode::InvariantViolation, "unknown page '" + page_id_ + "'");
    const diagram_model::Page before = *page;

    if (Status s = apply(diagram); !s.ok()) return s;
    delta_ = diagram_model::diff_pages(before, *diagram.page(page_id_));
    executed_ = true;
    return Status::success();
}

Status ElementCommand::undo(Diagram& diagram) {
    if (!executed_) return make_error(ErrorCode::InvariantViolation, "command was never executed");
    return diagram.apply_delta(delta_, diagram_model::DeltaDirection::Backward);
}

Status ElementCommand::redo(Diagram& diagram) {
    if (!executed_) return make_error(ErrorCode::InvariantViolation, "command was never executed");
    return diagram.apply_delta(delta_, diagram_model::DeltaDirection::Forward);
}

} // namespace diagram_commands
