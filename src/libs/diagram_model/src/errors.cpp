#include <diagram_model/errors.hpp>

namespace diagram_model {

const char* to_string(ErrorCode code) {
    switch (code) {
    case ErrorCode::None: return "None";
    case ErrorCode::MalformedXml: return "MalformedXML";
    case ErrorCode::MalformedCompression: return "MalformedCompression";
    case ErrorCode::MalformedStyle: return "MalformedStyle";
    case ErrorCode::DuplicateId: return "DuplicateId";
    case ErrorCode::UnresolvableReference: return "UnresolvableReference";
    case ErrorCode::InvariantViolation: return "InvariantViolation";
    case ErrorCode::NothingToUndo: return "NothingToUndo";
    case ErrorCode::NothingToRedo: return "NothingToRedo";
    case ErrorCode::ReentrantMutation: return "ReentrantMutation";
    case ErrorCode::Io: return "Io";
    }
    return "Unknown";
}

bool is_format_error(ErrorCode code) {
    return code == ErrorCode::MalformedXml || code == ErrorCode::MalformedCompression
        || code == ErrorCode::DuplicateId || code == ErrorCode::UnresolvableReference;
}

std::string describe(const Error& error) {
    std::string out = to_string(error.code);
    if (!error.message.empty()) out += ": " + error.message;
    if (!error.path.empty()) out += " at " + error.path;
    if (!error.fragment.empty()) out += " near '" + error.fragment + "'";
    return out;
}

} // namespace diagram_model
