#include <diagram_config/settings.hpp>
#include <diagram_model/logging.hpp>
#include <nlohmann/json.hpp>
#include <fstream>

namespace diagram_config {

namespace {

std::optional<diagram_codec::DanglingPolicy> dangling_from_string(const std::string& s) {
    if (s == "retain") return diagram_codec::DanglingPolicy::Retain;
    if (s == "reject") return diagram_codec::DanglingPolicy::Reject;
    if (s == "detach") return diagram_codec::DanglingPolicy::Detach;
    return std::nullopt;
}

std::optional<diagram_model::ReconnectPolicy> reconnect_from_string(const std::string& s) {
    if (s == "detach") return diagram_model::ReconnectPolicy::Detach;
    if (s == "cascade") return diagram_model::ReconnectPolicy::Cascade;
    return std::nullopt;
}

bool is_log_level(const std::string& s) {
    return s == "trace" || s == "debug" || s == "info" || s == "warn" || s == "warning" || s == "error"
        || s == "err" || s == "critical" || s == "off";
}

std::optional<Settings> parse_json(const nlohmann::json& j) {
    Settings out;
    if (!j.is_object()) return std::nullopt;

    if (j.contains("history_limit")) {
        if (!j["history_limit"].is_number_unsigned()) return std::nullopt;
        out.history_limit = j["history_limit"].get<std::size_t>();
    }
    if (j.contains("compress_on_save")) {
        if (!j["compress_on_save"].is_boolean()) return std::nullopt;
        out.compress_on_save = j["compress_on_save"].get<bool>();
    }
    if (j.contains("uri_encode_compressed")) {
        if (!j["uri_encode_compressed"].is_boolean()) return std::nullopt;
        out.uri_encode_compressed = j["uri_encode_compressed"].get<bool>();
    }
    if (j.contains("dangling_policy")) {
        if (!j["dangling_policy"].is_string()) return std::nullopt;
        const auto policy = dangling_from_string(j["dangling_policy"].get<std::string>());
        if (!policy) return std::nullopt;
        out.dangling_policy = *policy;
    }
    if (j.contains("reconnect_policy")) {
        if (!j["reconnect_policy"].is_string()) return std::nullopt;
        const auto policy = reconnect_from_string(j["reconnect_policy"].get<std::string>());
        if (!policy) return std::nullopt;
        out.reconnect_policy = *policy;
    }
    if (j.contains("log_level")) {
        if (!j["log_level"].is_string() || !is_log_level(j["log_level"].get<std::string>())) return std::nullopt;
        out.log_level = j["log_level"].get<std::string>();
    }
    if (j.contains("log_file")) {
        if (!j["log_file"].is_string()) return std::nullopt;
        out.log_file = j["log_file"].get<std::string>();
    }
    return out;
}

} // namespace

std::optional<Settings> load_settings_from_json(std::istream& in) {
    try {
        nlohmann::json j = nlohmann::json::parse(in);
        return parse_json(j);
    } catch (const nlohmann::json::exception& e) {
        diagram_model::core_logger()->warn("settings rejected: {}", e.what());
        return std::nullopt;
    }
}

std::optional<Settings> load_settings_from_json_file(const std::string& path) {
    std::ifstream f(path);
    if (!f) return std::nullopt;
    return load_settings_from_json(f);
}

void apply_logging(const Settings& settings) {
    diagram_model::configure_core_logger(settings.log_level, settings.log_file);
}

diagram_codec::DecodeOptions decode_options(const Settings& settings) {
    diagram_codec::DecodeOptions options;
    options.dangling = settings.dangling_policy;
    return options;
}

diagram_codec::EncodeOptions encode_options(const Settings& settings) {
    diagram_codec::EncodeOptions options;
    options.compression = settings.compress_on_save ? diagram_codec::Compression::Always
                                                    : diagram_codec::Compression::Preserve;
    options.uri_encode = settings.uri_encode_compressed;
    return options;
}

diagram_commands::CommandManager make_command_manager(diagram_model::Diagram& diagram, const Settings& settings) {
    return diagram_commands::CommandManager(diagram, settings.history_limit, settings.reconnect_policy);
}

} // namespace diagram_config
