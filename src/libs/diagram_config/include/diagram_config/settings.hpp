#pragma once

#include <diagram_codec/codec.hpp>
#include <diagram_commands/command_manager.hpp>
#include <diagram_model/diagram.hpp>
#include <cstddef>
#include <istream>
#include <optional>
#include <string>

namespace diagram_config {

// Host-side settings, read from a JSON object such as
//   { "history_limit": 50, "compress_on_save": true, "dangling_policy": "retain",
//     "reconnect_policy": "detach", "log_level": "info", "log_file": "logs/diagram.log" }
struct Settings {
    std::size_t history_limit = 100;
    bool compress_on_save = false;
    bool uri_encode_compressed = true;
    diagram_codec::DanglingPolicy dangling_policy = diagram_codec::DanglingPolicy::Retain;
    diagram_model::ReconnectPolicy reconnect_policy = diagram_model::ReconnectPolicy::Detach;
    std::string log_level = "warn";
    std::string log_file;
};

std::optional<Settings> load_settings_from_json(std::istream& in);
std::optional<Settings> load_settings_from_json_file(const std::string& path);

void apply_logging(const Settings& settings);
diagram_codec::DecodeOptions decode_options(const Settings& settings);
diagram_codec::EncodeOptions encode_options(const Settings& settings);
// History over the diagram with the configured limit and delete policy.
diagram_commands::CommandManager make_command_manager(diagram_model::Diagram& diagram, const Settings& settings);

} // namespace diagram_config
