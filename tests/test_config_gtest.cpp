#include <gtest/gtest.h>
#include <diagram_config/settings.hpp>
#include <diagram_model/logging.hpp>
#include <filesystem>
#include <fstream>
#include <sstream>

using namespace diagram_config;

namespace {

std::optional<Settings> parse(const std::string& text) {
    std::istringstream in(text);
    return load_settings_from_json(in);
}

} // namespace

TEST(SettingsTest, EmptyObjectKeepsDefaults) {
    const auto settings = parse("{}");
    ASSERT_TRUE(settings.has_value());
    EXPECT_EQ(settings->history_limit, 100u);
    EXPECT_FALSE(settings->compress_on_save);
    EXPECT_TRUE(settings->uri_encode_compressed);
    EXPECT_EQ(settings->dangling_policy, diagram_codec::DanglingPolicy::Retain);
    EXPECT_EQ(settings->reconnect_policy, diagram_model::ReconnectPolicy::Detach);
    EXPECT_EQ(settings->log_level, "warn");
    EXPECT_TRUE(settings->log_file.empty());
}

TEST(SettingsTest, ReadsEveryKey) {
    const auto settings = parse(R"({
        "history_limit": 25,
        "compress_on_save": true,
        "uri_encode_compressed": false,
        "dangling_policy": "reject",
        "reconnect_policy": "cascade",
        "log_level": "debug",
        "log_file": "logs/diagram.log"
    })");
    ASSERT_TRUE(settings.has_value());
    EXPECT_EQ(settings->history_limit, 25u);
    EXPECT_TRUE(settings->compress_on_save);
    EXPECT_FALSE(settings->uri_encode_compressed);
    EXPECT_EQ(settings->dangling_policy, diagram_codec::DanglingPolicy::Reject);
    EXPECT_EQ(settings->reconnect_policy, diagram_model::ReconnectPolicy::Cascade);
    EXPECT_EQ(settings->log_level, "debug");
    EXPECT_EQ(settings->log_file, "logs/diagram.log");
}

TEST(SettingsTest, RejectsBadValues) {
    EXPECT_FALSE(parse("[]").has_value());
    EXPECT_FALSE(parse("{ \"history_limit\": -1 }").has_value());
    EXPECT_FALSE(parse("{ \"history_limit\": \"ten\" }").has_value());
    EXPECT_FALSE(parse("{ \"compress_on_save\": 1 }").has_value());
    EXPECT_FALSE(parse("{ \"dangling_policy\": \"ignore\" }").has_value());
    EXPECT_FALSE(parse("{ \"reconnect_policy\": \"retain\" }").has_value());
    EXPECT_FALSE(parse("{ \"log_level\": \"loud\" }").has_value());
    EXPECT_FALSE(parse("{ \"history_limit\": ").has_value());
}

TEST(SettingsTest, UnknownKeysAreIgnored) {
    const auto settings = parse("{ \"theme\": \"dark\", \"history_limit\": 7 }");
    ASSERT_TRUE(settings.has_value());
    EXPECT_EQ(settings->history_limit, 7u);
}

TEST(SettingsTest, LoadsFromFile) {
    const auto path = std::filesystem::temp_directory_path() / "diagram_settings_test.json";
    {
        std::ofstream out(path);
        out << R"({ "dangling_policy": "detach", "compress_on_save": true })";
    }
    const auto settings = load_settings_from_json_file(path.string());
    std::filesystem::remove(path);
    ASSERT_TRUE(settings.has_value());
    EXPECT_EQ(settings->dangling_policy, diagram_codec::DanglingPolicy::Detach);
    EXPECT_TRUE(settings->compress_on_save);

    EXPECT_FALSE(load_settings_from_json_file("/nonexistent/settings.json").has_value());
}

TEST(SettingsTest, MapsToCodecOptions) {
    Settings settings;
    EXPECT_EQ(encode_options(settings).compression, diagram_codec::Compression::Preserve);
    EXPECT_TRUE(encode_options(settings).uri_encode);
    EXPECT_EQ(decode_options(settings).dangling, diagram_codec::DanglingPolicy::Retain);

    settings.compress_on_save = true;
    settings.uri_encode_compressed = false;
    settings.dangling_policy = diagram_codec::DanglingPolicy::Reject;
    EXPECT_EQ(encode_options(settings).compression, diagram_codec::Compression::Always);
    EXPECT_FALSE(encode_options(settings).uri_encode);
    EXPECT_EQ(decode_options(settings).dangling, diagram_codec::DanglingPolicy::Reject);
}

TEST(SettingsTest, ConfiguresCommandManager) {
    const auto settings = parse(R"({ "history_limit": 2, "reconnect_policy": "cascade" })");
    ASSERT_TRUE(settings.has_value());
    diagram_model::Diagram diagram;
    auto manager = make_command_manager(diagram, *settings);
    EXPECT_EQ(manager.history_limit(), 2u);
    EXPECT_EQ(manager.reconnect_policy(), diagram_model::ReconnectPolicy::Cascade);

    const std::string page = "page-1";
    ASSERT_TRUE(manager.create_element(page, diagram_model::make_shape("A", "", { 0, 0, 10, 10 })).ok());
    ASSERT_TRUE(manager.create_element(page, diagram_model::make_shape("B", "", { 50, 0, 10, 10 })).ok());
    ASSERT_TRUE(manager.connect(page, "c", "A", "B").ok());
    EXPECT_EQ(manager.history_size(), 2u);
    ASSERT_TRUE(manager.delete_element(page, "A").ok());
    EXPECT_EQ(diagram.element(page, "c"), nullptr);
}

TEST(SettingsTest, ApplyLoggingSetsLevel) {
    Settings settings;
    settings.log_level = "error";
    apply_logging(settings);
    EXPECT_EQ(diagram_model::core_logger()->level(), spdlog::level::err);

    settings.log_level = "warn";
    apply_logging(settings);
    EXPECT_EQ(diagram_model::core_logger()->level(), spdlog::level::warn);
}
