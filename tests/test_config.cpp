#include "config.hpp"
#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include <stdexcept>

using namespace spyhub;

namespace {

// YAML file removed when the test ends.
class temp_config {
public:
    explicit temp_config(const std::string& yaml) {
        const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        m_path = std::filesystem::temp_directory_path() /
                 (std::string("spyhub_") + info->name() + ".yaml");
        std::ofstream(m_path) << yaml;
    }
    ~temp_config() {
        std::error_code ec;
        std::filesystem::remove(m_path, ec);
    }

    std::string path() const { return m_path.string(); }

private:
    std::filesystem::path m_path;
};

} // namespace

TEST(config, empty_file_yields_defaults) {
    temp_config file("{}\n");
    auto cfg = load_config(file.path());

    EXPECT_EQ(cfg.nats_address, "127.0.0.1");
    EXPECT_EQ(cfg.nats_port, 4222);
    EXPECT_EQ(cfg.post_subject, "spyhub.posts");
    EXPECT_EQ(cfg.request_subject, "spyhub.requests");
    EXPECT_EQ(cfg.batch_milliseconds, 100u);
    EXPECT_EQ(cfg.batch_notifications, 150u);
    EXPECT_EQ(cfg.keep_values, 32u);
    EXPECT_EQ(cfg.keep_unsubscribed, 256u);
    EXPECT_EQ(cfg.cycle_threshold, 100u);
    EXPECT_TRUE(cfg.stack_traces);
    EXPECT_FALSE(cfg.demo);
    EXPECT_EQ(cfg.log_level, "info");
}

TEST(config, values_override_defaults) {
    temp_config file(
        "nats_address: nats.local\n"
        "nats_port: 4333\n"
        "post_subject: devtools.out\n"
        "request_subject: devtools.in\n"
        "batch_milliseconds: 50\n"
        "batch_notifications: 10\n"
        "keep_values: 4\n"
        "keep_unsubscribed: 8\n"
        "cycle_threshold: 20\n"
        "stack_traces: false\n"
        "demo: true\n"
        "demo_interval_ms: 500\n"
        "log_level: debug\n");
    auto cfg = load_config(file.path());

    EXPECT_EQ(cfg.nats_address, "nats.local");
    EXPECT_EQ(cfg.nats_port, 4333);
    EXPECT_EQ(cfg.post_subject, "devtools.out");
    EXPECT_EQ(cfg.request_subject, "devtools.in");
    EXPECT_EQ(cfg.batch_milliseconds, 50u);
    EXPECT_EQ(cfg.batch_notifications, 10u);
    EXPECT_EQ(cfg.keep_values, 4u);
    EXPECT_EQ(cfg.keep_unsubscribed, 8u);
    EXPECT_EQ(cfg.cycle_threshold, 20u);
    EXPECT_FALSE(cfg.stack_traces);
    EXPECT_TRUE(cfg.demo);
    EXPECT_EQ(cfg.demo_interval_ms, 500u);
    EXPECT_EQ(cfg.log_level, "debug");
}

TEST(config, invalid_log_level_throws) {
    temp_config file("log_level: chatty\n");
    EXPECT_THROW(load_config(file.path()), std::runtime_error);
}

TEST(config, zero_batch_window_throws) {
    temp_config file("batch_milliseconds: 0\n");
    EXPECT_THROW(load_config(file.path()), std::runtime_error);
}

TEST(config, empty_subject_throws) {
    temp_config file("post_subject: \"\"\n");
    EXPECT_THROW(load_config(file.path()), std::runtime_error);
}

TEST(config, missing_file_throws) {
    EXPECT_ANY_THROW(load_config("/nonexistent/spyhub.yaml"));
}

TEST(config, log_level_names) {
    EXPECT_EQ(parse_log_level("trace"), spdlog::level::trace);
    EXPECT_EQ(parse_log_level("warning"), spdlog::level::warn);
    EXPECT_EQ(parse_log_level("err"), spdlog::level::err);
    EXPECT_EQ(parse_log_level("off"), spdlog::level::off);
    EXPECT_FALSE(parse_log_level("verbose").has_value());
}
