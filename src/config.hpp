#pragma once

#include <spdlog/common.h>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

namespace spyhub {

struct hub_config {
    // NATS connection carrying the devtools posts
    std::string nats_address = "127.0.0.1";
    uint16_t nats_port = 4222;
    std::string tls_cert;
    std::string tls_key;
    std::string tls_ca;

    // Outbound messages (batches, responses) are published here
    std::string post_subject = "spyhub.posts";
    // Inbound requests from the remote viewer arrive here
    std::string request_subject = "spyhub.requests";

    // Batching
    uint32_t batch_milliseconds = 100;
    std::size_t batch_notifications = 150;

    // History bounds for the snapshot plugin
    std::size_t keep_values = 32;
    std::size_t keep_unsubscribed = 256;

    // Plugins
    std::size_t cycle_threshold = 100;
    bool stack_traces = true;

    // Synthetic instrumented pipeline
    bool demo = false;
    uint32_t demo_interval_ms = 250;

    // Operational
    std::string log_level = "info";
};

// Parse config from YAML file. Throws on error.
hub_config load_config(const std::string& path);

// Parse a log level name. Returns nullopt if invalid.
std::optional<spdlog::level::level_enum> parse_log_level(const std::string& s);

} // namespace spyhub
