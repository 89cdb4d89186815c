#include "config.hpp"
#include <yaml-cpp/yaml.h>
#include <stdexcept>

namespace spyhub {

std::optional<spdlog::level::level_enum> parse_log_level(const std::string& s) {
    if (s == "trace")                  return spdlog::level::trace;
    if (s == "debug")                  return spdlog::level::debug;
    if (s == "info")                   return spdlog::level::info;
    if (s == "warn" || s == "warning") return spdlog::level::warn;
    if (s == "error" || s == "err")    return spdlog::level::err;
    if (s == "off")                    return spdlog::level::off;
    return std::nullopt;
}

hub_config load_config(const std::string& path) {
    YAML::Node root = YAML::LoadFile(path);
    hub_config cfg;

    // NATS connection
    if (auto n = root["nats_address"]) cfg.nats_address = n.as<std::string>();
    if (auto n = root["nats_port"])    cfg.nats_port = n.as<uint16_t>();
    if (auto n = root["tls_cert"])     cfg.tls_cert = n.as<std::string>();
    if (auto n = root["tls_key"])      cfg.tls_key  = n.as<std::string>();
    if (auto n = root["tls_ca"])       cfg.tls_ca   = n.as<std::string>();

    // Subjects
    if (auto n = root["post_subject"])    cfg.post_subject = n.as<std::string>();
    if (auto n = root["request_subject"]) cfg.request_subject = n.as<std::string>();
    if (cfg.post_subject.empty() || cfg.request_subject.empty()) {
        throw std::runtime_error("config: 'post_subject' and 'request_subject' must not be empty");
    }

    // Batching
    if (auto n = root["batch_milliseconds"])  cfg.batch_milliseconds = n.as<uint32_t>();
    if (auto n = root["batch_notifications"]) cfg.batch_notifications = n.as<std::size_t>();
    if (cfg.batch_milliseconds == 0) {
        throw std::runtime_error("config: 'batch_milliseconds' must be positive");
    }

    // History bounds
    if (auto n = root["keep_values"])       cfg.keep_values = n.as<std::size_t>();
    if (auto n = root["keep_unsubscribed"]) cfg.keep_unsubscribed = n.as<std::size_t>();

    // Plugins
    if (auto n = root["cycle_threshold"]) cfg.cycle_threshold = n.as<std::size_t>();
    if (auto n = root["stack_traces"])    cfg.stack_traces = n.as<bool>();

    // Demo
    if (auto n = root["demo"])             cfg.demo = n.as<bool>();
    if (auto n = root["demo_interval_ms"]) cfg.demo_interval_ms = n.as<uint32_t>();

    // Operational
    if (auto n = root["log_level"]) {
        cfg.log_level = n.as<std::string>();
        if (!parse_log_level(cfg.log_level)) {
            throw std::runtime_error("config: invalid 'log_level': " + cfg.log_level);
        }
    }

    return cfg;
}

} // namespace spyhub
