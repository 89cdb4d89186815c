#pragma once

#include "deck.hpp"
#include "graph_registry.hpp"
#include "snapshot.hpp"
#include <nlohmann/json.hpp>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace spyhub {

inline constexpr std::string_view message_batch = "batch";
inline constexpr std::string_view message_broadcast = "broadcast";
inline constexpr std::string_view message_request = "request";
inline constexpr std::string_view message_response = "response";

struct observable_descriptor {
    std::string id;
    std::string path;
    std::optional<std::string> tag;
    std::string type;
};

struct notification_payload {
    std::string id;
    observable_descriptor observable;
    std::string subscriber_id;

    // subscription descriptor
    std::optional<std::string> error;  // serialized
    std::optional<graph_payload> graph;
    std::string subscription_id;
    std::optional<nlohmann::json> stack_trace;

    uint64_t tick = 0;
    int64_t timestamp = 0;
    std::string type;                  // "<before|after>-<notification>"
    std::optional<std::string> value;  // serialized; next and error only
};

struct deck_stats_payload {
    std::string id;
    deck_stats stats;
};

struct snapshot_hint {};

// Order matches the alternatives of broadcast::body.
enum class broadcast_type {
    notification,
    deck_stats,
    snapshot_hint
};

struct broadcast {
    std::variant<notification_payload, deck_stats_payload, snapshot_hint> body;

    broadcast_type type() const {
        return static_cast<broadcast_type>(body.index());
    }
};

struct batch {
    std::vector<broadcast> messages;
};

struct response {
    nlohmann::json request;
    std::optional<std::string> error;
    std::optional<std::string> plugin_id;
    std::shared_ptr<const spyhub::snapshot> snapshot;
};

using message = std::variant<batch, broadcast, response>;

std::string_view to_string(broadcast_type type);

void to_json(nlohmann::json& j, const graph_payload& g);
void to_json(nlohmann::json& j, const notification_payload& n);
void to_json(nlohmann::json& j, const deck_stats_payload& s);
void to_json(nlohmann::json& j, const broadcast& b);
void to_json(nlohmann::json& j, const batch& b);
void to_json(nlohmann::json& j, const response& r);

nlohmann::json to_json(const message& m);

} // namespace spyhub
