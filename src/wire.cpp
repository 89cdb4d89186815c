#include "wire.hpp"

namespace spyhub {

namespace {

template <typename T>
nlohmann::json or_null(const std::optional<T>& value) {
    return value ? nlohmann::json(*value) : nlohmann::json(nullptr);
}

} // namespace

std::string_view to_string(broadcast_type type) {
    switch (type) {
        case broadcast_type::notification:  return "notification";
        case broadcast_type::deck_stats:    return "deck-stats";
        case broadcast_type::snapshot_hint: return "snapshot-hint";
    }
    return "unknown";
}

void to_json(nlohmann::json& j, const graph_payload& g) {
    j = {
        {"flats", g.flats},
        {"flatsFlushed", g.flats_flushed},
        {"rootSink", or_null(g.root_sink)},
        {"sink", or_null(g.sink)},
        {"sources", g.sources},
        {"sourcesFlushed", g.sources_flushed}
    };
}

void to_json(nlohmann::json& j, const notification_payload& n) {
    j = {
        {"id", n.id},
        {"observable", {
            {"id", n.observable.id},
            {"path", n.observable.path},
            {"tag", or_null(n.observable.tag)},
            {"type", n.observable.type}
        }},
        {"subscriber", {{"id", n.subscriber_id}}},
        {"subscription", {
            {"error", n.error ? nlohmann::json({{"json", *n.error}}) : nlohmann::json(nullptr)},
            {"graph", or_null(n.graph)},
            {"id", n.subscription_id},
            {"stackTrace", or_null(n.stack_trace)}
        }},
        {"tick", n.tick},
        {"timestamp", n.timestamp},
        {"type", n.type}
    };
    if (n.value) {
        j["value"] = {{"json", *n.value}};
    }
}

void to_json(nlohmann::json& j, const deck_stats_payload& s) {
    j = {
        {"id", s.id},
        {"notifications", s.stats.notifications},
        {"paused", s.stats.paused},
        {"released", s.stats.released},
        {"skipped", s.stats.skipped},
        {"stepped", s.stats.stepped},
        {"cleared", s.stats.cleared}
    };
}

void to_json(nlohmann::json& j, const broadcast& b) {
    j = {
        {"messageType", std::string(message_broadcast)},
        {"broadcastType", std::string(to_string(b.type()))}
    };
    if (auto n = std::get_if<notification_payload>(&b.body)) {
        j["notification"] = *n;
    } else if (auto s = std::get_if<deck_stats_payload>(&b.body)) {
        j["stats"] = *s;
    }
}

void to_json(nlohmann::json& j, const batch& b) {
    j = {
        {"messageType", std::string(message_batch)},
        {"messages", b.messages}
    };
}

void to_json(nlohmann::json& j, const response& r) {
    j = {
        {"messageType", std::string(message_response)},
        {"request", r.request}
    };
    if (r.error)     j["error"] = *r.error;
    if (r.plugin_id) j["pluginId"] = *r.plugin_id;
    if (r.snapshot)  j["snapshot"] = *r.snapshot;
}

nlohmann::json to_json(const message& m) {
    return std::visit([](const auto& alt) { return nlohmann::json(alt); }, m);
}

} // namespace spyhub
