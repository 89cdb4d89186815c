#include "snapshot.hpp"

namespace spyhub {

namespace {

template <typename T>
nlohmann::json or_null(const std::optional<T>& value) {
    return value ? nlohmann::json(*value) : nlohmann::json(nullptr);
}

nlohmann::json ids(const std::set<std::string>& set) {
    return nlohmann::json(std::vector<std::string>(set.begin(), set.end()));
}

} // namespace

void to_json(nlohmann::json& j, const value_record& v) {
    j = {
        {"tick", v.tick},
        {"timestamp", v.timestamp},
        {"value", {{"json", v.value}}}
    };
}

void to_json(nlohmann::json& j, const observable_record& o) {
    j = {
        {"id", o.id},
        {"path", o.path},
        {"subscriptions", ids(o.subscriptions)},
        {"tag", or_null(o.tag)},
        {"tick", o.tick},
        {"type", o.type}
    };
}

void to_json(nlohmann::json& j, const subscriber_record& s) {
    j = {
        {"id", s.id},
        {"subscriptions", ids(s.subscriptions)},
        {"tick", s.tick},
        {"values", s.values},
        {"valuesFlushed", s.values_flushed}
    };
}

void to_json(nlohmann::json& j, const subscription_record& s) {
    j = {
        {"completeTimestamp", or_null(s.complete_timestamp)},
        {"error", s.error ? nlohmann::json({{"json", *s.error}}) : nlohmann::json(nullptr)},
        {"errorTimestamp", or_null(s.error_timestamp)},
        {"graph", {
            {"flats", ids(s.flats)},
            {"flatsFlushed", s.flats_flushed},
            {"rootSink", or_null(s.root_sink)},
            {"sink", or_null(s.sink)},
            {"sources", ids(s.sources)},
            {"sourcesFlushed", s.sources_flushed}
        }},
        {"id", s.id},
        {"nextCount", s.next_count},
        {"nextTimestamp", or_null(s.next_timestamp)},
        {"observable", s.observable},
        {"stackTrace", or_null(s.stack_trace)},
        {"subscribeTimestamp", s.subscribe_timestamp},
        {"subscriber", s.subscriber},
        {"tick", s.tick},
        {"unsubscribeTimestamp", or_null(s.unsubscribe_timestamp)},
        {"values", s.values},
        {"valuesFlushed", s.values_flushed}
    };
}

void to_json(nlohmann::json& j, const snapshot& s) {
    auto observables = nlohmann::json::array();
    for (const auto& [id, o] : s.observables) observables.push_back(o);

    auto subscribers = nlohmann::json::array();
    for (const auto& [id, sub] : s.subscribers) subscribers.push_back(sub);

    auto subscriptions = nlohmann::json::array();
    for (const auto& [id, sub] : s.subscriptions) subscriptions.push_back(sub);

    j = {
        {"observables", std::move(observables)},
        {"subscribers", std::move(subscribers)},
        {"subscriptions", std::move(subscriptions)},
        {"tick", s.tick}
    };
}

} // namespace spyhub
