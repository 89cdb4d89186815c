#include "snapshot_plugin.hpp"

namespace spyhub {

snapshot_plugin::snapshot_plugin(spy& s, std::size_t keep_values, std::size_t keep_unsubscribed,
                                 std::shared_ptr<spdlog::logger> log)
    : m_spy(s), m_keep_values(keep_values), m_log(std::move(log)),
      m_unsubscribed(keep_unsubscribed)
{}

subscription_record* snapshot_plugin::find(const subscription_ref& ref) {
    auto it = m_subscriptions.find(m_spy.inspector().identify(ref.subscription));
    return it != m_subscriptions.end() ? &it->second : nullptr;
}

void snapshot_plugin::append_value(std::vector<value_record>& values, bool& flushed,
                                   const value_record& v) const {
    values.push_back(v);
    if (values.size() > m_keep_values) {
        values.erase(values.begin(), values.begin() + (values.size() - m_keep_values));
        flushed = true;
    }
}

void snapshot_plugin::before_subscribe(const subscription_ref& ref) {
    auto& inspector = m_spy.inspector();
    uint64_t tick = m_spy.tick();

    std::string observable_id = inspector.identify(ref.observable);
    std::string subscriber_id = inspector.identify(ref.subscriber);
    std::string subscription_id = inspector.identify(ref.subscription);

    auto [obs_it, new_obs] = m_observables.try_emplace(observable_id);
    auto& obs = obs_it->second;
    if (new_obs) {
        obs.id = observable_id;
        obs.path = inspector.infer_path(ref.observable);
        obs.tag = inspector.read_tag(ref.observable);
        obs.type = inspector.infer_type(ref.observable);
    }
    obs.subscriptions.insert(subscription_id);
    obs.tick = tick;

    auto& subscriber = m_subscribers[subscriber_id];
    subscriber.id = subscriber_id;
    subscriber.subscriptions.insert(subscription_id);
    subscriber.tick = tick;

    auto& sub = m_subscriptions[subscription_id];
    sub.id = subscription_id;
    sub.observable = observable_id;
    sub.subscriber = subscriber_id;
    sub.subscribe_timestamp = timestamp_ms();
    sub.tick = tick;
    if (auto plugin = m_spy.find<stack_trace_plugin>()) {
        sub.stack_trace = plugin->stack_trace_of(subscription_id);
    }
}

void snapshot_plugin::before_next(const subscription_ref& ref, const std::any& value) {
    subscription_record* sub = find(ref);
    if (!sub) return;

    value_record v{m_spy.tick(), timestamp_ms(), m_spy.serializer()(value)};

    ++sub->next_count;
    sub->next_timestamp = v.timestamp;
    sub->tick = v.tick;
    append_value(sub->values, sub->values_flushed, v);

    auto it = m_subscribers.find(sub->subscriber);
    if (it != m_subscribers.end()) {
        it->second.tick = v.tick;
        append_value(it->second.values, it->second.values_flushed, v);
    }
}

void snapshot_plugin::before_error(const subscription_ref& ref, const std::any& error) {
    subscription_record* sub = find(ref);
    if (!sub) return;
    sub->error = m_spy.serializer()(error);
    sub->error_timestamp = timestamp_ms();
    sub->tick = m_spy.tick();
}

void snapshot_plugin::before_complete(const subscription_ref& ref) {
    subscription_record* sub = find(ref);
    if (!sub) return;
    sub->complete_timestamp = timestamp_ms();
    sub->tick = m_spy.tick();
}

void snapshot_plugin::after_unsubscribe(const subscription_ref& ref) {
    subscription_record* sub = find(ref);
    if (!sub) return;
    sub->unsubscribe_timestamp = timestamp_ms();
    sub->tick = m_spy.tick();

    if (auto evicted = m_unsubscribed.push(sub->id)) {
        evict(*evicted);
    }
}

void snapshot_plugin::evict(const std::string& subscription) {
    auto it = m_subscriptions.find(subscription);
    if (it == m_subscriptions.end()) return;

    auto obs = m_observables.find(it->second.observable);
    if (obs != m_observables.end()) {
        obs->second.subscriptions.erase(subscription);
    }

    auto subscriber = m_subscribers.find(it->second.subscriber);
    if (subscriber != m_subscribers.end()) {
        subscriber->second.subscriptions.erase(subscription);
        if (subscriber->second.subscriptions.empty()) {
            m_subscribers.erase(subscriber);
        }
    }

    m_subscriptions.erase(it);
    m_log->debug("snapshot: evicted subscription {}", subscription);
}

std::unique_ptr<const snapshot> snapshot_plugin::snapshot_all() const {
    auto snap = std::make_unique<snapshot>();
    snap->tick = m_spy.tick();

    for (const auto& [id, obs] : m_observables) snap->observables.emplace(id, obs);
    for (const auto& [id, sub] : m_subscribers) snap->subscribers.emplace(id, sub);
    for (const auto& [id, sub] : m_subscriptions) snap->subscriptions.emplace(id, sub);

    // Resolve graph links, keeping only ids that are part of this snapshot.
    std::shared_ptr<const graph_plugin> graph = m_spy.find<graph_plugin>();
    auto known = [&](const std::optional<std::string>& id) -> std::optional<std::string> {
        if (id && snap->subscriptions.count(*id)) return id;
        return std::nullopt;
    };

    // Traces captured after the subscription record was made.
    if (auto traces = m_spy.find<stack_trace_plugin>()) {
        for (auto& [id, sub] : snap->subscriptions) {
            if (!sub.stack_trace) sub.stack_trace = traces->stack_trace_of(id);
        }
    }

    for (auto& [id, sub] : snap->subscriptions) {
        if (!graph) continue;
        const graph_registry& registry = graph->registry();
        if (!registry.contains(id)) continue;

        sub.sink = known(registry.sink_of(id));
        sub.root_sink = known(registry.root_sink_of(id));
        for (const auto& source : registry.sources_of(id)) {
            if (snap->subscriptions.count(source)) sub.sources.insert(source);
        }
        for (const auto& flat : registry.flats_of(id)) {
            if (snap->subscriptions.count(flat)) sub.flats.insert(flat);
        }
        sub.sources_flushed = registry.sources_flushed_count(id) > 0;
        sub.flats_flushed = registry.flats_flushed_count(id) > 0;
    }

    m_log->debug("snapshot: {} observables, {} subscribers, {} subscriptions at tick {}",
                snap->observables.size(), snap->subscribers.size(),
                snap->subscriptions.size(), snap->tick);
    return snap;
}

} // namespace spyhub
