#include "plugins.hpp"
#include <iterator>

namespace spyhub {

std::optional<std::string> retention_queue::push(std::string id) {
    m_ids.push_back(std::move(id));
    if (m_ids.size() <= m_capacity) return std::nullopt;

    std::string evicted = std::move(m_ids.front());
    m_ids.pop_front();
    return evicted;
}

bool matches(spy& s, const subscription_ref& ref, const std::string& match) {
    if (match.empty()) return true;
    auto& inspector = s.inspector();
    if (inspector.identify(ref.observable) == match) return true;
    auto tag = inspector.read_tag(ref.observable);
    return tag && *tag == match;
}

// --- graph_plugin ---

graph_plugin::graph_plugin(spy& s, std::size_t keep_unsubscribed,
                           std::shared_ptr<spdlog::logger> log)
    : m_spy(s), m_log(log), m_registry(log), m_unsubscribed_roots(keep_unsubscribed)
{}

void graph_plugin::before_subscribe(const subscription_ref& ref) {
    std::string id = m_spy.inspector().identify(ref.subscription);
    m_registry.track(id);

    if (!m_frames.empty()) {
        const frame& top = m_frames.back();
        auto kind = top.kind == notification_kind::next ? link_kind::flat : link_kind::source;
        m_registry.link(top.id, id, kind);
    }
    m_frames.push_back({std::move(id), notification_kind::subscribe});
}

void graph_plugin::after_subscribe(const subscription_ref& ref) {
    pop_frame(m_spy.inspector().identify(ref.subscription), notification_kind::subscribe);
}

void graph_plugin::before_next(const subscription_ref& ref, const std::any&) {
    m_frames.push_back({m_spy.inspector().identify(ref.subscription), notification_kind::next});
}

void graph_plugin::after_next(const subscription_ref& ref, const std::any&) {
    pop_frame(m_spy.inspector().identify(ref.subscription), notification_kind::next);
}

void graph_plugin::pop_frame(const std::string& id, notification_kind kind) {
    // Normally the top frame; a subscriber that threw may have skipped its
    // after call, so unwind down to the matching frame.
    for (auto it = m_frames.rbegin(); it != m_frames.rend(); ++it) {
        if (it->id == id && it->kind == kind) {
            m_frames.erase(std::next(it).base(), m_frames.end());
            return;
        }
    }
    m_log->debug("graph: no open {} frame for subscription {}", to_string(kind), id);
}

void graph_plugin::after_unsubscribe(const subscription_ref& ref) {
    std::string id = m_spy.inspector().identify(ref.subscription);
    m_registry.unlink(id);

    if (!m_registry.sink_of(id)) {
        if (auto evicted = m_unsubscribed_roots.push(id)) {
            m_registry.erase(*evicted);
        }
    }
}

// --- stack_trace_plugin ---

stack_trace_plugin::stack_trace_plugin(spy& s, stack_trace_provider provider,
                                       std::size_t keep_unsubscribed)
    : m_spy(s), m_provider(std::move(provider)), m_unsubscribed(keep_unsubscribed)
{}

std::optional<nlohmann::json> stack_trace_plugin::stack_trace_of(const std::string& subscription) const {
    auto it = m_traces.find(subscription);
    if (it != m_traces.end()) return it->second;
    return std::nullopt;
}

void stack_trace_plugin::before_subscribe(const subscription_ref& ref) {
    if (!m_provider) return;
    if (auto trace = m_provider(ref)) {
        m_traces[m_spy.inspector().identify(ref.subscription)] = std::move(*trace);
    }
}

void stack_trace_plugin::after_unsubscribe(const subscription_ref& ref) {
    if (auto evicted = m_unsubscribed.push(m_spy.inspector().identify(ref.subscription))) {
        m_traces.erase(*evicted);
    }
}

// --- cycle_plugin ---

cycle_plugin::cycle_plugin(spy& s, std::size_t threshold, std::shared_ptr<spdlog::logger> log)
    : m_spy(s), m_threshold(threshold), m_log(std::move(log))
{}

void cycle_plugin::before_next(const subscription_ref& ref, const std::any& value) {
    auto& inspector = m_spy.inspector();
    std::string id = inspector.identify(ref.subscription);

    std::size_t depth = ++m_depths[id];
    if (depth <= m_threshold || m_in_cycle) return;
    m_in_cycle = true;
    ++m_reported;

    std::string trace = "(unknown)";
    if (auto plugin = m_spy.find<stack_trace_plugin>()) {
        if (auto captured = plugin->stack_trace_of(id)) {
            trace = captured->is_string() ? captured->get<std::string>() : captured->dump();
        }
    }

    m_log->warn("Cyclic next detected; type = {}; path = {}; value = {}; subscribed at\n{}",
               inspector.infer_type(ref.observable),
               inspector.infer_path(ref.observable),
               m_spy.serializer()(value),
               trace);
}

void cycle_plugin::after_next(const subscription_ref& ref, const std::any&) {
    auto it = m_depths.find(m_spy.inspector().identify(ref.subscription));
    if (it == m_depths.end()) return;
    if (--it->second == 0) m_depths.erase(it);
    if (m_depths.empty()) m_in_cycle = false;
}

void cycle_plugin::after_unsubscribe(const subscription_ref& ref) {
    m_depths.erase(m_spy.inspector().identify(ref.subscription));
    if (m_depths.empty()) m_in_cycle = false;
}

// --- log_plugin ---

log_plugin::log_plugin(spy& s, std::string match, std::shared_ptr<spdlog::logger> log)
    : m_spy(s), m_match(std::move(match)), m_log(std::move(log))
{}

void log_plugin::log(const subscription_ref& ref, notification_prefix prefix,
                     notification_kind kind, const std::any* value) {
    if (!matches(m_spy, ref, m_match)) return;

    auto& inspector = m_spy.inspector();
    auto tag = inspector.read_tag(ref.observable);
    std::string type = notification_type(prefix, kind);

    if (value) {
        m_log->info("{}; path = {}; tag = {}; subscription = {}; value = {}",
                   type, inspector.infer_path(ref.observable), tag.value_or("none"),
                   inspector.identify(ref.subscription), m_spy.serializer()(*value));
    } else {
        m_log->info("{}; path = {}; tag = {}; subscription = {}",
                   type, inspector.infer_path(ref.observable), tag.value_or("none"),
                   inspector.identify(ref.subscription));
    }
}

void log_plugin::before_subscribe(const subscription_ref& ref) {
    log(ref, notification_prefix::before, notification_kind::subscribe);
}

void log_plugin::after_subscribe(const subscription_ref& ref) {
    log(ref, notification_prefix::after, notification_kind::subscribe);
}

void log_plugin::before_next(const subscription_ref& ref, const std::any& value) {
    log(ref, notification_prefix::before, notification_kind::next, &value);
}

void log_plugin::before_error(const subscription_ref& ref, const std::any& error) {
    log(ref, notification_prefix::before, notification_kind::error, &error);
}

void log_plugin::before_complete(const subscription_ref& ref) {
    log(ref, notification_prefix::before, notification_kind::complete);
}

void log_plugin::before_unsubscribe(const subscription_ref& ref) {
    log(ref, notification_prefix::before, notification_kind::unsubscribe);
}

void log_plugin::after_unsubscribe(const subscription_ref& ref) {
    log(ref, notification_prefix::after, notification_kind::unsubscribe);
}

// --- pause_plugin ---

pause_plugin::pause_plugin(spy& s, std::string match, std::shared_ptr<spdlog::logger> log)
    : m_spy(s), m_match(match), m_deck(std::move(match), std::move(log))
{}

bool pause_plugin::controls(const subscription_ref& ref) const {
    return matches(m_spy, ref, m_match);
}

void pause_plugin::teardown() {
    m_deck.resume();
}

} // namespace spyhub
