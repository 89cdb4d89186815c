#pragma once

#include "deck.hpp"
#include "graph_registry.hpp"
#include "inspector.hpp"
#include "spy.hpp"
#include "subscription_ref.hpp"
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <any>
#include <cstddef>
#include <deque>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace spyhub {

// No-op hooks. Plugins shadow the ones they care about; the spy calls
// them statically through the plugin variant.
struct plugin_base {
    void before_subscribe(const subscription_ref&) {}
    void after_subscribe(const subscription_ref&) {}
    void before_next(const subscription_ref&, const std::any&) {}
    void after_next(const subscription_ref&, const std::any&) {}
    void before_error(const subscription_ref&, const std::any&) {}
    void after_error(const subscription_ref&, const std::any&) {}
    void before_complete(const subscription_ref&) {}
    void after_complete(const subscription_ref&) {}
    void before_unsubscribe(const subscription_ref&) {}
    void after_unsubscribe(const subscription_ref&) {}
    void teardown() {}
};

// Remembers the most recent `capacity` ids. push() returns the id that
// fell off the end, if any.
class retention_queue {
public:
    explicit retention_queue(std::size_t capacity) : m_capacity(capacity) {}

    std::optional<std::string> push(std::string id);

private:
    std::size_t m_capacity;
    std::deque<std::string> m_ids;
};

// True if match is empty or names the observable by id or tag.
bool matches(spy& s, const subscription_ref& ref, const std::string& match);

// Builds the graph registry from the order of lifecycle calls: a
// subscribe made while another subscribe is in progress is a source of
// it; a subscribe made while a next is in progress is a flat.
class graph_plugin : public plugin_base {
public:
    graph_plugin(spy& s, std::size_t keep_unsubscribed, std::shared_ptr<spdlog::logger> log);

    graph_registry& registry() { return m_registry; }
    const graph_registry& registry() const { return m_registry; }

    void before_subscribe(const subscription_ref& ref);
    void after_subscribe(const subscription_ref& ref);
    void before_next(const subscription_ref& ref, const std::any& value);
    void after_next(const subscription_ref& ref, const std::any& value);
    void after_unsubscribe(const subscription_ref& ref);

private:
    struct frame {
        std::string id;
        notification_kind kind;
    };

    void pop_frame(const std::string& id, notification_kind kind);

    spy& m_spy;
    std::shared_ptr<spdlog::logger> m_log;
    graph_registry m_registry;
    std::vector<frame> m_frames;
    retention_queue m_unsubscribed_roots;
};

// Captures the provider's stack trace for each subscription at subscribe time.
class stack_trace_plugin : public plugin_base {
public:
    stack_trace_plugin(spy& s, stack_trace_provider provider, std::size_t keep_unsubscribed);

    std::optional<nlohmann::json> stack_trace_of(const std::string& subscription) const;

    void before_subscribe(const subscription_ref& ref);
    void after_unsubscribe(const subscription_ref& ref);

private:
    spy& m_spy;
    stack_trace_provider m_provider;
    std::unordered_map<std::string, nlohmann::json> m_traces;
    retention_queue m_unsubscribed;
};

// Warns when a subscription receives a next while already inside a next
// more than `threshold` levels deep. One warning per cycle: nothing more
// is reported until the outermost next has returned.
class cycle_plugin : public plugin_base {
public:
    cycle_plugin(spy& s, std::size_t threshold, std::shared_ptr<spdlog::logger> log);

    // Warnings issued so far.
    std::size_t reported() const { return m_reported; }

    void before_next(const subscription_ref& ref, const std::any& value);
    void after_next(const subscription_ref& ref, const std::any& value);
    void after_unsubscribe(const subscription_ref& ref);

private:
    spy& m_spy;
    std::size_t m_threshold;
    std::shared_ptr<spdlog::logger> m_log;
    std::unordered_map<std::string, std::size_t> m_depths;
    std::size_t m_reported = 0;
    bool m_in_cycle = false;
};

// Logs every notification of the matching observables.
class log_plugin : public plugin_base {
public:
    log_plugin(spy& s, std::string match, std::shared_ptr<spdlog::logger> log);

    const std::string& match() const { return m_match; }

    void before_subscribe(const subscription_ref& ref);
    void after_subscribe(const subscription_ref& ref);
    void before_next(const subscription_ref& ref, const std::any& value);
    void before_error(const subscription_ref& ref, const std::any& error);
    void before_complete(const subscription_ref& ref);
    void before_unsubscribe(const subscription_ref& ref);
    void after_unsubscribe(const subscription_ref& ref);

private:
    void log(const subscription_ref& ref, notification_prefix prefix,
             notification_kind kind, const std::any* value = nullptr);

    spy& m_spy;
    std::string m_match;
    std::shared_ptr<spdlog::logger> m_log;
};

// Holds back next notifications of the matching observables in a deck.
// The spy routes the gating; the plugin only decides what it controls.
class pause_plugin : public plugin_base {
public:
    pause_plugin(spy& s, std::string match, std::shared_ptr<spdlog::logger> log);

    bool controls(const subscription_ref& ref) const;

    spyhub::deck& deck() { return m_deck; }
    const spyhub::deck& deck() const { return m_deck; }

    // Nothing stays stranded: whatever is buffered is released.
    void teardown();

private:
    spy& m_spy;
    std::string m_match;
    spyhub::deck m_deck;
};

} // namespace spyhub
