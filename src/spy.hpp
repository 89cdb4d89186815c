#pragma once

#include "inspector.hpp"
#include "subscription_ref.hpp"
#include <spdlog/spdlog.h>
#include <any>
#include <cstdint>
#include <functional>
#include <memory>
#include <string_view>
#include <variant>
#include <vector>

namespace spyhub {

class graph_plugin;
class snapshot_plugin;
class stack_trace_plugin;
class cycle_plugin;
class log_plugin;
class pause_plugin;
class devtools_session;

// A pipeline observer. Every alternative exposes the same hook set
// (before_*/after_* for each notification kind) and a teardown().
using plugin = std::variant<
    std::shared_ptr<graph_plugin>,
    std::shared_ptr<snapshot_plugin>,
    std::shared_ptr<stack_trace_plugin>,
    std::shared_ptr<cycle_plugin>,
    std::shared_ptr<log_plugin>,
    std::shared_ptr<pause_plugin>,
    std::shared_ptr<devtools_session>>;

// "graph", "snapshot", "stackTrace", "cycle", "log", "pause", "devTools"
std::string_view plugin_name(const plugin& p);

// Receives raw lifecycle calls from whatever intercepts the stream
// library and fans them out to the attached plugins. Single threaded:
// every call must come from the session's event loop.
class spy {
public:
    using teardown_fn = std::function<void()>;

    spy(iinspector_sptr inspector, value_serializer serializer,
        std::shared_ptr<spdlog::logger> log);
    ~spy();

    spy(const spy&) = delete;
    spy& operator=(const spy&) = delete;

    // Attach a plugin. The returned teardown detaches it and calls the
    // plugin's own teardown; calling it more than once is a no-op.
    teardown_fn plug(plugin p);

    // First attached plugin of the given kind, or null.
    template <typename T>
    std::shared_ptr<T> find() const {
        for (const auto& e : m_plugins) {
            if (auto p = std::get_if<std::shared_ptr<T>>(&e.instance)) return *p;
        }
        return nullptr;
    }

    std::size_t plugin_count() const { return m_plugins.size(); }

    // Logical clock; advanced by every lifecycle call.
    uint64_t tick() const { return m_tick; }

    iinspector& inspector() { return *m_inspector; }
    const value_serializer& serializer() const { return m_serializer; }
    std::shared_ptr<spdlog::logger> logger() const { return m_log; }

    // Detach and tear down every plugin.
    void teardown();

    void before_subscribe(const subscription_ref& ref);
    void after_subscribe(const subscription_ref& ref);

    // release performs the downstream delivery of the value. Pause plugins
    // controlling ref may hold it back; otherwise it runs before returning.
    void before_next(const subscription_ref& ref, const std::any& value,
                     std::function<void()> release = {});
    void after_next(const subscription_ref& ref, const std::any& value);

    void before_error(const subscription_ref& ref, const std::any& error);
    void after_error(const subscription_ref& ref, const std::any& error);
    void before_complete(const subscription_ref& ref);
    void after_complete(const subscription_ref& ref);
    void before_unsubscribe(const subscription_ref& ref);
    void after_unsubscribe(const subscription_ref& ref);

private:
    struct entry {
        uint64_t id;
        spyhub::plugin instance;
    };

    template <typename F>
    void fan_out(F&& hook);

    void unplug(uint64_t id);

    iinspector_sptr m_inspector;
    value_serializer m_serializer;
    std::shared_ptr<spdlog::logger> m_log;

    uint64_t m_tick = 0;
    uint64_t m_next_entry = 1;
    std::vector<entry> m_plugins;
};

} // namespace spyhub
