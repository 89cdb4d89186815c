#include "spy.hpp"
#include "devtools_session.hpp"
#include "plugins.hpp"
#include "snapshot_plugin.hpp"
#include <algorithm>

namespace spyhub {

namespace {

template <typename T> constexpr std::string_view name_of();
template <> constexpr std::string_view name_of<graph_plugin>()       { return "graph"; }
template <> constexpr std::string_view name_of<snapshot_plugin>()    { return "snapshot"; }
template <> constexpr std::string_view name_of<stack_trace_plugin>() { return "stackTrace"; }
template <> constexpr std::string_view name_of<cycle_plugin>()       { return "cycle"; }
template <> constexpr std::string_view name_of<log_plugin>()         { return "log"; }
template <> constexpr std::string_view name_of<pause_plugin>()       { return "pause"; }
template <> constexpr std::string_view name_of<devtools_session>()   { return "devTools"; }

} // namespace

std::string_view plugin_name(const plugin& p) {
    return std::visit([](const auto& ptr) {
        return name_of<typename std::decay_t<decltype(ptr)>::element_type>();
    }, p);
}

spy::spy(iinspector_sptr inspector, value_serializer serializer,
         std::shared_ptr<spdlog::logger> log)
    : m_inspector(std::move(inspector)),
      m_serializer(serializer ? std::move(serializer) : json_value_serializer()),
      m_log(std::move(log))
{}

spy::~spy() {
    teardown();
}

spy::teardown_fn spy::plug(plugin p) {
    uint64_t id = m_next_entry++;
    m_log->debug("spy: plugging {} plugin", plugin_name(p));
    m_plugins.push_back({id, std::move(p)});

    auto done = std::make_shared<bool>(false);
    return [this, id, done]() {
        if (*done) return;
        *done = true;
        unplug(id);
    };
}

void spy::unplug(uint64_t id) {
    auto it = std::find_if(m_plugins.begin(), m_plugins.end(),
                           [id](const entry& e) { return e.id == id; });
    if (it == m_plugins.end()) return;

    plugin p = std::move(it->instance);
    m_plugins.erase(it);

    m_log->debug("spy: unplugged {} plugin", plugin_name(p));
    std::visit([](const auto& ptr) { ptr->teardown(); }, p);
}

void spy::teardown() {
    while (!m_plugins.empty()) {
        unplug(m_plugins.back().id);
    }
}

template <typename F>
void spy::fan_out(F&& hook) {
    ++m_tick;

    // Plugins may be plugged or unplugged by the hooks themselves.
    std::vector<plugin> plugins;
    plugins.reserve(m_plugins.size());
    for (const auto& e : m_plugins) plugins.push_back(e.instance);

    for (const auto& p : plugins) {
        std::visit([&](const auto& ptr) { hook(*ptr); }, p);
    }
}

void spy::before_subscribe(const subscription_ref& ref) {
    fan_out([&](auto& p) { p.before_subscribe(ref); });
}

void spy::after_subscribe(const subscription_ref& ref) {
    fan_out([&](auto& p) { p.after_subscribe(ref); });
}

void spy::before_next(const subscription_ref& ref, const std::any& value,
                      std::function<void()> release) {
    fan_out([&](auto& p) { p.before_next(ref, value); });

    // Wrap the delivery in every controlling deck, first attached outermost.
    std::function<void()> gated = std::move(release);
    if (!gated) gated = [] {};
    std::string serialized;
    for (auto it = m_plugins.rbegin(); it != m_plugins.rend(); ++it) {
        auto pause = std::get_if<std::shared_ptr<pause_plugin>>(&it->instance);
        if (!pause || !(*pause)->controls(ref)) continue;

        if (serialized.empty()) serialized = m_serializer(value);
        std::weak_ptr<pause_plugin> weak = *pause;
        gated = [weak, ref, serialized, inner = std::move(gated)]() {
            auto plugin = weak.lock();
            if (!plugin) {
                inner();
                return;
            }
            plugin->deck().push(deck_item{ref, notification_kind::next, serialized, inner});
        };
    }
    gated();
}

void spy::after_next(const subscription_ref& ref, const std::any& value) {
    fan_out([&](auto& p) { p.after_next(ref, value); });
}

void spy::before_error(const subscription_ref& ref, const std::any& error) {
    fan_out([&](auto& p) { p.before_error(ref, error); });
}

void spy::after_error(const subscription_ref& ref, const std::any& error) {
    fan_out([&](auto& p) { p.after_error(ref, error); });
}

void spy::before_complete(const subscription_ref& ref) {
    fan_out([&](auto& p) { p.before_complete(ref); });
}

void spy::after_complete(const subscription_ref& ref) {
    fan_out([&](auto& p) { p.after_complete(ref); });
}

void spy::before_unsubscribe(const subscription_ref& ref) {
    fan_out([&](auto& p) { p.before_unsubscribe(ref); });
}

void spy::after_unsubscribe(const subscription_ref& ref) {
    fan_out([&](auto& p) { p.after_unsubscribe(ref); });
}

} // namespace spyhub
