#include "devtools_session.hpp"
#include "snapshot_plugin.hpp"
#include <algorithm>

namespace spyhub {

namespace {

// Post and plugin ids arrive as strings, but tolerate numbers.
std::string as_id(const nlohmann::json& value) {
    return value.is_string() ? value.get<std::string>() : value.dump();
}

} // namespace

devtools_session::devtools_session(asio::io_context& ioc, spy& s, iconnection_sptr conn,
                                   batch_settings settings,
                                   std::shared_ptr<spdlog::logger> log)
    : m_spy(s), m_conn(std::move(conn)), m_settings(settings),
      m_log(std::move(log)), m_batch_timer(ioc)
{}

devtools_session::~devtools_session() {
    teardown();
}

void devtools_session::start() {
    if (!m_conn) {
        m_log->info("devtools: no connection - session inert");
        return;
    }

    std::weak_ptr<devtools_session> weak = weak_from_this();
    m_conn->subscribe([weak](const nlohmann::json& post) {
        auto self = weak.lock();
        if (!self || self->m_torn_down) return;

        auto r = self->handle_post(post);
        if (r && self->m_conn) {
            self->m_conn->post(*r);
        }
    });
    m_log->info("devtools: session started (batch={}ms, max notifications={})",
               m_settings.window.count(), m_settings.max_notifications);
}

void devtools_session::teardown() {
    if (m_torn_down) return;
    m_torn_down = true;

    m_batch_timer.cancel();
    m_batch_open = false;
    m_queue.clear();

    // Teardown of one plugin must not invalidate the iteration.
    std::vector<std::string> ids;
    ids.reserve(m_plugins.size());
    for (const auto& [id, record] : m_plugins) ids.push_back(id);
    for (const auto& id : ids) teardown_plugin(id);

    if (m_conn) {
        m_conn->disconnect();
        m_conn.reset();
    }
    m_log->info("devtools: session torn down");
}

// --- requests ---

std::optional<response> devtools_session::handle_post(const nlohmann::json& post) {
    if (!post.is_object()) return std::nullopt;
    auto type_it = post.find("messageType");
    if (type_it == post.end() || !type_it->is_string() ||
        type_it->get<std::string>() != message_request) {
        m_log->debug("devtools: ignoring post that is not a request");
        return std::nullopt;
    }

    response r;
    r.request = post;

    try {
        std::string request_type = post.at("requestType").get<std::string>();
        m_log->debug("devtools: {} request", request_type);

        if (request_type == "log") {
            std::string spy_id = as_id(post.at("spyId"));
            std::string post_id = as_id(post.at("postId"));
            record_plugin(spy_id, post_id, std::make_shared<log_plugin>(m_spy, spy_id, m_log));
            r.plugin_id = post_id;

        } else if (request_type == "log-teardown" || request_type == "pause-teardown") {
            teardown_plugin(as_id(post.at("pluginId")));

        } else if (request_type == "pause") {
            std::string spy_id = as_id(post.at("spyId"));
            std::string post_id = as_id(post.at("postId"));
            auto plugin = std::make_shared<pause_plugin>(m_spy, spy_id, m_log);
            auto listener = plugin->deck().on_stats([this, spy_id](const deck_stats& stats) {
                enqueue_deck_stats({spy_id, stats});
            });
            record_plugin(spy_id, post_id, plugin, listener);
            r.plugin_id = post_id;

        } else if (request_type == "pause-command") {
            handle_pause_command(post, r);

        } else if (request_type == "snapshot") {
            handle_snapshot(r);

        } else {
            r.error = "Unexpected request.";
        }
    } catch (const nlohmann::json::exception& e) {
        r.error = std::string("Bad request: ") + e.what();
    }

    return r;
}

void devtools_session::handle_pause_command(const nlohmann::json& request, response& r) {
    auto it = m_plugins.find(as_id(request.at("pluginId")));
    if (it == m_plugins.end()) return;

    std::string command = request.at("command").get<std::string>();
    if (command == "inspect") {
        r.error = "Not implemented.";
        return;
    }

    void (deck::*action)() = nullptr;
    if (command == "clear")       action = &deck::clear;
    else if (command == "pause")  action = &deck::pause;
    else if (command == "resume") action = &deck::resume;
    else if (command == "skip")   action = &deck::skip;
    else if (command == "step")   action = &deck::step;
    else {
        r.error = "Unexpected command.";
        return;
    }

    // Deck commands for a plugin that has no deck do nothing.
    if (auto pause = std::get_if<std::shared_ptr<pause_plugin>>(&it->second.instance)) {
        ((*pause)->deck().*action)();
    }
}

void devtools_session::handle_snapshot(response& r) {
    m_snapshot_hinted = false;

    auto plugin = m_spy.find<snapshot_plugin>();
    if (!plugin) {
        r.error = "Cannot find snapshot plugin.";
        return;
    }
    r.snapshot = plugin->snapshot_all();
}

void devtools_session::record_plugin(const std::string& spy_id, const std::string& plugin_id,
                                     plugin p, std::optional<uint64_t> stats_listener) {
    // A repeated id replaces the earlier plugin rather than leaking it.
    teardown_plugin(plugin_id);

    auto teardown = m_spy.plug(p);
    m_plugins[plugin_id] = plugin_record{std::move(p), plugin_id, spy_id, std::move(teardown),
                                         stats_listener};
    m_log->info("devtools: {} plugin {} recorded for spy {}",
               plugin_name(m_plugins[plugin_id].instance), plugin_id, spy_id);
}

void devtools_session::teardown_plugin(const std::string& plugin_id) {
    auto it = m_plugins.find(plugin_id);
    if (it == m_plugins.end()) return;

    plugin_record record = std::move(it->second);
    m_plugins.erase(it);

    // Detach from the deck first so the resume done by its teardown queues
    // no stats for a deck the viewer no longer knows.
    auto pause = std::get_if<std::shared_ptr<pause_plugin>>(&record.instance);
    if (pause && record.stats_listener) {
        (*pause)->deck().remove_stats_listener(*record.stats_listener);
    }
    record.teardown();
    m_log->info("devtools: plugin {} torn down", plugin_id);
}

// --- batching ---

void devtools_session::enqueue(broadcast b) {
    if (m_torn_down || !m_conn) return;

    if (m_batch_open) {
        m_queue.push_back(std::move(b));
        return;
    }

    m_queue.clear();
    m_queue.push_back(std::move(b));
    m_batch_open = true;

    std::weak_ptr<devtools_session> weak = weak_from_this();
    m_batch_timer.expires_after(m_settings.window);
    m_batch_timer.async_wait([weak](const std::error_code& ec) {
        if (ec) return;
        if (auto self = weak.lock()) self->flush_batch();
    });
}

void devtools_session::flush_batch() {
    if (m_torn_down || !m_batch_open) return;

    batch b{std::move(m_queue)};
    m_queue.clear();
    m_batch_open = false;

    if (m_conn) {
        m_log->trace("devtools: posting batch of {} messages", b.messages.size());
        m_conn->post(b);
    }
}

void devtools_session::enqueue_notification(notification_payload n) {
    if (m_torn_down || !m_conn || m_snapshot_hinted) return;

    auto count = std::count_if(m_queue.begin(), m_queue.end(), [](const broadcast& b) {
        return b.type() == broadcast_type::notification;
    });

    if (static_cast<std::size_t>(count) + 1 > m_settings.max_notifications) {
        m_queue.erase(std::remove_if(m_queue.begin(), m_queue.end(), [](const broadcast& b) {
            return b.type() == broadcast_type::notification;
        }), m_queue.end());
        enqueue(broadcast{snapshot_hint{}});
        m_snapshot_hinted = true;
        m_log->debug("devtools: {} notifications queued - hinting snapshot", count);
        return;
    }

    enqueue(broadcast{std::move(n)});
}

void devtools_session::enqueue_deck_stats(deck_stats_payload stats) {
    m_queue.erase(std::remove_if(m_queue.begin(), m_queue.end(), [&](const broadcast& b) {
        auto queued = std::get_if<deck_stats_payload>(&b.body);
        return queued && queued->id == stats.id;
    }), m_queue.end());

    enqueue(broadcast{std::move(stats)});
}

// --- notifications ---

notification_payload devtools_session::to_notification(const subscription_ref& ref,
                                                       notification_prefix prefix,
                                                       notification_kind kind,
                                                       const std::any* value,
                                                       const std::any* error) {
    auto& inspector = m_spy.inspector();
    const auto& serialize = m_spy.serializer();

    notification_payload n;
    n.id = inspector.fresh_id();
    n.observable.id = inspector.identify(ref.observable);
    n.observable.path = inspector.infer_path(ref.observable);
    n.observable.tag = inspector.read_tag(ref.observable);
    n.observable.type = inspector.infer_type(ref.observable);
    n.subscriber_id = inspector.identify(ref.subscriber);
    n.subscription_id = inspector.identify(ref.subscription);

    if (error) n.error = serialize(*error);
    if (auto graph = m_spy.find<graph_plugin>()) {
        n.graph = graph->registry().graph_of(n.subscription_id);
    }
    if (auto traces = m_spy.find<stack_trace_plugin>()) {
        n.stack_trace = traces->stack_trace_of(n.subscription_id);
    }

    n.tick = m_spy.tick();
    n.timestamp = timestamp_ms();
    n.type = notification_type(prefix, kind);

    if (value) n.value = serialize(*value);
    else if (error) n.value = n.error;
    return n;
}

void devtools_session::batch_notification(const subscription_ref& ref, notification_prefix prefix,
                                          notification_kind kind, const std::any* value,
                                          const std::any* error) {
    if (m_torn_down || !m_conn || m_snapshot_hinted) return;
    enqueue_notification(to_notification(ref, prefix, kind, value, error));
}

void devtools_session::before_subscribe(const subscription_ref& ref) {
    batch_notification(ref, notification_prefix::before, notification_kind::subscribe);
}

void devtools_session::after_subscribe(const subscription_ref& ref) {
    batch_notification(ref, notification_prefix::after, notification_kind::subscribe);
}

void devtools_session::before_next(const subscription_ref& ref, const std::any& value) {
    batch_notification(ref, notification_prefix::before, notification_kind::next, &value);
}

void devtools_session::before_error(const subscription_ref& ref, const std::any& error) {
    batch_notification(ref, notification_prefix::before, notification_kind::error, nullptr, &error);
}

void devtools_session::before_complete(const subscription_ref& ref) {
    batch_notification(ref, notification_prefix::before, notification_kind::complete);
}

void devtools_session::before_unsubscribe(const subscription_ref& ref) {
    batch_notification(ref, notification_prefix::before, notification_kind::unsubscribe);
}

void devtools_session::after_unsubscribe(const subscription_ref& ref) {
    batch_notification(ref, notification_prefix::after, notification_kind::unsubscribe);
}

} // namespace spyhub
