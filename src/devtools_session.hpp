#pragma once

#include "iconnection.hpp"
#include "plugins.hpp"
#include "spy.hpp"
#include "wire.hpp"
#include <asio/io_context.hpp>
#include <asio/steady_timer.hpp>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <any>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace spyhub {

struct batch_settings {
    std::chrono::milliseconds window{100};
    // More queued notifications than this collapse into a snapshot hint.
    std::size_t max_notifications = 150;
};

// Bridge between the spy and a remote viewer. Turns lifecycle calls into
// batched broadcasts and answers the viewer's requests by creating,
// commanding and tearing down plugins.
class devtools_session : public plugin_base,
                         public std::enable_shared_from_this<devtools_session> {
public:
    devtools_session(asio::io_context& ioc, spy& s, iconnection_sptr conn,
                     batch_settings settings, std::shared_ptr<spdlog::logger> log);
    ~devtools_session();

    devtools_session(const devtools_session&) = delete;
    devtools_session& operator=(const devtools_session&) = delete;

    // Start receiving requests. No-op without a connection.
    void start();

    // Cancel the batch window without flushing, tear down every plugin the
    // viewer created and disconnect. Safe to call more than once.
    void teardown();

    // Answer one inbound post. Returns nothing for posts that are not requests.
    std::optional<response> handle_post(const nlohmann::json& post);

    // Queue a broadcast into the current batch window, opening one if needed.
    void enqueue(broadcast b);

    // Queue a notification, applying the overload policy.
    void enqueue_notification(notification_payload n);

    // Queue deck stats, replacing stats for the same deck still queued.
    void enqueue_deck_stats(deck_stats_payload stats);

    notification_payload to_notification(const subscription_ref& ref,
                                          notification_prefix prefix,
                                          notification_kind kind,
                                          const std::any* value = nullptr,
                                          const std::any* error = nullptr);

    const std::vector<broadcast>& queued() const { return m_queue; }
    bool batch_open() const { return m_batch_open; }
    bool snapshot_hinted() const { return m_snapshot_hinted; }
    std::size_t plugin_count() const { return m_plugins.size(); }
    bool has_plugin(const std::string& plugin_id) const { return m_plugins.count(plugin_id) > 0; }

    void before_subscribe(const subscription_ref& ref);
    void after_subscribe(const subscription_ref& ref);
    void before_next(const subscription_ref& ref, const std::any& value);
    void before_error(const subscription_ref& ref, const std::any& error);
    void before_complete(const subscription_ref& ref);
    void before_unsubscribe(const subscription_ref& ref);
    void after_unsubscribe(const subscription_ref& ref);

private:
    struct plugin_record {
        plugin instance;
        std::string plugin_id;
        std::string spy_id;
        spy::teardown_fn teardown;
        // Deck stats listener of a pause plugin.
        std::optional<uint64_t> stats_listener;
    };

    void record_plugin(const std::string& spy_id, const std::string& plugin_id, plugin p,
                       std::optional<uint64_t> stats_listener = std::nullopt);
    void teardown_plugin(const std::string& plugin_id);

    void handle_pause_command(const nlohmann::json& request, response& r);
    void handle_snapshot(response& r);

    void batch_notification(const subscription_ref& ref, notification_prefix prefix,
                            notification_kind kind, const std::any* value = nullptr,
                            const std::any* error = nullptr);

    void flush_batch();

    spy& m_spy;
    iconnection_sptr m_conn;
    batch_settings m_settings;
    std::shared_ptr<spdlog::logger> m_log;

    asio::steady_timer m_batch_timer;
    bool m_batch_open = false;
    std::vector<broadcast> m_queue;
    bool m_snapshot_hinted = false;

    std::unordered_map<std::string, plugin_record> m_plugins;
    bool m_torn_down = false;
};

} // namespace spyhub
