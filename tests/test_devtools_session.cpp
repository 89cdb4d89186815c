#include "devtools_session.hpp"
#include "snapshot_plugin.hpp"
#include "test_support.hpp"
#include <gtest/gtest.h>
#include <algorithm>

using namespace spyhub;
using namespace std::chrono_literals;
using spyhub::test::fake_connection;
using spyhub::test::fake_subscription;
using spyhub::test::make_log;
using spyhub::test::pump;

namespace {

constexpr auto window = 20ms;

struct session_fixture {
    asio::io_context ioc;
    std::shared_ptr<registry_inspector> inspector = std::make_shared<registry_inspector>();
    spy s{inspector, json_value_serializer(), make_log()};
    std::shared_ptr<fake_connection> conn = std::make_shared<fake_connection>();
    std::shared_ptr<devtools_session> session;

    explicit session_fixture(std::size_t max_notifications = 5, bool with_snapshots = true) {
        s.plug(std::make_shared<graph_plugin>(s, 16, make_log()));
        if (with_snapshots) {
            s.plug(std::make_shared<snapshot_plugin>(s, 8, 16, make_log()));
        }
        session = std::make_shared<devtools_session>(
            ioc, s, conn, batch_settings{window, max_notifications}, make_log());
        s.plug(session);
        session->start();
    }

    // Deliver a request through the connection; returns the response posted.
    response request(nlohmann::json post) {
        post["messageType"] = "request";
        std::size_t before = conn->posts.size();
        conn->handler(post);
        EXPECT_EQ(conn->posts.size(), before + 1);
        return std::get<response>(conn->posts.back());
    }

    std::vector<batch> batches() const { return conn->posted<batch>(); }
};

std::size_t count(const batch& b, broadcast_type type) {
    return std::count_if(b.messages.begin(), b.messages.end(),
                         [type](const broadcast& m) { return m.type() == type; });
}

} // namespace

// --- batching ---

TEST(devtools_session, notifications_are_posted_in_one_batch) {
    session_fixture f;
    fake_subscription sub;

    f.s.before_subscribe(sub.ref());
    f.s.after_subscribe(sub.ref());
    f.s.before_next(sub.ref(), 1);
    EXPECT_TRUE(f.session->batch_open());
    EXPECT_TRUE(f.conn->posts.empty());

    pump(f.ioc, window * 3);

    auto batches = f.batches();
    ASSERT_EQ(batches.size(), 1u);
    ASSERT_EQ(batches[0].messages.size(), 3u);

    const auto& first = std::get<notification_payload>(batches[0].messages[0].body);
    const auto& last = std::get<notification_payload>(batches[0].messages[2].body);
    EXPECT_EQ(first.type, "before-subscribe");
    EXPECT_EQ(last.type, "before-next");
    EXPECT_EQ(last.value, "1");
    EXPECT_LT(first.tick, last.tick);
    EXPECT_FALSE(f.session->batch_open());
}

TEST(devtools_session, windows_after_a_flush_start_a_new_batch) {
    session_fixture f;
    fake_subscription sub;

    f.s.before_subscribe(sub.ref());
    pump(f.ioc, window * 3);
    f.s.after_subscribe(sub.ref());
    pump(f.ioc, window * 3);

    auto batches = f.batches();
    ASSERT_EQ(batches.size(), 2u);
    EXPECT_EQ(std::get<notification_payload>(batches[1].messages[0].body).type, "after-subscribe");
}

TEST(devtools_session, overload_collapses_to_snapshot_hint) {
    session_fixture f(5);
    fake_subscription sub;

    for (int i = 0; i < 6; ++i) f.s.before_next(sub.ref(), i);

    ASSERT_EQ(f.session->queued().size(), 1u);
    EXPECT_EQ(f.session->queued()[0].type(), broadcast_type::snapshot_hint);
    EXPECT_TRUE(f.session->snapshot_hinted());

    // Suppressed until a snapshot is taken.
    f.s.before_next(sub.ref(), 6);
    EXPECT_EQ(f.session->queued().size(), 1u);

    pump(f.ioc, window * 3);
    auto batches = f.batches();
    ASSERT_EQ(batches.size(), 1u);
    EXPECT_EQ(count(batches[0], broadcast_type::notification), 0u);
    EXPECT_EQ(count(batches[0], broadcast_type::snapshot_hint), 1u);
}

TEST(devtools_session, five_notifications_fit_in_a_batch) {
    session_fixture f(5);
    fake_subscription sub;

    for (int i = 0; i < 5; ++i) f.s.before_next(sub.ref(), i);
    EXPECT_EQ(f.session->queued().size(), 5u);
    EXPECT_FALSE(f.session->snapshot_hinted());
}

TEST(devtools_session, snapshot_request_clears_suppression) {
    session_fixture f(5);
    fake_subscription sub;

    f.s.before_subscribe(sub.ref());
    for (int i = 0; i < 6; ++i) f.s.before_next(sub.ref(), i);
    ASSERT_TRUE(f.session->snapshot_hinted());

    auto r = f.request({{"requestType", "snapshot"}, {"postId", "p1"}});
    EXPECT_FALSE(r.error.has_value());
    ASSERT_TRUE(r.snapshot);
    EXPECT_EQ(r.snapshot->subscriptions.size(), 1u);
    EXPECT_FALSE(f.session->snapshot_hinted());

    f.s.before_next(sub.ref(), 7);
    EXPECT_EQ(f.session->queued().back().type(), broadcast_type::notification);
}

TEST(devtools_session, deck_stats_for_same_deck_are_deduplicated) {
    session_fixture f;

    deck_stats first;
    deck_stats second;
    second.paused = true;
    deck_stats other;

    f.session->enqueue_deck_stats({"deck-1", first});
    f.session->enqueue_deck_stats({"deck-2", other});
    f.session->enqueue_deck_stats({"deck-1", second});
    pump(f.ioc, window * 3);

    auto batches = f.batches();
    ASSERT_EQ(batches.size(), 1u);
    ASSERT_EQ(batches[0].messages.size(), 2u);

    const auto& kept = std::get<deck_stats_payload>(batches[0].messages[1].body);
    EXPECT_EQ(kept.id, "deck-1");
    EXPECT_TRUE(kept.stats.paused);
    EXPECT_EQ(std::get<deck_stats_payload>(batches[0].messages[0].body).id, "deck-2");
}

TEST(devtools_session, teardown_cancels_pending_batch) {
    session_fixture f;
    fake_subscription sub;

    f.s.before_subscribe(sub.ref());
    ASSERT_TRUE(f.session->batch_open());

    f.session->teardown();
    EXPECT_TRUE(f.session->queued().empty());
    EXPECT_EQ(f.conn->disconnects, 1);

    pump(f.ioc, window * 3);
    EXPECT_TRUE(f.conn->posts.empty());

    f.s.before_next(sub.ref(), 1);
    pump(f.ioc, window * 3);
    EXPECT_TRUE(f.conn->posts.empty());

    f.session->teardown();
    EXPECT_EQ(f.conn->disconnects, 1);
}

TEST(devtools_session, session_without_connection_is_inert) {
    asio::io_context ioc;
    auto inspector = std::make_shared<registry_inspector>();
    spy s{inspector, json_value_serializer(), make_log()};
    auto session = std::make_shared<devtools_session>(ioc, s, nullptr, batch_settings{}, make_log());
    s.plug(session);
    session->start();

    fake_subscription sub;
    s.before_subscribe(sub.ref());
    EXPECT_FALSE(session->batch_open());
    EXPECT_TRUE(session->queued().empty());
}

// --- notification payloads ---

TEST(devtools_session, notification_describes_observable_and_graph) {
    session_fixture f;
    fake_subscription outer, inner;
    f.inspector->describe(&inner.observable, "/source", "interval", "ticks");

    f.s.before_subscribe(outer.ref());
    f.s.before_subscribe(inner.ref());

    auto n = f.session->to_notification(inner.ref(), notification_prefix::after,
                                        notification_kind::subscribe);
    EXPECT_EQ(n.type, "after-subscribe");
    EXPECT_EQ(n.observable.id, f.inspector->identify(&inner.observable));
    EXPECT_EQ(n.observable.path, "/source");
    EXPECT_EQ(n.observable.type, "interval");
    EXPECT_EQ(n.observable.tag, "ticks");
    EXPECT_EQ(n.subscriber_id, f.inspector->identify(&inner.subscriber));
    EXPECT_EQ(n.subscription_id, f.inspector->identify(&inner.subscription));
    EXPECT_FALSE(n.value.has_value());
    EXPECT_FALSE(n.error.has_value());
    EXPECT_FALSE(n.stack_trace.has_value());
    ASSERT_TRUE(n.graph.has_value());
    EXPECT_EQ(n.graph->sink, f.inspector->identify(&outer.subscription));
    EXPECT_EQ(n.tick, f.s.tick());
}

TEST(devtools_session, error_notification_carries_error_and_value) {
    session_fixture f;
    fake_subscription sub;
    std::any error = std::string("bad");

    auto n = f.session->to_notification(sub.ref(), notification_prefix::before,
                                        notification_kind::error, nullptr, &error);
    EXPECT_EQ(n.type, "before-error");
    EXPECT_EQ(n.error, "\"bad\"");
    EXPECT_EQ(n.value, "\"bad\"");
    EXPECT_FALSE(n.graph.has_value());
}

// --- requests ---

TEST(devtools_session, non_request_posts_are_ignored) {
    session_fixture f;
    f.conn->handler({{"messageType", "broadcast"}});
    f.conn->handler(nlohmann::json::array());
    EXPECT_TRUE(f.conn->posts.empty());
}

TEST(devtools_session, unknown_request_type_is_an_error) {
    session_fixture f;
    auto r = f.request({{"requestType", "frobnicate"}, {"postId", "p1"}});
    EXPECT_EQ(r.error, "Unexpected request.");
    EXPECT_EQ(r.request["requestType"], "frobnicate");
}

TEST(devtools_session, malformed_request_is_a_bad_request) {
    session_fixture f;
    auto r = f.request({{"requestType", "log"}});
    ASSERT_TRUE(r.error.has_value());
    EXPECT_EQ(r.error->rfind("Bad request: ", 0), 0u);
    EXPECT_EQ(f.session->plugin_count(), 0u);
}

TEST(devtools_session, log_plugin_lifecycle) {
    session_fixture f;
    std::size_t plugins = f.s.plugin_count();

    auto created = f.request({{"requestType", "log"}, {"postId", "p1"}, {"spyId", "42"}});
    EXPECT_EQ(created.plugin_id, "p1");
    EXPECT_FALSE(created.error.has_value());
    EXPECT_TRUE(f.session->has_plugin("p1"));
    EXPECT_EQ(f.s.plugin_count(), plugins + 1);
    EXPECT_EQ(f.s.find<log_plugin>()->match(), "42");

    auto removed = f.request({{"requestType", "log-teardown"}, {"postId", "p2"}, {"pluginId", "p1"}});
    EXPECT_FALSE(removed.error.has_value());
    EXPECT_FALSE(f.session->has_plugin("p1"));
    EXPECT_EQ(f.s.plugin_count(), plugins);

    // Second teardown is a no-op.
    auto again = f.request({{"requestType", "log-teardown"}, {"postId", "p3"}, {"pluginId", "p1"}});
    EXPECT_FALSE(again.error.has_value());
    EXPECT_EQ(f.s.plugin_count(), plugins);
}

TEST(devtools_session, pause_commands_drive_the_deck) {
    session_fixture f;
    fake_subscription sub;
    std::string spy_id = f.inspector->identify(&sub.observable);

    auto created = f.request({{"requestType", "pause"}, {"postId", "p1"}, {"spyId", spy_id}});
    ASSERT_EQ(created.plugin_id, "p1");

    auto command = [&](const std::string& c) {
        return f.request({{"requestType", "pause-command"}, {"postId", "c"},
                          {"pluginId", "p1"}, {"command", c}});
    };

    std::vector<int> delivered;
    EXPECT_FALSE(command("pause").error.has_value());
    for (int i = 0; i < 4; ++i) {
        f.s.before_next(sub.ref(), i, [&delivered, i] { delivered.push_back(i); });
    }
    EXPECT_TRUE(delivered.empty());

    command("step");
    EXPECT_EQ(delivered, std::vector<int>{0});
    command("skip");
    EXPECT_EQ(delivered, std::vector<int>{0});
    command("resume");
    EXPECT_EQ(delivered, (std::vector<int>{0, 2, 3}));

    command("pause");
    f.s.before_next(sub.ref(), 9, [&delivered] { delivered.push_back(9); });
    command("clear");
    command("resume");
    EXPECT_EQ(delivered, (std::vector<int>{0, 2, 3}));

    // Only the latest stats for the deck reach the viewer.
    pump(f.ioc, window * 3);
    std::size_t stats_messages = 0;
    for (const auto& b : f.batches()) {
        for (const auto& m : b.messages) {
            if (auto s = std::get_if<deck_stats_payload>(&m.body)) {
                ++stats_messages;
                EXPECT_EQ(s->id, spy_id);
                EXPECT_FALSE(s->stats.paused);
                EXPECT_EQ(s->stats.cleared, 1u);
            }
        }
    }
    EXPECT_EQ(stats_messages, 1u);
}

TEST(devtools_session, inspect_is_not_implemented_and_changes_nothing) {
    session_fixture f;
    f.request({{"requestType", "pause"}, {"postId", "p1"}, {"spyId", "x"}});
    auto deck_plugin = f.s.find<pause_plugin>();
    ASSERT_TRUE(deck_plugin);

    auto paused = f.request({{"requestType", "pause-command"}, {"postId", "c1"},
                             {"pluginId", "p1"}, {"command", "pause"}});
    EXPECT_FALSE(paused.error.has_value());

    auto r = f.request({{"requestType", "pause-command"}, {"postId", "c2"},
                        {"pluginId", "p1"}, {"command", "inspect"}});
    EXPECT_EQ(r.error, "Not implemented.");
    EXPECT_TRUE(deck_plugin->deck().paused());
}

TEST(devtools_session, unexpected_pause_command_is_an_error) {
    session_fixture f;
    f.request({{"requestType", "pause"}, {"postId", "p1"}, {"spyId", "x"}});

    auto r = f.request({{"requestType", "pause-command"}, {"postId", "c1"},
                        {"pluginId", "p1"}, {"command", "rewind"}});
    EXPECT_EQ(r.error, "Unexpected command.");
}

TEST(devtools_session, commands_for_plugin_without_deck) {
    session_fixture f;
    f.request({{"requestType", "log"}, {"postId", "p1"}, {"spyId", "x"}});

    auto command = [&](const std::string& c) {
        return f.request({{"requestType", "pause-command"}, {"postId", "c"},
                          {"pluginId", "p1"}, {"command", c}});
    };

    EXPECT_EQ(command("inspect").error, "Not implemented.");
    EXPECT_EQ(command("rewind").error, "Unexpected command.");
    EXPECT_FALSE(command("pause").error.has_value());
    EXPECT_TRUE(f.session->has_plugin("p1"));
}

TEST(devtools_session, torn_down_deck_reports_no_stats) {
    session_fixture f;
    fake_subscription sub;
    std::string spy_id = f.inspector->identify(&sub.observable);

    f.request({{"requestType", "pause"}, {"postId", "p1"}, {"spyId", spy_id}});
    auto deck_plugin = f.s.find<pause_plugin>();
    ASSERT_TRUE(deck_plugin);

    f.request({{"requestType", "pause-command"}, {"postId", "c1"},
               {"pluginId", "p1"}, {"command", "pause"}});
    int delivered = 0;
    f.s.before_next(sub.ref(), 1, [&delivered] { ++delivered; });
    pump(f.ioc, window * 3);
    std::size_t batches_before = f.batches().size();

    f.request({{"requestType", "pause-teardown"}, {"postId", "t1"}, {"pluginId", "p1"}});
    EXPECT_EQ(delivered, 1);
    EXPECT_TRUE(f.session->queued().empty());

    deck_plugin->deck().pause();
    EXPECT_TRUE(f.session->queued().empty());

    pump(f.ioc, window * 3);
    EXPECT_EQ(f.batches().size(), batches_before);
}

TEST(devtools_session, command_for_unknown_plugin_is_a_no_op) {
    session_fixture f;
    auto r = f.request({{"requestType", "pause-command"}, {"postId", "c1"},
                        {"pluginId", "missing"}, {"command", "pause"}});
    EXPECT_FALSE(r.error.has_value());
    EXPECT_EQ(f.session->plugin_count(), 0u);
}

TEST(devtools_session, pause_teardown_is_idempotent) {
    session_fixture f;
    f.request({{"requestType", "pause"}, {"postId", "p1"}, {"spyId", "x"}});
    ASSERT_TRUE(f.s.find<pause_plugin>());

    f.request({{"requestType", "pause-teardown"}, {"postId", "t1"}, {"pluginId", "p1"}});
    EXPECT_FALSE(f.s.find<pause_plugin>());
    EXPECT_FALSE(f.session->has_plugin("p1"));

    auto again = f.request({{"requestType", "pause-teardown"}, {"postId", "t2"}, {"pluginId", "p1"}});
    EXPECT_FALSE(again.error.has_value());
}

TEST(devtools_session, snapshot_without_snapshot_plugin_is_an_error) {
    session_fixture f(5, false);
    auto r = f.request({{"requestType", "snapshot"}, {"postId", "p1"}});
    EXPECT_EQ(r.error, "Cannot find snapshot plugin.");
    EXPECT_FALSE(r.snapshot);
}

TEST(devtools_session, session_teardown_removes_recorded_plugins) {
    session_fixture f;
    f.request({{"requestType", "log"}, {"postId", "p1"}, {"spyId", "x"}});
    f.request({{"requestType", "pause"}, {"postId", "p2"}, {"spyId", "y"}});
    ASSERT_EQ(f.session->plugin_count(), 2u);

    f.session->teardown();
    EXPECT_EQ(f.session->plugin_count(), 0u);
    EXPECT_FALSE(f.s.find<log_plugin>());
    EXPECT_FALSE(f.s.find<pause_plugin>());
}
