#pragma once

#include "subscription_ref.hpp"
#include <spdlog/spdlog.h>
#include <cstdint>
#include <deque>
#include <functional>
#include <map>
#include <memory>
#include <string>

namespace spyhub {

// One notification held back by a deck.
struct deck_item {
    subscription_ref ref;
    notification_kind kind = notification_kind::next;
    std::string value;              // serialized, for logs and inspection
    std::function<void()> release;  // performs the downstream delivery
};

struct deck_stats {
    std::size_t notifications = 0;  // currently buffered
    bool paused = false;
    uint64_t released = 0;
    uint64_t skipped = 0;
    uint64_t stepped = 0;
    uint64_t cleared = 0;
};

// Pause/step controller. Starts running; while paused, pushed items are
// buffered in arrival order until released or discarded.
class deck {
public:
    using stats_listener = std::function<void(const deck_stats&)>;

    deck(std::string id, std::shared_ptr<spdlog::logger> log);

    const std::string& id() const { return m_id; }
    bool paused() const { return m_paused; }
    std::size_t buffered() const { return m_buffer.size(); }
    const deck_stats& stats() const { return m_stats; }

    // Deliver now if running, otherwise buffer.
    void push(deck_item item);

    void pause();
    // Release everything buffered, in order, then run freely.
    void resume();
    // Release the oldest buffered item; stays paused.
    void step();
    // Discard the oldest buffered item; stays paused.
    void skip();
    // Discard everything buffered; the run state is unchanged.
    void clear();

    uint64_t on_stats(stats_listener listener);
    void remove_stats_listener(uint64_t id);

private:
    void publish_stats();

    std::string m_id;
    std::shared_ptr<spdlog::logger> m_log;
    bool m_paused = false;
    bool m_releasing = false;
    std::deque<deck_item> m_buffer;
    deck_stats m_stats;

    uint64_t m_next_listener = 1;
    std::map<uint64_t, stats_listener> m_listeners;
};

} // namespace spyhub
