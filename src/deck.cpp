#include "deck.hpp"

namespace spyhub {

deck::deck(std::string id, std::shared_ptr<spdlog::logger> log)
    : m_id(std::move(id)), m_log(std::move(log))
{}

void deck::push(deck_item item) {
    if (!m_paused && !m_releasing) {
        if (item.release) item.release();
        return;
    }

    m_log->debug("deck {}: buffered {} {}", m_id, to_string(item.kind), item.value);
    m_buffer.push_back(std::move(item));
    publish_stats();
}

void deck::pause() {
    m_paused = true;
    m_log->debug("deck {}: paused", m_id);
    publish_stats();
}

void deck::resume() {
    m_paused = false;

    // Items pushed by a release queue up behind the buffered ones.
    m_releasing = true;
    while (!m_paused && !m_buffer.empty()) {
        deck_item item = std::move(m_buffer.front());
        m_buffer.pop_front();
        ++m_stats.released;
        if (item.release) item.release();
    }
    m_releasing = false;

    m_log->debug("deck {}: resumed", m_id);
    publish_stats();
}

void deck::step() {
    if (!m_buffer.empty()) {
        deck_item item = std::move(m_buffer.front());
        m_buffer.pop_front();
        ++m_stats.stepped;
        ++m_stats.released;
        if (item.release) item.release();
    }
    publish_stats();
}

void deck::skip() {
    if (!m_buffer.empty()) {
        m_buffer.pop_front();
        ++m_stats.skipped;
    }
    publish_stats();
}

void deck::clear() {
    m_stats.cleared += m_buffer.size();
    m_buffer.clear();
    publish_stats();
}

uint64_t deck::on_stats(stats_listener listener) {
    uint64_t id = m_next_listener++;
    m_listeners.emplace(id, std::move(listener));
    return id;
}

void deck::remove_stats_listener(uint64_t id) {
    m_listeners.erase(id);
}

void deck::publish_stats() {
    m_stats.notifications = m_buffer.size();
    m_stats.paused = m_paused;

    // Listeners may unregister themselves while being called.
    auto listeners = m_listeners;
    for (const auto& [id, listener] : listeners) {
        listener(m_stats);
    }
}

} // namespace spyhub
