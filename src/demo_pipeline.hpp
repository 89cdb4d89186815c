#pragma once

#include "inspector.hpp"
#include "spy.hpp"
#include <asio/io_context.hpp>
#include <asio/steady_timer.hpp>
#include <spdlog/spdlog.h>
#include <chrono>
#include <cstdint>
#include <memory>

namespace spyhub {

// A synthetic instrumented stream: interval -> map(x * 10) -> subscriber.
// Drives the spy exactly as an interceptor would, so a remote viewer has
// a live graph to look at.
class demo_pipeline {
public:
    demo_pipeline(spy& s, registry_inspector& inspector, std::shared_ptr<spdlog::logger> log);

    void subscribe();
    // One interval emission, flowing through the map stage to the subscriber.
    void emit();
    void complete();
    void unsubscribe();

    bool subscribed() const { return m_subscribed; }
    uint64_t emitted() const { return m_count; }
    uint64_t delivered() const { return m_delivered; }

    subscription_ref outer() const { return {&m_map, &m_sink, &m_outer}; }
    subscription_ref inner() const { return {&m_interval, &m_map_subscriber, &m_inner}; }

    // Emit every `period` on ioc until stop().
    void run(asio::io_context& ioc, std::chrono::milliseconds period);
    void stop();

private:
    void schedule();

    spy& m_spy;
    std::shared_ptr<spdlog::logger> m_log;

    // Handles only; their addresses identify the objects.
    char m_interval = 0;
    char m_map = 0;
    char m_map_subscriber = 0;
    char m_sink = 0;
    char m_outer = 0;
    char m_inner = 0;

    bool m_subscribed = false;
    uint64_t m_count = 0;
    uint64_t m_delivered = 0;

    std::unique_ptr<asio::steady_timer> m_timer;
    std::chrono::milliseconds m_period{250};
};

} // namespace spyhub
