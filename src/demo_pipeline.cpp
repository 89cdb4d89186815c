#include "demo_pipeline.hpp"

namespace spyhub {

demo_pipeline::demo_pipeline(spy& s, registry_inspector& inspector,
                             std::shared_ptr<spdlog::logger> log)
    : m_spy(s), m_log(std::move(log))
{
    inspector.describe(&m_interval, "/interval", "interval", "ticks");
    inspector.describe(&m_map, "/interval/map", "map", "scaled");
}

void demo_pipeline::subscribe() {
    if (m_subscribed) return;
    m_subscribed = true;

    // The map stage subscribes to its source while its own subscribe runs.
    m_spy.before_subscribe(outer());
    m_spy.before_subscribe(inner());
    m_spy.after_subscribe(inner());
    m_spy.after_subscribe(outer());
}

void demo_pipeline::emit() {
    if (!m_subscribed) return;

    int64_t value = static_cast<int64_t>(m_count++);
    m_spy.before_next(inner(), value, [this, value] {
        int64_t mapped = value * 10;
        m_spy.before_next(outer(), mapped, [this, mapped] {
            ++m_delivered;
            m_log->debug("demo: delivered {}", mapped);
        });
        m_spy.after_next(outer(), mapped);
    });
    m_spy.after_next(inner(), value);
}

void demo_pipeline::complete() {
    if (!m_subscribed) return;
    m_spy.before_complete(inner());
    m_spy.before_complete(outer());
    m_spy.after_complete(outer());
    m_spy.after_complete(inner());
    unsubscribe();
}

void demo_pipeline::unsubscribe() {
    if (!m_subscribed) return;
    m_subscribed = false;

    m_spy.before_unsubscribe(outer());
    m_spy.before_unsubscribe(inner());
    m_spy.after_unsubscribe(inner());
    m_spy.after_unsubscribe(outer());
}

void demo_pipeline::run(asio::io_context& ioc, std::chrono::milliseconds period) {
    m_period = period;
    m_timer = std::make_unique<asio::steady_timer>(ioc);
    subscribe();
    schedule();
    m_log->info("demo: emitting every {}ms", m_period.count());
}

void demo_pipeline::schedule() {
    m_timer->expires_after(m_period);
    m_timer->async_wait([this](const std::error_code& ec) {
        if (ec) return;
        emit();
        schedule();
    });
}

void demo_pipeline::stop() {
    if (m_timer) m_timer->cancel();
    unsubscribe();
}

} // namespace spyhub
