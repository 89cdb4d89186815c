#pragma once

#include "plugins.hpp"
#include "snapshot.hpp"
#include <spdlog/spdlog.h>
#include <any>
#include <cstddef>
#include <memory>
#include <string>
#include <unordered_map>

namespace spyhub {

// Keeps per-entity value, error and timing history for every subscription
// it sees and projects it, together with the graph registry, into
// immutable snapshots.
class snapshot_plugin : public plugin_base {
public:
    snapshot_plugin(spy& s, std::size_t keep_values, std::size_t keep_unsubscribed,
                    std::shared_ptr<spdlog::logger> log);

    // Consistent projection at the spy's current tick. The caller owns it.
    std::unique_ptr<const snapshot> snapshot_all() const;

    std::size_t observable_count() const { return m_observables.size(); }
    std::size_t subscriber_count() const { return m_subscribers.size(); }
    std::size_t subscription_count() const { return m_subscriptions.size(); }

    void before_subscribe(const subscription_ref& ref);
    void before_next(const subscription_ref& ref, const std::any& value);
    void before_error(const subscription_ref& ref, const std::any& error);
    void before_complete(const subscription_ref& ref);
    void after_unsubscribe(const subscription_ref& ref);

private:
    subscription_record* find(const subscription_ref& ref);
    void append_value(std::vector<value_record>& values, bool& flushed, const value_record& v) const;
    void evict(const std::string& subscription);

    spy& m_spy;
    std::size_t m_keep_values;
    std::shared_ptr<spdlog::logger> m_log;

    std::unordered_map<std::string, observable_record> m_observables;
    std::unordered_map<std::string, subscriber_record> m_subscribers;
    std::unordered_map<std::string, subscription_record> m_subscriptions;
    retention_queue m_unsubscribed;
};

} // namespace spyhub
