#pragma once

#include <spdlog/spdlog.h>
#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace spyhub {

enum class link_kind {
    source,
    flat
};

// Wire shape of one subscription's links.
struct graph_payload {
    std::vector<std::string> flats;
    bool flats_flushed = false;
    std::optional<std::string> root_sink;
    std::optional<std::string> sink;
    std::vector<std::string> sources;
    bool sources_flushed = false;
};

// Structural links between live subscriptions, keyed by subscription id.
//
// sink points upward toward the consumer; sources and flats point downward
// toward the producers. A subscription appears in the sources (or flats) of
// exactly one record, and that record is its sink.
class graph_registry {
public:
    explicit graph_registry(std::shared_ptr<spdlog::logger> log);

    // Start tracking a subscription with no links. No-op if already tracked.
    void track(const std::string& subscription);

    // Record child as a source/flat of parent. Both are tracked if needed.
    // Duplicate links are no-ops; a child already linked elsewhere is moved.
    // Returns false (and changes nothing) for self links and cycles.
    bool link(const std::string& parent, const std::string& child, link_kind kind);

    // Flush the subscription's downward links on unsubscribe. Their counts
    // are preserved in sources_flushed/flats_flushed. Children still live
    // lose their sink.
    void unlink(const std::string& subscription);

    // Absent if the subscription was never tracked.
    std::optional<graph_payload> graph_of(const std::string& subscription) const;

    std::optional<std::string> sink_of(const std::string& subscription) const;
    std::optional<std::string> root_sink_of(const std::string& subscription) const;
    std::vector<std::string> sources_of(const std::string& subscription) const;
    std::vector<std::string> flats_of(const std::string& subscription) const;
    std::size_t sources_flushed_count(const std::string& subscription) const;
    std::size_t flats_flushed_count(const std::string& subscription) const;

    // Forget an unsubscribed subscription that has no sink. Returns false
    // if it is still live or still referenced by a sink.
    bool erase(const std::string& subscription);

    bool contains(const std::string& subscription) const;
    std::size_t size() const { return m_records.size(); }

private:
    struct record {
        std::optional<std::string> sink;
        std::optional<std::string> root_sink;
        std::vector<std::string> sources;
        std::vector<std::string> flats;
        std::size_t sources_flushed = 0;
        std::size_t flats_flushed = 0;
        bool unsubscribed = false;
    };

    record* find(const std::string& subscription);
    const record* find(const std::string& subscription) const;

    // Walks sinks from id; true if ancestor is found on the way up.
    bool is_ancestor(const std::string& ancestor, const std::string& id) const;

    // Recompute root_sink for id and everything below it.
    void refresh_root_sinks(const std::string& id);

    void detach_from_sink(const std::string& child, record& child_rec);

    // Drop flushed children that are unsubscribed; they are unreachable now.
    // Live children are detached from sink and become roots.
    void prune(const std::string& sink, const std::vector<std::string>& children);

    std::shared_ptr<spdlog::logger> m_log;
    std::unordered_map<std::string, record> m_records;
};

} // namespace spyhub
