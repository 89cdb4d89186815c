#include "graph_registry.hpp"
#include <algorithm>

namespace spyhub {

namespace {

bool contains_id(const std::vector<std::string>& ids, const std::string& id) {
    return std::find(ids.begin(), ids.end(), id) != ids.end();
}

void remove_id(std::vector<std::string>& ids, const std::string& id) {
    ids.erase(std::remove(ids.begin(), ids.end(), id), ids.end());
}

} // namespace

graph_registry::graph_registry(std::shared_ptr<spdlog::logger> log)
    : m_log(std::move(log))
{}

graph_registry::record* graph_registry::find(const std::string& subscription) {
    auto it = m_records.find(subscription);
    return it != m_records.end() ? &it->second : nullptr;
}

const graph_registry::record* graph_registry::find(const std::string& subscription) const {
    auto it = m_records.find(subscription);
    return it != m_records.end() ? &it->second : nullptr;
}

void graph_registry::track(const std::string& subscription) {
    m_records.try_emplace(subscription);
}

bool graph_registry::is_ancestor(const std::string& ancestor, const std::string& id) const {
    const record* rec = find(id);
    // Bounded by the number of records so a corrupt chain cannot loop.
    for (std::size_t steps = 0; rec && rec->sink && steps <= m_records.size(); ++steps) {
        if (*rec->sink == ancestor) return true;
        rec = find(*rec->sink);
    }
    return false;
}

bool graph_registry::link(const std::string& parent, const std::string& child, link_kind kind) {
    if (parent == child || is_ancestor(child, parent)) {
        m_log->debug("graph: refusing link {} -> {} (cycle)", parent, child);
        return false;
    }

    track(parent);
    track(child);

    record& child_rec = m_records.at(child);
    record& parent_rec = m_records.at(parent);
    auto& ids = kind == link_kind::source ? parent_rec.sources : parent_rec.flats;

    if (child_rec.sink == parent && contains_id(ids, child)) {
        return true;
    }

    detach_from_sink(child, child_rec);
    ids.push_back(child);
    child_rec.sink = parent;
    refresh_root_sinks(child);
    return true;
}

void graph_registry::detach_from_sink(const std::string& child, record& child_rec) {
    if (!child_rec.sink) return;
    if (record* old_sink = find(*child_rec.sink)) {
        remove_id(old_sink->sources, child);
        remove_id(old_sink->flats, child);
    }
    child_rec.sink.reset();
    child_rec.root_sink.reset();
}

void graph_registry::refresh_root_sinks(const std::string& id) {
    std::vector<std::string> pending{id};
    while (!pending.empty()) {
        std::string current = std::move(pending.back());
        pending.pop_back();

        record* rec = find(current);
        if (!rec) continue;

        if (!rec->sink) {
            rec->root_sink.reset();
        } else {
            const record* sink = find(*rec->sink);
            rec->root_sink = (sink && sink->root_sink) ? sink->root_sink : rec->sink;
        }

        pending.insert(pending.end(), rec->sources.begin(), rec->sources.end());
        pending.insert(pending.end(), rec->flats.begin(), rec->flats.end());
    }
}

void graph_registry::unlink(const std::string& subscription) {
    record* rec = find(subscription);
    if (!rec) return;

    rec->unsubscribed = true;

    std::vector<std::string> children;
    children.reserve(rec->sources.size() + rec->flats.size());
    children.insert(children.end(), rec->sources.begin(), rec->sources.end());
    children.insert(children.end(), rec->flats.begin(), rec->flats.end());

    rec->sources_flushed += rec->sources.size();
    rec->flats_flushed += rec->flats.size();
    rec->sources.clear();
    rec->flats.clear();

    prune(subscription, children);
}

void graph_registry::prune(const std::string& sink, const std::vector<std::string>& children) {
    for (const auto& child : children) {
        auto it = m_records.find(child);
        if (it == m_records.end()) continue;

        if (it->second.unsubscribed) {
            m_records.erase(it);
        } else if (it->second.sink == sink) {
            // Still live: it becomes the root of its own subtree.
            it->second.sink.reset();
            refresh_root_sinks(child);
        }
    }
}

bool graph_registry::erase(const std::string& subscription) {
    auto it = m_records.find(subscription);
    if (it == m_records.end()) return false;
    if (!it->second.unsubscribed) return false;
    if (it->second.sink && find(*it->second.sink)) return false;
    m_records.erase(it);
    return true;
}

std::optional<graph_payload> graph_registry::graph_of(const std::string& subscription) const {
    const record* rec = find(subscription);
    if (!rec) return std::nullopt;

    graph_payload graph;
    graph.flats = rec->flats;
    graph.flats_flushed = rec->flats_flushed > 0;
    graph.root_sink = rec->root_sink;
    graph.sink = rec->sink;
    graph.sources = rec->sources;
    graph.sources_flushed = rec->sources_flushed > 0;
    return graph;
}

std::optional<std::string> graph_registry::sink_of(const std::string& subscription) const {
    const record* rec = find(subscription);
    return rec ? rec->sink : std::nullopt;
}

std::optional<std::string> graph_registry::root_sink_of(const std::string& subscription) const {
    const record* rec = find(subscription);
    return rec ? rec->root_sink : std::nullopt;
}

std::vector<std::string> graph_registry::sources_of(const std::string& subscription) const {
    const record* rec = find(subscription);
    return rec ? rec->sources : std::vector<std::string>{};
}

std::vector<std::string> graph_registry::flats_of(const std::string& subscription) const {
    const record* rec = find(subscription);
    return rec ? rec->flats : std::vector<std::string>{};
}

std::size_t graph_registry::sources_flushed_count(const std::string& subscription) const {
    const record* rec = find(subscription);
    return rec ? rec->sources_flushed : 0;
}

std::size_t graph_registry::flats_flushed_count(const std::string& subscription) const {
    const record* rec = find(subscription);
    return rec ? rec->flats_flushed : 0;
}

bool graph_registry::contains(const std::string& subscription) const {
    return m_records.count(subscription) > 0;
}

} // namespace spyhub
