#pragma once

#include <nlohmann/json.hpp>
#include <cstdint>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace spyhub {

struct value_record {
    uint64_t tick = 0;
    int64_t timestamp = 0;
    std::string value;  // serialized
};

struct observable_record {
    std::string id;
    std::string path;
    std::optional<std::string> tag;
    std::string type;
    std::set<std::string> subscriptions;
    uint64_t tick = 0;
};

struct subscriber_record {
    std::string id;
    std::set<std::string> subscriptions;
    uint64_t tick = 0;
    std::vector<value_record> values;
    bool values_flushed = false;
};

struct subscription_record {
    std::string id;
    std::string observable;
    std::string subscriber;

    int64_t subscribe_timestamp = 0;
    std::optional<int64_t> unsubscribe_timestamp;
    std::optional<int64_t> complete_timestamp;
    std::optional<std::string> error;  // serialized
    std::optional<int64_t> error_timestamp;
    uint64_t next_count = 0;
    std::optional<int64_t> next_timestamp;
    uint64_t tick = 0;
    std::optional<nlohmann::json> stack_trace;

    // Graph links, by subscription id
    std::optional<std::string> sink;
    std::optional<std::string> root_sink;
    std::set<std::string> sources;
    std::set<std::string> flats;
    bool sources_flushed = false;
    bool flats_flushed = false;

    std::vector<value_record> values;
    bool values_flushed = false;
};

// Point-in-time projection of everything the snapshot plugin tracks.
// Every id it references is a key of the same snapshot.
struct snapshot {
    std::map<std::string, observable_record> observables;
    std::map<std::string, subscriber_record> subscribers;
    std::map<std::string, subscription_record> subscriptions;
    uint64_t tick = 0;
};

void to_json(nlohmann::json& j, const value_record& v);
void to_json(nlohmann::json& j, const observable_record& o);
void to_json(nlohmann::json& j, const subscriber_record& s);
void to_json(nlohmann::json& j, const subscription_record& s);
// Wire SnapshotPayload
void to_json(nlohmann::json& j, const snapshot& s);

} // namespace spyhub
