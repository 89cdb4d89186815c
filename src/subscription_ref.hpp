#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>

namespace spyhub {

// Opaque handles to the three objects taking part in one subscription.
// The hub never dereferences them; it only hands them to the inspector.
struct subscription_ref {
    const void* observable = nullptr;
    const void* subscriber = nullptr;
    const void* subscription = nullptr;

    bool operator==(const subscription_ref&) const = default;
};

enum class notification_kind {
    subscribe,
    unsubscribe,
    next,
    error,
    complete
};

enum class notification_prefix {
    before,
    after
};

constexpr std::string_view to_string(notification_kind kind) {
    switch (kind) {
        case notification_kind::subscribe:   return "subscribe";
        case notification_kind::unsubscribe: return "unsubscribe";
        case notification_kind::next:        return "next";
        case notification_kind::error:       return "error";
        case notification_kind::complete:    return "complete";
    }
    return "unknown";
}

constexpr std::string_view to_string(notification_prefix prefix) {
    return prefix == notification_prefix::before ? "before" : "after";
}

// e.g. "before-next"
inline std::string notification_type(notification_prefix prefix, notification_kind kind) {
    std::string type(to_string(prefix));
    type += '-';
    type += to_string(kind);
    return type;
}

// Wall clock capture time, milliseconds since the epoch.
inline int64_t timestamp_ms() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

} // namespace spyhub
