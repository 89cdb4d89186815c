#pragma once

#include "subscription_ref.hpp"
#include <nlohmann/json.hpp>
#include <any>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>

namespace spyhub {

// Identity and path inference for the objects behind a subscription_ref.
// Implemented by whatever intercepts the stream library.
class iinspector {
public:
    virtual ~iinspector() = default;

    // Stable id for a handle; the same handle always yields the same id.
    virtual std::string identify(const void* handle) = 0;

    // Id for an object that has no handle (e.g. a notification).
    virtual std::string fresh_id() = 0;

    virtual std::string infer_path(const void* observable) = 0;
    virtual std::string infer_type(const void* observable) = 0;

    // User supplied label, if any.
    virtual std::optional<std::string> read_tag(const void* observable) = 0;
};

using iinspector_sptr = std::shared_ptr<iinspector>;

// Inspector backed by in-memory tables. Ids are decimal counters handed
// out on first sight; labels are registered with describe().
class registry_inspector : public iinspector {
public:
    void describe(const void* observable, std::string path, std::string type,
                  std::optional<std::string> tag = std::nullopt);

    std::string identify(const void* handle) override;
    std::string fresh_id() override;
    std::string infer_path(const void* observable) override;
    std::string infer_type(const void* observable) override;
    std::optional<std::string> read_tag(const void* observable) override;

private:
    struct labels {
        std::string path;
        std::string type;
        std::optional<std::string> tag;
    };

    uint64_t m_next_id = 1;
    std::unordered_map<const void*, std::string> m_ids;
    std::unordered_map<const void*, labels> m_labels;
};

// Turns a next value or an error into text. Must not throw.
using value_serializer = std::function<std::string(const std::any&)>;

// Serializer understanding nlohmann::json, strings, arithmetic types and
// std::exception_ptr. Anything else becomes "[object <type>]".
value_serializer json_value_serializer();

// Opaque stack trace captured at subscribe time.
using stack_trace_provider =
    std::function<std::optional<nlohmann::json>(const subscription_ref&)>;

} // namespace spyhub
