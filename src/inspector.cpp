#include "inspector.hpp"
#include <exception>
#include <stdexcept>

namespace spyhub {

void registry_inspector::describe(const void* observable, std::string path,
                                  std::string type, std::optional<std::string> tag) {
    m_labels[observable] = labels{std::move(path), std::move(type), std::move(tag)};
}

std::string registry_inspector::identify(const void* handle) {
    auto it = m_ids.find(handle);
    if (it != m_ids.end()) return it->second;
    return m_ids.emplace(handle, fresh_id()).first->second;
}

std::string registry_inspector::fresh_id() {
    return std::to_string(m_next_id++);
}

std::string registry_inspector::infer_path(const void* observable) {
    auto it = m_labels.find(observable);
    return it != m_labels.end() ? it->second.path : std::string();
}

std::string registry_inspector::infer_type(const void* observable) {
    auto it = m_labels.find(observable);
    return it != m_labels.end() ? it->second.type : std::string("unknown");
}

std::optional<std::string> registry_inspector::read_tag(const void* observable) {
    auto it = m_labels.find(observable);
    if (it != m_labels.end()) return it->second.tag;
    return std::nullopt;
}

namespace {

std::string describe_exception(const std::exception_ptr& ptr) {
    if (!ptr) return "null";
    try {
        std::rethrow_exception(ptr);
    } catch (const std::exception& e) {
        return nlohmann::json(e.what()).dump();
    } catch (...) {
        return nlohmann::json("unknown error").dump();
    }
}

template <typename T>
bool try_dump(const std::any& value, std::string& out) {
    if (auto p = std::any_cast<T>(&value)) {
        out = nlohmann::json(*p).dump();
        return true;
    }
    return false;
}

} // namespace

value_serializer json_value_serializer() {
    return [](const std::any& value) -> std::string {
        if (!value.has_value()) return "undefined";

        try {
            if (auto p = std::any_cast<nlohmann::json>(&value)) {
                return p->dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
            }
            if (auto p = std::any_cast<const char*>(&value)) {
                return *p ? nlohmann::json(*p).dump() : std::string("null");
            }
            if (auto p = std::any_cast<std::exception_ptr>(&value)) {
                return describe_exception(*p);
            }

            std::string out;
            if (try_dump<std::string>(value, out) ||
                try_dump<bool>(value, out) ||
                try_dump<int>(value, out) ||
                try_dump<long>(value, out) ||
                try_dump<long long>(value, out) ||
                try_dump<unsigned>(value, out) ||
                try_dump<unsigned long>(value, out) ||
                try_dump<unsigned long long>(value, out) ||
                try_dump<float>(value, out) ||
                try_dump<double>(value, out)) {
                return out;
            }
        } catch (const nlohmann::json::exception& e) {
            return nlohmann::json(std::string("[unserializable: ") + e.what() + "]").dump();
        }

        return nlohmann::json(std::string("[object ") + value.type().name() + "]").dump();
    };
}

} // namespace spyhub
