#pragma once

#include "iconnection.hpp"
#include "inspector.hpp"
#include "spy.hpp"
#include "subscription_ref.hpp"
#include <asio/io_context.hpp>
#include <asio/steady_timer.hpp>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/null_sink.h>
#include <spdlog/sinks/ostream_sink.h>
#include <chrono>
#include <memory>
#include <sstream>
#include <vector>

namespace spyhub::test {

inline std::shared_ptr<spdlog::logger> make_log() {
    return std::make_shared<spdlog::logger>("test", std::make_shared<spdlog::sinks::null_sink_mt>());
}

// Logger writing "<level> <message>" lines into out.
inline std::shared_ptr<spdlog::logger> make_capturing_log(std::ostringstream& out) {
    auto sink = std::make_shared<spdlog::sinks::ostream_sink_mt>(out);
    auto log = std::make_shared<spdlog::logger>("capture", sink);
    log->set_pattern("%l %v");
    log->set_level(spdlog::level::trace);
    return log;
}

class fake_connection : public iconnection {
public:
    void subscribe(post_handler on_post) override { handler = std::move(on_post); }
    void post(const message& m) override { posts.push_back(m); }
    void disconnect() override { ++disconnects; }

    // Posts of one alternative, in order.
    template <typename T>
    std::vector<T> posted() const {
        std::vector<T> out;
        for (const auto& m : posts) {
            if (auto p = std::get_if<T>(&m)) out.push_back(*p);
        }
        return out;
    }

    post_handler handler;
    std::vector<message> posts;
    int disconnects = 0;
};

// Stand-ins for the objects of one subscription; only their addresses matter.
struct fake_subscription {
    char observable = 0;
    char subscriber = 0;
    char subscription = 0;

    subscription_ref ref() const { return {&observable, &subscriber, &subscription}; }
};

// Run the loop for at least d, including any timers that fall due.
inline void pump(asio::io_context& ioc, std::chrono::milliseconds d) {
    asio::steady_timer guard(ioc, d);
    guard.async_wait([](const std::error_code&) {});
    ioc.restart();
    ioc.run();
}

} // namespace spyhub::test
