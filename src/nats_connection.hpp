#pragma once

#include "iconnection.hpp"
#include <nats_asio/nats_asio.hpp>
#include <asio/awaitable.hpp>
#include <asio/io_context.hpp>
#include <spdlog/spdlog.h>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>

namespace spyhub {

// iconnection over NATS: messages are published as JSON to the post
// subject, requests are read as JSON from the request subject.
class nats_connection : public iconnection,
                        public std::enable_shared_from_this<nats_connection> {
public:
    nats_connection(asio::io_context& ioc, nats_asio::iconnection_sptr conn,
                    std::string post_subject, std::string request_subject,
                    std::shared_ptr<spdlog::logger> log);

    // Subscribe to the request subject. Must be called once the NATS
    // connection is established.
    asio::awaitable<bool> start();

    void subscribe(post_handler on_post) override;
    void post(const message& m) override;
    void disconnect() override;

private:
    asio::awaitable<void> on_request(
        std::string_view subject,
        std::optional<std::string_view> reply_to,
        std::span<const char> payload);

    asio::awaitable<void> publish(std::string payload);

    asio::io_context& m_ioc;
    nats_asio::iconnection_sptr m_conn;
    std::string m_post_subject;
    std::string m_request_subject;
    std::shared_ptr<spdlog::logger> m_log;

    post_handler m_on_post;
    bool m_connected = true;
};

} // namespace spyhub
