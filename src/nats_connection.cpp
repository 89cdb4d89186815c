#include "nats_connection.hpp"
#include <nlohmann/json.hpp>
#include <asio/co_spawn.hpp>
#include <asio/detached.hpp>

namespace spyhub {

nats_connection::nats_connection(asio::io_context& ioc, nats_asio::iconnection_sptr conn,
                                 std::string post_subject, std::string request_subject,
                                 std::shared_ptr<spdlog::logger> log)
    : m_ioc(ioc), m_conn(std::move(conn)),
      m_post_subject(std::move(post_subject)),
      m_request_subject(std::move(request_subject)),
      m_log(std::move(log))
{}

asio::awaitable<bool> nats_connection::start() {
    auto self = shared_from_this();
    auto [request_sub, status] = co_await m_conn->subscribe(
        m_request_subject,
        [self](auto subject, auto reply_to, auto payload) {
            return self->on_request(subject, reply_to, payload);
        }
    );

    if (status.failed()) {
        m_log->error("Failed to subscribe to request subject '{}': {}",
                    m_request_subject, status.error());
        co_return false;
    }

    m_log->info("Listening for devtools requests on '{}', posting to '{}'",
               m_request_subject, m_post_subject);
    co_return true;
}

void nats_connection::subscribe(post_handler on_post) {
    m_on_post = std::move(on_post);
}

void nats_connection::post(const message& m) {
    if (!m_connected) return;

    std::string payload;
    try {
        payload = to_json(m).dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
    } catch (const nlohmann::json::exception& e) {
        m_log->error("Failed to serialize message: {}", e.what());
        return;
    }

    asio::co_spawn(m_ioc, publish(std::move(payload)), asio::detached);
}

void nats_connection::disconnect() {
    m_connected = false;
    m_on_post = nullptr;
    m_log->info("Devtools connection closed");
}

asio::awaitable<void> nats_connection::publish(std::string payload) {
    auto s = co_await m_conn->publish(
        m_post_subject,
        std::span<const char>(payload.data(), payload.size()),
        std::nullopt);

    if (s.failed()) {
        m_log->error("Failed to publish to '{}': {}", m_post_subject, s.error());
    }
}

asio::awaitable<void> nats_connection::on_request(
    std::string_view /*subject*/,
    std::optional<std::string_view> /*reply_to*/,
    std::span<const char> payload)
{
    if (!m_connected || !m_on_post) co_return;

    nlohmann::json post;
    try {
        post = nlohmann::json::parse(std::string_view(payload.data(), payload.size()));
    } catch (const nlohmann::json::parse_error& e) {
        m_log->warn("Ignoring malformed devtools post: {}", e.what());
        co_return;
    }

    m_on_post(post);
}

} // namespace spyhub
