#include "config.hpp"
#include "default_spy.hpp"
#include "demo_pipeline.hpp"
#include "devtools_session.hpp"
#include "nats_connection.hpp"
#include <nats_asio/nats_asio.hpp>
#include <asio/co_spawn.hpp>
#include <asio/detached.hpp>
#include <asio/io_context.hpp>
#include <asio/signal_set.hpp>
#include <asio/steady_timer.hpp>
#include <asio/use_awaitable.hpp>
#include <cxxopts.hpp>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <iostream>
#include <memory>

int main(int argc, char* argv[]) {
    cxxopts::Options options("spyhub_relay",
        "Stream instrumentation hub relaying to a remote devtools viewer over NATS");

    options.add_options()
        ("c,config", "Path to YAML config file", cxxopts::value<std::string>())
        ("a,address", "NATS server address (overrides config)", cxxopts::value<std::string>())
        ("p,port", "NATS server port (overrides config)", cxxopts::value<uint16_t>())
        ("demo", "Drive a synthetic instrumented pipeline")
        ("v,verbose", "Enable debug logging")
        ("h,help", "Print help");

    cxxopts::ParseResult result;
    try {
        result = options.parse(argc, argv);
    } catch (const std::exception& e) {
        std::cerr << e.what() << "\n" << options.help() << std::endl;
        return 1;
    }

    if (result.count("help") || !result.count("config")) {
        std::cout << options.help() << std::endl;
        return result.count("help") ? 0 : 1;
    }

    // Logger
    auto console = spdlog::stdout_color_mt("spyhub");

    // Load config
    spyhub::hub_config cfg;
    try {
        cfg = spyhub::load_config(result["config"].as<std::string>());
    } catch (const std::exception& e) {
        console->error("Failed to load config: {}", e.what());
        return 1;
    }

    // CLI overrides
    if (result.count("address")) cfg.nats_address = result["address"].as<std::string>();
    if (result.count("port"))    cfg.nats_port = result["port"].as<uint16_t>();
    if (result.count("demo"))    cfg.demo = true;
    if (result.count("verbose")) cfg.log_level = "debug";

    spdlog::set_level(spyhub::parse_log_level(cfg.log_level).value_or(spdlog::level::info));

    console->info("spyhub_relay starting");
    console->info("  server:   {}:{}", cfg.nats_address, cfg.nats_port);
    console->info("  posts:    {}", cfg.post_subject);
    console->info("  requests: {}", cfg.request_subject);
    console->info("  batching: {}ms, {} notifications", cfg.batch_milliseconds, cfg.batch_notifications);

    // Single-threaded io_context: notifications, requests and timers
    asio::io_context ioc(1);

    auto inspector = std::make_shared<spyhub::registry_inspector>();

    // Without a real interceptor there is no call stack to capture; record
    // where in the observable chain each subscription was made instead.
    spyhub::stack_trace_provider stack_traces =
        [inspector](const spyhub::subscription_ref& ref) -> std::optional<nlohmann::json> {
            return nlohmann::json::array({
                "subscribe " + inspector->infer_path(ref.observable),
                "spyhub_relay"
            });
        };

    auto spy = spyhub::create_default_spy(inspector, spyhub::json_value_serializer(),
                                          std::move(stack_traces), cfg, console);
    auto demo = std::make_unique<spyhub::demo_pipeline>(*spy, *inspector, console);

    // Build NATS connect config
    nats_asio::connect_config nats_cfg;
    nats_cfg.address = cfg.nats_address;
    nats_cfg.port = cfg.nats_port;

    // SSL config
    std::optional<nats_asio::ssl_config> ssl_conf;
    if (!cfg.tls_cert.empty()) {
        nats_asio::ssl_config sc;
        sc.cert = cfg.tls_cert;
        sc.key  = cfg.tls_key;
        sc.ca   = cfg.tls_ca;
        sc.verify = true;
        ssl_conf = sc;
    }

    auto on_connected = [console](nats_asio::iconnection& /*c*/) -> asio::awaitable<void> {
        console->info("Connected to NATS");
        co_return;
    };

    auto on_disconnected = [console](nats_asio::iconnection& /*c*/) -> asio::awaitable<void> {
        console->warn("Disconnected from NATS");
        co_return;
    };

    auto on_error = [console](nats_asio::iconnection& /*c*/, std::string_view err) -> asio::awaitable<void> {
        console->error("NATS connection error: {}", err);
        co_return;
    };

    auto nats = nats_asio::create_connection(
        ioc, on_connected, on_disconnected, on_error, ssl_conf);
    nats->start(nats_cfg);

    auto conn = std::make_shared<spyhub::nats_connection>(
        ioc, nats, cfg.post_subject, cfg.request_subject, console);

    spyhub::batch_settings batching;
    batching.window = std::chrono::milliseconds(cfg.batch_milliseconds);
    batching.max_notifications = cfg.batch_notifications;

    auto session = std::make_shared<spyhub::devtools_session>(ioc, *spy, conn, batching, console);

    // Graceful shutdown
    asio::signal_set signals(ioc, SIGINT, SIGTERM);
    signals.async_wait([&](auto, auto) {
        console->info("Shutting down...");
        demo->stop();
        ioc.stop();
    });

    // Start the session once connected
    asio::co_spawn(ioc,
        [&, c = nats]() mutable -> asio::awaitable<void> {
            asio::steady_timer timer(co_await asio::this_coro::executor);
            while (!c->is_connected()) {
                timer.expires_after(std::chrono::milliseconds(100));
                co_await timer.async_wait(asio::use_awaitable);
            }
            if (!co_await conn->start()) {
                ioc.stop();
                co_return;
            }
            spy->plug(session);
            session->start();
            if (cfg.demo) {
                demo->run(ioc, std::chrono::milliseconds(cfg.demo_interval_ms));
            }
        },
        asio::detached
    );

    // Run the event loop (single thread)
    ioc.run();

    // Shutdown ordering: the session first so no batch is posted after
    // disconnect, then the remaining plugins.
    session->teardown();
    spy->teardown();

    // Flush any remaining co_spawn'd publish coroutines
    ioc.restart();
    ioc.run();

    console->info("spyhub_relay stopped");
    return 0;
}
