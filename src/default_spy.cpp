#include "default_spy.hpp"
#include "plugins.hpp"
#include "snapshot_plugin.hpp"

namespace spyhub {

std::unique_ptr<spy> create_default_spy(iinspector_sptr inspector,
                                        value_serializer serializer,
                                        stack_trace_provider stack_traces,
                                        const hub_config& cfg,
                                        std::shared_ptr<spdlog::logger> log) {
    auto s = std::make_unique<spy>(std::move(inspector), std::move(serializer), log);

    // The teardown handles are not kept: these live as long as the spy.
    // The stack trace plugin goes before the snapshot plugin so a trace is
    // captured by the time the snapshot record for a subscribe is made.
    s->plug(std::make_shared<graph_plugin>(*s, cfg.keep_unsubscribed, log));
    if (cfg.stack_traces) {
        s->plug(std::make_shared<stack_trace_plugin>(*s, std::move(stack_traces),
                                                     cfg.keep_unsubscribed));
    }
    s->plug(std::make_shared<snapshot_plugin>(*s, cfg.keep_values, cfg.keep_unsubscribed, log));
    s->plug(std::make_shared<cycle_plugin>(*s, cfg.cycle_threshold, log));

    return s;
}

} // namespace spyhub
