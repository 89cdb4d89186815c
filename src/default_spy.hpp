#pragma once

#include "config.hpp"
#include "inspector.hpp"
#include "spy.hpp"
#include <spdlog/spdlog.h>
#include <memory>

namespace spyhub {

// A spy with the graph, stack trace (when enabled), snapshot and cycle
// plugins attached, in that order.
std::unique_ptr<spy> create_default_spy(iinspector_sptr inspector,
                                        value_serializer serializer,
                                        stack_trace_provider stack_traces,
                                        const hub_config& cfg,
                                        std::shared_ptr<spdlog::logger> log);

} // namespace spyhub
