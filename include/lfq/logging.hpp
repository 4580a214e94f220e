#pragma once
#include <memory>
#include <utility>

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace lfq {

constexpr const char* kLoggerName = "lfq";

// Library logger. An application that wants its own sinks registers a logger
// named "lfq" with spdlog before the first queue operation; otherwise a stderr
// logger is created on first use.
//
// The owning pointer is never destroyed: queues with static storage duration
// log from their destructors after function-local statics created later are gone.
inline spdlog::logger& logger() {
    static const std::shared_ptr<spdlog::logger>* const owner = [] {
        std::shared_ptr<spdlog::logger> instance = spdlog::get(kLoggerName);
        if (!instance) instance = spdlog::stderr_color_mt(kLoggerName);
        return new std::shared_ptr<spdlog::logger>(std::move(instance));
    }();
    return **owner;
}

} // namespace lfq

#define LFQ_LOG_TRACE(...) ::lfq::logger().trace(__VA_ARGS__)
#define LFQ_LOG_DEBUG(...) ::lfq::logger().debug(__VA_ARGS__)
#define LFQ_LOG_WARN(...)  ::lfq::logger().warn(__VA_ARGS__)
#define LFQ_LOG_ERROR(...) ::lfq::logger().error(__VA_ARGS__)
