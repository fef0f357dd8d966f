#pragma once

#include <memory>
#include <spdlog/spdlog.h>

namespace wire_cpp::log {

    /// @brief Logger used by the transport for diagnostic events.
    /// @note Defaults to spdlog's default logger. Never null.
    std::shared_ptr<spdlog::logger> get();

    /// @brief Replace the transport logger.
    /// @param logger New logger; nullptr installs a logger without sinks so
    /// every event is dropped.
    void set(std::shared_ptr<spdlog::logger> logger);

}  // namespace wire_cpp::log
