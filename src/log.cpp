#include "wire_cpp/log.hpp"

#include <mutex>
#include <spdlog/sinks/null_sink.h>

namespace wire_cpp::log {

    namespace {
        std::mutex& logger_mutex() {
            static std::mutex mu;
            return mu;
        }

        std::shared_ptr<spdlog::logger>& logger_slot() {
            static std::shared_ptr<spdlog::logger> slot;
            return slot;
        }
    }  // namespace

    std::shared_ptr<spdlog::logger> get() {
        std::lock_guard<std::mutex> lk(logger_mutex());
        auto& slot = logger_slot();
        if (!slot) slot = spdlog::default_logger();
        return slot;
    }

    void set(std::shared_ptr<spdlog::logger> logger) {
        if (!logger) {
            logger = std::make_shared<spdlog::logger>(
                "wire_cpp", std::make_shared<spdlog::sinks::null_sink_mt>());
        }
        std::lock_guard<std::mutex> lk(logger_mutex());
        logger_slot() = std::move(logger);
    }

}  // namespace wire_cpp::log
