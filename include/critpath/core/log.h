// core/log.h - Named logger for the scheduling engine
// Part of the critpath scheduling library (C++20)
//
// The engine logs to stderr only: stdout belongs to the terminal UI that
// hosts it.  Verbosity is the host's decision:
//
//   critpath::engine_log()->set_level(spdlog::level::debug);

#ifndef CRITPATH_CORE_LOG_H
#define CRITPATH_CORE_LOG_H

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <memory>

namespace critpath {

inline constexpr char const* engine_logger_name = "critpath";

/// The engine's logger, registered with spdlog on first use.
///
/// If the host registered a logger under the same name beforehand, that
/// logger is used instead.
inline std::shared_ptr<spdlog::logger> engine_log() {
    static auto logger = [] {
        if (auto existing = spdlog::get(engine_logger_name)) {
            return existing;
        }
        auto created = spdlog::stderr_color_mt(engine_logger_name);
        created->set_level(spdlog::level::warn);
        return created;
    }();
    return logger;
}

} // namespace critpath

#endif // CRITPATH_CORE_LOG_H
