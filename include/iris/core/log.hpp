#pragma once

/** \file log.hpp
 *  \brief Shared spdlog loggers.
 *
 * logger() is the component log ("iris"); lines carry a bracketed component
 * tag, e.g. "[rebuild] published v3". alert() ("iris.alert") receives
 * conditions operators must act on: index corruption and aggregate rebuild
 * failures. Both loggers are created lazily and are safe to use from any thread.
 */

#include <memory>
#include <string_view>

#include <spdlog/spdlog.h>

#include "iris/error.hpp"

namespace iris::core {

/** \brief Component logger. */
auto logger() -> std::shared_ptr<spdlog::logger>;

/** \brief Operational alert logger. */
auto alert() -> std::shared_ptr<spdlog::logger>;

/** \brief Apply a level name (trace|debug|info|warn|error|off) to both loggers. */
auto set_log_level(std::string_view level) -> std::expected<void, error>;

} // namespace iris::core
