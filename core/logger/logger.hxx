/* -*- Mode: C++; tab-width: 4; c-basic-offset: 4; indent-tabs-mode: nil -*- */
/*
 *   Copyright 2024-Present Couchbase, Inc.
 *
 *   Licensed under the Apache License, Version 2.0 (the "License");
 *   you may not use this file except in compliance with the License.
 *   You may obtain a copy of the License at
 *
 *       http://www.apache.org/licenses/LICENSE-2.0
 *
 *   Unless required by applicable law or agreed to in writing, software
 *   distributed under the License is distributed on an "AS IS" BASIS,
 *   WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 *   See the License for the specific language governing permissions and
 *   limitations under the License.
 */

/*
 *   A note on the thread safety of the logger API:
 *
 *   The API is thread safe unless the underlying logger object is changed
 * during runtime. This means some methods can only be safely called if the
 * caller guarantees no other threads exist and/or are calling the logging
 * functions.
 */

#pragma once

#include "level.hxx"

#include <fmt/core.h>
#include <spdlog/fwd.h>

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace couchview::core::logger
{
struct configuration;

struct log_location {
  const char* file;
  const char* function;
  int line;
};

using log_callback = std::function<void(std::string_view, level, const log_location&)>;

level
level_from_str(const std::string& str);

/**
 * Initialize the logger.
 *
 * The default level for the created logger is set to INFO
 *
 * See note about thread safety at the top of the file
 *
 * @param logger_settings the configuration for the logger
 * @return optional error message if something goes wrong
 */
std::optional<std::string>
create_file_logger(const configuration& logger_settings);

/**
 * Initialize the logger with the blackhole logger object
 *
 * This method is intended to be used by unit tests which don't need any output (but may call
 * methods who tries to fetch the logger)
 *
 * @throws spdlog::spdlog_ex if an error occurs creating the logger
 */
void
create_blackhole_logger();

/**
 * Initialize the logger with the logger which logs to the console
 *
 * @throws spdlog::spdlog_ex if an error occurs creating the logger
 */
void
create_console_logger();

/**
 * Get the underlying logger object
 *
 * This will return null if a logger has not been initialized.
 */
spdlog::logger*
get();

/**
 * Reset the underlying logger object
 */
void
reset();

/**
 * Registers a callback which receives every message that passes should_log(), regardless of the
 * spdlog logger being initialized.
 */
void
register_log_callback(log_callback callback);

void
unregister_log_callback();

/**
 * Set the log level of all registered spdLoggers
 */
void
set_log_levels(level lvl);

/**
 * Checks whether a specific level should be logged based on the current
 * configuration.
 */
bool
should_log(level lvl);

namespace detail
{
void
log(const char* file, int line, const char* function, level lvl, std::string_view msg);
} // namespace detail

/**
 * Logs a formatted message at a specific severity level.
 */
template<typename String, typename... Args>
inline void
log(const char* file, int line, const char* function, level lvl, const String& msg, Args&&... args)
{
  detail::log(file, line, function, lvl, fmt::format(msg, std::forward<Args>(args)...));
}

/**
 * Tell the logger to flush its buffers
 */
void
flush();

/**
 * Tell the logger to shut down (flush buffers) and release _ALL_
 * loggers (you'd need to create new loggers after this method)
 */
void
shutdown();

/**
 * @return whether or not the logger has been initialized
 */
bool
is_initialized();

} // namespace couchview::core::logger

#if defined(__GNUC__) || defined(__clang__)
#define COUCHVIEW_LOGGER_FUNCTION __PRETTY_FUNCTION__
#else
#define COUCHVIEW_LOGGER_FUNCTION __FUNCTION__
#endif
/**
 * We implement this macro to avoid having argument evaluation performed
 * on log messages which likely will not actually be logged due to their
 * severity value not matching the logger.
 */
#define COUCHVIEW_LOG(file, line, function, severity, ...)                                         \
  do {                                                                                             \
    if (couchview::core::logger::should_log(severity)) {                                           \
      couchview::core::logger::log(file, line, function, severity, __VA_ARGS__);                   \
    }                                                                                              \
  } while (false)

#define CV_LOG_TRACE(...)                                                                          \
  COUCHVIEW_LOG(__FILE__,                                                                          \
                __LINE__,                                                                          \
                COUCHVIEW_LOGGER_FUNCTION,                                                         \
                couchview::core::logger::level::trace,                                             \
                __VA_ARGS__)
#define CV_LOG_DEBUG(...)                                                                          \
  COUCHVIEW_LOG(__FILE__,                                                                          \
                __LINE__,                                                                          \
                COUCHVIEW_LOGGER_FUNCTION,                                                         \
                couchview::core::logger::level::debug,                                             \
                __VA_ARGS__)
#define CV_LOG_INFO(...)                                                                           \
  COUCHVIEW_LOG(__FILE__,                                                                          \
                __LINE__,                                                                          \
                COUCHVIEW_LOGGER_FUNCTION,                                                         \
                couchview::core::logger::level::info,                                              \
                __VA_ARGS__)
#define CV_LOG_WARNING(...)                                                                        \
  COUCHVIEW_LOG(__FILE__,                                                                          \
                __LINE__,                                                                          \
                COUCHVIEW_LOGGER_FUNCTION,                                                         \
                couchview::core::logger::level::warn,                                              \
                __VA_ARGS__)
#define CV_LOG_ERROR(...)                                                                          \
  COUCHVIEW_LOG(__FILE__,                                                                          \
                __LINE__,                                                                          \
                COUCHVIEW_LOGGER_FUNCTION,                                                         \
                couchview::core::logger::level::err,                                               \
                __VA_ARGS__)
#define CV_LOG_CRITICAL(...)                                                                       \
  COUCHVIEW_LOG(__FILE__,                                                                          \
                __LINE__,                                                                          \
                COUCHVIEW_LOGGER_FUNCTION,                                                         \
                couchview::core::logger::level::critical,                                          \
                __VA_ARGS__)
