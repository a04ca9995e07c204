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

#include "logger.hxx"

#include "configuration.hxx"

#include <spdlog/async.h>
#include <spdlog/async_logger.h>
#include <spdlog/common.h>
#include <spdlog/logger.h>
#include <spdlog/sinks/dist_sink.h>
#include <spdlog/sinks/null_sink.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace
{
const std::string file_logger_name{ "couchview_file_logger" };

/**
 * Custom log pattern which the loggers will use.
 */
const std::string log_pattern{ "[%Y-%m-%d %T.%e] %4oms [%^%4!l%$] [%P,%t] %v" };

/**
 * Instance of spdlog (async) file logger.
 * The loggers act as a handle to the sinks. They do the processing of log
 * messages and send them to the sinks, which do the actual writing (to file,
 * to stream etc.) or further processing.
 */
std::shared_ptr<spdlog::logger> file_logger{};
std::mutex file_logger_mutex;
std::atomic_int file_logger_version{ 0 };

couchview::core::logger::log_callback user_callback{};
std::mutex user_callback_mutex;
std::atomic_bool has_user_callback{ false };

auto
get_file_logger() -> std::shared_ptr<spdlog::logger>
{
  thread_local std::shared_ptr<spdlog::logger> logger{ nullptr };
  thread_local int version{ -1 };
  if (version != file_logger_version) {
    const std::scoped_lock lock(file_logger_mutex);
    logger = file_logger;
    version = file_logger_version;
  }
  return logger;
}

void
update_file_logger(const std::shared_ptr<spdlog::logger>& new_logger)
{
  const std::scoped_lock lock(file_logger_mutex);
  // delete if already exists
  spdlog::drop(file_logger_name);
  file_logger = new_logger;
  if (new_logger) {
    spdlog::register_logger(new_logger);
  }
  ++file_logger_version;
}
} // namespace

namespace couchview::core::logger
{
auto
translate_level(level level) -> spdlog::level::level_enum
{
  switch (level) {
    case level::trace:
      return spdlog::level::level_enum::trace;
    case level::debug:
      return spdlog::level::level_enum::debug;
    case level::info:
      return spdlog::level::level_enum::info;
    case level::warn:
      return spdlog::level::level_enum::warn;
    case level::err:
      return spdlog::level::level_enum::err;
    case level::critical:
      return spdlog::level::level_enum::critical;
    case level::off:
      return spdlog::level::level_enum::off;
  }
  return spdlog::level::level_enum::trace;
}

auto
level_from_str(const std::string& str) -> level
{
  switch (spdlog::level::from_str(str)) {
    case spdlog::level::level_enum::trace:
      return level::trace;
    case spdlog::level::level_enum::debug:
      return level::debug;
    case spdlog::level::level_enum::info:
      return level::info;
    case spdlog::level::level_enum::warn:
      return level::warn;
    case spdlog::level::level_enum::err:
      return level::err;
    case spdlog::level::level_enum::critical:
      return level::critical;
    case spdlog::level::level_enum::off:
      return level::off;
    default:
      break;
  }
  // return highest level if we don't understand
  return level::trace;
}

auto
should_log(level lvl) -> bool
{
  if (has_user_callback) {
    return true;
  }
  if (is_initialized()) {
    return get_file_logger()->should_log(translate_level(lvl));
  }
  return false;
}

namespace detail
{
void
log(const char* file, int line, const char* function, level lvl, std::string_view msg)
{
  if (has_user_callback) {
    log_callback callback{};
    {
      const std::scoped_lock lock(user_callback_mutex);
      callback = user_callback;
    }
    if (callback) {
      callback(msg, lvl, log_location{ file, function, line });
    }
  }
  if (is_initialized()) {
    auto logger = get_file_logger();
    if (logger->should_log(translate_level(lvl))) {
      logger->log(spdlog::source_loc{ file, line, function }, translate_level(lvl), msg);
    }
  }
}
} // namespace detail

void
flush()
{
  if (is_initialized()) {
    get_file_logger()->flush();
  }
}

void
shutdown()
{
  // Force a flush (posts a message to the async logger if we are not in unit
  // test mode)
  flush();

  /**
   * This will drop all spdlog instances from the registry, and destruct the
   * thread pool which will post terminate message(s) (one per thread) to the
   * thread pool message queue. The calling thread will then block until all
   * thread pool workers have joined.
   */
  update_file_logger(nullptr);
  spdlog::shutdown();
}

auto
is_initialized() -> bool
{
  return get_file_logger() != nullptr;
}

auto
create_file_logger(const configuration& logger_settings) -> std::optional<std::string>
{
  std::shared_ptr<spdlog::logger> logger{};

  try {
    // The structure is as follows:
    //
    // file_logger = sends log messages to sink
    //   |__dist_sink_mt = Distribute log messages to multiple sinks
    //       |     |__rotating_file_sink_mt = writes to the file, rotating it
    //       |__ (color)__stderr_sink_mt = Send log messages to console
    //
    // The level of the file_logger decides which messages go down to the
    // dist_sink at all, the file sink accepts everything it gets, and the
    // console sink drops everything below its own level.
    auto sink = std::make_shared<spdlog::sinks::dist_sink_mt>();
    sink->set_level(spdlog::level::trace);

    if (const auto& fname = logger_settings.filename; !fname.empty()) {
      auto fsink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
        fname, logger_settings.cycle_size, logger_settings.max_files);
      fsink->set_pattern(log_pattern);
      fsink->set_level(spdlog::level::trace);
      sink->add_sink(fsink);
    }

    if (logger_settings.console) {
      auto stderrsink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
      stderrsink->set_pattern(log_pattern);
      stderrsink->set_level(translate_level(logger_settings.console_sink_log_level));
      sink->add_sink(stderrsink);
    }
    if (nullptr != logger_settings.sink) {
      logger_settings.sink->set_pattern(log_pattern);
      sink->add_sink(logger_settings.sink);
    }

    if (logger_settings.unit_test) {
      logger = std::make_shared<spdlog::logger>(file_logger_name, sink);
    } else {
      spdlog::init_thread_pool(logger_settings.buffer_size, 1);
      logger = std::make_shared<spdlog::async_logger>(
        file_logger_name, sink, spdlog::thread_pool(), spdlog::async_overflow_policy::block);
    }

    logger->set_pattern(log_pattern);
    logger->set_level(translate_level(logger_settings.log_level));

    // Set the flushing interval policy
    spdlog::flush_every(std::chrono::seconds(1));
  } catch (const spdlog::spdlog_ex& ex) {
    return std::string{ "Log initialization failed: " } + ex.what();
  }
  update_file_logger(logger);
  return {};
}

auto
get() -> spdlog::logger*
{
  return get_file_logger().get();
}

void
reset()
{
  update_file_logger(nullptr);
}

void
create_blackhole_logger()
{
  auto new_logger = std::make_shared<spdlog::logger>(
    file_logger_name, std::make_shared<spdlog::sinks::null_sink_mt>());
  new_logger->set_level(spdlog::level::off);
  new_logger->set_pattern(log_pattern);

  update_file_logger(new_logger);
}

void
create_console_logger()
{
  auto stderrsink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
  auto new_logger = std::make_shared<spdlog::logger>(file_logger_name, stderrsink);
  new_logger->set_level(spdlog::level::info);
  new_logger->set_pattern(log_pattern);
  update_file_logger(new_logger);
}

void
register_log_callback(log_callback callback)
{
  const std::scoped_lock lock(user_callback_mutex);
  user_callback = std::move(callback);
  has_user_callback = static_cast<bool>(user_callback);
}

void
unregister_log_callback()
{
  const std::scoped_lock lock(user_callback_mutex);
  user_callback = nullptr;
  has_user_callback = false;
}

void
set_log_levels(level lvl)
{
  auto level = translate_level(lvl);
  spdlog::apply_all([level](const std::shared_ptr<spdlog::logger>& l) {
    try {
      l->set_level(level);
    } catch (const spdlog::spdlog_ex& e) {
      l->warn("Exception caught when attempting to change the verbosity "
              "of logger {} to spdlog level {}. e.what()={}",
              l->name(),
              spdlog::level::to_short_c_str(level),
              e.what());
    }
  });

  flush();
}
} // namespace couchview::core::logger
