#pragma once

#include <chrono>
#include <cstddef>
#include <cstring>
#include <functional>
#include <thread>

#include <fmt/chrono.h>
#include <fmt/format.h>

#include "log/logger.hpp"
#include "log/loglevel.hpp"

namespace pasture {

namespace log
{
  using HashFunc = std::hash<std::thread::id>;
  inline HashFunc Hasher = HashFunc();
} // namespace log

}

#define LOG_FUNC() __func__

#define __FILENAME__ \
  (std::strrchr(__FILE__, '/') ? std::strrchr(__FILE__, '/') + 1 : __FILE__)

#define LOG_FILE() __FILENAME__
#define LOG_LINE() __LINE__
#define GET_TID() \
  ::pasture::log::Hasher(std::this_thread::get_id()) // std::thread::id -> std::size_t

// Invoked on a logger object: logger.log_info("served {}", path);
// Each line is "<date time.ms> <LEVEL> <tid> [<func>:<file>@<line>] <message>".
#define LOG_WITH_LEVEL(level, format, ...)                                     \
  log(level,                                                                   \
      FMT_STRING("{:%Y-%m-%d %H:%M:}{:%S} {} {} [{}:{}@{}] " format "\n"),     \
      ::pasture::log::logLevelString(level), GET_TID(), LOG_FUNC(),            \
      LOG_FILE(), LOG_LINE(), ##__VA_ARGS__)

#define log_trace(format, ...) LOG_WITH_LEVEL(::pasture::log::TRACE, format, ##__VA_ARGS__)
#define log_debug(format, ...) LOG_WITH_LEVEL(::pasture::log::DEBUG, format, ##__VA_ARGS__)
#define log_info(format, ...)  LOG_WITH_LEVEL(::pasture::log::INFO, format, ##__VA_ARGS__)
#define log_warn(format, ...)  LOG_WITH_LEVEL(::pasture::log::WARN, format, ##__VA_ARGS__)
#define log_error(format, ...) LOG_WITH_LEVEL(::pasture::log::ERROR, format, ##__VA_ARGS__)
