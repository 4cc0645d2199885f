#include "logic/app/Logging.h"
#include "common/Exception.hpp"

#include <spdlog/fmt/ostr.h>

#include <sstream>


void Logging::setup(const std::string& logFileName)
{
  try
  {
    m_consoleSink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    m_consoleSink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");
    m_consoleSink->set_level(spdlog::level::info);

    // The daily file sink shows more info: logger name, time zone, thread, and source location.
    // Rotates at 23:59.
    m_dailySink = std::make_shared<spdlog::sinks::daily_file_sink_mt>(logFileName, 23, 59);
    m_dailySink->set_pattern("[%Y-%m-%d %H:%M:%S.%e %z] [%n] [tid %t] [%l] [%s:%#] %v");
    m_dailySink->set_level(spdlog::level::debug);

    spdlog::sinks_init_list sinkList{m_consoleSink, m_dailySink};

    auto defaultLogger
      = std::make_shared<spdlog::logger>("default", std::begin(sinkList), std::end(sinkList));

    defaultLogger->set_level(spdlog::level::trace);
    defaultLogger->flush_on(spdlog::level::debug);

    spdlog::register_logger(defaultLogger);
    spdlog::set_default_logger(defaultLogger);
  }
  catch (const spdlog::spdlog_ex& e)
  {
    std::ostringstream ss;
    ss << "Logging construction failed: " << e.what();
    throw_debug(ss.str())
  }
  catch (const std::exception& e)
  {
    std::ostringstream ss;
    ss << "Logging construction failed: " << e.what();
    throw_debug(ss.str())
  }

  spdlog::debug("Setup the logger");
}

void Logging::setConsoleSinkLevel(spdlog::level::level_enum level)
{
  if (m_consoleSink)
  {
    m_consoleSink->set_level(level);
    spdlog::debug("Set console log level to {}", spdlog::level::to_string_view(level));
  }
  else
  {
    spdlog::error("Console logging sink is null");
  }
}

void Logging::setDailyFileSinkLevel(spdlog::level::level_enum level)
{
  if (m_dailySink)
  {
    m_dailySink->set_level(level);
    spdlog::debug("Set daily file log level to {}", spdlog::level::to_string_view(level));
  }
  else
  {
    spdlog::error("Daily file logging sink is null");
  }
}
