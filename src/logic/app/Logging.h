#ifndef LOGGING_H
#define LOGGING_H

#include <spdlog/spdlog.h>
#include <spdlog/sinks/daily_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <memory>
#include <string>


/**
 * @brief Owns the console and daily file sinks of the default logger
 */
class Logging
{
public:

    Logging() = default;
    ~Logging() = default;

    /**
     * @brief Create the sinks and register the default logger
     * @param[in] logFileName Base name of the daily rotating log file
     * @throws Exception if a sink cannot be created
     */
    void setup( const std::string& logFileName = "logs/trackline.txt" );

    /**
     * @brief Set logging level for the console sink
     * @param[in] level Desired logging level. One of the following:
     *      SPDLOG_LEVEL_TRACE    0
     *      SPDLOG_LEVEL_DEBUG    1
     *      SPDLOG_LEVEL_INFO     2
     *      SPDLOG_LEVEL_WARN     3
     *      SPDLOG_LEVEL_ERROR    4
     *      SPDLOG_LEVEL_CRITICAL 5
     *      SPDLOG_LEVEL_OFF      6
     */
    void setConsoleSinkLevel( spdlog::level::level_enum level );

    void setDailyFileSinkLevel( spdlog::level::level_enum level );

private:

    std::shared_ptr<spdlog::sinks::stdout_color_sink_mt> m_consoleSink;
    std::shared_ptr<spdlog::sinks::daily_file_sink_mt> m_dailySink;
};

#endif // LOGGING_H
