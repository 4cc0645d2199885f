#ifndef PARSER_H
#define PARSER_H

#include "common/InputParams.h"

#include <optional>
#include <string>

/**
 * @brief Parse the command line arguments
 *
 * @param[in] argc Number of command line arguments
 * @param[in] argv Array of command line arguments
 * @param[out] params Parsed parameters
 *
 * @return EXIT_SUCCESS iff parsing succceeded without errors;
 *         EXIT_FAILURE if parsing failed
 */
int parseCommandLine( const int argc, char* argv[], InputParams& params );

/**
 * @brief Convert a log level name to an spdlog level
 * @param[in] logLevel One of {trace, debug, info, warn, err, critical, off}, case-insensitive.
 * "warning" and "error" are also accepted.
 * @return The level, or nullopt if the name is not recognized
 */
std::optional< spdlog::level::level_enum > parseLogLevel( const std::string& logLevel );

#endif // PARSER_H
