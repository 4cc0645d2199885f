#include "common/InputParser.h"
#include "defines.h"

#include <argparse/argparse.hpp>
#include <boost/algorithm/string/predicate.hpp>
#include <spdlog/spdlog.h>

#include <iostream>
#include <sstream>

namespace
{

/**
 * @brief Validate the input parameters
 * @param[in,out] params Input parameters
 * @return True iff parameters are valid
 */
bool validateParams(InputParams& params)
{
  if (params.tailLength && *params.tailLength < 0.0f)
  {
    spdlog::critical("Tail length must be non-negative (got {})", *params.tailLength);
    return false;
  }

  if (params.headLength && *params.headLength < 0.0f)
  {
    spdlog::critical("Head length must be non-negative (got {})", *params.headLength);
    return false;
  }

  if (params.noDepth && params.currentDepth)
  {
    spdlog::critical("Arguments --depth and --no-depth cannot both be provided");
    return false;
  }

  if (params.report && !params.tracksFile)
  {
    spdlog::critical("A tracks file is required to report track visibility");
    return false;
  }

  params.set = true;
  return true;
}

} // namespace

std::optional<spdlog::level::level_enum> parseLogLevel(const std::string& logLevel)
{
  if (boost::iequals(logLevel, "trace"))
  {
    return spdlog::level::level_enum::trace;
  }
  else if (boost::iequals(logLevel, "debug"))
  {
    return spdlog::level::level_enum::debug;
  }
  else if (boost::iequals(logLevel, "info"))
  {
    return spdlog::level::level_enum::info;
  }
  else if (boost::iequals(logLevel, "warn") || boost::iequals(logLevel, "warning"))
  {
    return spdlog::level::level_enum::warn;
  }
  else if (boost::iequals(logLevel, "err") || boost::iequals(logLevel, "error"))
  {
    return spdlog::level::level_enum::err;
  }
  else if (boost::iequals(logLevel, "critical"))
  {
    return spdlog::level::level_enum::critical;
  }
  else if (boost::iequals(logLevel, "off"))
  {
    return spdlog::level::level_enum::off;
  }

  return std::nullopt;
}

int parseCommandLine(const int argc, char* argv[], InputParams& params)
{
  params.set = false;

  std::ostringstream desc;
  desc << "Viewer for time-lapse object tracks (" << TRACKLINE_ORGNAME << ")";

  argparse::ArgumentParser program(TRACKLINE_APPNAME_FULL, TRACKLINE_VERSION_FULL);

  program.add_description(desc.str());

  program.add_argument("-l", "--log-level")
    .default_value(std::string("info"))
    .help("console log level: {trace, debug, info, warn, err, critical, off}");

  program.add_argument("-t", "--tracks").help("tracks file in JSON or CSV (track_id,t,[z,]y,x) format");

  program.add_argument("-o", "--output").help("JSON file to which edited tracks are saved on exit");

  program.add_argument("--time").help("current time (frame index)").scan<'g', float>();

  program.add_argument("--depth").help("current depth (z) of the slicing plane").scan<'g', float>();

  program.add_argument("--no-depth")
    .default_value(false)
    .implicit_value(true)
    .help("render without a current depth: depth neither culls nor shrinks vertices");

  program.add_argument("--tail").help("length of the visible tail into the past").scan<'g', float>();

  program.add_argument("--head").help("length of the visible head into the future").scan<'g', float>();

  program.add_argument("--no-fade")
    .default_value(false)
    .implicit_value(true)
    .help("show whole tracks without temporal fading");

  program.add_argument("--interactive")
    .default_value(false)
    .implicit_value(true)
    .help("hide vertices that are far from the current depth");

  program.add_argument("--report")
    .default_value(false)
    .implicit_value(true)
    .help("log the per-vertex visibility of the tracks and exit");

  try
  {
    program.parse_args(argc, argv);
  }
  catch (const std::exception& e)
  {
    spdlog::critical("Exception parsing arguments: {}", e.what());
    std::cout << program;
    return EXIT_FAILURE;
  }

  std::string logLevel;

  try
  {
    params.tracksFile = program.present<std::string>("-t");
    params.outputFile = program.present<std::string>("-o");

    params.currentTime = program.present<float>("--time");
    params.currentDepth = program.present<float>("--depth");
    params.tailLength = program.present<float>("--tail");
    params.headLength = program.present<float>("--head");

    params.noDepth = program.get<bool>("--no-depth");
    params.disableFade = program.get<bool>("--no-fade");
    params.interactive = program.get<bool>("--interactive");
    params.report = program.get<bool>("--report");

    logLevel = program.get<std::string>("-l");
  }
  catch (const std::exception& e)
  {
    spdlog::critical("Exception getting arguments: {}", e.what());
    std::cout << program;
    return EXIT_FAILURE;
  }

  if (params.tracksFile)
  {
    spdlog::info("Tracks file provided: {}", *params.tracksFile);
  }
  else
  {
    spdlog::info("No tracks file provided: starting with empty tracks");
  }

  if (const auto level = parseLogLevel(logLevel))
  {
    params.consoleLogLevel = *level;
  }
  else
  {
    spdlog::error("Invalid console log level: {}", logLevel);
    std::cout << program;
    return EXIT_FAILURE;
  }

  if (validateParams(params))
  {
    return EXIT_SUCCESS;
  }

  std::cout << program;
  return EXIT_FAILURE;
}
