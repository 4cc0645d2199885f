#ifndef INPUT_PARAMS_H
#define INPUT_PARAMS_H

#include <spdlog/spdlog.h>

#include <optional>
#include <ostream>
#include <string>


/**
 * @brief Trackline input parameters read from the command line.
 * Filter settings given here override those read from the tracks file.
 */
struct InputParams
{
    /// Path to a tracks file (JSON or CSV)
    std::optional< std::string > tracksFile;

    /// Path to which edited tracks are saved (JSON) when the viewer closes
    std::optional< std::string > outputFile;

    std::optional< float > currentTime;
    std::optional< float > currentDepth;
    std::optional< float > tailLength;
    std::optional< float > headLength;

    /// Render without any current depth, so that depth never culls or shrinks vertices
    bool noDepth = false;

    /// Show whole tracks without temporal fading
    bool disableFade = false;

    /// Cull vertices that are far from the current depth
    bool interactive = false;

    /// Log the per-vertex visibility table and exit without opening a window
    bool report = false;

    /// Console logging level
    spdlog::level::level_enum consoleLogLevel = spdlog::level::info;

    /// Flag indicating that the parameters been successfully set
    bool set = false;
};


std::ostream& operator<<( std::ostream&, const InputParams& );

#endif // INPUT_PARAMS_H
