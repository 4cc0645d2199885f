#ifndef APP_DATA_H
#define APP_DATA_H

#include "common/InputParams.h"

#include "logic/serialization/TrackSerialization.h"
#include "logic/tracks/TrackGroup.h"
#include "logic/tracks/TrackLineData.h"

#include "rendering/tracks/TrackFilter.h"

#include <glm/mat4x4.hpp>
#include <glm/vec2.hpp>
#include <glm/vec3.hpp>

#include <atomic>
#include <optional>
#include <string>
#include <utility>


/**
 * @brief Holds all application data: the tracks being viewed and edited, the track filter
 * that controls their visibility, and the window geometry
 */
class AppData
{
public:

    AppData();
    ~AppData() = default;

    /**
     * @brief Set the tracks and filter settings from a tracks file and the command line.
     * Settings given on the command line override those of the file.
     * @throws Exception if the combined settings are invalid
     */
    void setup( const InputParams& params, serialize::TracksFile file );

    const TrackGroup& tracks() const;
    TrackGroup& tracks();

    const TrackFilter& filter() const;
    TrackFilter& filter();

    /// Line data of the tracks. Rebuilt after the tracks have been marked modified.
    const TrackLineData& lineData();

    /// Mark that the tracks were edited, so that their line data must be rebuilt
    void setTracksModified();

    /// Returns true once after each rebuild of the line data
    bool takeLineDataUpdated();

    /// Range [min, max] of the times of all track points, or nullopt if there are no points
    std::optional< std::pair<float, float> > timeRange() const;

    /// Step the current time, clamped to the time range of the tracks
    void stepTime( float delta );

    /// Step the current depth. Without a current depth, stepping starts at depth 0.
    void stepDepth( float delta );

    void toggleFade();
    void toggleInteractive();

    /// Toggle between no current depth and the last depth that was set
    void toggleDepth();

    /// Start a new track, so that added points do not extend the current one
    void startNewTrack();

    void setWindowSize( int width, int height );
    const glm::ivec2& windowSize() const;

    void setFramebufferSize( int width, int height );
    const glm::ivec2& framebufferSize() const;

    /// Transformation from track (world) space to clip space that fits all tracks in the window
    glm::mat4 clip_T_world();

    /**
     * @brief Map a window position (pixels, origin at top left) to track space.
     * The depth of the returned position is the current depth (0 when there is none).
     */
    glm::vec3 world_T_window( const glm::vec2& windowPos );

    /// Depths of the vertices that the pointer reaches: all depths when there is no current
    /// depth, and only the vertices drawn by the depth cutoff when it is on
    PointerDepth pointerDepth() const;

    /// Set/get the file to which tracks are saved on exit
    void setOutputFileName( std::optional<std::string> fileName );
    const std::optional<std::string>& outputFileName() const;

    void setQuitApp( bool quit );
    bool quitApp() const;


private:

    TrackGroup m_tracks; //!< Tracks being viewed and edited
    TrackFilter m_filter; //!< Temporal visibility filter of the tracks

    TrackLineData m_lineData; //!< Line data of the tracks
    bool m_tracksModified; //!< Flag that line data must be rebuilt
    bool m_lineDataUpdated; //!< Flag that line data was rebuilt

    std::optional<glm::mat4> m_clip_T_world; //!< Cached fit of the tracks to the window

    float m_lastDepth; //!< Depth restored when toggling the depth back on

    glm::ivec2 m_windowSize; //!< Window size (device-agnostic units)
    glm::ivec2 m_framebufferSize; //!< Framebuffer size (pixels)

    std::optional<std::string> m_outputFileName;

    std::atomic<bool> m_quitApp; //!< Flag to quit the application
};

#endif // APP_DATA_H
