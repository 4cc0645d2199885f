#ifndef TRACKLINE_APP_H
#define TRACKLINE_APP_H

#include "common/InputParams.h"

#include "logic/app/Data.h"
#include "rendering/TrackDrawing.h"
#include "windowing/GlfwWrapper.h"

#include <string>


/**
 * @brief This class runs the show. Its responsibilities are
 * 1) Hold the OpenGL context and all application data
 * 2) Load and save tracks
 * 3) Run the rendering loop
 */
class TracklineApp
{
public:

    TracklineApp();
    ~TracklineApp();

    /**
     * @brief Load the tracks file and apply the filter settings of the input parameters
     * @throws Exception if the tracks cannot be loaded or the settings are invalid
     */
    void setup( const InputParams& params );

    /// Initialize the track state machine, rendering, and windowing callbacks
    void init();

    /// Run the render loop. Tracks are saved to the output file, if any, when it ends.
    void run();

    /// Resize the window, with width and height specified in device-agnostic units
    void resize( int windowWidth, int windowHeight );

    /// Resize the framebuffer (pixels)
    void resizeFramebuffer( int fbWidth, int fbHeight );

    /// Render one frame
    void render();

    /// Load tracks from a JSON or CSV file, replacing the current tracks
    bool loadTracksFile( const std::string& fileName );

    /// Save tracks to the output file, or to "tracks.json" if none was given
    bool saveTracks();

    /// Show the current time and depth in the window title
    void updateWindowTitle();

    const AppData& appData() const;
    AppData& appData();

    const GlfwWrapper& glfw() const;
    GlfwWrapper& glfw();

    static void logPreamble();

    /**
     * @brief Log the per-vertex visibility of the tracks of the input file without
     * creating a window
     * @return True iff the tracks were loaded and the report was logged
     */
    static bool reportVisibility( const InputParams& params );


private:

    static constexpr int sk_glMajorVersion = 3;
    static constexpr int sk_glMinorVersion = 3;

    InputParams m_params; //!< Input parameters, reapplied to dropped track files

    GlfwWrapper m_glfw; //!< GLFW wrapper
    AppData m_data; //!< Application data
    TrackDrawing m_drawing; //!< Track rendering
};

#endif // TRACKLINE_APP_H
