#ifndef GLFW_WRAPPER_H
#define GLFW_WRAPPER_H

#include <functional>
#include <string>

class TracklineApp;

struct GLFWwindow;


/**
 * @brief Owns the GLFW window of the track viewer and its OpenGL context, and runs the
 * event-driven render loop. A frame is rendered after each batch of input events.
 */
class GlfwWrapper
{
public:

    /**
     * @brief Create the window and its OpenGL core profile context, load the OpenGL
     * functions, and connect the input callbacks to the application
     * @param app Application that receives the window's input callbacks
     * @throws Exception if GLFW, the window, or the OpenGL function pointers cannot be initialized
     */
    GlfwWrapper( TracklineApp* app, int glMajorVersion, int glMinorVersion );
    ~GlfwWrapper();

    GlfwWrapper( const GlfwWrapper& ) = delete;
    GlfwWrapper& operator=( const GlfwWrapper& ) = delete;

    void setRenderCallback( std::function< void() > renderScene );

    /// Seconds to wait for input before rendering anyway. Zero waits indefinitely.
    void setIdleTimeout( double seconds );

    /// Report the current window and framebuffer sizes to the application
    void init();

    /**
     * @brief Render and process input until the window closes or the app quits
     * @throws Exception if there is no render callback
     */
    void renderLoop( const std::function< bool (void) >& checkAppQuit );

    GLFWwindow* window();

    /// Show a status after the application name in the window title
    void setWindowTitleStatus( const std::string& status );

    /// Switch between windowed mode and full screen on the primary monitor
    void toggleFullScreenMode();


private:

    /// Window position and size restored when leaving full screen
    struct WindowedGeometry
    {
        int x = 0;
        int y = 0;
        int width = 0;
        int height = 0;
    };

    void connectCallbacks( TracklineApp* app );

    GLFWwindow* m_window;
    std::function<void()> m_renderScene;
    double m_idleTimeout;
    WindowedGeometry m_windowed;
};

#endif // GLFW_WRAPPER_H
