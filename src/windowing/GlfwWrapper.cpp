#include "windowing/GlfwWrapper.h"

#include "TracklineApp.h"
#include "common/Exception.hpp"
#include "defines.h"
#include "windowing/GlfwCallbacks.h"

#include <spdlog/spdlog.h>

#include <glad/glad.h>

#define GLFW_INCLUDE_NONE
#include <GLFW/glfw3.h>

#include <algorithm>


namespace
{

constexpr int sk_initialWidth = 1280;
constexpr int sk_initialHeight = 800;

/// Antialiasing of track lines
constexpr int sk_numSamples = 4;

void failInit( const std::string& msg )
{
    spdlog::critical( msg );
    glfwTerminate();
    throw_debug( msg )
}

} // anonymous


GlfwWrapper::GlfwWrapper( TracklineApp* app, int glMajorVersion, int glMinorVersion )
    :
    m_window( nullptr ),
    m_renderScene( nullptr ),
    m_idleTimeout( 0.0 ),
    m_windowed{ 0, 0, sk_initialWidth, sk_initialHeight }
{
    if ( ! app )
    {
        throw_debug( "Cannot create a window without an application" )
    }

    glfwSetErrorCallback( errorCallback );

    if ( ! glfwInit() )
    {
        spdlog::critical( "Unable to initialize GLFW" );
        throw_debug( "Unable to initialize GLFW" )
    }

    glfwWindowHint( GLFW_CONTEXT_VERSION_MAJOR, glMajorVersion );
    glfwWindowHint( GLFW_CONTEXT_VERSION_MINOR, glMinorVersion );
    glfwWindowHint( GLFW_OPENGL_PROFILE, GLFW_OPENGL_CORE_PROFILE );
    glfwWindowHint( GLFW_SAMPLES, sk_numSamples );
    glfwWindowHint( GLFW_DOUBLEBUFFER, GLFW_TRUE );

#ifdef __APPLE__
    glfwWindowHint( GLFW_OPENGL_FORWARD_COMPAT, GL_TRUE );
    glfwWindowHint( GLFW_COCOA_RETINA_FRAMEBUFFER, GL_TRUE );
#endif

    m_window = glfwCreateWindow( sk_initialWidth, sk_initialHeight, TRACKLINE_APPNAME_FULL, nullptr, nullptr );

    if ( ! m_window )
    {
        failInit( fmt::format( "Unable to create a window with an OpenGL {}.{} core context",
                               glMajorVersion, glMinorVersion ) );
    }

    glfwMakeContextCurrent( m_window );

    if ( ! gladLoadGLLoader( reinterpret_cast<GLADloadproc>( glfwGetProcAddress ) ) )
    {
        glfwDestroyWindow( m_window );
        failInit( "Unable to load OpenGL functions" );
    }

    spdlog::info( "Created window with OpenGL {}", reinterpret_cast<const char*>( glGetString( GL_VERSION ) ) );

    connectCallbacks( app );
}


GlfwWrapper::~GlfwWrapper()
{
    glfwDestroyWindow( m_window );
    glfwTerminate();
    spdlog::debug( "Closed window" );
}


void GlfwWrapper::connectCallbacks( TracklineApp* app )
{
    // Callbacks recover the application from the window
    glfwSetWindowUserPointer( m_window, reinterpret_cast<void*>( app ) );

    glfwSetWindowCloseCallback( m_window, windowCloseCallback );
    glfwSetWindowSizeCallback( m_window, windowSizeCallback );
    glfwSetFramebufferSizeCallback( m_window, framebufferSizeCallback );

    glfwSetCursorPosCallback( m_window, cursorPosCallback );
    glfwSetMouseButtonCallback( m_window, mouseButtonCallback );
    glfwSetScrollCallback( m_window, scrollCallback );
    glfwSetKeyCallback( m_window, keyCallback );
    glfwSetDropCallback( m_window, dropCallback );
}


void GlfwWrapper::setRenderCallback( std::function< void() > renderScene )
{
    m_renderScene = std::move( renderScene );
}

void GlfwWrapper::setIdleTimeout( double seconds )
{
    m_idleTimeout = std::max( seconds, 0.0 );
}


void GlfwWrapper::init()
{
    int width = 0;
    int height = 0;

    glfwGetWindowSize( m_window, &width, &height );
    windowSizeCallback( m_window, width, height );

    // Also renders the first frame
    glfwGetFramebufferSize( m_window, &width, &height );
    framebufferSizeCallback( m_window, width, height );
}


void GlfwWrapper::renderLoop( const std::function< bool (void) >& checkAppQuit )
{
    if ( ! m_renderScene )
    {
        throw_debug( "No render callback is set" )
    }

    while ( ! glfwWindowShouldClose( m_window ) && ! checkAppQuit() )
    {
        m_renderScene();
        glfwSwapBuffers( m_window );

        if ( m_idleTimeout > 0.0 )
        {
            glfwWaitEventsTimeout( m_idleTimeout );
        }
        else
        {
            glfwWaitEvents();
        }
    }

    spdlog::debug( "Render loop ended" );
}


GLFWwindow* GlfwWrapper::window()
{
    return m_window;
}

void GlfwWrapper::setWindowTitleStatus( const std::string& status )
{
    const std::string title = status.empty()
            ? std::string( TRACKLINE_APPNAME_FULL )
            : fmt::format( "{} [{}]", TRACKLINE_APPNAME_FULL, status );

    glfwSetWindowTitle( m_window, title.c_str() );
}

void GlfwWrapper::toggleFullScreenMode()
{
    if ( glfwGetWindowMonitor( m_window ) )
    {
        glfwSetWindowMonitor( m_window, nullptr, m_windowed.x, m_windowed.y,
                              m_windowed.width, m_windowed.height, GLFW_DONT_CARE );
        return;
    }

    GLFWmonitor* monitor = glfwGetPrimaryMonitor();
    const GLFWvidmode* mode = ( monitor ? glfwGetVideoMode( monitor ) : nullptr );

    if ( ! mode )
    {
        spdlog::error( "Unable to enter full screen: no video mode for the primary monitor" );
        return;
    }

    glfwGetWindowPos( m_window, &m_windowed.x, &m_windowed.y );
    glfwGetWindowSize( m_window, &m_windowed.width, &m_windowed.height );

    glfwSetWindowMonitor( m_window, monitor, 0, 0, mode->width, mode->height, mode->refreshRate );
}
