#include "windowing/GlfwCallbacks.h"

#include "TracklineApp.h"

#include "logic/interaction/events/ButtonState.h"
#include "logic/states/FsmList.hpp"

#include <glm/glm.hpp>
#include <spdlog/spdlog.h>

#define GLFW_INCLUDE_NONE
#include <GLFW/glfw3.h>


namespace
{

static ButtonState s_mouseButtonState;
static ModifierState s_modifierState;

/// Time step of the arrow keys; Shift multiplies it by ten
static constexpr float sk_timeStep = 1.0f;

/// Depth step of the arrow keys; Shift multiplies it by ten
static constexpr float sk_depthStep = 1.0f;

TracklineApp* getApp( GLFWwindow* window, const char* callbackName )
{
    auto app = reinterpret_cast<TracklineApp*>( glfwGetWindowUserPointer( window ) );
    if ( ! app )
    {
        spdlog::warn( "App is null in {} callback", callbackName );
    }
    return app;
}

glm::vec3 cursorWorldPos( GLFWwindow* window, TracklineApp& app )
{
    double windowCursorPosX, windowCursorPosY;
    glfwGetCursorPos( window, &windowCursorPosX, &windowCursorPosY );

    return app.appData().world_T_window(
                glm::vec2{ static_cast<float>( windowCursorPosX ),
                           static_cast<float>( windowCursorPosY ) } );
}

} // anonymous


void errorCallback( int error, const char* description )
{
    spdlog::error( "GLFW error #{}: '{}'", error, description );
}


void windowCloseCallback( GLFWwindow* window )
{
    if ( auto app = getApp( window, "window close" ) )
    {
        spdlog::trace( "User has requested to close the application" );
        app->appData().setQuitApp( true );
    }
}


void windowSizeCallback( GLFWwindow* window, int windowWidth, int windowHeight )
{
    auto app = getApp( window, "window size" );
    if ( ! app ) return;

    spdlog::debug( "Window size: {}x{}", windowWidth, windowHeight );
    app->resize( windowWidth, windowHeight );
}


void framebufferSizeCallback( GLFWwindow* window, int fbWidth, int fbHeight )
{
    auto app = getApp( window, "framebuffer size" );
    if ( ! app ) return;

    spdlog::debug( "Framebuffer size: {}x{}", fbWidth, fbHeight );
    app->resizeFramebuffer( fbWidth, fbHeight );
    app->render();

    // The app sometimes crashes on macOS without this call
    glfwSwapBuffers( window );
}


void cursorPosCallback( GLFWwindow* window, double windowCursorPosX, double windowCursorPosY )
{
    auto app = getApp( window, "cursor position" );
    if ( ! app ) return;

    const glm::vec3 worldPos = app->appData().world_T_window(
                glm::vec2{ static_cast<float>( windowCursorPosX ),
                           static_cast<float>( windowCursorPosY ) } );

    state::send_event( state::PointerMoveEvent(
                           worldPos, app->appData().filter().params().currentTime,
                           s_mouseButtonState, s_modifierState, app->appData().pointerDepth() ) );
}


void mouseButtonCallback( GLFWwindow* window, int button, int action, int mods )
{
    auto app = getApp( window, "mouse button" );
    if ( ! app ) return;

    // Update button state
    s_mouseButtonState.updateFromGlfwEvent( button, action );
    s_modifierState.updateFromGlfwEvent( mods );

    const glm::vec3 worldPos = cursorWorldPos( window, *app );
    const float time = app->appData().filter().params().currentTime;
    const PointerDepth depth = app->appData().pointerDepth();

    // Send event to the track editing state machine
    switch ( action )
    {
    case GLFW_PRESS:
    {
        state::send_event( state::PointerPressEvent(
                               worldPos, time, s_mouseButtonState, s_modifierState, depth ) );
        break;
    }
    case GLFW_RELEASE:
    {
        state::send_event( state::PointerReleaseEvent(
                               worldPos, time, s_mouseButtonState, s_modifierState, depth ) );
        break;
    }
    default: break;
    }
}


void scrollCallback( GLFWwindow* window, double /*offsetX*/, double offsetY )
{
    auto app = getApp( window, "scroll" );
    if ( ! app ) return;

    app->appData().stepTime( static_cast<float>( offsetY ) * sk_timeStep );
    app->updateWindowTitle();
}


void keyCallback( GLFWwindow* window, int key, int /*scancode*/, int action, int mods )
{
    s_modifierState.updateFromGlfwEvent( mods );

    auto app = getApp( window, "key" );
    if ( ! app ) return;

    // Do actions on GLFW_PRESS and GLFW_REPEAT only
    if ( GLFW_RELEASE == action ) return;

    AppData& data = app->appData();
    const float stepFactor = ( s_modifierState.shift ) ? 10.0f : 1.0f;

    switch ( key )
    {
    case GLFW_KEY_Q:
    {
        if ( s_modifierState.control )
        {
            data.setQuitApp( true );
        }
        break;
    }
    case GLFW_KEY_S:
    {
        if ( s_modifierState.control && ! app->saveTracks() )
        {
            spdlog::warn( "Tracks were not saved" );
        }
        break;
    }

    case GLFW_KEY_LEFT: data.stepTime( -stepFactor * sk_timeStep ); break;
    case GLFW_KEY_RIGHT: data.stepTime( stepFactor * sk_timeStep ); break;
    case GLFW_KEY_DOWN: data.stepDepth( -stepFactor * sk_depthStep ); break;
    case GLFW_KEY_UP: data.stepDepth( stepFactor * sk_depthStep ); break;

    case GLFW_KEY_F: data.toggleFade(); break;
    case GLFW_KEY_I: data.toggleInteractive(); break;
    case GLFW_KEY_U: data.toggleDepth(); break;
    case GLFW_KEY_N: data.startNewTrack(); break;

    case GLFW_KEY_ESCAPE: state::send_event( state::CancelJoinEvent() ); break;
    case GLFW_KEY_F4: app->glfw().toggleFullScreenMode(); break;

    default: break;
    }

    app->updateWindowTitle();
}


void dropCallback( GLFWwindow* window, int count, const char** paths )
{
    if ( 0 == count || ! paths ) return;

    auto app = getApp( window, "drop" );
    if ( ! app ) return;

    if ( count > 1 )
    {
        spdlog::warn( "Only the first of {} dropped files is loaded", count );
    }

    if ( ! app->loadTracksFile( paths[0] ) )
    {
        spdlog::warn( "Keeping the current tracks: unable to load dropped file {}", paths[0] );
    }
}
