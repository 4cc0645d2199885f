#include "TracklineApp.h"
#include "defines.h"

#include "common/Exception.hpp"

#include "logic/app/VisibilityReport.h"
#include "logic/serialization/TrackSerialization.h"
#include "logic/states/FsmList.hpp"

#include <glad/glad.h>

#include <spdlog/spdlog.h>
#include <spdlog/fmt/fmt.h>

#include <string>


namespace
{

serialize::TracksFile openTracks( const InputParams& params )
{
    serialize::TracksFile file;

    if ( params.tracksFile && ! serialize::openTracksFile( file, *params.tracksFile ) )
    {
        throw_debug( "Unable to open tracks file " + *params.tracksFile )
    }

    return file;
}

} // anonymous


TracklineApp::TracklineApp()
    :
    m_params(),

    // GLFW creates the OpenGL context
    m_glfw( this, sk_glMajorVersion, sk_glMinorVersion ),

    m_data(),
    m_drawing()
{
    spdlog::debug( "Constructed application" );
}


TracklineApp::~TracklineApp()
{
    state::TrackEditStateMachine::setEditor( nullptr );
    state::TrackEditStateMachine::setCallbacks( nullptr );
}


void TracklineApp::setup( const InputParams& params )
{
    m_params = params;
    m_data.setup( params, openTracks( params ) );
}


void TracklineApp::init()
{
    spdlog::debug( "Begin initializing application" );

    // Start the track editing state machine
    state::TrackEditStateMachine::reset();
    state::fsm_list::start();

    state::TrackEditStateMachine::setEditor( &m_data.tracks() );
    state::TrackEditStateMachine::setCallbacks( [this]() { m_data.setTracksModified(); } );

    m_drawing.initialize();
    m_glfw.setRenderCallback( [this]() { render(); } );

    // Trigger initial windowing callbacks
    m_glfw.init();
    updateWindowTitle();

    spdlog::debug( "Done initializing application" );
}


void TracklineApp::run()
{
    spdlog::debug( "Begin application run loop" );

    m_glfw.renderLoop( [this]() { return m_data.quitApp(); } );

    if ( m_data.outputFileName() && ! saveTracks() )
    {
        spdlog::error( "Edited tracks were not saved to {}", *m_data.outputFileName() );
    }

    spdlog::debug( "Done application run loop" );
}


void TracklineApp::resize( int windowWidth, int windowHeight )
{
    m_data.setWindowSize( windowWidth, windowHeight );
}


void TracklineApp::resizeFramebuffer( int fbWidth, int fbHeight )
{
    m_data.setFramebufferSize( fbWidth, fbHeight );
}


void TracklineApp::render()
{
    const auto& lineData = m_data.lineData();

    if ( m_data.takeLineDataUpdated() )
    {
        m_drawing.setLineData( lineData );
    }

    const glm::ivec2& fbSize = m_data.framebufferSize();
    glViewport( 0, 0, fbSize.x, fbSize.y );

    glClearColor( 0.0f, 0.0f, 0.0f, 1.0f );
    glClear( GL_COLOR_BUFFER_BIT );

    m_drawing.render( m_data.filter(), m_data.clip_T_world() );
}


bool TracklineApp::loadTracksFile( const std::string& fileName )
{
    InputParams params = m_params;
    params.tracksFile = fileName;

    serialize::TracksFile file;

    if ( ! serialize::openTracksFile( file, fileName ) )
    {
        return false;
    }

    try
    {
        state::send_event( state::CancelJoinEvent() );
        m_data.setup( params, std::move( file ) );
        m_params = params;
    }
    catch ( const std::exception& e )
    {
        spdlog::error( "Unable to view tracks from file {}: {}", fileName, e.what() );
        return false;
    }

    updateWindowTitle();
    return true;
}


bool TracklineApp::saveTracks()
{
    const std::string fileName = m_data.outputFileName().value_or( "tracks.json" );
    return serialize::saveTracksJsonFile( m_data.tracks(), m_data.filter().params(), fileName );
}


void TracklineApp::updateWindowTitle()
{
    const auto& params = m_data.filter().params();

    m_glfw.setWindowTitleStatus( fmt::format(
        "time {}, depth {}{}{}",
        params.currentTime,
        params.currentDepth ? fmt::format( "{}", *params.currentDepth ) : std::string( "none" ),
        params.useFade ? "" : ", no fade",
        params.interactive ? ", depth cutoff" : "" ) );
}


const AppData& TracklineApp::appData() const { return m_data; }
AppData& TracklineApp::appData() { return m_data; }

const GlfwWrapper& TracklineApp::glfw() const { return m_glfw; }
GlfwWrapper& TracklineApp::glfw() { return m_glfw; }


void TracklineApp::logPreamble()
{
    spdlog::info( "{} (version {})", TRACKLINE_APPNAME_FULL, TRACKLINE_VERSION_FULL );
    spdlog::info( "{}", TRACKLINE_ORGNAME );
}


bool TracklineApp::reportVisibility( const InputParams& params )
{
    AppData data;

    try
    {
        data.setup( params, openTracks( params ) );
    }
    catch ( const std::exception& e )
    {
        spdlog::error( "Unable to report track visibility: {}", e.what() );
        return false;
    }

    spdlog::info( "Track visibility:\n{}", createVisibilityReport( data.lineData(), data.filter() ) );
    return true;
}
