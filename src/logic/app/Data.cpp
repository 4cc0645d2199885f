#include "logic/app/Data.h"

#include "common/Exception.hpp"

#include <glm/glm.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <limits>


AppData::AppData()
    :
      m_tracks(),
      m_filter(),

      m_lineData(),
      m_tracksModified( true ),
      m_lineDataUpdated( false ),

      m_clip_T_world( std::nullopt ),
      m_lastDepth( 0.0f ),

      m_windowSize( 1, 1 ),
      m_framebufferSize( 1, 1 ),

      m_outputFileName( std::nullopt ),
      m_quitApp( false )
{
    spdlog::debug( "Created application data" );
}


void AppData::setup( const InputParams& params, serialize::TracksFile file )
{
    tracks::TrackShadingParams shading = file.m_display.value_or( tracks::TrackShadingParams{} );

    if ( params.currentDepth ) shading.currentDepth = *params.currentDepth;
    if ( params.noDepth ) shading.currentDepth = std::nullopt;
    if ( params.tailLength ) shading.tailLength = *params.tailLength;
    if ( params.headLength ) shading.headLength = *params.headLength;
    if ( params.disableFade ) shading.useFade = false;
    if ( params.interactive ) shading.interactive = true;

    m_tracks = std::move( file.m_tracks );
    m_tracksModified = true;
    m_clip_T_world = std::nullopt;

    m_filter = TrackFilter( shading );

    if ( params.currentTime )
    {
        m_filter.setCurrentTime( *params.currentTime );
    }
    else if ( ! file.m_display )
    {
        // Show the ends of all tracks
        m_filter.setCurrentTimeToLatest( lineData().m_attributes );
    }

    m_lastDepth = shading.currentDepth.value_or( 0.0f );
    m_outputFileName = params.outputFile;

    spdlog::info( "Viewing {} tracks at time {}", m_tracks.numTracks(), m_filter.params().currentTime );
}

const TrackGroup& AppData::tracks() const { return m_tracks; }
TrackGroup& AppData::tracks() { return m_tracks; }

const TrackFilter& AppData::filter() const { return m_filter; }
TrackFilter& AppData::filter() { return m_filter; }

const TrackLineData& AppData::lineData()
{
    if ( m_tracksModified )
    {
        m_lineData = buildTrackLineData( m_tracks );
        m_tracksModified = false;
        m_lineDataUpdated = true;
    }

    return m_lineData;
}

void AppData::setTracksModified()
{
    m_tracksModified = true;
}

bool AppData::takeLineDataUpdated()
{
    const bool updated = m_lineDataUpdated;
    m_lineDataUpdated = false;
    return updated;
}

std::optional< std::pair<float, float> > AppData::timeRange() const
{
    if ( 0 == m_tracks.numPoints() )
    {
        return std::nullopt;
    }

    float minTime = std::numeric_limits<float>::max();
    float maxTime = std::numeric_limits<float>::lowest();

    for ( const auto& track : m_tracks.getTracks() )
    {
        // Points are sorted by time
        const auto& points = track.second.m_points;
        minTime = std::min( minTime, points.front().time() );
        maxTime = std::max( maxTime, points.back().time() );
    }

    return std::make_pair( minTime, maxTime );
}

void AppData::stepTime( float delta )
{
    float time = m_filter.params().currentTime + delta;

    if ( const auto range = timeRange() )
    {
        time = std::clamp( time, range->first, range->second );
    }

    m_filter.setCurrentTime( time );
    spdlog::debug( "Current time: {}", time );
}

void AppData::stepDepth( float delta )
{
    const float depth = m_filter.params().currentDepth.value_or( 0.0f ) + delta;
    m_filter.setCurrentDepth( depth );
    m_lastDepth = depth;
    spdlog::debug( "Current depth: {}", depth );
}

void AppData::toggleFade()
{
    m_filter.setUseFade( ! m_filter.params().useFade );
    spdlog::info( "Track fading is {}", m_filter.params().useFade ? "on" : "off" );
}

void AppData::toggleInteractive()
{
    m_filter.setInteractive( ! m_filter.params().interactive );
    spdlog::info( "Depth cutoff is {}", m_filter.params().interactive ? "on" : "off" );
}

void AppData::toggleDepth()
{
    if ( m_filter.params().currentDepth )
    {
        m_lastDepth = *m_filter.params().currentDepth;
        m_filter.setCurrentDepth( std::nullopt );
        spdlog::info( "Current depth is unset" );
    }
    else
    {
        m_filter.setCurrentDepth( m_lastDepth );
        spdlog::info( "Current depth: {}", m_lastDepth );
    }
}

void AppData::startNewTrack()
{
    const uint32_t trackId = m_tracks.nextTrackId();
    m_tracks.setCurrentTrackId( trackId );
    spdlog::info( "Adding points to new track {}", trackId );
}

void AppData::setWindowSize( int width, int height )
{
    m_windowSize = glm::ivec2{ std::max( width, 1 ), std::max( height, 1 ) };
    m_clip_T_world = std::nullopt;
}

const glm::ivec2& AppData::windowSize() const
{
    return m_windowSize;
}

void AppData::setFramebufferSize( int width, int height )
{
    m_framebufferSize = glm::ivec2{ std::max( width, 1 ), std::max( height, 1 ) };
}

const glm::ivec2& AppData::framebufferSize() const
{
    return m_framebufferSize;
}

glm::mat4 AppData::clip_T_world()
{
    if ( ! m_clip_T_world )
    {
        const float aspectRatio = static_cast<float>( m_windowSize.x ) / static_cast<float>( m_windowSize.y );
        m_clip_T_world = fitTracksToView( lineData(), aspectRatio );
    }

    return *m_clip_T_world;
}

glm::vec3 AppData::world_T_window( const glm::vec2& windowPos )
{
    const glm::vec2 ndcPos{
        2.0f * windowPos.x / static_cast<float>( m_windowSize.x ) - 1.0f,
        1.0f - 2.0f * windowPos.y / static_cast<float>( m_windowSize.y ) };

    const glm::vec4 worldPos = glm::inverse( clip_T_world() ) * glm::vec4{ ndcPos, 0.0f, 1.0f };

    return glm::vec3{ worldPos.x / worldPos.w, worldPos.y / worldPos.w,
                      m_filter.params().currentDepth.value_or( 0.0f ) };
}

PointerDepth AppData::pointerDepth() const
{
    const tracks::TrackShadingParams& params = m_filter.params();

    PointerDepth depth;
    depth.m_isSet = params.currentDepth.has_value();

    if ( params.interactive )
    {
        depth.m_cutoff = tracks::depthCutoffRadius( params.currentDepth );
    }

    return depth;
}

void AppData::setOutputFileName( std::optional<std::string> fileName )
{
    m_outputFileName = std::move( fileName );
}

const std::optional<std::string>& AppData::outputFileName() const
{
    return m_outputFileName;
}

void AppData::setQuitApp( bool quit )
{
    m_quitApp = quit;
}

bool AppData::quitApp() const
{
    return m_quitApp;
}
