#include "logic/serialization/TrackSerialization.h"

#include "common/Exception.hpp"

#include <boost/algorithm/string/case_conv.hpp>
#include <boost/algorithm/string/trim.hpp>
#include <boost/tokenizer.hpp>

#include <spdlog/spdlog.h>

#include <array>
#include <cerrno>
#include <cstring>
#include <exception>
#include <fstream>
#include <limits>
#include <system_error>
#include <vector>


#if defined(_LIBCPP_VERSION) && (_LIBCPP_VERSION >= 1000)
#define HAS_IOS_BASE_FAILURE_DERIVED_FROM_SYSTEM_ERROR 1
#else
#define HAS_IOS_BASE_FAILURE_DERIVED_FROM_SYSTEM_ERROR 0
#endif


using json = nlohmann::json;


namespace
{

void logStreamFailure( const std::ios_base::failure& e, const fs::path& fileName )
{
#if HAS_IOS_BASE_FAILURE_DERIVED_FROM_SYSTEM_ERROR
    // e.code() is only available if the lib actually follows ISO §27.5.3.1.1
    // and derives ios_base::failure from system_error
    spdlog::error( "Error #{} on opening file {}: {}",
                   e.code().value(), fileName.string(), e.code().message() );
#else
    spdlog::error( "Error #{}: {}", errno, ::strerror(errno) );
#endif

    spdlog::error( "Failure while reading tracks from file {}: {}", fileName.string(), e.what() );
}

constexpr uint64_t sk_maxTrackId = std::numeric_limits<uint32_t>::max();

/**
 * @brief Parse a track ID from a CSV field
 * @return The ID, or nullopt if the field is not an integer in [0, 4294967295]
 * @throws std::out_of_range if the field does not fit in a long long
 */
std::optional<uint32_t> parseTrackId( std::string field )
{
    boost::algorithm::trim( field );

    std::size_t numParsed = 0;
    const long long id = std::stoll( field, &numParsed );

    if ( field.size() != numParsed || id < 0 || static_cast<uint64_t>( id ) > sk_maxTrackId )
    {
        return std::nullopt;
    }

    return static_cast<uint32_t>( id );
}

} // anonymous


namespace serialize
{

void to_json( json& j, const TrackGroup& group )
{
    j = json::object();
    json jTracks = json::array();

    for ( const auto& p : group.getTracks() )
    {
        const TrackGroup::Track& track = p.second;

        json jPoints = json::array();

        for ( const TrackPoint& point : track.m_points )
        {
            const glm::vec3& pos = point.position();

            jPoints.push_back( json{
                { "t", point.time() },
                { "position", { pos.x, pos.y, pos.z } } } );
        }

        jTracks.push_back( json{
            { "id", p.first },
            { "color", { track.m_color.r, track.m_color.g, track.m_color.b } },
            { "points", jPoints } } );
    }

    j["tracks"] = jTracks;
}

void from_json( const json& j, TrackGroup& group )
{
    TrackGroup newGroup;

    if ( ! j.count( "tracks" ) )
    {
        throw_debug( "JSON structure has no tracks" )
    }

    for ( const auto& jTrack : j.at( "tracks" ) )
    {
        if ( ! jTrack.count( "id" ) || ! jTrack.count( "points" ) )
        {
            throw_debug( "JSON structure contains track without ID or points" )
        }

        const json& jId = jTrack.at( "id" );

        if ( ! jId.is_number_unsigned() || jId.get<uint64_t>() > sk_maxTrackId )
        {
            throw_debug( "JSON structure contains track with ID " + jId.dump() +
                         " that is not an integer in [0, 4294967295]" )
        }

        const uint32_t trackId = jId.get<uint32_t>();

        for ( const auto& jPoint : jTrack.at( "points" ) )
        {
            const auto position = jPoint.at( "position" ).get< std::vector<float> >();

            if ( 2 != position.size() && 3 != position.size() )
            {
                throw_debug( "JSON structure contains point with invalid position" )
            }

            const glm::vec3 pos{ position[0], position[1], ( 3 == position.size() ) ? position[2] : 0.0f };

            if ( ! newGroup.add( pos, jPoint.at( "t" ).get<float>(), trackId ) )
            {
                spdlog::warn( "Skipped point of track {} at duplicate time {}",
                              trackId, jPoint.at( "t" ).get<float>() );
            }
        }

        // The optional color applies only if the track received points
        if ( jTrack.count( "color" ) )
        {
            const auto color = jTrack.at( "color" ).get< std::array<float, 3> >();
            newGroup.setTrackColor( trackId, glm::vec3{ color[0], color[1], color[2] } );
        }
    }

    group = newGroup;
}

void to_json( json& j, const tracks::TrackShadingParams& params )
{
    j = json{
        { "currentTime", params.currentTime },
        { "tailLength", params.tailLength },
        { "headLength", params.headLength },
        { "useFade", params.useFade },
        { "interactive", params.interactive } };

    if ( params.currentDepth )
    {
        j["currentDepth"] = *params.currentDepth;
    }
    else
    {
        j["currentDepth"] = nullptr;
    }
}

void from_json( const json& j, tracks::TrackShadingParams& params )
{
    // All of these parameters are optional in the JSON:

    if ( j.count( "currentTime" ) )
    {
        params.currentTime = j.at( "currentTime" ).get<float>();
    }

    if ( j.count( "currentDepth" ) )
    {
        const auto& d = j.at( "currentDepth" );
        params.currentDepth = d.is_null() ? std::nullopt : std::optional<float>( d.get<float>() );
    }

    if ( j.count( "tailLength" ) )
    {
        params.tailLength = j.at( "tailLength" ).get<float>();
    }

    if ( j.count( "headLength" ) )
    {
        params.headLength = j.at( "headLength" ).get<float>();
    }

    if ( j.count( "useFade" ) )
    {
        params.useFade = j.at( "useFade" ).get<bool>();
    }

    if ( j.count( "interactive" ) )
    {
        params.interactive = j.at( "interactive" ).get<bool>();
    }

    if ( params.tailLength < 0.0f || params.headLength < 0.0f )
    {
        throw_debug( "JSON display settings contain a negative tail or head length" )
    }
}


bool openTracksJsonFile( TracksFile& file, const fs::path& jsonFileName )
{
    std::ifstream inFile;
    inFile.exceptions( inFile.exceptions() | std::ios::failbit | std::ifstream::badbit );

    try
    {
        inFile.open( jsonFileName, std::ios_base::in );

        if ( ! inFile )
        {
            throw std::system_error( errno, std::system_category(),
                                     "Failed to open tracks file " + jsonFileName.string() );
        }

        json j;
        inFile >> j;

        TracksFile newFile;
        from_json( j, newFile.m_tracks );

        if ( j.count( "display" ) )
        {
            tracks::TrackShadingParams display;
            from_json( j.at( "display" ), display );
            newFile.m_display = display;
        }

        newFile.m_tracks.setFileName( jsonFileName );
        newFile.m_tracks.setName( jsonFileName.stem().string() );
        newFile.m_tracks.setCurrentTrackId( newFile.m_tracks.nextTrackId() );

        file = newFile;

        spdlog::info( "Loaded {} tracks with {} points from JSON file {}",
                      file.m_tracks.numTracks(), file.m_tracks.numPoints(), jsonFileName.string() );
        return true;
    }
    catch ( const std::ios_base::failure& e )
    {
        logStreamFailure( e, jsonFileName );
        return false;
    }
    catch ( const std::exception& e )
    {
        spdlog::error( "Invalid tracks JSON file {}: {}", jsonFileName.string(), e.what() );
        return false;
    }
}

bool openTracksCsvFile( TrackGroup& group, const fs::path& csvFileName )
{
    using Tokenizer = boost::tokenizer< boost::escaped_list_separator<char> >;

    std::ifstream inFile;
    inFile.exceptions( inFile.exceptions() | std::ifstream::badbit );

    try
    {
        spdlog::debug( "Opening tracks CSV file {}", csvFileName.string() );
        inFile.open( csvFileName, std::ios_base::in );

        if ( ! inFile || ! inFile.good() )
        {
            spdlog::error( "Error opening tracks CSV file {}", csvFileName.string() );
            throw std::system_error( errno, std::system_category(),
                                     "Failed to open CSV file " + csvFileName.string() );
        }

        std::string line;

        // Read the column headers (they are not used)
        if ( ! std::getline( inFile, line ) )
        {
            spdlog::error( "Tracks CSV file {} is empty", csvFileName.string() );
            return false;
        }

        const Tokenizer headerTok( line );
        const std::size_t numCols = static_cast<std::size_t>(
                    std::distance( headerTok.begin(), headerTok.end() ) );

        // The expected columns are track_id, t, [z,] y, x
        if ( 4 != numCols && 5 != numCols )
        {
            spdlog::error( "Expected four (track_id, t, y, x) or five (track_id, t, z, y, x) columns "
                           "when reading tracks CSV file {}, but read {} columns", csvFileName.string(), numCols );
            return false;
        }

        TrackGroup newGroup;
        std::size_t lineNum = 1;

        while ( std::getline( inFile, line ) )
        {
            ++lineNum;
            boost::algorithm::trim( line );

            if ( line.empty() )
            {
                continue;
            }

            const Tokenizer tok( line );
            std::vector< std::string > c;
            c.assign( tok.begin(), tok.end() );

            if ( numCols != c.size() )
            {
                spdlog::error( "Line {} of tracks CSV file {} has {} columns instead of {}",
                               lineNum, csvFileName.string(), c.size(), numCols );
                return false;
            }

            const std::optional<uint32_t> parsedId = parseTrackId( c[0] );

            if ( ! parsedId )
            {
                spdlog::error( "Line {} of tracks CSV file {} has track ID '{}', which is not an integer "
                               "in [0, {}]", lineNum, csvFileName.string(), c[0], sk_maxTrackId );
                return false;
            }

            const uint32_t trackId = *parsedId;
            const float t = std::stof( c[1] );

            glm::vec3 pos{ 0.0f };

            if ( 5 == numCols )
            {
                pos.z = std::stof( c[2] );
                pos.y = std::stof( c[3] );
                pos.x = std::stof( c[4] );
            }
            else
            {
                pos.y = std::stof( c[2] );
                pos.x = std::stof( c[3] );
            }

            if ( ! newGroup.add( pos, t, trackId ) )
            {
                spdlog::warn( "Skipped line {} of tracks CSV file {}: track {} already has a point at time {}",
                              lineNum, csvFileName.string(), trackId, t );
            }
        }

        newGroup.setFileName( csvFileName );
        newGroup.setName( csvFileName.stem().string() );
        newGroup.setCurrentTrackId( newGroup.nextTrackId() );

        group = newGroup;

        spdlog::info( "Loaded {} tracks with {} points from CSV file {}",
                      group.numTracks(), group.numPoints(), csvFileName.string() );
        return true;
    }
    catch ( const std::ios_base::failure& e )
    {
        logStreamFailure( e, csvFileName );
        return false;
    }
    catch ( const std::exception& e )
    {
        spdlog::error( "Invalid tracks CSV file {}: {}", csvFileName.string(), e.what() );
        return false;
    }
}

bool openTracksFile( TracksFile& file, const fs::path& fileName )
{
    const std::string ext = boost::algorithm::to_lower_copy( fileName.extension().string() );

    if ( ".csv" == ext )
    {
        TracksFile newFile;

        if ( ! openTracksCsvFile( newFile.m_tracks, fileName ) )
        {
            return false;
        }

        file = newFile;
        return true;
    }
    else if ( ".json" == ext )
    {
        return openTracksJsonFile( file, fileName );
    }

    spdlog::error( "Unrecognized extension of tracks file {}: expected .json or .csv", fileName.string() );
    return false;
}

bool saveTracksJsonFile(
    const TrackGroup& group,
    const tracks::TrackShadingParams& display,
    const fs::path& jsonFileName )
{
    try
    {
        json j;
        to_json( j, group );

        json jDisplay;
        to_json( jDisplay, display );
        j["display"] = jDisplay;

        std::ofstream outFile( jsonFileName );

        if ( ! outFile )
        {
            spdlog::error( "Unable to open file {} for saving tracks", jsonFileName.string() );
            return false;
        }

        outFile << j.dump( 2 );

        spdlog::debug( "Saved JSON for tracks:\n{}", j.dump( 2 ) );
        spdlog::info( "Saved {} tracks to file {}", group.numTracks(), jsonFileName.string() );
        return true;
    }
    catch ( const std::exception& e )
    {
        spdlog::error( "Error saving tracks to JSON file {}: {}", jsonFileName.string(), e.what() );
        return false;
    }
}

} // namespace serialize
