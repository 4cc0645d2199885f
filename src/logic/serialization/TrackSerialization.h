#ifndef TRACK_SERIALIZATION_H
#define TRACK_SERIALIZATION_H

#include "common/filesystem.h"
#include "logic/tracks/TrackGroup.h"
#include "rendering/tracks/TrackShading.h"

#include <nlohmann/json.hpp>

#include <optional>


namespace serialize
{

/**
 * @brief Tracks and display settings read from a tracks file
 */
struct TracksFile
{
    TrackGroup m_tracks;

    /// Filter settings of the file's "display" block, if present
    std::optional<tracks::TrackShadingParams> m_display;
};

/**
 * @brief Create a JSON structure for a track group. Each track is written with its ID, color,
 * and points. Each point has a time ("t") and a position ([x, y, z], with z the depth).
 */
void to_json( nlohmann::json& j, const TrackGroup& group );

/// @throws Exception if a track or point entry is malformed
void from_json( const nlohmann::json& j, TrackGroup& group );

/**
 * @brief Create a JSON structure for the display settings of tracks.
 * An unset current depth is written as null.
 */
void to_json( nlohmann::json& j, const tracks::TrackShadingParams& params );

/// All display settings are optional in the JSON; missing ones keep their defaults
void from_json( const nlohmann::json& j, tracks::TrackShadingParams& params );

/**
 * @brief Open tracks from a JSON file
 * @param[out] file Tracks and display settings
 * @param[in] jsonFileName JSON file name
 * @return True iff the tracks were loaded
 */
bool openTracksJsonFile( TracksFile& file, const fs::path& jsonFileName );

/**
 * @brief Open tracks from a CSV table with one row per point. The columns are
 * track_id, t, z, y, x (or track_id, t, y, x for 2D tracks, which get depth 0).
 * The first row is a header and is skipped.
 *
 * @param[out] group Track group
 * @param[in] csvFileName CSV file name
 * @return True iff the tracks were loaded
 */
bool openTracksCsvFile( TrackGroup& group, const fs::path& csvFileName );

/// Open tracks from a JSON or CSV file, chosen by the file extension
bool openTracksFile( TracksFile& file, const fs::path& fileName );

/**
 * @brief Save tracks and display settings to a JSON file
 * @return True iff the file was written
 */
bool saveTracksJsonFile(
    const TrackGroup& group,
    const tracks::TrackShadingParams& display,
    const fs::path& jsonFileName );

} // namespace serialize

#endif // TRACK_SERIALIZATION_H
