#ifndef TRACK_GROUP_H
#define TRACK_GROUP_H

#include "common/filesystem.h"
#include "logic/tracks/TrackEditor.h"
#include "logic/tracks/TrackPoint.h"

#include <glm/vec3.hpp>

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>


/**
 * @brief Represents a grouping of object tracks. Each track is a sequence of points
 * ordered by time, with at most one point per time point.
 */
class TrackGroup : public TrackEditor
{
public:

    /// A single track
    struct Track
    {
        /// Points, sorted by increasing time
        std::vector<TrackPoint> m_points;

        /// Track color (non-premultiplied RGB)
        glm::vec3 m_color;
    };

    /// Construct an empty track group
    explicit TrackGroup();

    ~TrackGroup() override = default;

    /// Set/get the file name of the file from which tracks were loaded
    void setFileName( const fs::path& fileName );
    const fs::path& getFileName() const;

    /// Set/get the group name
    void setName( std::string name );
    const std::string& getName() const;

    std::optional<uuids::uuid> add( const glm::vec3& position, float time, uint32_t trackId ) override;

    /// Select the point closest to a position among points at the given time that lie
    /// within the pick radius and within the depth cutoff. Without a pointer depth, the
    /// distance to the position is measured in x and y only.
    std::optional<uuids::uuid> select(
            const glm::vec3& position, float time, const PointerDepth& depth ) const override;

    /// Remove a point. Removing the last point of a track removes the track.
    bool remove( const uuids::uuid& pointUid ) override;

    /// Move a point. Without a pointer depth, the point keeps its depth.
    bool move( const uuids::uuid& pointUid, const glm::vec3& position, const PointerDepth& depth ) override;

    /// Join the track of the second point into the track of the first point. Fails when both
    /// points belong to the same track or when the tracks share a time point.
    bool join( const uuids::uuid& firstUid, const uuids::uuid& secondUid ) override;

    /// Set/get the ID of the track to which points are added
    void setCurrentTrackId( uint32_t trackId );
    uint32_t currentTrackId() const override;

    /// Get an ID that is not used by any track: one more than the largest ID, or the
    /// smallest unused ID if the largest ID is 4294967295
    uint32_t nextTrackId() const;

    /// Get a point by its UID
    const TrackPoint* getPoint( const uuids::uuid& pointUid ) const;

    /// Get all tracks, keyed by track ID
    const std::map< uint32_t, Track >& getTracks() const;

    /// Get IDs of all tracks, in increasing order
    std::vector<uint32_t> getTrackIds() const;

    std::size_t numTracks() const;
    std::size_t numPoints() const;

    /// Remove all tracks
    void clear();

    /// Set/get a track color. Setting fails if the track does not exist.
    bool setTrackColor( uint32_t trackId, const glm::vec3& color );
    std::optional<glm::vec3> getTrackColor( uint32_t trackId ) const;

    /// Set/get the radius within which points are selected
    void setPickRadius( float radius );
    float getPickRadius() const;

    /// Default color of a new track
    static glm::vec3 defaultTrackColor( uint32_t trackId );


private:

    /// Find the track ID and position in the track of a point
    std::optional< std::pair<uint32_t, std::size_t> > findPoint( const uuids::uuid& pointUid ) const;

    /// Name of the file with the tracks
    fs::path m_fileName;

    /// Name of track group
    std::string m_name;

    /// Map of tracks, keyed by track ID
    std::map< uint32_t, Track > m_tracks;

    /// ID of the track to which points are added
    uint32_t m_currentTrackId;

    /// Maximum distance between a position and a selected point
    float m_pickRadius;
};

#endif // TRACK_GROUP_H
