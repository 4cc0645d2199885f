#ifndef TRACK_LINE_DATA_H
#define TRACK_LINE_DATA_H

#include "rendering/tracks/TrackVertexAttributes.h"

#include <glm/mat4x4.hpp>
#include <glm/vec3.hpp>
#include <glm/vec4.hpp>

#include <cstdint>
#include <uuid.h>
#include <vector>

class TrackGroup;


/**
 * @brief Vertex and index data of the line segments that render a group of tracks.
 * Consecutive points of a track are connected by a segment; points of different tracks
 * are never connected.
 */
struct TrackLineData
{
    std::vector<glm::vec3> m_positions;
    std::vector<glm::vec4> m_colors;

    /// Time and depth of each vertex
    TrackVertexAttributes m_attributes;

    /// Track ID of each vertex
    std::vector<uint32_t> m_trackIds;

    /// UID of the track point of each vertex
    std::vector<uuids::uuid> m_pointUids;

    /// Pairs of vertex indices, one pair per line segment
    std::vector<uint32_t> m_segmentIndices;

    std::size_t numVertices() const { return m_positions.size(); }
    std::size_t numSegments() const { return m_segmentIndices.size() / 2; }
};


/// Build the line data of all tracks in a group, in order of increasing track ID
TrackLineData buildTrackLineData( const TrackGroup& group );

/**
 * @brief Orthographic transformation from track space to clip space that fits the x and y
 * extent of the tracks, with a margin, into a viewport of a given aspect ratio (width / height).
 * Image rows (y) increase downwards.
 */
glm::mat4 fitTracksToView( const TrackLineData& data, float aspectRatio );

#endif // TRACK_LINE_DATA_H
