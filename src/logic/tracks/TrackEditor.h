#ifndef TRACK_EDITOR_H
#define TRACK_EDITOR_H

#include <glm/vec3.hpp>

#include <cstdint>
#include <limits>
#include <optional>
#include <uuid.h>

/**
 * @brief Depth limits of the vertices that a pointer reaches
 */
struct PointerDepth
{
    /// False when the view has no current depth. The pointer then reaches vertices at any
    /// depth, picks them by x and y only, and keeps their depths when moving them.
    bool m_isSet = true;

    /// Vertices farther than this in depth from the pointer are culled from the view
    /// and cannot be picked
    float m_cutoff = std::numeric_limits<float>::infinity();
};

/**
 * @brief Editing operations on track vertices that are driven by pointer interaction
 */
class TrackEditor
{
public:

    TrackEditor() = default;
    virtual ~TrackEditor() = default;

    /// Add a vertex at a position and time to a track
    /// @return UID of the new vertex, or nullopt if it could not be added
    virtual std::optional<uuids::uuid> add( const glm::vec3& position, float time, uint32_t trackId ) = 0;

    /// Select the vertex at a position and time among the vertices that the pointer reaches
    /// @return UID of the selected vertex, or nullopt if no vertex is there
    virtual std::optional<uuids::uuid> select(
            const glm::vec3& position, float time, const PointerDepth& depth ) const = 0;

    virtual bool remove( const uuids::uuid& vertexUid ) = 0;

    virtual bool move( const uuids::uuid& vertexUid, const glm::vec3& position, const PointerDepth& depth ) = 0;

    /// Join the track of the second vertex into the track of the first vertex
    virtual bool join( const uuids::uuid& firstUid, const uuids::uuid& secondUid ) = 0;

    /// ID of the track to which vertices are added
    virtual uint32_t currentTrackId() const = 0;
};

#endif // TRACK_EDITOR_H
