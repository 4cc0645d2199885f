#ifndef TRACK_POINT_H
#define TRACK_POINT_H

#include "common/UuidUtility.h"

#include <glm/vec3.hpp>

#include <cstdint>
#include <uuid.h>

/**
 * @brief A vertex of an object track: the position of the tracked object at one time point.
 * The point has a unique ID. Its z coordinate is the depth of the point.
 */
class TrackPoint
{
public:
  /// Construct a point of a track with an automatically generated unique ID
  TrackPoint(uint32_t trackId, float time, glm::vec3 position)
    : m_uid(generateRandomUuid())
    , m_trackId(trackId)
    , m_time(time)
    , m_position(std::move(position))
  {
  }

  ~TrackPoint() = default;

  /// Get the point's UID
  const uuids::uuid& uid() const { return m_uid; }

  /// Set/get the ID of the track to which the point belongs
  void setTrackId(uint32_t trackId) { m_trackId = trackId; }
  uint32_t trackId() const { return m_trackId; }

  /// Get the time point
  float time() const { return m_time; }

  /// Set position of the point
  void setPosition(glm::vec3 position) { m_position = std::move(position); }

  /// Get the point's position
  const glm::vec3& position() const { return m_position; }

  /// Get the depth of the point
  float depth() const { return m_position.z; }

private:
  uuids::uuid m_uid;     //!< Unique ID
  uint32_t m_trackId;    //!< Track ID
  float m_time;          //!< Time point
  glm::vec3 m_position;  //!< Position (x, y, depth)
};

#endif // TRACK_POINT_H
