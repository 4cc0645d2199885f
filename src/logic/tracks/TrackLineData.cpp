#include "logic/tracks/TrackLineData.h"
#include "logic/tracks/TrackGroup.h"

#include <glm/common.hpp>
#include <glm/gtc/matrix_transform.hpp>
#include <glm/vec2.hpp>

#include <spdlog/spdlog.h>

#include <limits>

namespace
{

/// Fraction of the track extent added as margin around the tracks
constexpr float sk_fitMargin = 0.05f;

const glm::mat4 sk_identMat4{1.0f};

} // namespace

TrackLineData buildTrackLineData(const TrackGroup& group)
{
  TrackLineData data;

  const std::size_t numPoints = group.numPoints();

  data.m_positions.reserve(numPoints);
  data.m_colors.reserve(numPoints);
  data.m_trackIds.reserve(numPoints);
  data.m_pointUids.reserve(numPoints);

  std::vector<float> times;
  std::vector<float> depths;
  times.reserve(numPoints);
  depths.reserve(numPoints);

  for (const auto& p : group.getTracks())
  {
    const auto& track = p.second;
    const glm::vec4 color{track.m_color, 1.0f};

    for (std::size_t i = 0; i < track.m_points.size(); ++i)
    {
      const auto& point = track.m_points[i];
      const auto index = static_cast<uint32_t>(data.m_positions.size());

      if (i > 0)
      {
        data.m_segmentIndices.push_back(index - 1);
        data.m_segmentIndices.push_back(index);
      }

      data.m_positions.push_back(point.position());
      data.m_colors.push_back(color);
      data.m_trackIds.push_back(p.first);
      data.m_pointUids.push_back(point.uid());

      times.push_back(point.time());
      depths.push_back(point.depth());
    }
  }

  data.m_attributes.set(std::move(times), std::move(depths), data.m_positions.size());

  spdlog::debug("Built line data for {} tracks: {} vertices and {} segments",
                group.numTracks(), data.numVertices(), data.numSegments());

  return data;
}

glm::mat4 fitTracksToView(const TrackLineData& data, float aspectRatio)
{
  if (data.m_positions.empty() || aspectRatio <= 0.0f)
  {
    return sk_identMat4;
  }

  glm::vec3 minCorner{std::numeric_limits<float>::max()};
  glm::vec3 maxCorner{std::numeric_limits<float>::lowest()};

  for (const auto& p : data.m_positions)
  {
    minCorner = glm::min(minCorner, p);
    maxCorner = glm::max(maxCorner, p);
  }

  const glm::vec2 center = 0.5f * glm::vec2{minCorner + maxCorner};
  glm::vec2 halfExtent = 0.5f * (1.0f + sk_fitMargin) * glm::vec2{maxCorner - minCorner};
  halfExtent = glm::max(halfExtent, glm::vec2{1.0f});

  // Expand the extent along one axis to match the viewport aspect ratio
  if (halfExtent.x / halfExtent.y < aspectRatio)
  {
    halfExtent.x = halfExtent.y * aspectRatio;
  }
  else
  {
    halfExtent.y = halfExtent.x / aspectRatio;
  }

  // Image rows (y) increase downwards. The depth range covers all vertices, so none are clipped.
  return glm::ortho(center.x - halfExtent.x, center.x + halfExtent.x,
                    center.y + halfExtent.y, center.y - halfExtent.y,
                    -maxCorner.z - 1.0f, -minCorner.z + 1.0f);
}
