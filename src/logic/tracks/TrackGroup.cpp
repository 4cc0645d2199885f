#include "logic/tracks/TrackGroup.h"

#define GLM_ENABLE_EXPERIMENTAL
#include <glm/geometric.hpp>
#include <glm/vec2.hpp>
#include <glm/gtx/color_space.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cmath>
#include <limits>
#include <set>

namespace
{

/// Points closer in time than this are at the same time point
constexpr float sk_timeTolerance = 0.5f;

bool sameTimePoint(float t1, float t2)
{
  return (std::abs(t1 - t2) < sk_timeTolerance);
}

} // namespace

TrackGroup::TrackGroup()
  : m_fileName()
  , m_name()
  , m_tracks()
  , m_currentTrackId(0)
  , m_pickRadius(5.0f)
{
}

void TrackGroup::setFileName(const fs::path& fileName)
{
  m_fileName = fileName;
}

const fs::path& TrackGroup::getFileName() const
{
  return m_fileName;
}

void TrackGroup::setName(std::string name)
{
  m_name = std::move(name);
}

const std::string& TrackGroup::getName() const
{
  return m_name;
}

std::optional<uuids::uuid> TrackGroup::add(const glm::vec3& position, float time, uint32_t trackId)
{
  auto it = m_tracks.find(trackId);

  if (std::end(m_tracks) == it)
  {
    it = m_tracks.emplace(trackId, Track{{}, defaultTrackColor(trackId)}).first;
    spdlog::debug("Created track {}", trackId);
  }

  auto& points = it->second.m_points;

  for (const auto& point : points)
  {
    if (sameTimePoint(point.time(), time))
    {
      spdlog::warn("Track {} already has a point at time {}", trackId, time);
      return std::nullopt;
    }
  }

  TrackPoint newPoint(trackId, time, position);
  const uuids::uuid uid = newPoint.uid();

  const auto pos = std::upper_bound(
    std::begin(points), std::end(points), time,
    [](float t, const TrackPoint& p) { return t < p.time(); });

  points.insert(pos, std::move(newPoint));

  spdlog::debug("Added point {} to track {} at time {}", uid, trackId, time);
  return uid;
}

std::optional<uuids::uuid> TrackGroup::select(
  const glm::vec3& position, float time, const PointerDepth& depth) const
{
  std::optional<uuids::uuid> selected;
  float minDistance = std::numeric_limits<float>::max();

  for (const auto& track : m_tracks)
  {
    for (const auto& point : track.second.m_points)
    {
      if (!sameTimePoint(point.time(), time))
      {
        continue;
      }

      const glm::vec3& p = point.position();

      if (depth.m_isSet && std::abs(p.z - position.z) > depth.m_cutoff)
      {
        continue;
      }

      const float distance = depth.m_isSet
        ? glm::distance(p, position)
        : glm::distance(glm::vec2{p}, glm::vec2{position});

      if (distance <= m_pickRadius && distance < minDistance)
      {
        minDistance = distance;
        selected = point.uid();
      }
    }
  }

  return selected;
}

bool TrackGroup::remove(const uuids::uuid& pointUid)
{
  const auto found = findPoint(pointUid);

  if (!found)
  {
    spdlog::warn("Cannot remove point {}: it is not in any track", pointUid);
    return false;
  }

  auto& points = m_tracks.at(found->first).m_points;
  points.erase(std::begin(points) + static_cast<std::ptrdiff_t>(found->second));

  if (points.empty())
  {
    m_tracks.erase(found->first);
    spdlog::debug("Removed empty track {}", found->first);
  }

  spdlog::debug("Removed point {}", pointUid);
  return true;
}

bool TrackGroup::move(const uuids::uuid& pointUid, const glm::vec3& position, const PointerDepth& depth)
{
  const auto found = findPoint(pointUid);

  if (!found)
  {
    spdlog::warn("Cannot move point {}: it is not in any track", pointUid);
    return false;
  }

  TrackPoint& point = m_tracks.at(found->first).m_points.at(found->second);
  point.setPosition(depth.m_isSet ? position : glm::vec3{position.x, position.y, point.depth()});
  return true;
}

bool TrackGroup::join(const uuids::uuid& firstUid, const uuids::uuid& secondUid)
{
  const auto first = findPoint(firstUid);
  const auto second = findPoint(secondUid);

  if (!first || !second)
  {
    spdlog::warn("Cannot join tracks of points {} and {}: point not found", firstUid, secondUid);
    return false;
  }

  const uint32_t targetId = first->first;
  const uint32_t sourceId = second->first;

  if (targetId == sourceId)
  {
    spdlog::warn("Cannot join track {} with itself", targetId);
    return false;
  }

  auto& target = m_tracks.at(targetId).m_points;
  auto& source = m_tracks.at(sourceId).m_points;

  for (const auto& s : source)
  {
    for (const auto& t : target)
    {
      if (sameTimePoint(s.time(), t.time()))
      {
        spdlog::warn("Cannot join tracks {} and {}: both have a point at time {}", targetId, sourceId, s.time());
        return false;
      }
    }
  }

  for (auto& point : source)
  {
    point.setTrackId(targetId);
    target.emplace_back(std::move(point));
  }

  std::stable_sort(std::begin(target), std::end(target), [](const TrackPoint& a, const TrackPoint& b) {
    return a.time() < b.time();
  });

  m_tracks.erase(sourceId);

  if (m_currentTrackId == sourceId)
  {
    m_currentTrackId = targetId;
  }

  spdlog::info("Joined track {} into track {}", sourceId, targetId);
  return true;
}

void TrackGroup::setCurrentTrackId(uint32_t trackId)
{
  m_currentTrackId = trackId;
}

uint32_t TrackGroup::currentTrackId() const
{
  return m_currentTrackId;
}

uint32_t TrackGroup::nextTrackId() const
{
  if (m_tracks.empty())
  {
    return 0;
  }

  const uint32_t maxId = m_tracks.rbegin()->first;

  if (maxId < std::numeric_limits<uint32_t>::max())
  {
    return maxId + 1;
  }

  // The largest ID is taken, so use the smallest unused one
  uint32_t id = 0;

  for (const auto& track : m_tracks)
  {
    if (track.first != id)
    {
      break;
    }
    ++id;
  }

  return id;
}

const TrackPoint* TrackGroup::getPoint(const uuids::uuid& pointUid) const
{
  if (const auto found = findPoint(pointUid))
  {
    return &m_tracks.at(found->first).m_points.at(found->second);
  }

  return nullptr;
}

const std::map<uint32_t, TrackGroup::Track>& TrackGroup::getTracks() const
{
  return m_tracks;
}

std::vector<uint32_t> TrackGroup::getTrackIds() const
{
  std::vector<uint32_t> ids;
  ids.reserve(m_tracks.size());

  for (const auto& track : m_tracks)
  {
    ids.push_back(track.first);
  }

  return ids;
}

std::size_t TrackGroup::numTracks() const
{
  return m_tracks.size();
}

std::size_t TrackGroup::numPoints() const
{
  std::size_t count = 0;

  for (const auto& track : m_tracks)
  {
    count += track.second.m_points.size();
  }

  return count;
}

void TrackGroup::clear()
{
  m_tracks.clear();
  m_currentTrackId = 0;
}

bool TrackGroup::setTrackColor(uint32_t trackId, const glm::vec3& color)
{
  auto it = m_tracks.find(trackId);

  if (std::end(m_tracks) == it)
  {
    return false;
  }

  it->second.m_color = color;
  return true;
}

std::optional<glm::vec3> TrackGroup::getTrackColor(uint32_t trackId) const
{
  auto it = m_tracks.find(trackId);

  if (std::end(m_tracks) == it)
  {
    return std::nullopt;
  }

  return it->second.m_color;
}

void TrackGroup::setPickRadius(float radius)
{
  m_pickRadius = std::max(radius, 0.0f);
}

float TrackGroup::getPickRadius() const
{
  return m_pickRadius;
}

glm::vec3 TrackGroup::defaultTrackColor(uint32_t trackId)
{
  // Hues of consecutive tracks are spaced by the golden angle
  const float hue = std::fmod(137.508f * static_cast<float>(trackId), 360.0f);
  return glm::rgbColor(glm::vec3{hue, 0.75f, 1.0f});
}

std::optional<std::pair<uint32_t, std::size_t> > TrackGroup::findPoint(const uuids::uuid& pointUid) const
{
  for (const auto& track : m_tracks)
  {
    const auto& points = track.second.m_points;

    for (std::size_t i = 0; i < points.size(); ++i)
    {
      if (pointUid == points[i].uid())
      {
        return std::make_pair(track.first, i);
      }
    }
  }

  return std::nullopt;
}
