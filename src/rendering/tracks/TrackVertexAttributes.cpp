#include "rendering/tracks/TrackVertexAttributes.h"

#include "common/Exception.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <sstream>

void TrackVertexAttributes::set(
  std::vector<float> vertexTime, std::vector<float> vertexDepth, std::size_t vertexCount
)
{
  if (vertexTime.size() != vertexCount || vertexDepth.size() != vertexCount)
  {
    std::ostringstream ss;
    ss << "Shape mismatch in track vertex attributes: " << vertexTime.size() << " times and "
       << vertexDepth.size() << " depths for " << vertexCount << " vertices";

    spdlog::error(ss.str());
    throw_debug(ss.str())
  }

  m_vertexTime = std::move(vertexTime);
  m_vertexDepth = std::move(vertexDepth);

  spdlog::trace("Set time and depth attributes of {} track vertices", vertexCount);
}

void TrackVertexAttributes::clear()
{
  m_vertexTime.clear();
  m_vertexDepth.clear();
}

std::optional<float> TrackVertexAttributes::maxTime() const
{
  if (m_vertexTime.empty())
  {
    return std::nullopt;
  }

  return *std::max_element(std::begin(m_vertexTime), std::end(m_vertexTime));
}
