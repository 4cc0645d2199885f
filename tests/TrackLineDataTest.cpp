#include "logic/tracks/TrackLineData.h"
#include "logic/tracks/TrackGroup.h"

#include <gtest/gtest.h>

#include <glm/glm.hpp>

namespace
{

TrackGroup makeTwoTracks()
{
  TrackGroup group;
  group.add({0, 0, 1}, 0.0f, 0);
  group.add({1, 0, 1}, 1.0f, 0);
  group.add({2, 0, 2}, 2.0f, 0);
  group.add({5, 5, 4}, 1.0f, 1);
  group.add({6, 6, 4}, 2.0f, 1);
  return group;
}

} // namespace

TEST(TrackLineData, ConnectsConsecutivePointsWithinTracks)
{
  const TrackGroup group = makeTwoTracks();
  const TrackLineData data = buildTrackLineData(group);

  EXPECT_EQ(5u, data.numVertices());
  EXPECT_EQ(3u, data.numSegments());
  EXPECT_EQ((std::vector<uint32_t>{0, 1, 1, 2, 3, 4}), data.m_segmentIndices);

  EXPECT_EQ((std::vector<uint32_t>{0, 0, 0, 1, 1}), data.m_trackIds);
  EXPECT_EQ((std::vector<float>{0, 1, 2, 1, 2}), data.m_attributes.vertexTime());
  EXPECT_EQ((std::vector<float>{1, 1, 2, 4, 4}), data.m_attributes.vertexDepth());

  EXPECT_EQ(glm::vec4(*group.getTrackColor(1), 1.0f), data.m_colors[3]);
  EXPECT_EQ(glm::vec3(6, 6, 4), data.m_positions[4]);

  const auto& firstTrack = group.getTracks().at(0).m_points;
  EXPECT_EQ(firstTrack[2].uid(), data.m_pointUids[2]);
}

TEST(TrackLineData, EmptyGroupGivesEmptyData)
{
  const TrackLineData data = buildTrackLineData(TrackGroup{});

  EXPECT_EQ(0u, data.numVertices());
  EXPECT_EQ(0u, data.numSegments());
  EXPECT_TRUE(data.m_attributes.empty());
  EXPECT_EQ(glm::mat4{1.0f}, fitTracksToView(data, 1.0f));
}

TEST(TrackLineData, FitMapsTracksInsideClipSpace)
{
  const TrackLineData data = buildTrackLineData(makeTwoTracks());

  for (float aspect : {0.5f, 1.0f, 2.0f})
  {
    const glm::mat4 clip_T_world = fitTracksToView(data, aspect);

    for (const auto& p : data.m_positions)
    {
      const glm::vec4 clipPos = clip_T_world * glm::vec4{p, 1.0f};
      EXPECT_LE(std::abs(clipPos.x), 1.0f);
      EXPECT_LE(std::abs(clipPos.y), 1.0f);
      EXPECT_LE(std::abs(clipPos.z), 1.0f);
    }
  }

  // Rows increase downwards: the point with the largest y is at the bottom
  const glm::mat4 clip_T_world = fitTracksToView(data, 1.0f);
  const glm::vec4 top = clip_T_world * glm::vec4{data.m_positions[0], 1.0f};
  const glm::vec4 bottom = clip_T_world * glm::vec4{data.m_positions[4], 1.0f};
  EXPECT_GT(top.y, bottom.y);

  EXPECT_EQ(glm::mat4{1.0f}, fitTracksToView(data, 0.0f));
}
