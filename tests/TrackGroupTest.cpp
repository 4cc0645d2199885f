#include "logic/tracks/TrackGroup.h"

#include <gtest/gtest.h>

#include <glm/glm.hpp>

TEST(TrackGroup, AddKeepsPointsOrderedByTime)
{
  TrackGroup group;
  EXPECT_EQ(0u, group.nextTrackId());

  ASSERT_TRUE(group.add({0, 0, 0}, 5.0f, 2));
  ASSERT_TRUE(group.add({1, 0, 0}, 1.0f, 2));
  ASSERT_TRUE(group.add({2, 0, 0}, 3.0f, 2));
  ASSERT_TRUE(group.add({0, 0, 0}, 0.0f, 7));

  EXPECT_EQ(2u, group.numTracks());
  EXPECT_EQ(4u, group.numPoints());
  EXPECT_EQ((std::vector<uint32_t>{2, 7}), group.getTrackIds());
  EXPECT_EQ(8u, group.nextTrackId());

  const auto& points = group.getTracks().at(2).m_points;
  ASSERT_EQ(3u, points.size());
  EXPECT_EQ(1.0f, points[0].time());
  EXPECT_EQ(3.0f, points[1].time());
  EXPECT_EQ(5.0f, points[2].time());

  for (const auto& point : points)
  {
    EXPECT_EQ(2u, point.trackId());
  }
}

TEST(TrackGroup, NextTrackIdDoesNotWrap)
{
  TrackGroup group;
  group.add({0, 0, 0}, 0.0f, 4294967295u);
  EXPECT_EQ(0u, group.nextTrackId());

  group.add({0, 0, 0}, 0.0f, 0);
  group.add({0, 0, 0}, 0.0f, 1);
  EXPECT_EQ(2u, group.nextTrackId());
}

TEST(TrackGroup, AddRefusesDuplicateTimePoint)
{
  TrackGroup group;
  const auto uid = group.add({0, 0, 0}, 4.0f, 0);
  ASSERT_TRUE(uid);

  EXPECT_FALSE(group.add({3, 3, 0}, 4.0f, 0));
  EXPECT_FALSE(group.add({3, 3, 0}, 4.2f, 0));
  EXPECT_TRUE(group.add({3, 3, 0}, 4.0f, 1));
  EXPECT_EQ(2u, group.numPoints());
}

TEST(TrackGroup, NewTracksGetDistinctDefaultColors)
{
  TrackGroup group;
  group.add({0, 0, 0}, 0.0f, 0);
  group.add({0, 0, 0}, 0.0f, 1);

  const auto c0 = group.getTrackColor(0);
  const auto c1 = group.getTrackColor(1);
  ASSERT_TRUE(c0);
  ASSERT_TRUE(c1);
  EXPECT_EQ(TrackGroup::defaultTrackColor(0), *c0);
  EXPECT_GT(glm::distance(*c0, *c1), 0.1f);

  EXPECT_TRUE(group.setTrackColor(1, {0.2f, 0.4f, 0.6f}));
  EXPECT_EQ(glm::vec3(0.2f, 0.4f, 0.6f), *group.getTrackColor(1));

  EXPECT_FALSE(group.setTrackColor(9, {1, 1, 1}));
  EXPECT_FALSE(group.getTrackColor(9));
}

TEST(TrackGroup, SelectsNearestPointAtTime)
{
  TrackGroup group;
  const auto a = group.add({0, 0, 0}, 3.0f, 0);
  const auto b = group.add({4, 0, 0}, 3.0f, 1);
  const auto c = group.add({1, 0, 0}, 4.0f, 1);
  ASSERT_TRUE(a && b && c);

  EXPECT_EQ(*a, *group.select({1, 0, 0}, 3.0f, PointerDepth{}));
  EXPECT_EQ(*b, *group.select({3, 0, 0}, 3.0f, PointerDepth{}));
  EXPECT_EQ(*c, *group.select({1, 0, 0}, 4.0f, PointerDepth{}));

  // No point at this time
  EXPECT_FALSE(group.select({0, 0, 0}, 8.0f, PointerDepth{}));

  // Outside the pick radius
  group.setPickRadius(0.5f);
  EXPECT_FALSE(group.select({2, 0, 0}, 3.0f, PointerDepth{}));
  EXPECT_EQ(0.5f, group.getPickRadius());
}

TEST(TrackGroup, RemoveDropsEmptyTracks)
{
  TrackGroup group;
  const auto a = group.add({0, 0, 0}, 0.0f, 0);
  const auto b = group.add({0, 0, 0}, 1.0f, 0);
  const auto c = group.add({0, 0, 0}, 0.0f, 1);

  EXPECT_TRUE(group.remove(*a));
  EXPECT_EQ(nullptr, group.getPoint(*a));
  EXPECT_EQ(2u, group.numTracks());

  EXPECT_TRUE(group.remove(*c));
  EXPECT_EQ(1u, group.numTracks());
  EXPECT_FALSE(group.getTrackColor(1));

  EXPECT_FALSE(group.remove(*c));
  ASSERT_NE(nullptr, group.getPoint(*b));
}

TEST(TrackGroup, MoveUpdatesPositionAndDepth)
{
  TrackGroup group;
  const auto a = group.add({0, 0, 0}, 0.0f, 0);

  EXPECT_TRUE(group.move(*a, {5, 6, 2}, PointerDepth{}));

  const TrackPoint* point = group.getPoint(*a);
  ASSERT_NE(nullptr, point);
  EXPECT_EQ(glm::vec3(5, 6, 2), point->position());
  EXPECT_EQ(2.0f, point->depth());
  EXPECT_EQ(0.0f, point->time());

  EXPECT_FALSE(group.move(generateRandomUuid(), {0, 0, 0}, PointerDepth{}));
}

TEST(TrackGroup, JoinMergesSecondTrackIntoFirst)
{
  TrackGroup group;
  const auto a0 = group.add({0, 0, 0}, 0.0f, 3);
  group.add({0, 0, 0}, 4.0f, 3);
  const auto b0 = group.add({0, 0, 0}, 2.0f, 5);
  group.add({0, 0, 0}, 6.0f, 5);

  group.setCurrentTrackId(5);
  ASSERT_TRUE(group.join(*a0, *b0));

  EXPECT_EQ(1u, group.numTracks());
  EXPECT_EQ(3u, group.currentTrackId());

  const auto& points = group.getTracks().at(3).m_points;
  ASSERT_EQ(4u, points.size());

  const float expectedTimes[] = {0.0f, 2.0f, 4.0f, 6.0f};
  for (std::size_t i = 0; i < points.size(); ++i)
  {
    EXPECT_EQ(expectedTimes[i], points[i].time());
    EXPECT_EQ(3u, points[i].trackId());
  }

  EXPECT_EQ(3u, group.getPoint(*b0)->trackId());
}

TEST(TrackGroup, JoinRefusesSameTrackAndSharedTimes)
{
  TrackGroup group;
  const auto a0 = group.add({0, 0, 0}, 0.0f, 0);
  const auto a1 = group.add({0, 0, 0}, 1.0f, 0);
  const auto b0 = group.add({0, 0, 0}, 1.0f, 1);

  EXPECT_FALSE(group.join(*a0, *a1));
  EXPECT_FALSE(group.join(*a0, *b0));
  EXPECT_FALSE(group.join(*a0, generateRandomUuid()));
  EXPECT_EQ(2u, group.numTracks());
  EXPECT_EQ(3u, group.numPoints());
}

TEST(TrackGroup, ClearResetsCurrentTrack)
{
  TrackGroup group;
  group.add({0, 0, 0}, 0.0f, 4);
  group.setCurrentTrackId(4);

  group.clear();
  EXPECT_EQ(0u, group.numTracks());
  EXPECT_EQ(0u, group.currentTrackId());
}

TEST(TrackGroup, SelectWithoutPointerDepthIgnoresDepth)
{
  TrackGroup group;
  const auto deep = group.add({0, 0, 10}, 3.0f, 0);
  const auto beside = group.add({3, 0, -20}, 3.0f, 1);
  ASSERT_TRUE(deep && beside);

  PointerDepth noDepth;
  noDepth.m_isSet = false;

  // With a pointer depth of 0, the vertices are beyond the pick radius
  EXPECT_FALSE(group.select({0, 0, 0}, 3.0f, PointerDepth{}));

  EXPECT_EQ(*deep, *group.select({0, 0, 0}, 3.0f, noDepth));
  EXPECT_EQ(*beside, *group.select({2, 0, 0}, 3.0f, noDepth));
  EXPECT_FALSE(group.select({20, 0, 0}, 3.0f, noDepth));
}

TEST(TrackGroup, MoveWithoutPointerDepthKeepsDepth)
{
  TrackGroup group;
  const auto a = group.add({0, 0, 10}, 0.0f, 0);

  PointerDepth noDepth;
  noDepth.m_isSet = false;

  EXPECT_TRUE(group.move(*a, {4, 5, 0}, noDepth));
  EXPECT_EQ(glm::vec3(4, 5, 10), group.getPoint(*a)->position());

  EXPECT_TRUE(group.move(*a, {1, 2, 3}, PointerDepth{}));
  EXPECT_EQ(glm::vec3(1, 2, 3), group.getPoint(*a)->position());
}

TEST(TrackGroup, SelectSkipsVerticesBeyondDepthCutoff)
{
  TrackGroup group;
  const auto culled = group.add({0, 0, 4}, 3.0f, 0);
  const auto shown = group.add({4, 0, 1}, 3.0f, 1);
  ASSERT_TRUE(culled && shown);

  PointerDepth cutoff;
  cutoff.m_cutoff = 3.0f;

  // The culled vertex is nearer to the pointer but is not drawn
  EXPECT_EQ(*culled, *group.select({0, 0, 0}, 3.0f, PointerDepth{}));
  EXPECT_EQ(*shown, *group.select({0, 0, 0}, 3.0f, cutoff));

  group.remove(*shown);
  EXPECT_FALSE(group.select({0, 0, 0}, 3.0f, cutoff));
}
