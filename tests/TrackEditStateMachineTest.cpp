#include "logic/states/FsmList.hpp"
#include "logic/states/TrackEditStates.h"
#include "logic/tracks/TrackGroup.h"

#include <gtest/gtest.h>

using namespace state;

namespace
{

ModifierState modifiers(bool shift, bool control, bool alt)
{
  ModifierState m;
  m.shift = shift;
  m.control = control;
  m.alt = alt;
  return m;
}

PointerDepth unsetDepth()
{
  PointerDepth depth;
  depth.m_isSet = false;
  return depth;
}

PointerDepth depthCutoff(float cutoff)
{
  PointerDepth depth;
  depth.m_cutoff = cutoff;
  return depth;
}

ButtonState leftButton(bool pressed)
{
  ButtonState b;
  b.left = pressed;
  return b;
}

class TrackEditStateMachineTest : public ::testing::Test
{
protected:
  void SetUp() override
  {
    TSM::reset();
    fsm_list::start();

    TSM::setEditor(&m_tracks);
    TSM::setCallbacks([this]() { ++m_numChanges; });
  }

  void TearDown() override
  {
    TSM::setEditor(nullptr);
    TSM::setCallbacks(nullptr);
    TSM::reset();
  }

  void press(const glm::vec3& pos, float time, const ModifierState& m, const PointerDepth& depth = PointerDepth{})
  {
    send_event(PointerPressEvent(pos, time, leftButton(true), m, depth));
  }

  void move(const glm::vec3& pos, float time, const ModifierState& m, const PointerDepth& depth = PointerDepth{})
  {
    send_event(PointerMoveEvent(pos, time, leftButton(true), m, depth));
  }

  void release(const glm::vec3& pos, float time)
  {
    send_event(PointerReleaseEvent(pos, time, leftButton(false), ModifierState{}));
  }

  TrackGroup m_tracks;
  int m_numChanges = 0;
};

} // namespace

TEST_F(TrackEditStateMachineTest, StartsIdle)
{
  EXPECT_TRUE(TSM::is_in_state<IdleState>());
  EXPECT_FALSE(TSM::draggedVertexUid());
  EXPECT_FALSE(TSM::pendingJoinVertexUid());
}

TEST_F(TrackEditStateMachineTest, ShiftAddsToCurrentTrack)
{
  m_tracks.setCurrentTrackId(6);

  press({1, 2, 0}, 0.0f, modifiers(true, false, false));
  release({1, 2, 0}, 0.0f);
  press({3, 2, 0}, 1.0f, modifiers(true, false, false));

  EXPECT_EQ(2, m_numChanges);
  EXPECT_EQ((std::vector<uint32_t>{6}), m_tracks.getTrackIds());
  EXPECT_EQ(2u, m_tracks.numPoints());
  EXPECT_TRUE(TSM::is_in_state<IdleState>());

  // A second point at the same time is refused and nothing changes
  press({5, 5, 0}, 1.0f, modifiers(true, false, false));
  EXPECT_EQ(2, m_numChanges);
}

TEST_F(TrackEditStateMachineTest, PressWithoutModifiersDoesNothing)
{
  press({1, 2, 0}, 0.0f, ModifierState{});
  press({1, 2, 0}, 0.0f, modifiers(true, false, true));

  EXPECT_EQ(0, m_numChanges);
  EXPECT_EQ(0u, m_tracks.numPoints());
}

TEST_F(TrackEditStateMachineTest, AltRemovesSelectedVertex)
{
  m_tracks.add({0, 0, 0}, 2.0f, 0);
  const auto keep = m_tracks.add({0, 0, 0}, 3.0f, 0);

  // Nothing at this position
  press({50, 50, 0}, 2.0f, modifiers(false, false, true));
  EXPECT_EQ(0, m_numChanges);

  press({1, 0, 0}, 2.0f, modifiers(false, false, true));
  EXPECT_EQ(1, m_numChanges);
  ASSERT_EQ(1u, m_tracks.numPoints());
  EXPECT_NE(nullptr, m_tracks.getPoint(*keep));
}

TEST_F(TrackEditStateMachineTest, ControlDragsVertexUntilRelease)
{
  const auto uid = m_tracks.add({0, 0, 0}, 2.0f, 0);

  press({1, 1, 0}, 2.0f, modifiers(false, true, false));
  EXPECT_TRUE(TSM::is_in_state<DraggingState>());
  ASSERT_TRUE(TSM::draggedVertexUid());
  EXPECT_EQ(*uid, *TSM::draggedVertexUid());

  move({4, 4, 0}, 2.0f, modifiers(false, true, false));
  move({6, 5, 0}, 2.0f, ModifierState{});
  EXPECT_EQ(2, m_numChanges);
  EXPECT_EQ(glm::vec3(6, 5, 0), m_tracks.getPoint(*uid)->position());

  release({6, 5, 0}, 2.0f);
  EXPECT_TRUE(TSM::is_in_state<IdleState>());
  EXPECT_FALSE(TSM::draggedVertexUid());

  // Moves after release do not drag
  move({9, 9, 0}, 2.0f, ModifierState{});
  EXPECT_EQ(glm::vec3(6, 5, 0), m_tracks.getPoint(*uid)->position());
}

TEST_F(TrackEditStateMachineTest, ControlOnEmptySpaceStaysIdle)
{
  m_tracks.add({0, 0, 0}, 2.0f, 0);

  press({0, 0, 0}, 7.0f, modifiers(false, true, false));
  EXPECT_TRUE(TSM::is_in_state<IdleState>());
  EXPECT_FALSE(TSM::draggedVertexUid());
}

TEST_F(TrackEditStateMachineTest, DraggingEndsWhenVertexDisappears)
{
  const auto uid = m_tracks.add({0, 0, 0}, 2.0f, 0);

  press({0, 0, 0}, 2.0f, modifiers(false, true, false));
  ASSERT_TRUE(TSM::is_in_state<DraggingState>());

  m_tracks.remove(*uid);
  move({1, 1, 0}, 2.0f, ModifierState{});
  EXPECT_TRUE(TSM::is_in_state<IdleState>());
}

TEST_F(TrackEditStateMachineTest, ShiftControlJoinsTracks)
{
  const auto a = m_tracks.add({0, 0, 0}, 0.0f, 1);
  m_tracks.add({10, 0, 0}, 1.0f, 1);
  m_tracks.add({20, 0, 0}, 2.0f, 2);
  const auto b = m_tracks.add({30, 0, 0}, 3.0f, 2);

  const ModifierState m = modifiers(true, true, false);

  press({0, 0, 0}, 0.0f, m);
  ASSERT_TRUE(TSM::pendingJoinVertexUid());
  EXPECT_EQ(*a, *TSM::pendingJoinVertexUid());
  EXPECT_EQ(0, m_numChanges);

  // Selecting nothing keeps the pending vertex
  press({100, 0, 0}, 3.0f, m);
  EXPECT_TRUE(TSM::pendingJoinVertexUid());

  press({30, 0, 0}, 3.0f, m);
  EXPECT_EQ(1, m_numChanges);
  EXPECT_FALSE(TSM::pendingJoinVertexUid());
  EXPECT_EQ((std::vector<uint32_t>{1}), m_tracks.getTrackIds());
  EXPECT_EQ(1u, m_tracks.getPoint(*b)->trackId());
}

TEST_F(TrackEditStateMachineTest, CancelForgetsPendingJoin)
{
  m_tracks.add({0, 0, 0}, 0.0f, 1);

  press({0, 0, 0}, 0.0f, modifiers(true, true, false));
  ASSERT_TRUE(TSM::pendingJoinVertexUid());

  send_event(CancelJoinEvent());
  EXPECT_FALSE(TSM::pendingJoinVertexUid());
}

TEST_F(TrackEditStateMachineTest, NullEditorIsIgnored)
{
  TSM::setEditor(nullptr);

  press({0, 0, 0}, 0.0f, modifiers(true, false, false));
  press({0, 0, 0}, 0.0f, modifiers(false, true, false));

  EXPECT_EQ(0, m_numChanges);
  EXPECT_TRUE(TSM::is_in_state<IdleState>());
}

TEST_F(TrackEditStateMachineTest, EditsReachAllDepthsWithoutCurrentDepth)
{
  const auto uid = m_tracks.add({0, 0, 10}, 2.0f, 0);
  const auto other = m_tracks.add({8, 8, -6}, 2.0f, 1);

  // The pointer lies in the plane z = 0, but every vertex is drawn at full size
  press({1, 0, 0}, 2.0f, modifiers(false, true, false), unsetDepth());
  ASSERT_TRUE(TSM::is_in_state<DraggingState>());
  EXPECT_EQ(*uid, *TSM::draggedVertexUid());

  move({3, 4, 0}, 2.0f, ModifierState{}, unsetDepth());
  EXPECT_EQ(glm::vec3(3, 4, 10), m_tracks.getPoint(*uid)->position());
  release({3, 4, 0}, 2.0f);

  press({8, 7, 0}, 2.0f, modifiers(false, false, true), unsetDepth());
  EXPECT_EQ(nullptr, m_tracks.getPoint(*other));
  EXPECT_EQ(2, m_numChanges);
}

TEST_F(TrackEditStateMachineTest, CulledVerticesCannotBeEdited)
{
  const auto culled = m_tracks.add({0, 0, 4}, 2.0f, 0);

  // The vertex lies beyond the depth cutoff around the pointer, so it is not drawn
  press({0, 0, 0}, 2.0f, modifiers(false, false, true), depthCutoff(3.0f));
  press({0, 0, 0}, 2.0f, modifiers(false, true, false), depthCutoff(3.0f));
  press({0, 0, 0}, 2.0f, modifiers(true, true, false), depthCutoff(3.0f));

  EXPECT_EQ(0, m_numChanges);
  EXPECT_NE(nullptr, m_tracks.getPoint(*culled));
  EXPECT_TRUE(TSM::is_in_state<IdleState>());
  EXPECT_FALSE(TSM::pendingJoinVertexUid());

  // Without the cutoff, the vertex is drawn and removed
  press({0, 0, 0}, 2.0f, modifiers(false, false, true));
  EXPECT_EQ(nullptr, m_tracks.getPoint(*culled));
  EXPECT_EQ(1, m_numChanges);
}
