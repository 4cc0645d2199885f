#include "logic/states/TrackEditStateMachine.h"
#include "logic/states/TrackEditStates.h"

#include "common/UuidUtility.h"
#include "logic/tracks/TrackEditor.h"

#include <spdlog/spdlog.h>

namespace state
{

TrackEditor* TSM::ms_editor = nullptr;
std::function<void()> TSM::ms_tracksChangedCallback = nullptr;

std::optional<uuids::uuid> TSM::ms_draggedVertexUid = std::nullopt;
std::optional<uuids::uuid> TSM::ms_pendingJoinVertexUid = std::nullopt;

void TrackEditStateMachine::reset()
{
  ms_draggedVertexUid = std::nullopt;
  ms_pendingJoinVertexUid = std::nullopt;
}

void TrackEditStateMachine::react(const tinyfsm::Event&)
{
  spdlog::warn("Unhandled event sent to TrackEditStateMachine");
}

void TrackEditStateMachine::react(const CancelJoinEvent&)
{
  if (ms_pendingJoinVertexUid)
  {
    spdlog::debug("Cancelled join from vertex {}", *ms_pendingJoinVertexUid);
  }

  ms_pendingJoinVertexUid = std::nullopt;
}

bool TrackEditStateMachine::checkEditor()
{
  if (!ms_editor)
  {
    spdlog::error("Track editor is null");
    return false;
  }
  return true;
}

void TrackEditStateMachine::tracksChanged()
{
  if (ms_tracksChangedCallback)
  {
    ms_tracksChangedCallback();
  }
}

void TrackEditStateMachine::addVertex(const PointerEvent& e)
{
  if (!checkEditor())
    return;

  if (ms_editor->add(e.m_position, e.m_time, ms_editor->currentTrackId()))
  {
    tracksChanged();
  }
}

void TrackEditStateMachine::removeVertex(const PointerEvent& e)
{
  if (!checkEditor())
    return;

  const auto selected = ms_editor->select(e.m_position, e.m_time, e.m_depth);

  if (selected && ms_editor->remove(*selected))
  {
    tracksChanged();
  }
}

bool TrackEditStateMachine::selectVertexForDragging(const PointerEvent& e)
{
  if (!checkEditor())
    return false;

  ms_draggedVertexUid = ms_editor->select(e.m_position, e.m_time, e.m_depth);
  return ms_draggedVertexUid.has_value();
}

void TrackEditStateMachine::selectOrJoin(const PointerEvent& e)
{
  if (!checkEditor())
    return;

  const auto selected = ms_editor->select(e.m_position, e.m_time, e.m_depth);

  if (!ms_pendingJoinVertexUid)
  {
    ms_pendingJoinVertexUid = selected;

    if (selected)
    {
      spdlog::debug("Selected vertex {} to join", *selected);
    }
  }
  else if (selected)
  {
    if (ms_editor->join(*ms_pendingJoinVertexUid, *selected))
    {
      tracksChanged();
    }

    ms_pendingJoinVertexUid = std::nullopt;
  }
}

} // namespace state

FSM_INITIAL_STATE(state::TrackEditStateMachine, state::IdleState)
