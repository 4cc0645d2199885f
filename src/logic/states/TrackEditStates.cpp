#include "logic/states/TrackEditStates.h"

#include "common/UuidUtility.h"
#include "logic/tracks/TrackEditor.h"

#include <spdlog/spdlog.h>

namespace state
{

void IdleState::entry()
{
  ms_draggedVertexUid = std::nullopt;
}

void IdleState::react(const PointerPressEvent& e)
{
  const ModifierState& m = e.modifierState;

  if (1 == m.numEditModifiers())
  {
    if (m.shift)
    {
      addVertex(e);
    }
    else if (m.alt)
    {
      removeVertex(e);
    }
    else if (m.control && selectVertexForDragging(e))
    {
      transit<DraggingState>();
    }
  }
  else if (2 == m.numEditModifiers() && m.shift && m.control)
  {
    selectOrJoin(e);
  }
}

/**************** DraggingState *******************/

void DraggingState::entry()
{
  if (ms_draggedVertexUid)
  {
    spdlog::debug("Started dragging vertex {}", *ms_draggedVertexUid);
  }
}

void DraggingState::exit()
{
  ms_draggedVertexUid = std::nullopt;
}

void DraggingState::react(const PointerMoveEvent& e)
{
  if (!ms_draggedVertexUid || !checkEditor())
  {
    transit<IdleState>();
    return;
  }

  if (ms_editor->move(*ms_draggedVertexUid, e.m_position, e.m_depth))
  {
    tracksChanged();
  }
  else
  {
    // The vertex no longer exists
    transit<IdleState>();
  }
}

void DraggingState::react(const PointerReleaseEvent&)
{
  transit<IdleState>();
}

} // namespace state
