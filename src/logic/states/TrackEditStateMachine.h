#ifndef TRACK_EDIT_STATE_MACHINE_H
#define TRACK_EDIT_STATE_MACHINE_H

#include "logic/states/TrackEditEvents.h"

#include <tinyfsm.hpp>
#include <uuid.h>

#include <functional>
#include <optional>

class TrackEditor;

namespace state
{

/**
 * @brief State machine for editing tracks with the pointer.
 *
 * With exactly one modifier pressed, a pointer press adds a vertex (Shift), removes the
 * selected vertex (Alt), or starts dragging the selected vertex (Control). Dragging moves the
 * vertex with each pointer move until the pointer is released. With Shift and Control pressed,
 * the first press selects the first vertex of a join and the second press joins the track of
 * the vertex it selects into the track of the first vertex.
 *
 * @note Access the current state with \c current_state_ptr()
 * @note Check if it is in a given state with \c is_in_state<STATE>()
 */
class TrackEditStateMachine : public tinyfsm::Fsm<TrackEditStateMachine>
{
  friend class tinyfsm::Fsm<TrackEditStateMachine>;

public:
  TrackEditStateMachine() = default;
  virtual ~TrackEditStateMachine() = default;

  /// Set a non-const pointer to the tracks being edited
  static void setEditor(TrackEditor* editor) { ms_editor = editor; }

  /// Get a non-const pointer to the tracks being edited
  static TrackEditor* editor() { return ms_editor; }

  /**
   * @brief Set callbacks used by state machine
   * @param tracksChanged Function called after the tracks have been edited
   */
  static void setCallbacks(std::function<void()> tracksChanged) { ms_tracksChangedCallback = tracksChanged; }

  /// Get the vertex being dragged
  static std::optional<uuids::uuid> draggedVertexUid() { return ms_draggedVertexUid; }

  /// Get the vertex selected as the first vertex of a join
  static std::optional<uuids::uuid> pendingJoinVertexUid() { return ms_pendingJoinVertexUid; }

  /// Clear the dragged and pending join vertices. Call before \c start().
  static void reset();

protected:
  /// Default action when entering a state
  virtual void entry() {}

  /// Default action when exiting a state
  virtual void exit() {}

  /// Default reaction for unhandled events
  void react(const tinyfsm::Event&);

  /// Default reactions for handled events
  virtual void react(const PointerPressEvent&) {}
  virtual void react(const PointerReleaseEvent&) {}
  virtual void react(const PointerMoveEvent&) {}
  virtual void react(const CancelJoinEvent&);

  /**
   * @brief Check if the pointer to the track editor is null
   * @return False iff the pointer is null
   */
  static bool checkEditor();

  /// Notify that the tracks changed
  static void tracksChanged();

  /// Add a vertex at the pointer to the current track
  static void addVertex(const PointerEvent& e);

  /// Remove the vertex selected by the pointer
  static void removeVertex(const PointerEvent& e);

  /// Select the vertex at the pointer for dragging
  /// @return True iff a vertex was selected
  static bool selectVertexForDragging(const PointerEvent& e);

  /// Select the first vertex of a join, or join with the previously selected vertex
  static void selectOrJoin(const PointerEvent& e);

  /// Tracks being edited
  static TrackEditor* ms_editor;

  /// Function called after the tracks have been edited
  static std::function<void()> ms_tracksChangedCallback;

  /// Vertex being dragged
  static std::optional<uuids::uuid> ms_draggedVertexUid;

  /// First vertex of a join
  static std::optional<uuids::uuid> ms_pendingJoinVertexUid;
};

} // namespace state

// Shortcut for referring to the state machine:
using TSM = state::TrackEditStateMachine;

#endif // TRACK_EDIT_STATE_MACHINE_H
