#ifndef TRACK_EDIT_EVENTS_H
#define TRACK_EDIT_EVENTS_H

#include "logic/interaction/events/ButtonState.h"
#include "logic/tracks/TrackEditor.h"

#include <glm/vec3.hpp>

#include <tinyfsm.hpp>


namespace state
{

/// PointerEvent is a base class for pointer press, release, and move events.
struct PointerEvent : public tinyfsm::Event
{
    PointerEvent( const glm::vec3& position, float time,
                  const ButtonState& b, const ModifierState& m,
                  const PointerDepth& depth = PointerDepth{} )
        : m_position( position ), m_time( time ), m_depth( depth ),
          buttonState( b ), modifierState( m ) {}

    virtual ~PointerEvent() = default;

    const glm::vec3 m_position; //!< Pointer position in track coordinates (z is depth)
    const float m_time; //!< Current time of the view
    const PointerDepth m_depth; //!< Depths of the vertices that the pointer reaches
    const ButtonState buttonState; //!< Mouse button state
    const ModifierState modifierState; //!< Keyboard modifier state
};

/// Pointer pressed
struct PointerPressEvent : public PointerEvent
{
    using PointerEvent::PointerEvent;
    ~PointerPressEvent() override = default;
};

/// Pointer released
struct PointerReleaseEvent : public PointerEvent
{
    using PointerEvent::PointerEvent;
    ~PointerReleaseEvent() override = default;
};

/// Pointer moved
struct PointerMoveEvent : public PointerEvent
{
    using PointerEvent::PointerEvent;
    ~PointerMoveEvent() override = default;
};

/// User wants to forget the vertex selected as the first vertex of a join
struct CancelJoinEvent : public tinyfsm::Event {};

} // namespace state

#endif // TRACK_EDIT_EVENTS_H
