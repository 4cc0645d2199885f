#ifndef TRACK_EDIT_STATES_H
#define TRACK_EDIT_STATES_H

#include "logic/states/TrackEditStateMachine.h"


namespace state
{

/**
 * @brief State where no vertex is being dragged. Pointer presses add, remove, and join.
 */
class IdleState : public TrackEditStateMachine
{
    void entry() override;

    void react( const PointerPressEvent& ) override;
};

/**
 * @brief State where the user drags a vertex with the pointer
 */
class DraggingState : public TrackEditStateMachine
{
    void entry() override;
    void exit() override;

    void react( const PointerMoveEvent& ) override;
    void react( const PointerReleaseEvent& ) override;
};

} // namespace state

#endif // TRACK_EDIT_STATES_H
