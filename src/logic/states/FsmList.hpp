#ifndef FSMLIST_HPP
#define FSMLIST_HPP

#include "logic/states/TrackEditStateMachine.h"

#include <tinyfsm.hpp>


namespace state
{

/**
 * @brief The list of all state machines. There is only the track editing machine.
 */
using fsm_list = TrackEditStateMachine;


/**
 * @brief Dispatch event to the state machine(s)
 */
template<typename E>
void send_event( const E& event )
{
    fsm_list::template dispatch<E>( event );
}

} // namespace state

#endif // FSMLIST_HPP
