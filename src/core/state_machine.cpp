// src/core/state_machine.cpp
#include "state_machine.h"

StateMachine::StateMachine() : m_current_state(PacerState::UNCONFIGURED) {}

PacerState StateMachine::get_current_state() const {
    return m_current_state;
}

bool StateMachine::set_state(PacerState new_state) {
    if (m_current_state == PacerState::STOPPED) {
        return new_state == PacerState::STOPPED;
    }
    if (new_state == PacerState::UNCONFIGURED) {
        return false;
    }
    m_current_state = new_state;
    return true;
}

bool StateMachine::is_active() const {
    return m_current_state == PacerState::ACTIVE_UNLIMITED ||
           m_current_state == PacerState::ACTIVE_BOUNDED;
}

std::string StateMachine::state_to_string(PacerState state) const {
    switch(state) {
        case PacerState::UNCONFIGURED: return "UNCONFIGURED";
        case PacerState::ACTIVE_UNLIMITED: return "ACTIVE_UNLIMITED";
        case PacerState::ACTIVE_BOUNDED: return "ACTIVE_BOUNDED";
        case PacerState::STOPPED: return "STOPPED";
        default: return "UNKNOWN";
    }
}
