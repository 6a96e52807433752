// src/core/state_machine.h
#pragma once
#include <string>

enum class PacerState {
    UNCONFIGURED,
    ACTIVE_UNLIMITED,
    ACTIVE_BOUNDED,
    STOPPED
};

class StateMachine {
public:
    StateMachine();
    PacerState get_current_state() const;
    // Returns false when the transition is refused (STOPPED is terminal).
    bool set_state(PacerState new_state);
    bool is_active() const;
    std::string state_to_string(PacerState state) const;

private:
    PacerState m_current_state;
};
