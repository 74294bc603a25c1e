#pragma once

#include "ClientResult.hpp"

#include <mutex>

// NotStarted -> Started -> Stopping -> Stopped. No step goes back.
enum class SessionState {
    NotStarted,
    Started,
    Stopping,
    Stopped
};

const char* ToString(SessionState state);

// Returns Ok when `from -> to` is a legal step, otherwise the lifecycle
// error a caller asking for `to` should see.
ClientErrorCode CheckTransition(SessionState from, SessionState to);

class SessionStateMachine {
public:
    SessionState Current() const;

    // Applies the step or returns the lifecycle error without changing state.
    ClientResult TransitionTo(SessionState next);

private:
    mutable std::mutex mutex_;
    SessionState state_ = SessionState::NotStarted;
};
