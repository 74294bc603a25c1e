#include "SessionState.hpp"

#include <string>

const char* ToString(SessionState state) {
    switch (state) {
        case SessionState::NotStarted: return "NotStarted";
        case SessionState::Started: return "Started";
        case SessionState::Stopping: return "Stopping";
        case SessionState::Stopped: return "Stopped";
    }
    return "Unknown";
}

ClientErrorCode CheckTransition(SessionState from, SessionState to) {
    switch (to) {
        case SessionState::NotStarted:
            return ClientErrorCode::AlreadyStarted;
        case SessionState::Started:
            return from == SessionState::NotStarted ? ClientErrorCode::Ok : ClientErrorCode::AlreadyStarted;
        case SessionState::Stopping:
            if (from == SessionState::Started) {
                return ClientErrorCode::Ok;
            }
            return from == SessionState::NotStarted ? ClientErrorCode::NotRunning : ClientErrorCode::AlreadyStopped;
        case SessionState::Stopped:
            if (from == SessionState::Stopping) {
                return ClientErrorCode::Ok;
            }
            return from == SessionState::Stopped ? ClientErrorCode::AlreadyStopped : ClientErrorCode::NotRunning;
    }
    return ClientErrorCode::NotRunning;
}

SessionState SessionStateMachine::Current() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

ClientResult SessionStateMachine::TransitionTo(SessionState next) {
    std::lock_guard<std::mutex> lock(mutex_);
    const ClientErrorCode code = CheckTransition(state_, next);
    if (code != ClientErrorCode::Ok) {
        return ClientResult::Failure(
            code,
            std::string("cannot move from ") + ToString(state_) + " to " + ToString(next));
    }

    state_ = next;
    return ClientResult::Success();
}
