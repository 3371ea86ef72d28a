#ifndef BREAKERSTATUS_HPP
#define BREAKERSTATUS_HPP

#include <string>

// CLOSED and CLOSING let requests through, OPEN rejects them.
// CLOSING is never derived by BreakerEngine::getStatus; listeners still have a
// callback for it.
enum class BreakerStatus {
    CLOSED,
    OPEN,
    CLOSING
};

// Counter field a recorded event increments.
enum class BreakerEvent {
    SUCCESS,
    FAILURE,
    REJECTION
};

inline std::string toString(BreakerStatus status) {
    switch (status) {
        case BreakerStatus::CLOSED: return "CLOSED";
        case BreakerStatus::OPEN: return "OPEN";
        case BreakerStatus::CLOSING: return "CLOSING";
    }
    return "UNKNOWN";
}

inline std::string toString(BreakerEvent event) {
    switch (event) {
        case BreakerEvent::SUCCESS: return "SUCCESS";
        case BreakerEvent::FAILURE: return "FAIL";
        case BreakerEvent::REJECTION: return "REJECT";
    }
    return "UNKNOWN";
}

#endif // BREAKERSTATUS_HPP
