#pragma once

#include <string>

#include "BreakerStatus.hpp"
#include "StatCounter.hpp"

struct TransitionEvent {
    std::string service_identity;
    BreakerStatus previous_status;
    BreakerStatus new_status;
    StatCounter stats;
};
