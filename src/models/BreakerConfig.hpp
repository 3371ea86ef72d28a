#pragma once

#include <chrono>

struct BreakerConfig {
    int failure_threshold = 50;   // percent, 0-100
    unsigned int min_requests = 3;
    std::chrono::seconds consideration_window = std::chrono::minutes(15);
    bool enabled = true;
};
