#include "StatCounter.hpp"

#include <cmath>
#include <limits>
#include <sstream>

void StatCounter::add(BreakerEvent event, int delta) {
    switch (event) {
        case BreakerEvent::SUCCESS:
            addSuccess(delta);
            break;
        case BreakerEvent::FAILURE:
            addFailure(delta);
            break;
        case BreakerEvent::REJECTION:
            addRejection(delta);
            break;
    }
}

int StatCounter::getSuccessRatio() const {
    const unsigned long sent = getRequestsSentToService();
    if (sent == 0) {
        return 100;
    }
    return static_cast<int>(std::lround(static_cast<double>(successes_) * 100.0 / static_cast<double>(sent)));
}

std::string StatCounter::to_string() const {
    std::ostringstream oss;
    oss << "successes " << successes_
        << ", failures " << failures_
        << ", rejections " << rejections_;
    return oss.str();
}

json StatCounter::to_json() const {
    return json{
        {"successes", successes_},
        {"failures", failures_},
        {"rejections", rejections_}
    };
}

// Throws json::exception when a field is missing or not a number.
StatCounter StatCounter::from_json(const json& j) {
    const unsigned int successes = j.at("successes").get<unsigned int>();
    const unsigned int failures = j.at("failures").get<unsigned int>();
    const unsigned int rejections = j.at("rejections").get<unsigned int>();
    return StatCounter(successes, failures, rejections);
}

unsigned int StatCounter::clampedAdd(unsigned int value, int delta) {
    long long result = static_cast<long long>(value) + delta;
    if (result < 0) {
        return 0;
    }
    if (result > std::numeric_limits<unsigned int>::max()) {
        return std::numeric_limits<unsigned int>::max();
    }
    return static_cast<unsigned int>(result);
}
