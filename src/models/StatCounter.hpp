#ifndef STATCOUNTER_HPP
#define STATCOUNTER_HPP

#include <string>

#include <nlohmann/json.hpp>

#include "BreakerStatus.hpp"

using json = nlohmann::json;

// Success / failure / rejection counts for one service identity.
// Fields never go below zero: a negative delta clamps at 0.
class StatCounter {
public:
    StatCounter() = default;
    StatCounter(unsigned int successes, unsigned int failures, unsigned int rejections)
        : successes_(successes), failures_(failures), rejections_(rejections) {}

    unsigned int getSuccesses() const { return successes_; }
    unsigned int getFailures() const { return failures_; }
    unsigned int getRejections() const { return rejections_; }

    void addSuccess(int delta = 1) { successes_ = clampedAdd(successes_, delta); }
    void addFailure(int delta = 1) { failures_ = clampedAdd(failures_, delta); }
    void addRejection(int delta = 1) { rejections_ = clampedAdd(rejections_, delta); }
    void add(BreakerEvent event, int delta = 1);

    // Calls that actually reached the service.
    unsigned long getRequestsSentToService() const {
        return static_cast<unsigned long>(successes_) + failures_;
    }

    unsigned long getTotalAttempted() const {
        return getRequestsSentToService() + rejections_;
    }

    // 0-100, rounded. 100 when nothing reached the service yet.
    int getSuccessRatio() const;
    int getFailureRatio() const { return 100 - getSuccessRatio(); }

    bool isEmpty() const { return getTotalAttempted() == 0; }

    std::string to_string() const;
    json to_json() const;
    static StatCounter from_json(const json& j);

    bool operator==(const StatCounter& other) const {
        return successes_ == other.successes_
            && failures_ == other.failures_
            && rejections_ == other.rejections_;
    }
    bool operator!=(const StatCounter& other) const { return !(*this == other); }

private:
    static unsigned int clampedAdd(unsigned int value, int delta);

    unsigned int successes_ = 0;
    unsigned int failures_ = 0;
    unsigned int rejections_ = 0;
};

#endif // STATCOUNTER_HPP
