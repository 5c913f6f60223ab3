#pragma once
#include <ctime>
#include <vector>
#include "ReviewEvent.hpp"

// Append-only review log.
class ReviewEventStore {
public:
    virtual ~ReviewEventStore() = default;

    virtual void append(const ReviewEvent& event) = 0;

    // Events with from <= submitted_at <= to, oldest first
    virtual std::vector<ReviewEvent> query(std::time_t from, std::time_t to) const = 0;
};
