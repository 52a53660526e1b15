// event_queue.hpp
// FIFO Event Channel for the Market Replay Engine
// Owned by the orchestrator and handed by reference to every role; single consumer

#pragma once

#include <cstdint>
#include <deque>
#include <optional>
#include <variant>
#include "event_types.hpp"

namespace replay {

// ============================================================================
// Unbounded FIFO queue with statistics
// ============================================================================

// Not synchronized: producers and the consumer all run on the orchestrator
// thread. Asynchronous sources must hand their events to the orchestrator
// (see IExecutionHandler::processPendingEvents) rather than publish directly.
class EventQueue {
private:
    std::deque<EventVariant> buffer_;

    uint64_t next_sequence_ = 1;
    uint64_t total_published_ = 0;
    uint64_t total_consumed_ = 0;
    size_t high_water_mark_ = 0;

public:
    EventQueue() = default;

    EventQueue(const EventQueue&) = delete;
    EventQueue& operator=(const EventQueue&) = delete;

    // Stamps the event with the next sequence id and appends it
    void publish(EventVariant event) {
        std::visit([this](auto& e) { e.sequence_id = next_sequence_; }, event);
        ++next_sequence_;
        buffer_.push_back(std::move(event));
        ++total_published_;
        if (buffer_.size() > high_water_mark_) {
            high_water_mark_ = buffer_.size();
        }
    }

    std::optional<EventVariant> try_consume() {
        if (buffer_.empty()) {
            return std::nullopt;
        }
        EventVariant event = std::move(buffer_.front());
        buffer_.pop_front();
        ++total_consumed_;
        return event;
    }

    bool empty() const { return buffer_.empty(); }
    size_t size() const { return buffer_.size(); }

    void clear() { buffer_.clear(); }

    struct QueueStats {
        uint64_t total_published;
        uint64_t total_consumed;
        size_t current_size;
        size_t high_water_mark;
    };

    QueueStats getStats() const {
        return {total_published_, total_consumed_, buffer_.size(), high_water_mark_};
    }

    void resetStats() {
        total_published_ = 0;
        total_consumed_ = 0;
        high_water_mark_ = buffer_.size();
    }
};

} // namespace replay
