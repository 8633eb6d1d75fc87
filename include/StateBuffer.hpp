#pragma once

#include "Protocol.hpp"
#include <chrono>
#include <cstdint>
#include <deque>
#include <memory>
#include <optional>

namespace lansync {

/**
 * @brief What to draw at one instant.
 *
 * factor 0 or no after snapshot: draw before as is.
 * 0 < factor <= 1: blend before -> after.
 * factor > 1: extrapolate past after (capped).
 */
struct RenderState {
    std::shared_ptr<const WorldSnapshot> before;
    std::shared_ptr<const WorldSnapshot> after;
    double factor = 0.0;
};

/**
 * @brief Bounded, tick ordered history of received world snapshots.
 *
 * Not thread safe: owned by the thread that renders.
 */
class StateBuffer {
public:
    using Clock = std::chrono::steady_clock;

    struct Entry {
        std::shared_ptr<const WorldSnapshot> snapshot;
        int64_t tick;
        Clock::time_point receivedAt;
    };

    explicit StateBuffer(std::size_t capacity = 30,
                         std::chrono::milliseconds extrapolationWindow = std::chrono::milliseconds(500),
                         double extrapolationCap = 1.5);

    // False (and nothing stored) unless tick is newer than every stored tick
    bool addSnapshot(WorldSnapshot snapshot, int64_t tick, Clock::time_point now = Clock::now());

    std::optional<RenderState> getRenderState(std::chrono::milliseconds bufferDelay,
                                              Clock::time_point now = Clock::now()) const;

    std::shared_ptr<const WorldSnapshot> latest() const;
    std::optional<int64_t> lastTick() const;

    // Seconds since the newest snapshot arrived; nullopt when nothing ever arrived
    std::optional<double> secondsSinceLastUpdate(Clock::time_point now = Clock::now()) const;

    // Smoothed seconds per host tick, diagnostics only
    double estimatedTickInterval() const { return _estimatedTickInterval; }

    const std::deque<Entry>& entries() const { return _entries; }
    std::size_t size() const { return _entries.size(); }
    std::size_t capacity() const { return _capacity; }
    bool empty() const { return _entries.empty(); }
    void clear();

private:
    std::size_t _capacity;
    std::chrono::milliseconds _extrapolationWindow;
    double _extrapolationCap;

    std::deque<Entry> _entries;
    std::optional<int64_t> _lastTick;
    std::optional<Clock::time_point> _lastReceive;
    double _estimatedTickInterval;
};

} // namespace lansync
