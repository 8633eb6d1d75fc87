#pragma once

#include "Config.hpp"
#include "Prediction.hpp"
#include "StateBuffer.hpp"
#include "Protocol.hpp"
#include <chrono>
#include <cstdint>
#include <optional>
#include <vector>

namespace lansync {

struct SyncStats {
    uint64_t interpolations = 0;
    uint64_t extrapolations = 0;
    uint64_t predictions = 0;
    std::size_t bufferSize = 0;
    std::optional<double> secondsSinceUpdate;
};

/**
 * @brief The only object the simulation and the renderer talk to.
 *
 * ingest() once per snapshot received, positionsFor() once per frame and
 * entity. Both must be called from the same thread.
 */
class Synchronizer {
public:
    using Clock = std::chrono::steady_clock;

    explicit Synchronizer(SyncConfig config = {});

    // Feeds the state buffer and every entity's prediction record. False for stale ticks.
    bool ingest(const WorldSnapshot& snapshot, int64_t tick, Clock::time_point now = Clock::now());

    // Smoothed positions; nullopt when the entity was never seen
    std::optional<std::vector<RenderPos>> positionsFor(int entityId, int moveIntervalTicks = 16,
                                                       Clock::time_point now = Clock::now());

    bool isStale(std::chrono::milliseconds maxAge, Clock::time_point now = Clock::now()) const;
    bool isStale(Clock::time_point now = Clock::now()) const { return isStale(_config.staleAfter, now); }

    // Newest authoritative record of an entity (facing, active, meta)
    std::optional<EntitySnapshot> latestEntity(int entityId) const;

    // When disabled, positionsFor returns the newest snapshot without smoothing
    void setEnabled(bool enabled) { _enabled = enabled; }
    bool isEnabled() const { return _enabled; }

    SyncStats stats(Clock::time_point now = Clock::now()) const;
    double estimatedTickInterval() const { return _buffer.estimatedTickInterval(); }

    void reset();

    const StateBuffer& buffer() const { return _buffer; }

private:
    SyncConfig _config;
    StateBuffer _buffer;
    EntityPredictor _predictor;
    bool _enabled;

    uint64_t _interpolations;
    uint64_t _extrapolations;
    uint64_t _predictions;
};

} // namespace lansync
