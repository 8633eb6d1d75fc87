#include "../include/Synchronizer.hpp"
#include <iostream>

namespace lansync {

Synchronizer::Synchronizer(SyncConfig config)
    : _config(std::move(config)),
      _buffer(_config.bufferCapacity, _config.extrapolationWindow, _config.extrapolationFactorCap),
      _predictor(_config.grid, _config.tickRate, _config.predictionMoveCap),
      _enabled(true),
      _interpolations(0),
      _extrapolations(0),
      _predictions(0) {
}

bool Synchronizer::ingest(const WorldSnapshot& snapshot, int64_t tick, Clock::time_point now) {
    if (!_buffer.addSnapshot(snapshot, tick, now)) {
        return false;
    }

    for (const auto& entity : snapshot.entities) {
        _predictor.onServerUpdate(entity.entityId, entity.positions, entity.facing,
                                  entity.active, tick, now);
    }
    return true;
}

std::optional<std::vector<RenderPos>> Synchronizer::positionsFor(int entityId, int moveIntervalTicks,
                                                                 Clock::time_point now) {
    auto latest = _buffer.latest();

    if (!_enabled) {
        if (latest) {
            if (const EntitySnapshot* entity = latest->findEntity(entityId)) {
                return toRenderPositions(entity->positions);
            }
        }
        return std::nullopt;
    }

    if (auto state = _buffer.getRenderState(_config.bufferDelay, now)) {
        if (const EntitySnapshot* before = state->before->findEntity(entityId)) {
            const EntitySnapshot* after = state->after ? state->after->findEntity(entityId) : nullptr;
            if (!after || state->factor == 0.0) {
                return toRenderPositions(before->positions);
            }

            if (state->factor > 1.0) {
                _extrapolations++;
            } else {
                _interpolations++;
            }
            return interpolatePositions(before->positions, after->positions, state->factor, _config.grid);
        }

        // Gone from the newest snapshot: nothing to guess
        if (latest && !latest->findEntity(entityId)) {
            return std::nullopt;
        }
    }

    // No buffered state covers this entity yet
    if (auto predicted = _predictor.predict(entityId, moveIntervalTicks, now)) {
        _predictions++;
        return toRenderPositions(*predicted);
    }
    return std::nullopt;
}

bool Synchronizer::isStale(std::chrono::milliseconds maxAge, Clock::time_point now) const {
    auto elapsed = _buffer.secondsSinceLastUpdate(now);
    if (!elapsed) {
        return true;
    }
    return *elapsed > std::chrono::duration<double>(maxAge).count();
}

std::optional<EntitySnapshot> Synchronizer::latestEntity(int entityId) const {
    auto latest = _buffer.latest();
    if (!latest) {
        return std::nullopt;
    }
    if (const EntitySnapshot* entity = latest->findEntity(entityId)) {
        return *entity;
    }
    return std::nullopt;
}

SyncStats Synchronizer::stats(Clock::time_point now) const {
    SyncStats stats;
    stats.interpolations = _interpolations;
    stats.extrapolations = _extrapolations;
    stats.predictions = _predictions;
    stats.bufferSize = _buffer.size();
    stats.secondsSinceUpdate = _buffer.secondsSinceLastUpdate(now);
    return stats;
}

void Synchronizer::reset() {
    _buffer.clear();
    _predictor.clear();
    _interpolations = 0;
    _extrapolations = 0;
    _predictions = 0;
    std::cout << "[Sync] Reset" << std::endl;
}

} // namespace lansync
