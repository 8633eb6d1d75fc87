#include "../include/Prediction.hpp"
#include <algorithm>
#include <cmath>

namespace lansync {

namespace {

// Floating modulo into [0, extent)
double wrapCoordinate(double value, int extent) {
    double wrapped = std::fmod(value, static_cast<double>(extent));
    if (wrapped < 0.0) {
        wrapped += extent;
    }
    return wrapped;
}

int wrapCell(int value, int extent) {
    int wrapped = value % extent;
    return wrapped < 0 ? wrapped + extent : wrapped;
}

// Shift one endpoint by a full extent when the raw delta is longer than half the grid
void unwrapAxis(double& from, double& to, int extent) {
    double delta = to - from;
    if (std::abs(delta) > extent / 2) {
        if (delta > 0) {
            from += extent;
        } else {
            to += extent;
        }
    }
}

} // namespace

std::vector<RenderPos> toRenderPositions(const std::vector<GridPos>& cells) {
    std::vector<RenderPos> positions;
    positions.reserve(cells.size());
    for (const auto& cell : cells) {
        positions.push_back(RenderPos{static_cast<double>(cell.x), static_cast<double>(cell.y)});
    }
    return positions;
}

std::vector<RenderPos> interpolatePositions(const std::vector<GridPos>& before,
                                            const std::vector<GridPos>& after,
                                            double factor, GridSize grid) {
    if (before.empty()) {
        return toRenderPositions(after);
    }
    if (after.empty()) {
        return toRenderPositions(before);
    }

    std::vector<RenderPos> result;
    const std::size_t count = std::max(before.size(), after.size());
    result.reserve(count);

    for (std::size_t i = 0; i < count; ++i) {
        if (i < before.size() && i < after.size()) {
            double fromX = before[i].x;
            double fromY = before[i].y;
            double toX = after[i].x;
            double toY = after[i].y;

            unwrapAxis(fromX, toX, grid.width);
            unwrapAxis(fromY, toY, grid.height);

            result.push_back(RenderPos{
                wrapCoordinate(fromX + (toX - fromX) * factor, grid.width),
                wrapCoordinate(fromY + (toY - fromY) * factor, grid.height)
            });
        } else if (i < after.size()) {
            // Grew: new tail cell shows up as soon as we move towards after
            if (factor > 0.0) {
                result.push_back(RenderPos{static_cast<double>(after[i].x), static_cast<double>(after[i].y)});
            }
        } else if (factor < 0.5) {
            // Shrunk: old tail cell lingers for the first half only
            result.push_back(RenderPos{static_cast<double>(before[i].x), static_cast<double>(before[i].y)});
        }
    }

    return result;
}

GridPos stepCell(GridPos cell, Direction direction, GridSize grid) {
    switch (direction) {
        case Direction::Up:
            return GridPos{cell.x, wrapCell(cell.y - 1, grid.height)};
        case Direction::Down:
            return GridPos{cell.x, wrapCell(cell.y + 1, grid.height)};
        case Direction::Left:
            return GridPos{wrapCell(cell.x - 1, grid.width), cell.y};
        case Direction::Right:
            return GridPos{wrapCell(cell.x + 1, grid.width), cell.y};
    }
    return cell;
}

EntityPredictor::EntityPredictor(GridSize grid, int tickRate, int moveCap)
    : _grid(grid),
      _tickRate(std::max(tickRate, 1)),
      _moveCap(std::max(moveCap, 0)) {
}

void EntityPredictor::onServerUpdate(int entityId, std::vector<GridPos> positions, Direction facing,
                                     bool active, int64_t tick, Clock::time_point now) {
    Record record;
    record.predictedPositions = positions;
    record.lastKnownPositions = std::move(positions);
    record.facing = facing;
    record.active = active;
    record.lastServerTick = tick;
    record.lastUpdate = now;
    record.movesAlreadyPredicted = 0;
    _records[entityId] = std::move(record);
}

std::optional<std::vector<GridPos>> EntityPredictor::predict(int entityId, int moveIntervalTicks,
                                                             Clock::time_point now) {
    auto it = _records.find(entityId);
    if (it == _records.end() || it->second.lastKnownPositions.empty()) {
        return std::nullopt;
    }

    Record& record = it->second;
    // Inactive entities are frozen where the host left them, not dropped; hiding them is the renderer's call
    if (!record.active) {
        return record.lastKnownPositions;
    }

    const int interval = std::max(moveIntervalTicks, 1);
    const double elapsed = std::max(0.0, std::chrono::duration<double>(now - record.lastUpdate).count());
    const int expectedMoves = static_cast<int>(std::floor(elapsed * _tickRate / interval));

    // The cap bounds the total guess, not just one call
    const int targetMoves = std::min(expectedMoves, _moveCap);
    const int movesToApply = targetMoves - record.movesAlreadyPredicted;

    for (int move = 0; move < movesToApply; ++move) {
        auto& chain = record.predictedPositions;
        chain.insert(chain.begin(), stepCell(chain.front(), record.facing, _grid));
        chain.pop_back();
    }
    if (movesToApply > 0) {
        record.movesAlreadyPredicted = targetMoves;
    }

    return record.predictedPositions;
}

const EntityPredictor::Record* EntityPredictor::find(int entityId) const {
    auto it = _records.find(entityId);
    return it == _records.end() ? nullptr : &it->second;
}

} // namespace lansync
