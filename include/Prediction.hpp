#pragma once

#include "Config.hpp"
#include "Protocol.hpp"
#include <chrono>
#include <cstdint>
#include <optional>
#include <unordered_map>
#include <vector>

namespace lansync {

// Fractional grid position handed to the renderer
struct RenderPos {
    double x;
    double y;
};

std::vector<RenderPos> toRenderPositions(const std::vector<GridPos>& cells);

/**
 * @brief Blend two chains of cells of the same entity.
 *
 * Each axis takes the short way around the wrapping grid and the result is
 * wrapped back into [0, extent). Cells only present in after appear once
 * factor > 0; cells only present in before survive while factor < 0.5.
 */
std::vector<RenderPos> interpolatePositions(const std::vector<GridPos>& before,
                                            const std::vector<GridPos>& after,
                                            double factor, GridSize grid);

// Neighbour cell in the given direction, wrapping at the grid edges
GridPos stepCell(GridPos cell, Direction direction, GridSize grid);

/**
 * @brief Dead reckoning for head driven chains (snake-like entities).
 *
 * Only used when no buffered snapshot can answer for an entity. At most
 * moveCap moves are guessed past the last authoritative state.
 */
class EntityPredictor {
public:
    using Clock = std::chrono::steady_clock;

    struct Record {
        std::vector<GridPos> lastKnownPositions;
        std::vector<GridPos> predictedPositions;
        Direction facing;
        bool active;
        int64_t lastServerTick;
        Clock::time_point lastUpdate;
        int movesAlreadyPredicted;
    };

    explicit EntityPredictor(GridSize grid = {}, int tickRate = 60, int moveCap = 5);

    // Replaces the whole record for entityId
    void onServerUpdate(int entityId, std::vector<GridPos> positions, Direction facing,
                        bool active, int64_t tick, Clock::time_point now = Clock::now());

    std::optional<std::vector<GridPos>> predict(int entityId, int moveIntervalTicks,
                                                Clock::time_point now = Clock::now());

    const Record* find(int entityId) const;
    std::size_t size() const { return _records.size(); }
    void clear() { _records.clear(); }

private:
    GridSize _grid;
    int _tickRate;
    int _moveCap;
    std::unordered_map<int, Record> _records;
};

} // namespace lansync
