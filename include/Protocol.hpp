#pragma once

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <variant>
#include <vector>

#include <nlohmann/json.hpp>

namespace lansync {

// Direction an entity is heading on the grid
enum class Direction : uint8_t {
    Up = 0,
    Down = 1,
    Left = 2,
    Right = 3
};

const char* directionName(Direction direction);
std::optional<Direction> parseDirection(const std::string& name);

// One grid cell
struct GridPos {
    int x;
    int y;

    bool operator==(const GridPos& other) const { return x == other.x && y == other.y; }
    bool operator!=(const GridPos& other) const { return !(*this == other); }
};

// Authoritative state of one entity at one tick
struct EntitySnapshot {
    int entityId = 0;
    std::vector<GridPos> positions;     // Head first
    Direction facing = Direction::Right;
    bool active = true;
    int meta = 0;                       // Small per-entity value (remaining lives...)
};

struct LooseItem {
    GridPos pos{0, 0};
    std::string kind;
};

struct PendingSpawn {
    int entityId = 0;
    GridPos pos{0, 0};
    int countdown = 0;
};

// Everything the host knows about the world at one tick
struct WorldSnapshot {
    std::vector<EntitySnapshot> entities;
    std::vector<LooseItem> looseItems;
    std::vector<PendingSpawn> pendingSpawns;
    int64_t tick = 0;

    const EntitySnapshot* findEntity(int entityId) const;
};

// Client -> Host
struct InputMessage {
    int entityId = 0;
    Direction direction = Direction::Right;
};

struct ReadyMessage {};

// Host -> Client
struct WorldSnapshotMessage {
    WorldSnapshot snapshot;
};

struct GameStartMessage {
    int participantCount = 0;
    std::optional<nlohmann::json> config;
    std::optional<nlohmann::json> level;
};

struct GameEndMessage {
    std::optional<int> winnerId;        // nullopt means draw
    std::vector<int> scores;
};

struct PlayerAssignedMessage {
    int entityId = 0;
};

struct LobbyStateMessage {
    nlohmann::json settings = nlohmann::json::object();
    int connectedCount = 0;
};

struct ReturnToLobbyMessage {};

// Bidirectional
struct PingMessage {
    int64_t timestamp = 0;
};

struct PongMessage {
    int64_t timestamp = 0;
};

struct DisconnectMessage {
    std::string reason;
};

using Message = std::variant<
    InputMessage,
    ReadyMessage,
    WorldSnapshotMessage,
    GameStartMessage,
    GameEndMessage,
    PlayerAssignedMessage,
    LobbyStateMessage,
    ReturnToLobbyMessage,
    PingMessage,
    PongMessage,
    DisconnectMessage
>;

/**
 * @brief Raised when a record is not valid JSON, has an unknown type,
 * or misses a required field. Callers drop the offending line.
 */
class MalformedMessage : public std::runtime_error {
public:
    explicit MalformedMessage(const std::string& what) : std::runtime_error(what) {}
};

// Wire name of the message ("world_snapshot", "input"...)
const char* messageTypeName(const Message& message);

// Serialise to a single JSON record, without the trailing newline. Invalid UTF-8 becomes U+FFFD;
// anything else json cannot write is reported as MalformedMessage.
std::string encodeMessage(const Message& message);

// Parse one record; throws MalformedMessage
Message decodeMessage(const std::string& line);

nlohmann::json snapshotToJson(const WorldSnapshot& snapshot);
WorldSnapshot snapshotFromJson(const nlohmann::json& json);

// Milliseconds since epoch, used as ping timestamp
int64_t currentTimestampMs();

} // namespace lansync
