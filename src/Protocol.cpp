#include "../include/Protocol.hpp"
#include <chrono>
#include <type_traits>

namespace lansync {

namespace {

using nlohmann::json;

template <typename>
constexpr bool always_false = false;

// Message type names on the wire
constexpr const char* TYPE_INPUT = "input";
constexpr const char* TYPE_READY = "ready";
constexpr const char* TYPE_WORLD_SNAPSHOT = "world_snapshot";
constexpr const char* TYPE_GAME_START = "game_start";
constexpr const char* TYPE_GAME_END = "game_end";
constexpr const char* TYPE_PLAYER_ASSIGNED = "player_assigned";
constexpr const char* TYPE_LOBBY_STATE = "lobby_state";
constexpr const char* TYPE_RETURN_TO_LOBBY = "return_to_lobby";
constexpr const char* TYPE_PING = "ping";
constexpr const char* TYPE_PONG = "pong";
constexpr const char* TYPE_DISCONNECT = "disconnect";

const json& requireField(const json& record, const char* key) {
    auto it = record.find(key);
    if (it == record.end()) {
        throw MalformedMessage(std::string("missing field '") + key + "'");
    }
    return *it;
}

int64_t requireInt(const json& record, const char* key) {
    const json& value = requireField(record, key);
    if (!value.is_number_integer()) {
        throw MalformedMessage(std::string("field '") + key + "' is not an integer");
    }
    return value.get<int64_t>();
}

bool requireBool(const json& record, const char* key) {
    const json& value = requireField(record, key);
    if (!value.is_boolean()) {
        throw MalformedMessage(std::string("field '") + key + "' is not a boolean");
    }
    return value.get<bool>();
}

std::string requireString(const json& record, const char* key) {
    const json& value = requireField(record, key);
    if (!value.is_string()) {
        throw MalformedMessage(std::string("field '") + key + "' is not a string");
    }
    return value.get<std::string>();
}

const json& requireArray(const json& record, const char* key) {
    const json& value = requireField(record, key);
    if (!value.is_array()) {
        throw MalformedMessage(std::string("field '") + key + "' is not an array");
    }
    return value;
}

Direction requireDirection(const json& record, const char* key) {
    std::string name = requireString(record, key);
    auto direction = parseDirection(name);
    if (!direction) {
        throw MalformedMessage("unknown direction '" + name + "'");
    }
    return *direction;
}

json cellToJson(const GridPos& pos) {
    return json::array({pos.x, pos.y});
}

GridPos cellFromJson(const json& value) {
    if (!value.is_array() || value.size() != 2 ||
        !value[0].is_number_integer() || !value[1].is_number_integer()) {
        throw MalformedMessage("grid cell must be [x, y]");
    }
    return GridPos{value[0].get<int>(), value[1].get<int>()};
}

// Optional fields may be absent or null, but not of the wrong type
std::optional<json> optionalField(const json& record, const char* key) {
    auto it = record.find(key);
    if (it == record.end() || it->is_null()) {
        return std::nullopt;
    }
    return *it;
}

} // namespace

const char* directionName(Direction direction) {
    switch (direction) {
        case Direction::Up: return "UP";
        case Direction::Down: return "DOWN";
        case Direction::Left: return "LEFT";
        case Direction::Right: return "RIGHT";
    }
    return "RIGHT";
}

std::optional<Direction> parseDirection(const std::string& name) {
    if (name == "UP") return Direction::Up;
    if (name == "DOWN") return Direction::Down;
    if (name == "LEFT") return Direction::Left;
    if (name == "RIGHT") return Direction::Right;
    return std::nullopt;
}

const EntitySnapshot* WorldSnapshot::findEntity(int entityId) const {
    for (const auto& entity : entities) {
        if (entity.entityId == entityId) {
            return &entity;
        }
    }
    return nullptr;
}

json snapshotToJson(const WorldSnapshot& snapshot) {
    json entities = json::array();
    for (const auto& entity : snapshot.entities) {
        json cells = json::array();
        for (const auto& pos : entity.positions) {
            cells.push_back(cellToJson(pos));
        }
        entities.push_back({
            {"id", entity.entityId},
            {"pos", cells},
            {"facing", directionName(entity.facing)},
            {"active", entity.active},
            {"meta", entity.meta}
        });
    }

    json items = json::array();
    for (const auto& item : snapshot.looseItems) {
        items.push_back({{"pos", cellToJson(item.pos)}, {"kind", item.kind}});
    }

    json spawns = json::array();
    for (const auto& spawn : snapshot.pendingSpawns) {
        spawns.push_back({
            {"id", spawn.entityId},
            {"pos", cellToJson(spawn.pos)},
            {"countdown", spawn.countdown}
        });
    }

    return {
        {"tick", snapshot.tick},
        {"entities", entities},
        {"items", items},
        {"spawns", spawns}
    };
}

WorldSnapshot snapshotFromJson(const json& record) {
    WorldSnapshot snapshot;
    snapshot.tick = requireInt(record, "tick");

    for (const auto& entry : requireArray(record, "entities")) {
        EntitySnapshot entity;
        entity.entityId = static_cast<int>(requireInt(entry, "id"));
        for (const auto& cell : requireArray(entry, "pos")) {
            entity.positions.push_back(cellFromJson(cell));
        }
        entity.facing = requireDirection(entry, "facing");
        entity.active = requireBool(entry, "active");
        // meta is optional on the wire, older hosts did not send it
        if (auto meta = optionalField(entry, "meta")) {
            if (!meta->is_number_integer()) {
                throw MalformedMessage("field 'meta' is not an integer");
            }
            entity.meta = meta->get<int>();
        }
        snapshot.entities.push_back(std::move(entity));
    }

    if (auto items = optionalField(record, "items")) {
        if (!items->is_array()) {
            throw MalformedMessage("field 'items' is not an array");
        }
        for (const auto& entry : *items) {
            snapshot.looseItems.push_back(
                LooseItem{cellFromJson(requireField(entry, "pos")), requireString(entry, "kind")});
        }
    }

    if (auto spawns = optionalField(record, "spawns")) {
        if (!spawns->is_array()) {
            throw MalformedMessage("field 'spawns' is not an array");
        }
        for (const auto& entry : *spawns) {
            PendingSpawn spawn;
            spawn.entityId = static_cast<int>(requireInt(entry, "id"));
            spawn.pos = cellFromJson(requireField(entry, "pos"));
            spawn.countdown = static_cast<int>(requireInt(entry, "countdown"));
            snapshot.pendingSpawns.push_back(spawn);
        }
    }

    return snapshot;
}

const char* messageTypeName(const Message& message) {
    return std::visit([](const auto& msg) -> const char* {
        using T = std::decay_t<decltype(msg)>;
        if constexpr (std::is_same_v<T, InputMessage>) return TYPE_INPUT;
        else if constexpr (std::is_same_v<T, ReadyMessage>) return TYPE_READY;
        else if constexpr (std::is_same_v<T, WorldSnapshotMessage>) return TYPE_WORLD_SNAPSHOT;
        else if constexpr (std::is_same_v<T, GameStartMessage>) return TYPE_GAME_START;
        else if constexpr (std::is_same_v<T, GameEndMessage>) return TYPE_GAME_END;
        else if constexpr (std::is_same_v<T, PlayerAssignedMessage>) return TYPE_PLAYER_ASSIGNED;
        else if constexpr (std::is_same_v<T, LobbyStateMessage>) return TYPE_LOBBY_STATE;
        else if constexpr (std::is_same_v<T, ReturnToLobbyMessage>) return TYPE_RETURN_TO_LOBBY;
        else if constexpr (std::is_same_v<T, PingMessage>) return TYPE_PING;
        else if constexpr (std::is_same_v<T, PongMessage>) return TYPE_PONG;
        else if constexpr (std::is_same_v<T, DisconnectMessage>) return TYPE_DISCONNECT;
        else static_assert(always_false<T>, "unhandled message kind");
    }, message);
}

std::string encodeMessage(const Message& message) {
    json record = std::visit([](const auto& msg) -> json {
        using T = std::decay_t<decltype(msg)>;
        if constexpr (std::is_same_v<T, InputMessage>) {
            return {{"entity_id", msg.entityId}, {"direction", directionName(msg.direction)}};
        } else if constexpr (std::is_same_v<T, WorldSnapshotMessage>) {
            return snapshotToJson(msg.snapshot);
        } else if constexpr (std::is_same_v<T, GameStartMessage>) {
            json body = {{"participant_count", msg.participantCount}};
            if (msg.config) body["config"] = *msg.config;
            if (msg.level) body["level"] = *msg.level;
            return body;
        } else if constexpr (std::is_same_v<T, GameEndMessage>) {
            json winner = msg.winnerId ? json(*msg.winnerId) : json(nullptr);
            return {{"winner", winner}, {"scores", msg.scores}};
        } else if constexpr (std::is_same_v<T, PlayerAssignedMessage>) {
            return {{"entity_id", msg.entityId}};
        } else if constexpr (std::is_same_v<T, LobbyStateMessage>) {
            return {{"settings", msg.settings}, {"connected_count", msg.connectedCount}};
        } else if constexpr (std::is_same_v<T, PingMessage> || std::is_same_v<T, PongMessage>) {
            return {{"timestamp", msg.timestamp}};
        } else if constexpr (std::is_same_v<T, DisconnectMessage>) {
            return {{"reason", msg.reason}};
        } else {
            // READY and RETURN_TO_LOBBY carry no fields
            return json::object();
        }
    }, message);

    record["type"] = messageTypeName(message);
    // dump() escapes control characters so the record never contains a raw newline.
    // Invalid UTF-8 from a caller's string becomes U+FFFD instead of throwing.
    try {
        return record.dump(-1, ' ', false, json::error_handler_t::replace);
    } catch (const json::exception& e) {
        throw MalformedMessage(std::string("cannot encode ") + messageTypeName(message) + ": " + e.what());
    }
}

Message decodeMessage(const std::string& line) {
    json record;
    try {
        record = json::parse(line);
    } catch (const json::parse_error& e) {
        throw MalformedMessage(std::string("invalid JSON: ") + e.what());
    }

    if (!record.is_object()) {
        throw MalformedMessage("record is not an object");
    }

    std::string type = requireString(record, "type");

    if (type == TYPE_INPUT) {
        return InputMessage{static_cast<int>(requireInt(record, "entity_id")),
                            requireDirection(record, "direction")};
    }
    if (type == TYPE_READY) {
        return ReadyMessage{};
    }
    if (type == TYPE_WORLD_SNAPSHOT) {
        return WorldSnapshotMessage{snapshotFromJson(record)};
    }
    if (type == TYPE_GAME_START) {
        GameStartMessage msg;
        msg.participantCount = static_cast<int>(requireInt(record, "participant_count"));
        msg.config = optionalField(record, "config");
        msg.level = optionalField(record, "level");
        return msg;
    }
    if (type == TYPE_GAME_END) {
        GameEndMessage msg;
        const json& winner = requireField(record, "winner");
        if (winner.is_number_integer()) {
            msg.winnerId = winner.get<int>();
        } else if (!winner.is_null()) {
            throw MalformedMessage("field 'winner' must be an integer or null");
        }
        for (const auto& score : requireArray(record, "scores")) {
            if (!score.is_number_integer()) {
                throw MalformedMessage("scores must be integers");
            }
            msg.scores.push_back(score.get<int>());
        }
        return msg;
    }
    if (type == TYPE_PLAYER_ASSIGNED) {
        return PlayerAssignedMessage{static_cast<int>(requireInt(record, "entity_id"))};
    }
    if (type == TYPE_LOBBY_STATE) {
        LobbyStateMessage msg;
        msg.settings = requireField(record, "settings");
        msg.connectedCount = static_cast<int>(requireInt(record, "connected_count"));
        return msg;
    }
    if (type == TYPE_RETURN_TO_LOBBY) {
        return ReturnToLobbyMessage{};
    }
    if (type == TYPE_PING) {
        return PingMessage{requireInt(record, "timestamp")};
    }
    if (type == TYPE_PONG) {
        return PongMessage{requireInt(record, "timestamp")};
    }
    if (type == TYPE_DISCONNECT) {
        DisconnectMessage msg;
        if (auto reason = optionalField(record, "reason"); reason && reason->is_string()) {
            msg.reason = reason->get<std::string>();
        }
        return msg;
    }

    throw MalformedMessage("unknown message type '" + type + "'");
}

int64_t currentTimestampMs() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()
    ).count();
}

} // namespace lansync
