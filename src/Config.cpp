#include "../include/Config.hpp"
#include <cmath>
#include <functional>
#include <iostream>
#include <map>
#include <sstream>

namespace lansync {

namespace {

using Setter = std::function<void(SyncConfig&, const std::string&)>;

long parseNumber(const std::string& value, long minValue, long maxValue) {
    std::size_t consumed = 0;
    long number = std::stol(value, &consumed);
    if (consumed != value.size() || number < minValue || number > maxValue) {
        throw std::out_of_range(value);
    }
    return number;
}

// stod accepts "nan" and "inf", which no option can use
double parseReal(const std::string& value, double minValue) {
    std::size_t consumed = 0;
    double number = std::stod(value, &consumed);
    if (consumed != value.size() || !std::isfinite(number) || number < minValue) {
        throw std::out_of_range(value);
    }
    return number;
}

std::chrono::milliseconds parseMillis(const std::string& value) {
    return std::chrono::milliseconds(parseNumber(value, 0, 3600 * 1000));
}

const std::map<std::string, Setter>& setters() {
    static const std::map<std::string, Setter> table = {
        {"discovery_port", [](SyncConfig& c, const std::string& v) {
            c.discoveryPort = static_cast<uint16_t>(parseNumber(v, 1, 65535)); }},
        {"broadcast_address", [](SyncConfig& c, const std::string& v) { c.broadcastAddress = v; }},
        {"heartbeat_ms", [](SyncConfig& c, const std::string& v) { c.heartbeatInterval = parseMillis(v); }},
        {"server_ttl_ms", [](SyncConfig& c, const std::string& v) { c.serverTtl = parseMillis(v); }},
        {"listener_timeout_ms", [](SyncConfig& c, const std::string& v) { c.listenerTimeout = parseMillis(v); }},
        {"game_port", [](SyncConfig& c, const std::string& v) {
            c.gamePort = static_cast<uint16_t>(parseNumber(v, 1, 65535)); }},
        {"max_players", [](SyncConfig& c, const std::string& v) {
            c.maxPlayers = static_cast<int>(parseNumber(v, 2, 64)); }},
        {"connect_timeout_ms", [](SyncConfig& c, const std::string& v) { c.connectTimeout = parseMillis(v); }},
        {"write_timeout_ms", [](SyncConfig& c, const std::string& v) { c.writeTimeout = parseMillis(v); }},
        {"buffer_delay_ms", [](SyncConfig& c, const std::string& v) { c.bufferDelay = parseMillis(v); }},
        {"buffer_capacity", [](SyncConfig& c, const std::string& v) {
            c.bufferCapacity = static_cast<std::size_t>(parseNumber(v, 2, 10000)); }},
        {"extrapolation_window_ms", [](SyncConfig& c, const std::string& v) {
            c.extrapolationWindow = parseMillis(v); }},
        {"extrapolation_cap", [](SyncConfig& c, const std::string& v) {
            c.extrapolationFactorCap = parseReal(v, 1.0); }},
        {"prediction_cap", [](SyncConfig& c, const std::string& v) {
            c.predictionMoveCap = static_cast<int>(parseNumber(v, 0, 1000)); }},
        {"tick_rate", [](SyncConfig& c, const std::string& v) {
            c.tickRate = static_cast<int>(parseNumber(v, 1, 1000)); }},
        {"stale_ms", [](SyncConfig& c, const std::string& v) { c.staleAfter = parseMillis(v); }},
        {"grid_width", [](SyncConfig& c, const std::string& v) {
            c.grid.width = static_cast<int>(parseNumber(v, 1, 100000)); }},
        {"grid_height", [](SyncConfig& c, const std::string& v) {
            c.grid.height = static_cast<int>(parseNumber(v, 1, 100000)); }},
    };
    return table;
}

} // namespace

bool applyOption(SyncConfig& config, const std::string& option) {
    size_t equalPos = option.find('=');
    if (equalPos == std::string::npos) {
        std::cerr << "[Config] Expected key=value, got '" << option << "'" << std::endl;
        return false;
    }

    std::string key = option.substr(0, equalPos);
    std::string value = option.substr(equalPos + 1);

    auto it = setters().find(key);
    if (it == setters().end()) {
        std::cerr << "[Config] Unknown option: " << key << std::endl;
        return false;
    }

    try {
        it->second(config, value);
    } catch (const std::exception&) {
        std::cerr << "[Config] Invalid value for " << key << ": '" << value << "'" << std::endl;
        return false;
    }
    return true;
}

std::string describeConfig(const SyncConfig& config) {
    std::ostringstream oss;
    oss << "discovery_port=" << config.discoveryPort
        << " game_port=" << config.gamePort
        << " max_players=" << config.maxPlayers
        << " heartbeat_ms=" << config.heartbeatInterval.count()
        << " server_ttl_ms=" << config.serverTtl.count()
        << " buffer_delay_ms=" << config.bufferDelay.count()
        << " buffer_capacity=" << config.bufferCapacity
        << " extrapolation_cap=" << config.extrapolationFactorCap
        << " prediction_cap=" << config.predictionMoveCap
        << " grid=" << config.grid.width << "x" << config.grid.height;
    return oss.str();
}

} // namespace lansync
