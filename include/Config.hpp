#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>

namespace lansync {

// Grid extent used for wrap-around (cells)
struct GridSize {
    int width = 15;
    int height = 15;
};

/**
 * @brief Every tunable of the synchronisation layer, with its default.
 *
 * Values can be overridden one by one with applyOption("key=value").
 */
struct SyncConfig {
    // Discovery
    uint16_t discoveryPort = 50000;
    std::string broadcastAddress = "255.255.255.255";
    std::chrono::milliseconds heartbeatInterval{1000};
    std::chrono::milliseconds serverTtl{5000};
    std::chrono::milliseconds listenerTimeout{500};

    // Game connection
    uint16_t gamePort = 5555;
    int maxPlayers = 4;                               // Host included
    std::chrono::milliseconds connectTimeout{5000};
    std::chrono::milliseconds writeTimeout{2000};

    // Smoothing
    std::chrono::milliseconds bufferDelay{80};
    std::size_t bufferCapacity = 30;
    std::chrono::milliseconds extrapolationWindow{500};
    double extrapolationFactorCap = 1.5;
    int predictionMoveCap = 5;
    int tickRate = 60;
    std::chrono::milliseconds staleAfter{500};
    GridSize grid;
};

// Apply a single "key=value" override. Returns false for unknown keys or bad values.
bool applyOption(SyncConfig& config, const std::string& option);

// Human readable dump of the active configuration
std::string describeConfig(const SyncConfig& config);

} // namespace lansync
