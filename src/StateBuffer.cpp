#include "../include/StateBuffer.hpp"
#include <algorithm>
#include <cmath>

namespace lansync {

namespace {

double toSeconds(StateBuffer::Clock::duration duration) {
    return std::chrono::duration<double>(duration).count();
}

} // namespace

StateBuffer::StateBuffer(std::size_t capacity, std::chrono::milliseconds extrapolationWindow,
                         double extrapolationCap)
    : _capacity(std::max<std::size_t>(capacity, 1)),
      _extrapolationWindow(extrapolationWindow),
      _extrapolationCap(std::isfinite(extrapolationCap) ? std::max(extrapolationCap, 1.0) : 1.0),
      _estimatedTickInterval(1.0 / 60.0) {
}

bool StateBuffer::addSnapshot(WorldSnapshot snapshot, int64_t tick, Clock::time_point now) {
    if (_lastTick && tick <= *_lastTick) {
        return false;
    }

    if (!_entries.empty()) {
        const Entry& previous = _entries.back();
        double elapsed = toSeconds(now - previous.receivedAt);
        int64_t ticks = tick - previous.tick;
        if (elapsed > 0.0 && ticks > 0) {
            _estimatedTickInterval = 0.9 * _estimatedTickInterval + 0.1 * (elapsed / ticks);
        }
    }

    snapshot.tick = tick;
    _entries.push_back(Entry{std::make_shared<const WorldSnapshot>(std::move(snapshot)), tick, now});
    while (_entries.size() > _capacity) {
        _entries.pop_front();
    }

    _lastTick = tick;
    _lastReceive = now;
    return true;
}

std::optional<RenderState> StateBuffer::getRenderState(std::chrono::milliseconds bufferDelay,
                                                       Clock::time_point now) const {
    if (_entries.empty()) {
        return std::nullopt;
    }
    if (_entries.size() < 2) {
        return RenderState{_entries.back().snapshot, nullptr, 0.0};
    }

    const Clock::time_point renderTime = now - bufferDelay;

    if (renderTime < _entries.front().receivedAt) {
        return RenderState{_entries.front().snapshot, nullptr, 0.0};
    }

    for (std::size_t i = 0; i + 1 < _entries.size(); ++i) {
        const Entry& before = _entries[i];
        const Entry& after = _entries[i + 1];
        if (before.receivedAt <= renderTime && renderTime <= after.receivedAt) {
            double span = toSeconds(after.receivedAt - before.receivedAt);
            if (span <= 0.0) {
                return RenderState{after.snapshot, nullptr, 0.0};
            }
            double factor = std::clamp(toSeconds(renderTime - before.receivedAt) / span, 0.0, 1.0);
            return RenderState{before.snapshot, after.snapshot, factor};
        }
    }

    // renderTime is past the newest entry
    const Entry& newest = _entries.back();
    const Entry& previous = _entries[_entries.size() - 2];

    if (renderTime - newest.receivedAt > _extrapolationWindow) {
        return RenderState{newest.snapshot, nullptr, 0.0};
    }

    double span = std::max(0.001, toSeconds(newest.receivedAt - previous.receivedAt));
    double factor = 1.0 + toSeconds(renderTime - newest.receivedAt) / span;
    return RenderState{previous.snapshot, newest.snapshot, std::min(factor, _extrapolationCap)};
}

std::shared_ptr<const WorldSnapshot> StateBuffer::latest() const {
    if (_entries.empty()) {
        return nullptr;
    }
    return _entries.back().snapshot;
}

std::optional<int64_t> StateBuffer::lastTick() const {
    return _lastTick;
}

std::optional<double> StateBuffer::secondsSinceLastUpdate(Clock::time_point now) const {
    if (!_lastReceive) {
        return std::nullopt;
    }
    return toSeconds(now - *_lastReceive);
}

void StateBuffer::clear() {
    _entries.clear();
    _lastTick.reset();
    _lastReceive.reset();
    _estimatedTickInterval = 1.0 / 60.0;
}

} // namespace lansync
