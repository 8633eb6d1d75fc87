#include "../include/Connection.hpp"
#include <iostream>
#include <iterator>
#include <thread>

namespace lansync {

namespace {
// A peer that never sends '\n' must not grow the buffer forever
constexpr std::size_t MAX_LINE_LENGTH = 1 << 20;
}

void EventQueue::push(NetworkEvent event) {
    std::lock_guard<std::mutex> lock(_mutex);
    _events.push_back(std::move(event));
}

std::vector<NetworkEvent> EventQueue::drain() {
    std::lock_guard<std::mutex> lock(_mutex);
    std::vector<NetworkEvent> events(std::make_move_iterator(_events.begin()),
                                     std::make_move_iterator(_events.end()));
    _events.clear();
    return events;
}

std::size_t EventQueue::size() const {
    std::lock_guard<std::mutex> lock(_mutex);
    return _events.size();
}

void EventQueue::clear() {
    std::lock_guard<std::mutex> lock(_mutex);
    _events.clear();
}

void LineBuffer::append(const char* data, std::size_t length) {
    _buffer.append(data, length);
}

std::vector<std::string> LineBuffer::extractLines() {
    std::vector<std::string> lines;

    size_t start = 0;
    size_t pos = 0;
    while ((pos = _buffer.find('\n', start)) != std::string::npos) {
        std::string line = _buffer.substr(start, pos - start);
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (!line.empty()) {
            lines.push_back(std::move(line));
        }
        start = pos + 1;
    }
    _buffer.erase(0, start);

    if (_buffer.size() > MAX_LINE_LENGTH) {
        std::cerr << "[Protocol] Dropping " << _buffer.size()
                  << " bytes without line terminator" << std::endl;
        _buffer.clear();
    }
    return lines;
}

bool writeLine(asio::ip::tcp::socket& socket, const std::string& record,
               std::chrono::milliseconds timeout, std::error_code& ec) {
    std::string data = record;
    data.push_back('\n');

    auto deadline = std::chrono::steady_clock::now() + timeout;
    size_t written = 0;
    while (written < data.size()) {
        ec.clear();
        written += socket.write_some(asio::buffer(data.data() + written, data.size() - written), ec);

        if (ec == asio::error::would_block || ec == asio::error::try_again) {
            if (std::chrono::steady_clock::now() >= deadline) {
                ec = asio::error::timed_out;
                return false;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(1));
            continue;
        }
        if (ec) {
            return false;
        }
    }
    return true;
}

std::vector<Message> decodeLines(const std::vector<std::string>& lines, const char* tag) {
    std::vector<Message> messages;
    messages.reserve(lines.size());
    for (const auto& line : lines) {
        try {
            messages.push_back(decodeMessage(line));
        } catch (const MalformedMessage& e) {
            std::cerr << "[" << tag << "] Dropped malformed message: " << e.what() << std::endl;
        }
    }
    return messages;
}

} // namespace lansync
