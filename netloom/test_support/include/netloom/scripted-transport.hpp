#pragma once

#include <algorithm>
#include <cstddef>
#include <deque>
#include <initializer_list>
#include <string>
#include <string_view>
#include <utility>

#include "netloom/transport.hpp"

namespace netloom::test {

// In-memory ITransport delivering reads from a script of segments, one segment (at most) per read call,
// and recording everything written.
// Once the script is exhausted, reads report the configured end: orderly close (default), timeout or error.
class ScriptedTransport : public ITransport {
 public:
  ScriptedTransport() = default;

  ScriptedTransport(std::initializer_list<std::string_view> segments) {
    for (std::string_view segment : segments) {
      _segments.emplace_back(segment);
    }
  }

  void addSegment(std::string_view segment) { _segments.emplace_back(segment); }

  // Splits 'data' into segments of at most 'segmentSize' bytes.
  void addSplit(std::string_view data, std::size_t segmentSize) {
    while (!data.empty()) {
      const auto len = std::min(segmentSize, data.size());
      _segments.emplace_back(data.substr(0, len));
      data.remove_prefix(len);
    }
  }

  void endWith(TransportHint hint) noexcept { _endHint = hint; }

  // After 'nbBytes' bytes, writes fail with TransportHint::Error.
  void failWritesAfter(std::size_t nbBytes) noexcept { _writeLimit = nbBytes; }

  TransportResult read(char* buf, std::size_t len) override {
    ++_nbReads;
    if (_segments.empty()) {
      return {0, _endHint};
    }
    std::string& front = _segments.front();
    const auto nbBytes = std::min(len, front.size());
    std::copy_n(front.data(), nbBytes, buf);
    front.erase(0, nbBytes);
    if (front.empty()) {
      _segments.pop_front();
    }
    return {nbBytes, TransportHint::None};
  }

  TransportResult write(std::string_view data) override {
    const auto room = _writeLimit - std::min(_writeLimit, _written.size());
    const auto nbBytes = std::min(room, data.size());
    _written.append(data.substr(0, nbBytes));
    return {nbBytes, nbBytes == data.size() ? TransportHint::None : TransportHint::Error};
  }

  [[nodiscard]] const std::string& written() const noexcept { return _written; }

  [[nodiscard]] std::size_t nbReads() const noexcept { return _nbReads; }

 private:
  std::deque<std::string> _segments;
  std::string _written;
  std::size_t _writeLimit{static_cast<std::size_t>(-1)};
  std::size_t _nbReads{};
  TransportHint _endHint{TransportHint::None};
};

}  // namespace netloom::test
