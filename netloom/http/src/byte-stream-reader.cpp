#include "netloom/byte-stream-reader.hpp"

#include <cstddef>
#include <string_view>

#include "netloom/transport.hpp"

namespace netloom {

TransportHint ByteStreamReader::fill(std::size_t& nbRead) {
  // compact already consumed bytes before growing
  if (_pos != 0 && _pos == _buf.size()) {
    _buf.clear();
    _pos = 0;
  } else if (_pos > kReadChunkSize) {
    _buf.erase(0, _pos);
    _pos = 0;
  }
  const auto oldSize = _buf.size();
  _buf.resize(oldSize + kReadChunkSize);
  const auto [bytesRead, hint] = _transport.read(_buf.data() + oldSize, kReadChunkSize);
  _buf.resize(oldSize + bytesRead);
  nbRead = bytesRead;
  return hint;
}

void ByteStreamReader::consume(std::size_t n) {
  _pos += n;
  _consumedBytes += n;
}

ByteStreamReader::ReadStatus ByteStreamReader::readLine() {
  std::size_t searchFrom = _pos;
  while (true) {
    const std::string_view pending(_buf.data() + _pos, _buf.size() - _pos);
    const auto lfPos = std::string_view(_buf).find('\n', searchFrom);
    if (lfPos != std::string_view::npos) {
      std::size_t lineLen = lfPos - _pos;
      if (lineLen != 0 && _buf[lfPos - 1] == '\r') {
        --lineLen;
      }
      if (lineLen > _maxLineLength) {
        return ReadStatus::LineTooLong;
      }
      _line.assign(_buf.data() + _pos, lineLen);
      consume(lfPos + 1 - _pos);
      return ReadStatus::Ok;
    }
    // a pending '\r' may still be followed by '\n', hence the + 1
    if (pending.size() > _maxLineLength + 1) {
      return ReadStatus::LineTooLong;
    }

    const std::size_t nbPendingBefore = pending.size();
    std::size_t nbRead{};
    const TransportHint hint = fill(nbRead);
    // fill may have compacted the buffer
    searchFrom = _pos + nbPendingBefore;
    if (nbRead == 0) {
      switch (hint) {
        case TransportHint::Timeout:
          return ReadStatus::Timeout;
        case TransportHint::Error:
          return ReadStatus::ConnectionReset;
        default:
          return nbPendingBefore == 0 ? ReadStatus::EndOfStream : ReadStatus::ConnectionReset;
      }
    }
  }
}

ByteStreamReader::ReadStatus ByteStreamReader::readExact(std::size_t n) {
  while (pendingBytes() < n) {
    std::size_t nbRead{};
    const TransportHint hint = fill(nbRead);
    if (nbRead == 0) {
      switch (hint) {
        case TransportHint::Timeout:
          return ReadStatus::Timeout;
        default:
          return ReadStatus::IncompleteBody;
      }
    }
  }
  _data.assign(_buf.data() + _pos, n);
  consume(n);
  return ReadStatus::Ok;
}

}  // namespace netloom
