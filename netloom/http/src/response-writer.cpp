#include "netloom/response-writer.hpp"

#include <algorithm>
#include <cstddef>
#include <iterator>
#include <memory>
#include <span>
#include <stdexcept>
#include <string>
#include <string_view>

#include "netloom/http-constants.hpp"
#include "netloom/http-header.hpp"
#include "netloom/http-response.hpp"
#include "netloom/log.hpp"
#include "netloom/transport.hpp"
#include "spdlog/fmt/fmt.h"

namespace netloom {

std::string ResponseWriter::SerializeHead(const HttpResponse& response, bool closeConnection) {
  std::string head;
  head.reserve(64UL + (response.headers().size() * 32UL));

  fmt::format_to(std::back_inserter(head), "{} {} {}{}", http::HTTP11Sv, response.status(), response.reason(),
                 http::CRLF);
  fmt::format_to(std::back_inserter(head), "{}{}{}{}", http::ContentLength, http::HeaderSep, response.bodyLength(),
                 http::CRLF);
  for (const auto& [name, value] : response.headers()) {
    // framing headers are computed here, never taken from user code
    if (http::IsReservedResponseHeader(name)) {
      continue;
    }
    head.append(name).append(http::HeaderSep).append(value).append(http::CRLF);
  }
  if (closeConnection) {
    head.append(http::Connection).append(http::HeaderSep).append(http::close).append(http::CRLF);
  }
  head.append(http::CRLF);
  return head;
}

std::string ResponseWriter::Serialize(const HttpResponse& response, bool closeConnection, bool headOnly) {
  const std::string* pBody = response.bodyInMemory();
  if (pBody == nullptr) {
    throw std::invalid_argument("Cannot serialize a streamed body in memory");
  }
  std::string ret = SerializeHead(response, closeConnection);
  if (!headOnly) {
    ret.append(*pBody);
  }
  return ret;
}

bool ResponseWriter::writeAll(std::string_view data) {
  const auto [bytesWritten, hint] = _transport.write(data);
  _bytesWritten += bytesWritten;
  if (hint != TransportHint::None || bytesWritten != data.size()) {
    log::debug("Write failed after {} / {} bytes", bytesWritten, data.size());
    return false;
  }
  return true;
}

bool ResponseWriter::write(const HttpResponse& response, bool closeConnection, bool headOnly) {
  const std::string* pBody = response.bodyInMemory();
  if (pBody != nullptr) {
    // single write for the common case
    return writeAll(Serialize(response, closeConnection, headOnly));
  }
  if (!writeAll(SerializeHead(response, closeConnection))) {
    return false;
  }
  if (headOnly) {
    return true;
  }

  const StreamedBody& streamedBody = *response.bodyStreamed();
  const auto bufSize = std::min(_chunkSize, streamedBody.length);
  auto buf = std::make_unique<char[]>(bufSize);
  for (std::size_t remaining = streamedBody.length; remaining != 0;) {
    const auto toProduce = std::min(bufSize, remaining);
    const std::size_t nbProduced = streamedBody.produce(std::span<char>(buf.get(), toProduce));
    if (nbProduced == 0 || nbProduced > toProduce) {
      log::error("Body producer returned {} bytes while {} remained to be sent, aborting response", nbProduced,
                 remaining);
      return false;
    }
    if (!writeAll(std::string_view(buf.get(), nbProduced))) {
      return false;
    }
    remaining -= nbProduced;
  }
  return true;
}

}  // namespace netloom
