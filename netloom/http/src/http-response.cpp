#include "netloom/http-response.hpp"

#include <algorithm>
#include <cstddef>
#include <iterator>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>

#include "netloom/http-constants.hpp"
#include "netloom/http-header.hpp"
#include "netloom/http-status-code.hpp"
#include "netloom/string-equal-ignore-case.hpp"
#include "spdlog/fmt/fmt.h"

namespace netloom {

namespace {

void CheckHeader(std::string_view key, std::string_view value) {
  if (!http::IsValidHeaderName(key)) {
    throw std::invalid_argument(fmt::format("Invalid header name '{}'", key));
  }
  if (!http::IsValidHeaderValue(value)) {
    throw std::invalid_argument(fmt::format("Invalid value for header '{}'", key));
  }
  if (http::IsReservedResponseHeader(key)) {
    throw std::invalid_argument(fmt::format("Header '{}' is managed by the server", key));
  }
}

}  // namespace

std::string_view HttpResponse::reason() const noexcept {
  if (_reason.empty()) {
    return http::ReasonPhraseFor(_statusCode);
  }
  return _reason;
}

void HttpResponse::setReason(std::string_view reason) {
  if (reason.find_first_of("\r\n") != std::string_view::npos) {
    throw std::invalid_argument("Reason phrase cannot contain CR or LF");
  }
  _reason.assign(reason);
}

void HttpResponse::setHeader(std::string_view key, std::string_view value) {
  CheckHeader(key, value);
  auto it = std::ranges::find_if(_headers, [key](const http::Header& hdr) { return CaseInsensitiveEqual(hdr.name, key); });
  if (it == _headers.end()) {
    _headers.emplace_back(std::string(key), std::string(value));
    return;
  }
  it->value.assign(value);
  // remove other occurrences, if any
  const auto nextIt = std::next(it);
  _headers.erase(std::remove_if(nextIt, _headers.end(),
                                [key](const http::Header& hdr) { return CaseInsensitiveEqual(hdr.name, key); }),
                 _headers.end());
}

void HttpResponse::appendHeader(std::string_view key, std::string_view value) {
  CheckHeader(key, value);
  _headers.emplace_back(std::string(key), std::string(value));
}

void HttpResponse::setBody(std::string body, std::string_view contentType) {
  if (!contentType.empty()) {
    setHeader(http::ContentType, contentType);
  }
  _body = std::move(body);
}

void HttpResponse::setBody(StreamedBody body, std::string_view contentType) {
  if (body.length != 0 && !body.produce) {
    throw std::invalid_argument("Streamed body needs a producer");
  }
  if (!contentType.empty()) {
    setHeader(http::ContentType, contentType);
  }
  _body = std::move(body);
}

std::optional<std::string_view> HttpResponse::headerValue(std::string_view key) const noexcept {
  const auto it =
      std::ranges::find_if(_headers, [key](const http::Header& hdr) { return CaseInsensitiveEqual(hdr.name, key); });
  if (it == _headers.end()) {
    return std::nullopt;
  }
  return std::string_view(it->value);
}

std::size_t HttpResponse::eraseHeader(std::string_view key) noexcept {
  return std::erase_if(_headers, [key](const http::Header& hdr) { return CaseInsensitiveEqual(hdr.name, key); });
}

std::size_t HttpResponse::bodyLength() const noexcept {
  return std::visit(
      [](const auto& body) -> std::size_t {
        if constexpr (std::is_same_v<std::decay_t<decltype(body)>, std::string>) {
          return body.size();
        } else {
          return body.length;
        }
      },
      _body);
}

HttpResponse MakeStatusResponse(http::StatusCode statusCode) {
  std::string body(http::ReasonPhraseFor(statusCode));
  body.push_back('\n');
  return HttpResponse(statusCode).body(std::move(body), http::ContentTypeTextPlain);
}

}  // namespace netloom
