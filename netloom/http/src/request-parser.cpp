#include "netloom/request-parser.hpp"

#include <charconv>
#include <cstddef>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>

#include "netloom/byte-stream-reader.hpp"
#include "netloom/cookie.hpp"
#include "netloom/header-line-parse.hpp"
#include "netloom/http-constants.hpp"
#include "netloom/http-error.hpp"
#include "netloom/http-header.hpp"
#include "netloom/http-method.hpp"
#include "netloom/http-request.hpp"
#include "netloom/http-version.hpp"
#include "netloom/log.hpp"
#include "netloom/string-equal-ignore-case.hpp"
#include "netloom/string-trim.hpp"
#include "netloom/url-decode.hpp"

namespace netloom {

namespace {

using ReadStatus = ByteStreamReader::ReadStatus;

// Error of a line read that failed after the first byte of the request.
ParseResult MidRequestFailure(ReadStatus status, http::ErrorKind tooLongError,
                              http::ErrorKind truncatedError) noexcept {
  switch (status) {
    case ReadStatus::Timeout:
      return ParseResult::Failure(http::ErrorKind::RequestTimeout);
    case ReadStatus::LineTooLong:
      return ParseResult::Failure(tooLongError);
    default:
      return ParseResult::Failure(truncatedError);
  }
}

// Parses a non-empty decimal without sign. Returns false on any other input or overflow.
bool ParseContentLength(std::string_view value, std::size_t& out) noexcept {
  if (value.empty()) {
    return false;
  }
  const auto [ptr, errc] = std::from_chars(value.data(), value.data() + value.size(), out);
  return errc == std::errc{} && ptr == value.data() + value.size();
}

bool IsFormContentType(std::string_view contentType) noexcept {
  const auto semiPos = contentType.find(';');
  return CaseInsensitiveEqual(TrimOws(contentType.substr(0, semiPos)), http::ContentTypeFormUrlEncoded);
}

}  // namespace

ParseResult RequestParser::parse(ByteStreamReader& reader, HttpRequest& request) const {
  request.clear();
  reader.setMaxLineLength(_maxHeaderBytes);

  const std::size_t headStart = reader.consumedBytes();

  ParseResult result = parseRequestLine(reader, request);
  if (!result.ok()) {
    return result;
  }
  result = parseHeaders(reader, request, headStart);
  if (!result.ok()) {
    return result;
  }
  result = parseBody(reader, request);
  if (!result.ok()) {
    return result;
  }
  request._wireSize = reader.consumedBytes() - headStart;
  return result;
}

ParseResult RequestParser::parseRequestLine(ByteStreamReader& reader, HttpRequest& request) const {
  // RFC 9112 §2.2: at least one empty line received prior to the request line should be ignored.
  for (int nbEmptyLines = 0;; ++nbEmptyLines) {
    const ReadStatus status = reader.readLine();
    if (status != ReadStatus::Ok) {
      if (status != ReadStatus::LineTooLong && reader.pendingBytes() == 0) {
        return ParseResult::ConnectionClosed();
      }
      return MidRequestFailure(status, http::ErrorKind::UriTooLong, http::ErrorKind::MalformedRequestLine);
    }
    if (!reader.line().empty()) {
      break;
    }
    if (nbEmptyLines == kMaxLeadingEmptyLines) {
      return ParseResult::Failure(http::ErrorKind::MalformedRequestLine);
    }
  }

  // the request has started: the remaining parts must arrive within the header read timeout
  reader.setReadTimeout(_headerReadTimeout);

  // METHOD SP TARGET SP VERSION, with exactly one space between tokens
  const std::string_view line = reader.line();
  const auto firstSpace = line.find(' ');
  const auto lastSpace = line.rfind(' ');
  if (firstSpace == std::string_view::npos || firstSpace == lastSpace) {
    return ParseResult::Failure(http::ErrorKind::MalformedRequestLine);
  }
  const std::string_view methodStr = line.substr(0, firstSpace);
  const std::string_view target = line.substr(firstSpace + 1, lastSpace - firstSpace - 1);
  const std::string_view versionStr = line.substr(lastSpace + 1);
  if (target.empty() || target.find(' ') != std::string_view::npos || target.front() != '/') {
    return ParseResult::Failure(http::ErrorKind::MalformedRequestLine);
  }

  const auto optMethod = http::MethodStrToOptEnum(methodStr);
  if (!optMethod) {
    return ParseResult::Failure(http::ErrorKind::MalformedRequestLine);
  }
  const auto optVersion = http::VersionFromStr(versionStr);
  if (!optVersion) {
    return ParseResult::Failure(http::ErrorKind::MalformedRequestLine);
  }
  request._method = *optMethod;
  request._version = *optVersion;
  request._target.assign(target);

  const auto qPos = target.find('?');
  request._path.assign(target.substr(0, qPos));
  // '+' is a literal character in the path component
  if (!url::DecodeInPlace(request._path, '+', true)) {
    return ParseResult::Failure(http::ErrorKind::MalformedRequestLine);
  }
  if (qPos != std::string_view::npos) {
    url::ForEachDecodedPair(target.substr(qPos + 1), [&request](std::string key, std::string value) {
      request._queryParams.insert_or_assign(std::move(key), std::move(value));
    });
  }
  return ParseResult::Success();
}

ParseResult RequestParser::parseHeaders(ByteStreamReader& reader, HttpRequest& request, std::size_t headStart) const {
  while (true) {
    const ReadStatus status = reader.readLine();
    if (status != ReadStatus::Ok) {
      return MidRequestFailure(status, http::ErrorKind::HeadersTooLarge, http::ErrorKind::MalformedHeader);
    }
    if (reader.consumedBytes() - headStart > _maxHeaderBytes) {
      return ParseResult::Failure(http::ErrorKind::HeadersTooLarge);
    }
    const std::string_view line = reader.line();
    if (line.empty()) {
      return ParseResult::Success();
    }
    // obsolete line folding is not supported (RFC 9112 §5.2 allows rejecting it)
    if (line.front() == ' ' || line.front() == '\t') {
      return ParseResult::Failure(http::ErrorKind::MalformedHeader);
    }
    const auto [name, value] = http::ParseHeaderLine(line);
    if (!http::IsValidHeaderName(name) || !http::IsValidHeaderValue(value)) {
      return ParseResult::Failure(http::ErrorKind::MalformedHeader);
    }

    auto it = request._headers.find(name);
    if (it == request._headers.end()) {
      request._headers.emplace(name, value);
      continue;
    }
    if (CaseInsensitiveEqual(name, http::ContentLength)) {
      // RFC 9110 §8.6: identical repeated values may be accepted, differing ones may not
      if (it->second != value) {
        return ParseResult::Failure(http::ErrorKind::MalformedHeader);
      }
      continue;
    }
    if (value.empty()) {
      continue;
    }
    if (it->second.empty()) {
      it->second.assign(value);
      continue;
    }
    const bool isCookie = CaseInsensitiveEqual(name, http::CookieHeader);
    it->second.append(isCookie ? std::string_view("; ") : std::string_view(", "));
    it->second.append(value);
  }
}

ParseResult RequestParser::parseBody(ByteStreamReader& reader, HttpRequest& request) const {
  if (request.headerValue(http::TransferEncoding)) {
    return ParseResult::Failure(http::ErrorKind::UnsupportedEncoding);
  }
  std::size_t contentLength = 0;
  const auto optContentLength = request.headerValue(http::ContentLength);
  if (optContentLength && !ParseContentLength(*optContentLength, contentLength)) {
    return ParseResult::Failure(http::ErrorKind::MalformedHeader);
  }
  if (contentLength > _maxBodyBytes) {
    log::debug("Rejecting body of {} bytes (max {})", contentLength, _maxBodyBytes);
    return ParseResult::Failure(http::ErrorKind::PayloadTooLarge);
  }
  if (contentLength != 0) {
    const ReadStatus status = reader.readExact(contentLength);
    if (status != ReadStatus::Ok) {
      return ParseResult::Failure(status == ReadStatus::Timeout ? http::ErrorKind::RequestTimeout
                                                                : http::ErrorKind::IncompleteBody);
    }
    request._body.assign(reader.data());
  }

  if (IsFormContentType(request.headerValueOrEmpty(http::ContentType))) {
    url::ForEachDecodedPair(request._body, [&request](std::string key, std::string value) {
      request._formParams.insert_or_assign(std::move(key), std::move(value));
    });
  }
  const auto optCookie = request.headerValue(http::CookieHeader);
  if (optCookie) {
    request._cookies = http::ParseCookieHeader(*optCookie);
  }
  return ParseResult::Success();
}

}  // namespace netloom
