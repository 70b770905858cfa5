#include "netloom/compression-middleware.hpp"

#include <charconv>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>

#include "netloom/compression-config.hpp"
#include "netloom/context.hpp"
#include "netloom/http-constants.hpp"
#include "netloom/http-response.hpp"
#include "netloom/log.hpp"
#include "netloom/middleware.hpp"
#include "netloom/string-equal-ignore-case.hpp"
#include "netloom/string-trim.hpp"
#include "netloom/zlib-encoder.hpp"

namespace netloom {

namespace {

// Parse q-value within a token (portion including parameters); never throws.
// Invalid q-values are treated as 0.
double ParseQ(std::string_view token) {
  const auto scPos = token.find(';');
  if (scPos == std::string_view::npos) {
    return 1.0;
  }
  std::string_view params = token.substr(scPos + 1);
  while (!params.empty()) {
    const auto nextSemi = params.find(';');
    const std::string_view param = TrimOws(params.substr(0, nextSemi));
    params = nextSemi == std::string_view::npos ? std::string_view{} : params.substr(nextSemi + 1);
    if (param.size() < 2 || (param[0] != 'q' && param[0] != 'Q') || param[1] != '=') {
      continue;
    }
    const std::string_view val = TrimOws(param.substr(2));
    double qualityValue = 0.0;
    const auto [ptr, errc] = std::from_chars(val.data(), val.data() + val.size(), qualityValue);
    if (val.empty() || errc != std::errc() || ptr != val.data() + val.size()) {
      return 0.0;
    }
    if (qualityValue < 0.0) {
      return 0.0;
    }
    return qualityValue > 1.0 ? 1.0 : qualityValue;
  }
  return 1.0;
}

}  // namespace

CompressionMiddleware::CompressionMiddleware(CompressionConfig config) : _config(std::move(config)) {
  _config.validate();
}

std::optional<ZStreamRAII::Variant> CompressionMiddleware::NegotiateEncoding(std::string_view acceptEncoding) {
  std::optional<double> gzipQ;
  std::optional<double> deflateQ;
  std::optional<double> wildcardQ;
  while (!acceptEncoding.empty()) {
    const auto commaPos = acceptEncoding.find(',');
    const std::string_view raw = TrimOws(acceptEncoding.substr(0, commaPos));
    acceptEncoding =
        commaPos == std::string_view::npos ? std::string_view{} : acceptEncoding.substr(commaPos + 1);
    if (raw.empty()) {
      continue;
    }
    const std::string_view name = TrimOws(raw.substr(0, raw.find(';')));
    const double quality = ParseQ(raw);
    // earliest occurrence wins
    if (CaseInsensitiveEqual(name, http::gzip)) {
      if (!gzipQ) {
        gzipQ = quality;
      }
    } else if (CaseInsensitiveEqual(name, http::deflate)) {
      if (!deflateQ) {
        deflateQ = quality;
      }
    } else if (name == "*") {
      if (!wildcardQ) {
        wildcardQ = quality;
      }
    }
  }
  const double gzipQuality = gzipQ.value_or(wildcardQ.value_or(0.0));
  const double deflateQuality = deflateQ.value_or(wildcardQ.value_or(0.0));
  if (gzipQuality <= 0.0 && deflateQuality <= 0.0) {
    return std::nullopt;
  }
  return gzipQuality >= deflateQuality ? ZStreamRAII::Variant::gzip : ZStreamRAII::Variant::deflate;
}

bool CompressionMiddleware::isCompressibleContentType(std::string_view contentType) const noexcept {
  if (_config.contentTypeAllowlist.empty()) {
    return true;
  }
  for (const std::string& allowed : _config.contentTypeAllowlist) {
    if (contentType.size() >= allowed.size() && CaseInsensitiveEqual(contentType.substr(0, allowed.size()), allowed)) {
      return true;
    }
  }
  return false;
}

void CompressionMiddleware::operator()(Context& ctx, Next& next) const {
  next();

  HttpResponse& response = ctx.response();
  const std::string* pBody = response.bodyInMemory();
  if (pBody == nullptr || pBody->size() < _config.minBytes || response.headerValue(http::ContentEncoding) ||
      !isCompressibleContentType(response.headerValueOrEmpty(http::ContentType))) {
    return;
  }
  if (_config.addVaryHeader && !response.headerValue(http::Vary)) {
    response.header(http::Vary, http::AcceptEncoding);
  }
  const auto variant = NegotiateEncoding(ctx.request().headerValueOrEmpty(http::AcceptEncoding));
  if (!variant) {
    return;
  }
  std::string compressed = ZlibEncoder(*variant, _config.level).encodeFull(*pBody);
  log::trace("Compressed body from {} to {} bytes", pBody->size(), compressed.size());
  response.body(std::move(compressed));
  response.header(http::ContentEncoding, *variant == ZStreamRAII::Variant::gzip ? http::gzip : http::deflate);
}

}  // namespace netloom
