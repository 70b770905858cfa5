#include "netloom/static-file-handler.hpp"

#include <algorithm>
#include <cerrno>
#include <cstddef>
#include <filesystem>
#include <memory>
#include <span>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>

#include "netloom/context.hpp"
#include "netloom/file.hpp"
#include "netloom/http-constants.hpp"
#include "netloom/http-error.hpp"
#include "netloom/http-method.hpp"
#include "netloom/http-response.hpp"
#include "netloom/http-status-code.hpp"
#include "netloom/log.hpp"
#include "netloom/mime-mappings.hpp"
#include "netloom/static-file-config.hpp"
#include "spdlog/fmt/fmt.h"

namespace netloom {

namespace {

HttpResponse MakeError(http::ErrorKind kind) { return MakeStatusResponse(http::StatusCodeFor(kind)); }

}  // namespace

StaticFileHandler::StaticFileHandler(const std::filesystem::path& rootDirectory, StaticFileConfig config)
    : _config(std::move(config)) {
  _config.validate();
  std::error_code ec;
  if (!std::filesystem::is_directory(rootDirectory, ec)) {
    throw std::invalid_argument(
        fmt::format("Static files root '{}' is not an existing directory", rootDirectory.string()));
  }
  _root = std::filesystem::canonical(rootDirectory, ec);
  if (ec) {
    throw std::invalid_argument(
        fmt::format("Cannot resolve static files root '{}': {}", rootDirectory.string(), ec.message()));
  }
}

http::ErrorKind StaticFileHandler::FileOpenErrorKind(int err) noexcept {
  switch (err) {
    case ENOENT:
      [[fallthrough]];
    case ENOTDIR:
      return http::ErrorKind::FileNotFound;
    default:
      // EACCES, EPERM, EMFILE...
      return http::ErrorKind::FileUnreadable;
  }
}

bool StaticFileHandler::isWithinRoot(const std::filesystem::path& canonicalPath) const {
  const auto [rootIt, pathIt] = std::mismatch(_root.begin(), _root.end(), canonicalPath.begin(), canonicalPath.end());
  return rootIt == _root.end();
}

StaticFileHandler::Resolution StaticFileHandler::resolve(std::string_view relativePath) const {
  if (relativePath.find('\0') != std::string_view::npos) {
    return {{}, http::ErrorKind::ForbiddenPath};
  }
  std::filesystem::path relative;
  while (!relativePath.empty()) {
    const auto slashPos = relativePath.find('/');
    const std::string_view segment = relativePath.substr(0, slashPos);
    if (segment == "..") {
      return {{}, http::ErrorKind::ForbiddenPath};
    }
    if (!segment.empty() && segment != ".") {
      relative /= std::filesystem::path(segment);
    }
    if (slashPos == std::string_view::npos) {
      break;
    }
    relativePath.remove_prefix(slashPos + 1);
  }

  std::error_code ec;
  std::filesystem::path resolvedPath = std::filesystem::weakly_canonical(_root / relative, ec);
  if (ec) {
    return {{}, FileOpenErrorKind(ec.value())};
  }
  // symbolic links are followed by the canonicalization, so an escaping link is caught here
  if (!isWithinRoot(resolvedPath)) {
    return {{}, http::ErrorKind::ForbiddenPath};
  }

  auto status = std::filesystem::status(resolvedPath, ec);
  if (ec) {
    return {{}, FileOpenErrorKind(ec.value())};
  }
  if (std::filesystem::is_directory(status)) {
    if (_config.defaultIndex.empty()) {
      return {{}, http::ErrorKind::FileNotFound};
    }
    resolvedPath = std::filesystem::weakly_canonical(resolvedPath / _config.defaultIndex, ec);
    if (ec) {
      return {{}, FileOpenErrorKind(ec.value())};
    }
    if (!isWithinRoot(resolvedPath)) {
      return {{}, http::ErrorKind::ForbiddenPath};
    }
    status = std::filesystem::status(resolvedPath, ec);
    if (ec) {
      return {{}, FileOpenErrorKind(ec.value())};
    }
  }
  if (!std::filesystem::is_regular_file(status)) {
    return {{}, http::ErrorKind::FileNotFound};
  }
  return {std::move(resolvedPath), std::nullopt};
}

HttpResponse StaticFileHandler::operator()(Context& ctx) const {
  const HttpRequest& request = ctx.request();
  if (request.method() != http::Method::GET && request.method() != http::Method::HEAD) {
    return MakeStatusResponse(http::StatusCodeMethodNotAllowed).header(http::Allow, "GET, HEAD");
  }

  const std::string_view relativePath =
      ctx.pathParams().empty() ? request.path() : std::string_view(ctx.pathParams().back().second);
  Resolution resolution = resolve(relativePath);
  if (resolution.error) {
    log::debug("Static file '{}' not served: {}", relativePath, http::ErrorKindName(*resolution.error));
    return MakeError(*resolution.error);
  }

  const std::string filePath = resolution.path.string();
  auto pFile = std::make_shared<File>(filePath);
  if (!*pFile) {
    return MakeError(FileOpenErrorKind(pFile->openErrno()));
  }
  const std::size_t fileSize = pFile->size();
  if (fileSize == File::kError) {
    return MakeError(http::ErrorKind::FileUnreadable);
  }

  std::string_view contentType = DetermineMIMETypeStr(filePath);
  if (contentType.empty()) {
    contentType = _config.defaultContentType;
  }

  // the file stays open as long as the body producer (owned by the response) is alive
  StreamedBody body{fileSize, [pFile = std::move(pFile), offset = std::size_t{0},
                               chunkSize = _config.chunkSize](std::span<char> buf) mutable {
                      const std::size_t nbRead = pFile->readAt(buf.first(std::min(buf.size(), chunkSize)), offset);
                      if (nbRead == File::kError) {
                        log::error("Read failure at offset {} of a served static file", offset);
                        return std::size_t{0};
                      }
                      offset += nbRead;
                      return nbRead;
                    }};
  return HttpResponse(http::StatusCodeOK).body(std::move(body), contentType);
}

}  // namespace netloom
