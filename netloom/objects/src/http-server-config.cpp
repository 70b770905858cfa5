#include "netloom/http-server-config.hpp"

#include <spdlog/fmt/fmt.h>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string_view>

#include "netloom/http-header.hpp"

namespace netloom {

void HttpServerConfig::validate() const {
  if (nbThreads == 0) {
    throw std::invalid_argument("nbThreads must be > 0");
  }
  if (pollInterval.count() <= 0) {
    throw std::invalid_argument("pollInterval must be > 0");
  }
  if (maxRequestsPerConnection == 0) {
    throw std::invalid_argument("maxRequestsPerConnection must be > 0");
  }
  if (enableKeepAlive && keepAliveTimeout.count() <= 0) {
    throw std::invalid_argument("keepAliveTimeout must be > 0 when keep-alive is enabled");
  }
  if (headerReadTimeout.count() <= 0) {
    throw std::invalid_argument("headerReadTimeout must be > 0");
  }
  if (writeTimeout.count() <= 0) {
    throw std::invalid_argument("writeTimeout must be > 0");
  }
  if (maxHeaderBytes < 128) {
    throw std::invalid_argument("maxHeaderBytes must be >= 128");
  }
  for (const http::Header& header : globalHeaders) {
    if (!http::IsValidHeaderName(header.name)) {
      throw std::invalid_argument(fmt::format("global header has invalid name: '{}'", header.name));
    }
    if (!http::IsValidHeaderValue(header.value)) {
      throw std::invalid_argument(fmt::format("global header has invalid value: '{}'", header.value));
    }
    if (http::IsReservedResponseHeader(header.name)) {
      throw std::invalid_argument(fmt::format("attempt to set reserved header: '{}'", header.name));
    }
  }
}

HttpServerConfig& HttpServerConfig::withPort(uint16_t port) {
  this->port = port;
  return *this;
}

HttpServerConfig& HttpServerConfig::withReusePort(bool on) {
  this->reusePort = on;
  return *this;
}

HttpServerConfig& HttpServerConfig::withTcpNoDelay(bool on) {
  this->tcpNoDelay = on;
  return *this;
}

HttpServerConfig& HttpServerConfig::withNbThreads(uint32_t nbThreads) {
  this->nbThreads = nbThreads;
  return *this;
}

HttpServerConfig& HttpServerConfig::withPollInterval(std::chrono::milliseconds interval) {
  this->pollInterval = interval;
  return *this;
}

HttpServerConfig& HttpServerConfig::withKeepAliveMode(bool on) {
  this->enableKeepAlive = on;
  return *this;
}

HttpServerConfig& HttpServerConfig::withMaxRequestsPerConnection(uint32_t maxRequests) {
  this->maxRequestsPerConnection = maxRequests;
  return *this;
}

HttpServerConfig& HttpServerConfig::withKeepAliveTimeout(std::chrono::milliseconds timeout) {
  this->keepAliveTimeout = timeout;
  return *this;
}

HttpServerConfig& HttpServerConfig::withHeaderReadTimeout(std::chrono::milliseconds timeout) {
  this->headerReadTimeout = timeout;
  return *this;
}

HttpServerConfig& HttpServerConfig::withWriteTimeout(std::chrono::milliseconds timeout) {
  this->writeTimeout = timeout;
  return *this;
}

HttpServerConfig& HttpServerConfig::withMaxHeaderBytes(std::size_t maxHeaderBytes) {
  this->maxHeaderBytes = maxHeaderBytes;
  return *this;
}

HttpServerConfig& HttpServerConfig::withMaxBodyBytes(std::size_t maxBodyBytes) {
  this->maxBodyBytes = maxBodyBytes;
  return *this;
}

HttpServerConfig& HttpServerConfig::withGlobalHeader(std::string_view name, std::string_view value) {
  globalHeaders.push_back(http::Header{std::string(name), std::string(value)});
  return *this;
}

HttpServerConfig& HttpServerConfig::withHideBanner(bool on) {
  this->hideBanner = on;
  return *this;
}

}  // namespace netloom
