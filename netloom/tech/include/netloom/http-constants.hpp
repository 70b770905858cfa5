#pragma once

#include <string_view>

namespace netloom::http {

// Header field names are case-insensitive. They are stored here in their canonical form for emission;
// parsing code compares them with CaseInsensitiveEqual.
// Header value tokens below are kept lower case for the same reason.

// Version
inline constexpr std::string_view HTTP10Sv = "HTTP/1.0";
inline constexpr std::string_view HTTP11Sv = "HTTP/1.1";

// Header field names
inline constexpr std::string_view Connection = "Connection";
inline constexpr std::string_view TransferEncoding = "Transfer-Encoding";
inline constexpr std::string_view ContentLength = "Content-Length";
inline constexpr std::string_view ContentType = "Content-Type";
inline constexpr std::string_view ContentEncoding = "Content-Encoding";
inline constexpr std::string_view AcceptEncoding = "Accept-Encoding";
inline constexpr std::string_view Authorization = "Authorization";
inline constexpr std::string_view CookieHeader = "Cookie";
inline constexpr std::string_view SetCookie = "Set-Cookie";
inline constexpr std::string_view Host = "Host";
inline constexpr std::string_view Location = "Location";
inline constexpr std::string_view Vary = "Vary";
inline constexpr std::string_view Allow = "Allow";

inline constexpr std::string_view HeaderSep = ": ";
inline constexpr std::string_view CRLF = "\r\n";
inline constexpr std::string_view DoubleCRLF = "\r\n\r\n";

// Content codings
inline constexpr std::string_view identity = "identity";
inline constexpr std::string_view gzip = "gzip";
inline constexpr std::string_view deflate = "deflate";

// Header value tokens
inline constexpr std::string_view keepalive = "keep-alive";
inline constexpr std::string_view close = "close";
inline constexpr std::string_view chunked = "chunked";

// Content types
inline constexpr std::string_view ContentTypeTextPlain = "text/plain";
inline constexpr std::string_view ContentTypeTextHtml = "text/html";
inline constexpr std::string_view ContentTypeApplicationJson = "application/json";
inline constexpr std::string_view ContentTypeApplicationOctetStream = "application/octet-stream";
inline constexpr std::string_view ContentTypeFormUrlEncoded = "application/x-www-form-urlencoded";

}  // namespace netloom::http
