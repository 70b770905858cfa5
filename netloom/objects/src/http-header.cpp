#include "netloom/http-header.hpp"

#include <string_view>

#include "netloom/http-constants.hpp"
#include "netloom/string-equal-ignore-case.hpp"

namespace netloom::http {

bool IsReservedResponseHeader(std::string_view name) noexcept {
  return CaseInsensitiveEqual(name, ContentLength) || CaseInsensitiveEqual(name, TransferEncoding) ||
         CaseInsensitiveEqual(name, Connection);
}

}  // namespace netloom::http
