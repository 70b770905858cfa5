#include "netloom/url-decode.hpp"

#include <cstddef>
#include <string>

namespace netloom::url {

namespace {

constexpr int FromHexDigit(char ch) {
  if (ch >= '0' && ch <= '9') {
    return ch - '0';
  }
  if (ch >= 'A' && ch <= 'F') {
    return 10 + (ch - 'A');
  }
  if (ch >= 'a' && ch <= 'f') {
    return 10 + (ch - 'a');
  }
  return -1;
}

}  // namespace

char* DecodeInPlace(char* first, char* last, char plusAs, bool strictInvalid) {
  char* out = first;
  for (; first < last; ++first) {
    const char ch = *first;
    if (ch == '+') {
      *out++ = plusAs;
      continue;
    }
    if (ch != '%') {
      *out++ = ch;
      continue;
    }
    if (last - first < 3) {
      if (strictInvalid) {
        return nullptr;
      }
      // keep the truncated escape as is
      while (first < last) {
        *out++ = *first++;
      }
      break;
    }
    const int hi = FromHexDigit(first[1]);
    const int lo = FromHexDigit(first[2]);
    if (hi < 0 || lo < 0) {
      if (strictInvalid) {
        return nullptr;
      }
      *out++ = '%';
      continue;
    }
    *out++ = static_cast<char>((hi << 4) | lo);
    first += 2;
  }
  return out;
}

bool DecodeInPlace(std::string& str, char plusAs, bool strictInvalid) {
  char* newEnd = DecodeInPlace(str.data(), str.data() + str.size(), plusAs, strictInvalid);
  if (newEnd == nullptr) {
    return false;
  }
  str.resize(static_cast<std::size_t>(newEnd - str.data()));
  return true;
}

}  // namespace netloom::url
