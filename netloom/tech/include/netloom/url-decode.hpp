#pragma once

#include <string>
#include <string_view>
#include <utility>

namespace netloom::url {

// Decodes within the provided buffer, compacting percent-encoded sequences and translating '+' into
// 'plusAs' (pass ' ' for application/x-www-form-urlencoded data, keep '+' for paths).
// Returns a pointer to the new logical end of the decoded sequence, or nullptr on invalid encoding
// (truncated % or non-hex digits) when strictInvalid is true. In this case the buffer is left in an
// unspecified, partially modified state.
// With strictInvalid false, invalid escapes are kept verbatim.
char* DecodeInPlace(char* first, char* last, char plusAs = '+', bool strictInvalid = true);

// Convenience overload shrinking 'str' to its decoded size. Returns false on invalid encoding.
bool DecodeInPlace(std::string& str, char plusAs = '+', bool strictInvalid = true);

// Calls pairCallback(std::string key, std::string value) for each pair of an urlencoded string
// ("a=1&b=2"), in order of appearance. Pairs without '=' get an empty value, empty pairs are skipped.
// Keys and values are decoded as best effort, with '+' meaning space.
template <class PairCallback>
void ForEachDecodedPair(std::string_view encoded, PairCallback&& pairCallback) {
  while (!encoded.empty()) {
    const auto ampPos = encoded.find('&');
    const std::string_view pair = encoded.substr(0, ampPos);
    encoded = ampPos == std::string_view::npos ? std::string_view{} : encoded.substr(ampPos + 1);
    if (pair.empty()) {
      continue;
    }
    const auto eqPos = pair.find('=');
    std::string key(pair.substr(0, eqPos));
    std::string value(eqPos == std::string_view::npos ? std::string_view{} : pair.substr(eqPos + 1));
    DecodeInPlace(key, ' ', false);
    DecodeInPlace(value, ' ', false);
    pairCallback(std::move(key), std::move(value));
  }
}

}  // namespace netloom::url
