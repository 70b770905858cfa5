#pragma once

#include <bit>
#include <cstdint>
#include <optional>
#include <string_view>
#include <type_traits>

namespace netloom::http {

enum class Method : uint16_t {
  GET = 1 << 0,
  HEAD = 1 << 1,
  POST = 1 << 2,
  PUT = 1 << 3,
  DELETE = 1 << 4,
  CONNECT = 1 << 5,
  OPTIONS = 1 << 6,
  TRACE = 1 << 7,
  PATCH = 1 << 8
};

using MethodIdx = std::underlying_type_t<Method>;
inline constexpr MethodIdx kNbMethods = 9;

// Set of methods, one bit per Method.
using MethodBmp = uint16_t;

inline constexpr MethodBmp kAllMethods = static_cast<MethodBmp>((1U << kNbMethods) - 1U);

constexpr MethodBmp operator|(Method lhs, Method rhs) noexcept {
  return static_cast<MethodBmp>(static_cast<MethodBmp>(lhs) | static_cast<MethodBmp>(rhs));
}

constexpr MethodBmp operator|(MethodBmp lhs, Method rhs) noexcept {
  return static_cast<MethodBmp>(lhs | static_cast<MethodBmp>(rhs));
}

constexpr bool IsMethodSet(MethodBmp mask, Method method) noexcept {
  return (mask & static_cast<MethodBmp>(method)) != 0U;
}

constexpr MethodIdx MethodToIdx(Method method) noexcept {
  return static_cast<MethodIdx>(std::countr_zero(static_cast<MethodIdx>(method)));
}

constexpr Method MethodFromIdx(MethodIdx methodIdx) noexcept { return static_cast<Method>(1U << methodIdx); }

inline constexpr std::string_view kMethodStrings[] = {"GET",     "HEAD",    "POST",  "PUT",  "DELETE",
                                                      "CONNECT", "OPTIONS", "TRACE", "PATCH"};

static_assert(std::size(kMethodStrings) == kNbMethods);

constexpr std::string_view MethodToStr(Method method) noexcept { return kMethodStrings[MethodToIdx(method)]; }

// Parse a method token. Method tokens are case-sensitive: "get" is not a known method.
constexpr std::optional<Method> MethodStrToOptEnum(std::string_view str) noexcept {
  for (MethodIdx methodIdx = 0; methodIdx < kNbMethods; ++methodIdx) {
    if (kMethodStrings[methodIdx] == str) {
      return MethodFromIdx(methodIdx);
    }
  }
  return std::nullopt;
}

}  // namespace netloom::http
