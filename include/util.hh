#ifndef __PUNCHCARD_UTIL_HH__
#define __PUNCHCARD_UTIL_HH__

#include <cstdint>
#include <iostream>
#include <limits>
#include <optional>
#include <type_traits>

typedef uint8_t u8;
typedef uint16_t u16;
typedef uint32_t u32;
typedef uint64_t u64;
typedef int8_t i8;
typedef int16_t i16;
typedef int32_t i32;
typedef int64_t i64;

namespace punchcard {

template <typename... Ts>
struct Overloaded : Ts... {
  using Ts::operator()...;
};

template <class... Ts>
Overloaded(Ts...) -> Overloaded<Ts...>;

inline std::ostream &LogInfo() {
  return std::cout << "\e[94m"
                      "[info] "
                      "\e[0m";
}

inline std::ostream &LogWarning() {
  return std::cout << "\e[97m"
                      "[warn] "
                      "\e[0m";
}

inline std::ostream &LogError() {
  return std::cout << "\e[91m"
                      "[err] "
                      "\e[0m";
}

template <typename T>
  requires std::is_unsigned_v<T>
inline std::optional<T> CheckedAdd(T a, T b) {
  if (a > std::numeric_limits<T>::max() - b) return std::nullopt;
  return T(a + b);
}

template <typename T>
  requires std::is_unsigned_v<T>
inline std::optional<T> CheckedSub(T a, T b) {
  if (a < b) return std::nullopt;
  return T(a - b);
}

}  // namespace punchcard

#endif /* __PUNCHCARD_UTIL_HH__ */
