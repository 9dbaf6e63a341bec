#ifndef __PUNCHCARD_ADDRESS_HH__
#define __PUNCHCARD_ADDRESS_HH__

#include <array>
#include <boost/container_hash/hash.hpp>
#include <cstddef>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "util.hh"

namespace punchcard {
constexpr size_t kAddressLen = 32;

struct Address {
  std::array<u8, kAddressLen> bytes{};

  inline bool operator==(const Address &address) const = default;

  static std::optional<Address> FromBase58(std::string_view str);
  static Address Random();

  std::string ToBase58() const;
};

static_assert(sizeof(Address) == kAddressLen);
static_assert(std::is_trivially_copyable_v<Address>);

std::string EncodeBase58(std::span<const u8> bytes);
std::optional<std::vector<u8>> DecodeBase58(std::string_view str);

// Owner of every account that no program has claimed.
inline const Address &SystemProgramId() {
  static const Address id{};
  return id;
}

std::ostream &operator<<(std::ostream &stream, const Address &address);
}  // namespace punchcard

namespace std {
template <>
struct hash<punchcard::Address> {
  size_t operator()(const punchcard::Address &a) const {
    return boost::hash_range(a.bytes.begin(), a.bytes.end());
  }
};
}  // namespace std

#endif /* __PUNCHCARD_ADDRESS_HH__ */
