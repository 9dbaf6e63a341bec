#include "address.hh"

#include <algorithm>
#include <random>

namespace punchcard {
namespace {
constexpr char kAlphabet[] =
    "123456789ABCDEFGHJKLMNPQRSTUVWXYZabcdefghijkmnopqrstuvwxyz";

// Longest base58 form of a 32 byte value.
constexpr size_t kMaxAddressBase58Len = 44;

struct Base58Table {
  std::array<i8, 256> digits;

  constexpr Base58Table() : digits() {
    for (auto &digit : digits) digit = -1;
    for (i8 i = 0; i < 58; i++) digits[u8(kAlphabet[i])] = i;
  }
};

constexpr Base58Table kTable = Base58Table();
}  // namespace

std::string EncodeBase58(std::span<const u8> bytes) {
  size_t zeroes = 0;
  while (zeroes < bytes.size() && bytes[zeroes] == 0) zeroes++;

  // log(256) / log(58), rounded up
  size_t size = (bytes.size() - zeroes) * 138 / 100 + 1;
  std::vector<u8> b58(size);
  size_t length = 0;

  for (size_t i = zeroes; i < bytes.size(); i++) {
    u32 carry = bytes[i];
    size_t j = 0;

    for (auto it = b58.rbegin();
         (carry != 0 || j < length) && it != b58.rend(); ++it, ++j) {
      carry += 256 * u32(*it);
      *it = carry % 58;
      carry /= 58;
    }

    length = j;
  }

  auto it = b58.begin() + (size - length);
  while (it != b58.end() && *it == 0) ++it;

  std::string str(zeroes, '1');
  for (; it != b58.end(); ++it) str += kAlphabet[*it];

  return str;
}

std::optional<std::vector<u8>> DecodeBase58(std::string_view str) {
  size_t zeroes = 0;
  while (zeroes < str.size() && str[zeroes] == '1') zeroes++;

  // log(58) / log(256), rounded up
  size_t size = (str.size() - zeroes) * 733 / 1000 + 1;
  std::vector<u8> b256(size);
  size_t length = 0;

  for (size_t i = zeroes; i < str.size(); i++) {
    i8 digit = kTable.digits[u8(str[i])];
    if (digit < 0) return std::nullopt;

    u32 carry = u32(digit);
    size_t j = 0;

    for (auto it = b256.rbegin();
         (carry != 0 || j < length) && it != b256.rend(); ++it, ++j) {
      carry += 58 * u32(*it);
      *it = carry % 256;
      carry /= 256;
    }

    length = j;
  }

  auto it = b256.begin() + (size - length);
  while (it != b256.end() && *it == 0) ++it;

  std::vector<u8> out(zeroes, 0);
  out.insert(out.end(), it, b256.end());

  return out;
}

std::optional<Address> Address::FromBase58(std::string_view str) {
  if (str.empty() || str.size() > kMaxAddressBase58Len) return std::nullopt;

  auto decoded = DecodeBase58(str);
  if (!decoded || decoded->size() != kAddressLen) return std::nullopt;

  Address address;
  std::copy(decoded->begin(), decoded->end(), address.bytes.begin());
  return address;
}

Address Address::Random() {
  static std::mt19937_64 engine{std::random_device{}()};

  Address address;
  for (size_t i = 0; i < kAddressLen; i += sizeof(u64)) {
    u64 word = engine();
    for (size_t k = 0; k < sizeof(u64); k++)
      address.bytes[i + k] = u8(word >> (8 * k));
  }

  return address;
}

std::string Address::ToBase58() const { return EncodeBase58(bytes); }

std::ostream &operator<<(std::ostream &stream, const Address &address) {
  return stream << address.ToBase58();
}
}  // namespace punchcard
