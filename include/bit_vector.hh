#ifndef __PUNCHCARD_BIT_VECTOR_HH__
#define __PUNCHCARD_BIT_VECTOR_HH__

#include <algorithm>
#include <boost/dynamic_bitset/dynamic_bitset.hpp>
#include <cstddef>
#include <span>
#include <stdexcept>

#include "util.hh"

namespace punchcard {

// Bit i lives in byte i / 8 under mask 1 << (i % 8). The view does not own
// its bytes and knows nothing about how many of its bits are meaningful.
class BitVectorView {
  std::span<u8> bytes_;

  inline size_t ByteIndex(u64 index) const {
    u64 byte = index / 8;
    if (byte >= bytes_.size())
      throw std::out_of_range("Bit index outside of bit vector");
    return size_t(byte);
  }

 public:
  BitVectorView() = default;
  inline explicit BitVectorView(std::span<u8> bytes) : bytes_(bytes) {}

  inline bool Get(u64 index) const {
    return (bytes_[ByteIndex(index)] & (1u << (index % 8))) != 0;
  }

  inline void Set(u64 index) {
    bytes_[ByteIndex(index)] |= u8(1u << (index % 8));
  }

  inline void Clear() { std::fill(bytes_.begin(), bytes_.end(), u8(0)); }

  inline size_t SizeInBytes() const { return bytes_.size(); }
  inline u64 SizeInBits() const { return u64(bytes_.size()) * 8; }

  inline std::span<u8> Bytes() const { return bytes_; }

  // Block i of the bitset is byte i, so bit numbering carries over as is.
  inline boost::dynamic_bitset<u8> Snapshot() const {
    return boost::dynamic_bitset<u8>(bytes_.begin(), bytes_.end());
  }
};
}  // namespace punchcard

#endif /* __PUNCHCARD_BIT_VECTOR_HH__ */
