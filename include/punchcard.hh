#ifndef __PUNCHCARD_PUNCHCARD_HH__
#define __PUNCHCARD_PUNCHCARD_HH__

#include <bit>
#include <cstddef>
#include <optional>
#include <span>
#include <type_traits>
#include <utility>

#include "address.hh"
#include "bit_vector.hh"
#include "error.hh"
#include "util.hh"

namespace punchcard {

static_assert(std::endian::native == std::endian::little,
              "Record fields are stored in native little-endian order");

struct PunchcardHeader {
  Address authority;
  u64 capacity;
  u64 claimed;
};

constexpr size_t kPunchcardHeaderLen = sizeof(PunchcardHeader);

static_assert(kPunchcardHeaderLen == 48);
static_assert(offsetof(PunchcardHeader, capacity) == 32);
static_assert(offsetof(PunchcardHeader, claimed) == 40);
static_assert(std::is_standard_layout_v<PunchcardHeader> &&
              std::is_trivially_copyable_v<PunchcardHeader>);

// Number of bitset bytes for a capacity, empty if it does not fit a size_t.
std::optional<size_t> BitsetLen(u64 capacity);

// A record viewed in place: the header and the bitset are disjoint parts of
// one buffer owned by someone else, which must outlive the view.
class Punchcard {
  PunchcardHeader *header_;
  BitVectorView bits_;

  inline Punchcard(PunchcardHeader *header, BitVectorView bits)
      : header_(header), bits_(bits) {}

 public:
  using Parts = std::pair<PunchcardHeader *, std::span<u8>>;

  static std::optional<size_t> Space(u64 capacity);

  // Only checks that a header fits at the front of the buffer.
  static Result<Parts> Split(std::span<u8> data);

  static Result<Punchcard> FromBytes(std::span<u8> data);

  // The caller has already checked index < capacity.
  Status Claim(u64 index);

  inline PunchcardHeader &Header() { return *header_; }
  inline const PunchcardHeader &Header() const { return *header_; }

  inline BitVectorView &Bits() { return bits_; }
  inline const BitVectorView &Bits() const { return bits_; }

  inline bool IsFull() const { return header_->claimed == header_->capacity; }
};
}  // namespace punchcard

#endif /* __PUNCHCARD_PUNCHCARD_HH__ */
