#include "punchcard.hh"

#include <limits>

namespace punchcard {
std::optional<size_t> BitsetLen(u64 capacity) {
  if (capacity > std::numeric_limits<size_t>::max()) return std::nullopt;

  auto rounded = CheckedAdd(size_t(capacity), size_t(7));
  if (!rounded) return std::nullopt;

  return *rounded / 8;
}

std::optional<size_t> Punchcard::Space(u64 capacity) {
  auto bits_len = BitsetLen(capacity);
  if (!bits_len) return std::nullopt;

  return CheckedAdd(kPunchcardHeaderLen, *bits_len);
}

Result<Punchcard::Parts> Punchcard::Split(std::span<u8> data) {
  if (data.size() < kPunchcardHeaderLen)
    return ProgramError(ErrorKind::kInvalidAccountData);

  if (reinterpret_cast<uintptr_t>(data.data()) % alignof(PunchcardHeader))
    return ProgramError(ErrorKind::kInvalidAccountData);

  // PunchcardHeader is an implicit-lifetime type, so the aligned bytes of an
  // account's data already hold one. This is the only place the record is
  // reinterpreted.
  auto *header = reinterpret_cast<PunchcardHeader *>(data.data());
  return Parts{header, data.subspan(kPunchcardHeaderLen)};
}

Result<Punchcard> Punchcard::FromBytes(std::span<u8> data) {
  auto split = Split(data);
  if (auto *err = std::get_if<ProgramError>(&split)) return *err;

  auto [header, bits] = std::get<Parts>(split);

  // A capacity too large to size is a mismatch like any other.
  auto expected_bits_len = BitsetLen(header->capacity);
  if (!expected_bits_len || bits.size() != *expected_bits_len)
    return ProgramError(ErrorKind::kInvalidAccountData);

  if (header->claimed > header->capacity)
    return ProgramError(ErrorKind::kInvalidAccountData);

  return Punchcard(header, BitVectorView(bits));
}

Status Punchcard::Claim(u64 index) {
  if (bits_.Get(index)) return PunchcardError::kAlreadyClaimed;

  // Counter says every slot is taken but this bit is clear.
  if (header_->claimed >= header_->capacity)
    return ProgramError(ErrorKind::kInvalidAccountData);

  bits_.Set(index);
  header_->claimed++;

  return std::nullopt;
}
}  // namespace punchcard
