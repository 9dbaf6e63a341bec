#include "instruction.hh"

#include <limits>
#include <stdexcept>
#include <utility>

namespace punchcard {
namespace {
enum InstructionTag : u8 { kCreate = 0, kClaim = 1 };

class BorshReader {
  std::span<const u8> data_;
  size_t offset_{0};

  template <typename T>
  inline std::optional<T> ReadLittleEndian() {
    if (Remaining() < sizeof(T)) return std::nullopt;

    T value = 0;
    for (size_t i = 0; i < sizeof(T); i++)
      value |= T(data_[offset_ + i]) << (8 * i);

    offset_ += sizeof(T);
    return value;
  }

 public:
  inline explicit BorshReader(std::span<const u8> data) : data_(data) {}

  inline size_t Remaining() const { return data_.size() - offset_; }

  inline std::optional<u8> ReadU8() { return ReadLittleEndian<u8>(); }
  inline std::optional<u32> ReadU32() { return ReadLittleEndian<u32>(); }
  inline std::optional<u64> ReadU64() { return ReadLittleEndian<u64>(); }
};

template <typename T>
void WriteLittleEndian(std::vector<u8> &out, T value) {
  for (size_t i = 0; i < sizeof(T); i++) out.push_back(u8(value >> (8 * i)));
}

std::optional<Instruction> ReadInstruction(BorshReader &reader) {
  auto tag = reader.ReadU8();
  if (!tag) return std::nullopt;

  switch (*tag) {
    case kCreate: {
      auto capacity = reader.ReadU64();
      if (!capacity) return std::nullopt;
      return CreateInstruction{*capacity};
    }

    case kClaim: {
      auto count = reader.ReadU32();
      if (!count || *count > reader.Remaining() / sizeof(u64))
        return std::nullopt;

      ClaimInstruction claim;
      claim.indices.reserve(*count);

      for (u32 i = 0; i < *count; i++) claim.indices.push_back(*reader.ReadU64());

      return claim;
    }
  }

  return std::nullopt;
}
}  // namespace

std::vector<u8> EncodeInstruction(const Instruction &instruction) {
  std::vector<u8> out;

  std::visit(Overloaded{[&](const CreateInstruction &create) {
                          out.push_back(kCreate);
                          WriteLittleEndian(out, create.capacity);
                        },
                        [&](const ClaimInstruction &claim) {
                          if (claim.indices.size() >
                              std::numeric_limits<u32>::max())
                            throw std::length_error("Too many claim indices");
                          out.push_back(kClaim);
                          WriteLittleEndian(out, u32(claim.indices.size()));
                          for (u64 index : claim.indices)
                            WriteLittleEndian(out, index);
                        }},
             instruction);

  return out;
}

Result<Instruction> DecodeInstruction(std::span<const u8> data) {
  BorshReader reader{data};

  auto instruction = ReadInstruction(reader);
  if (!instruction || reader.Remaining() != 0)
    return ProgramError(ErrorKind::kInvalidInstructionData);

  return std::move(*instruction);
}
}  // namespace punchcard
