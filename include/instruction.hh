#ifndef __PUNCHCARD_INSTRUCTION_HH__
#define __PUNCHCARD_INSTRUCTION_HH__

#include <span>
#include <variant>
#include <vector>

#include "error.hh"
#include "util.hh"

namespace punchcard {

struct CreateInstruction {
  u64 capacity;

  inline bool operator==(const CreateInstruction &) const = default;
};

struct ClaimInstruction {
  std::vector<u64> indices;

  inline bool operator==(const ClaimInstruction &) const = default;
};

// Borsh layout: a u8 tag in declaration order, then the fields. Integers are
// little-endian, vectors carry a u32 element count.
using Instruction = std::variant<CreateInstruction, ClaimInstruction>;

std::vector<u8> EncodeInstruction(const Instruction &instruction);

// Rejects unknown tags, short input and trailing bytes.
Result<Instruction> DecodeInstruction(std::span<const u8> data);
}  // namespace punchcard

#endif /* __PUNCHCARD_INSTRUCTION_HH__ */
