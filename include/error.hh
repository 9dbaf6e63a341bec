#ifndef __PUNCHCARD_ERROR_HH__
#define __PUNCHCARD_ERROR_HH__

#include <optional>
#include <ostream>
#include <string>
#include <variant>

#include "util.hh"

namespace punchcard {

enum class ErrorKind : u32 {
  kCustom,
  kInvalidArgument,
  kInvalidInstructionData,
  kInvalidAccountData,
  kInsufficientFunds,
  kIncorrectProgramId,
  kMissingRequiredSignature,
  kNotEnoughAccountKeys,
  kAccountAlreadyInUse,
  kInvalidAccountDataLength,
  kArithmeticOverflow,
  kUnsupportedProgramId,
  kAccountLoadedTwice,
  kUnbalancedInstruction,
  kReadonlyDataModified,
  kReadonlyLamportChange,
};

// Custom codes reported by the punchcard program. Values are part of the
// program's external interface.
enum class PunchcardError : u32 {
  kInvalidAuthority = 0,
  kIndexOutOfBounds = 1,
  kAlreadyClaimed = 2,
  kInvalidCapacity = 3,
};

enum class ErrorCategory {
  kStructural,  // the buffer is not a punchcard
  kDomain,
  kHost
};

class ProgramError {
  ErrorKind kind_;
  u32 custom_code_;

 public:
  inline constexpr ProgramError(ErrorKind kind)
      : kind_(kind), custom_code_(0) {}

  inline constexpr ProgramError(PunchcardError error)
      : kind_(ErrorKind::kCustom), custom_code_(u32(error)) {}

  inline constexpr ErrorKind Kind() const { return kind_; }
  inline constexpr u32 CustomCode() const { return custom_code_; }

  inline constexpr bool Is(PunchcardError error) const {
    return kind_ == ErrorKind::kCustom && custom_code_ == u32(error);
  }

  ErrorCategory Category() const;
  std::string ToString() const;

  inline constexpr bool operator==(const ProgramError &error) const = default;
};

std::ostream &operator<<(std::ostream &stream, const ProgramError &error);

template <typename T>
using Result = std::variant<T, ProgramError>;

// Empty on success.
using Status = std::optional<ProgramError>;

}  // namespace punchcard

#endif /* __PUNCHCARD_ERROR_HH__ */
