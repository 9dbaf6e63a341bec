#include "error.hh"

namespace punchcard {
namespace {
const char *KindName(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::kCustom:
      return "Custom";
    case ErrorKind::kInvalidArgument:
      return "InvalidArgument";
    case ErrorKind::kInvalidInstructionData:
      return "InvalidInstructionData";
    case ErrorKind::kInvalidAccountData:
      return "InvalidAccountData";
    case ErrorKind::kInsufficientFunds:
      return "InsufficientFunds";
    case ErrorKind::kIncorrectProgramId:
      return "IncorrectProgramId";
    case ErrorKind::kMissingRequiredSignature:
      return "MissingRequiredSignature";
    case ErrorKind::kNotEnoughAccountKeys:
      return "NotEnoughAccountKeys";
    case ErrorKind::kAccountAlreadyInUse:
      return "AccountAlreadyInUse";
    case ErrorKind::kInvalidAccountDataLength:
      return "InvalidAccountDataLength";
    case ErrorKind::kArithmeticOverflow:
      return "ArithmeticOverflow";
    case ErrorKind::kUnsupportedProgramId:
      return "UnsupportedProgramId";
    case ErrorKind::kAccountLoadedTwice:
      return "AccountLoadedTwice";
    case ErrorKind::kUnbalancedInstruction:
      return "UnbalancedInstruction";
    case ErrorKind::kReadonlyDataModified:
      return "ReadonlyDataModified";
    case ErrorKind::kReadonlyLamportChange:
      return "ReadonlyLamportChange";
  }

  return "Unknown";
}

const char *CustomName(u32 code) {
  switch (PunchcardError(code)) {
    case PunchcardError::kInvalidAuthority:
      return "InvalidAuthority";
    case PunchcardError::kIndexOutOfBounds:
      return "IndexOutOfBounds";
    case PunchcardError::kAlreadyClaimed:
      return "AlreadyClaimed";
    case PunchcardError::kInvalidCapacity:
      return "InvalidCapacity";
  }

  return nullptr;
}
}  // namespace

ErrorCategory ProgramError::Category() const {
  switch (kind_) {
    case ErrorKind::kInvalidAccountData:
      return ErrorCategory::kStructural;
    case ErrorKind::kCustom:
      return ErrorCategory::kDomain;
    default:
      return ErrorCategory::kHost;
  }
}

std::string ProgramError::ToString() const {
  if (kind_ != ErrorKind::kCustom) return KindName(kind_);

  if (const char *name = CustomName(custom_code_)) return name;

  return "Custom(" + std::to_string(custom_code_) + ")";
}

std::ostream &operator<<(std::ostream &stream, const ProgramError &error) {
  return stream << error.ToString();
}
}  // namespace punchcard
