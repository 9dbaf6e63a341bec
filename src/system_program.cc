#include "system_program.hh"

namespace punchcard::system {
Status Transfer(AccountInfo &from, AccountInfo &to, u64 lamports) {
  if (!from.is_signer) return ProgramError(ErrorKind::kMissingRequiredSignature);

  // Accounts holding data pay only through their owning program.
  if (!from.account.data.empty())
    return ProgramError(ErrorKind::kInvalidArgument);

  auto remaining = CheckedSub(from.account.lamports, lamports);
  if (!remaining) return ProgramError(ErrorKind::kInsufficientFunds);

  auto received = CheckedAdd(to.account.lamports, lamports);
  if (!received) return ProgramError(ErrorKind::kArithmeticOverflow);

  from.account.lamports = *remaining;
  to.account.lamports = *received;

  return std::nullopt;
}

Status CreateAccount(AccountInfo &from, AccountInfo &to, u64 lamports,
                     size_t space, const Address &owner) {
  if (!from.is_signer || !to.is_signer)
    return ProgramError(ErrorKind::kMissingRequiredSignature);

  if (to.account.lamports != 0 || !to.account.data.empty() ||
      !to.IsOwnedBy(SystemProgramId()))
    return ProgramError(ErrorKind::kAccountAlreadyInUse);

  if (space > kMaxPermittedDataLength)
    return ProgramError(ErrorKind::kInvalidAccountDataLength);

  if (auto err = Transfer(from, to, lamports)) return err;

  to.account.data.assign(space, 0);
  to.account.owner = owner;

  return std::nullopt;
}
}  // namespace punchcard::system
