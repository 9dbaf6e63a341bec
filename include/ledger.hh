#ifndef __PUNCHCARD_LEDGER_HH__
#define __PUNCHCARD_LEDGER_HH__

#include <functional>
#include <mutex>
#include <optional>
#include <span>
#include <unordered_map>
#include <utility>
#include <vector>

#include "account.hh"
#include "error.hh"

namespace punchcard {

using Entrypoint = std::function<Status(const Address &program_id,
                                        std::span<AccountInfo> accounts,
                                        std::span<const u8> data,
                                        const Rent &rent)>;

// Address-keyed account store. Transactions run one at a time and either
// commit every account they touched or none of them.
class Ledger {
  using AccountMap = std::unordered_map<Address, Account>;

  mutable std::mutex mutex_;
  AccountMap accounts_;
  std::unordered_map<Address, Entrypoint> programs_;
  Rent rent_;

  Ledger(const Ledger &) = delete;
  void operator=(const Ledger &) = delete;

  Status ExecuteInstruction(const TransactionInstruction &instruction,
                            AccountMap &staged) const;

 public:
  // The punchcard program is registered under ProgramId().
  explicit Ledger(Rent rent = Rent{});

  // Entrypoints run with the ledger locked and must not call back into it.
  void RegisterProgram(const Address &program_id, Entrypoint entrypoint);

  Status Airdrop(const Address &address, u64 lamports);

  std::optional<Account> GetAccount(const Address &address) const;
  void SetAccount(const Address &address, Account account);
  std::vector<std::pair<Address, Account>> Accounts() const;

  inline const Rent &GetRent() const { return rent_; }

  Status Execute(const TransactionInstruction &instruction);
  Status ExecuteTransaction(std::span<const TransactionInstruction> instructions);
};
}  // namespace punchcard

#endif /* __PUNCHCARD_LEDGER_HH__ */
